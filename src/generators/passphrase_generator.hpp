/**
 * xkpass Passphrase Generator
 *
 * Assembles "correct horse battery staple" style passphrases:
 *
 *   [digits][sep]Word[sep]Word[sep]...Word[sep][digits]
 *
 * followed by FIXED or ADAPTIVE symbol padding. The configuration and the
 * word source are re-read on every call.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/random_source.hpp"
#include "../core/yaml_config.hpp"
#include "word_source.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>

namespace xkpass {

class PassphraseGenerator;

/**
 * Lazy sequence of passphrases returned by PassphraseGenerator::generate(n).
 *
 * Each step runs the full generation pipeline. Iterating the sequence again
 * produces fresh passphrases. A failure is thrown from begin() or operator++
 * at the position where it happened.
 */
class PasswordSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return position_ == other.position_; }
        bool operator!=(const iterator& other) const { return position_ != other.position_; }

        size_t position() const { return position_; }

    private:
        friend class PasswordSequence;

        iterator(PassphraseGenerator* generator, size_t position, size_t count);

        void advance();

        PassphraseGenerator* generator_ = nullptr;
        size_t position_ = 0;
        size_t count_ = 0;
        std::string current_;
    };

    PasswordSequence(PassphraseGenerator& generator, size_t count)
        : generator_(&generator), count_(count) {}

    iterator begin() const { return iterator(generator_, 0, count_); }
    iterator end() const { return iterator(generator_, count_, count_); }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

private:
    PassphraseGenerator* generator_;
    size_t count_;
};

/**
 * Main passphrase generator.
 *
 * Not thread-safe; give each thread its own generator (they may share a
 * RandomSource).
 */
class PassphraseGenerator {
public:
    explicit PassphraseGenerator(
        GeneratorConfig config = GeneratorConfig(),
        std::shared_ptr<RandomSource> rng = nullptr
    );

    /**
     * Take the generator settings and resource directory from a loaded
     * config file. An empty resource_dir keeps the current one.
     */
    void apply_config_file(const ConfigFile& file);

    GeneratorConfig& config() { return config_; }
    const GeneratorConfig& config() const { return config_; }

    /**
     * Use a specific word source instead of the configured word_list_path.
     * Pass nullptr to go back to the configured path.
     */
    void set_word_source(std::shared_ptr<const WordSource> source) {
        word_source_ = std::move(source);
    }

    /**
     * Directory that "?name" word list paths resolve against.
     */
    void set_resource_dir(std::string dir) { resource_dir_ = std::move(dir); }
    const std::string& resource_dir() const { return resource_dir_; }

    RandomSource& random_source() { return *rng_; }

    /**
     * Generate one passphrase.
     *
     * @throws EmptyCandidateSet if no word passes the length filter
     * @throws WordSourceUnavailable if the word list cannot be read
     * @throws InvalidConfiguration if a random pick is needed from an empty alphabet
     */
    std::string generate();

    /**
     * Lazily generate `count` passphrases.
     */
    PasswordSequence generate(size_t count) { return PasswordSequence(*this, count); }

    // -------------------------------------------------------------------------
    // Pipeline stages
    // -------------------------------------------------------------------------

    /**
     * Keep words with min < length < max (both bounds exclusive). Length is
     * counted in UTF-8 characters.
     */
    static WordList filter_candidates(const WordList& words, int min_length, int max_length);

    /**
     * Draw word_count words uniformly with replacement.
     * @throws EmptyCandidateSet if candidates is empty
     */
    WordList select_words(const WordList& candidates);

    /**
     * Case transform (skipped for CaseTransform::NONE) then substitutions.
     */
    void transform_words(WordList& words);

    /**
     * Separator for one generate() call: "" for NONE, the fixed character,
     * or a random pick from the separator alphabet (symbol alphabet if empty).
     */
    std::string resolve_separator();

    std::string random_digits(int count);

    /**
     * Digits, separators and words in output order, before symbol padding.
     */
    std::string assemble_core(const WordList& words, const std::string& separator);

    /**
     * FIXED or ADAPTIVE symbol padding.
     *
     * FIXED pads with the fixed character, else the separator, else a random
     * pick from the symbol alphabet. ADAPTIVE fits the result to exactly
     * pad_to_length characters.
     */
    std::string apply_padding(std::string password, const std::string& separator);

private:
    WordList load_candidates();
    char pick_symbol(const std::set<char>& alphabet, const char* what);

    GeneratorConfig config_;
    std::shared_ptr<RandomSource> rng_;
    std::shared_ptr<const WordSource> word_source_;
    std::string resource_dir_;
};

}  // namespace xkpass
