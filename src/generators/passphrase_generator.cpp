/**
 * Passphrase Generator Implementation
 */

#include "passphrase_generator.hpp"

#include "../core/logger.hpp"
#include "../core/utf8.hpp"
#include "../core/word_transform.hpp"

#include <chrono>
#include <iterator>

namespace xkpass {

// -----------------------------------------------------------------------------
// PasswordSequence
// -----------------------------------------------------------------------------

PasswordSequence::iterator::iterator(PassphraseGenerator* generator, size_t position, size_t count)
    : generator_(generator), position_(position), count_(count) {
    if (position_ < count_) {
        current_ = generator_->generate();
    }
}

void PasswordSequence::iterator::advance() {
    ++position_;
    if (position_ < count_) {
        current_ = generator_->generate();
    } else {
        current_.clear();
    }
}

// -----------------------------------------------------------------------------
// PassphraseGenerator
// -----------------------------------------------------------------------------

PassphraseGenerator::PassphraseGenerator(
    GeneratorConfig config,
    std::shared_ptr<RandomSource> rng
) : config_(std::move(config)),
    rng_(rng ? std::move(rng) : make_default_random_source()),
    resource_dir_(WordSourceFactory::default_resource_dir()) {}

void PassphraseGenerator::apply_config_file(const ConfigFile& file) {
    config_ = file.generator;
    if (!file.resource_dir.empty()) {
        resource_dir_ = file.resource_dir;
    }
}

std::string PassphraseGenerator::generate() {
    Logger& logger = Logger::instance();
    if (logger.enabled(Logger::Level::DEBUG)) {
        logger.log(Logger::Level::DEBUG,
                   "GENERATE: Words=" + std::to_string(config_.word_count()) +
                   ", Case=" + to_string(config_.case_transform()) +
                   ", Padding=" + to_string(config_.padding_type()) +
                   ", List=" + (word_source_ ? word_source_->describe() : config_.word_list_path()));
    }

    try {
        WordList candidates = load_candidates();

        std::string separator = resolve_separator();
        WordList words = select_words(candidates);
        transform_words(words);

        std::string password = assemble_core(words, separator);
        return apply_padding(std::move(password), separator);
    } catch (const PassphraseError& e) {
        logger.log_error(e.what());
        throw;
    }
}

WordList PassphraseGenerator::load_candidates() {
    const int min_length = config_.min_word_length();
    const int max_length = config_.max_word_length();

    auto start = std::chrono::steady_clock::now();

    // Re-resolved on every call so a changed word_list_path takes effect
    std::unique_ptr<WordSource> configured;
    const WordSource* source = word_source_.get();
    if (!source) {
        configured = WordSourceFactory::create(config_.word_list_path(), resource_dir_);
        source = configured.get();
    }

    WordList all_words = source->read_words();
    WordList candidates = filter_candidates(all_words, min_length, max_length);

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start);
    Logger::instance().log_wordlist_loaded(source->describe(), all_words.size(),
                                           candidates.size(), min_length, max_length,
                                           elapsed.count());

    return candidates;
}

WordList PassphraseGenerator::filter_candidates(const WordList& words, int min_length, int max_length) {
    WordList result;
    for (const auto& word : words) {
        const auto length = static_cast<long long>(utf8_length(word));
        if (length > min_length && length < max_length) {
            result.push_back(word);
        }
    }
    return result;
}

WordList PassphraseGenerator::select_words(const WordList& candidates) {
    if (candidates.empty()) {
        throw EmptyCandidateSet(
            "No words longer than " + std::to_string(config_.min_word_length()) +
            " and shorter than " + std::to_string(config_.max_word_length()) +
            " characters in the word list");
    }

    const int count = config_.word_count();
    WordList words;
    words.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        words.push_back(candidates[rng_->next_index(candidates.size())]);
    }
    return words;
}

void PassphraseGenerator::transform_words(WordList& words) {
    if (config_.case_transform() != CaseTransform::NONE) {
        CaseTransformer(*rng_).apply_all(words, config_.case_transform());
    }
    CharacterSubstituter::apply_all(words, config_.character_substitutions());
}

char PassphraseGenerator::pick_symbol(const std::set<char>& alphabet, const char* what) {
    if (alphabet.empty()) {
        throw InvalidConfiguration(std::string("Cannot pick a random ") + what +
                                   ": symbol alphabet is empty");
    }
    auto it = alphabet.begin();
    std::advance(it, static_cast<std::ptrdiff_t>(rng_->next_index(alphabet.size())));
    return *it;
}

std::string PassphraseGenerator::resolve_separator() {
    const CharChoice choice = config_.separator_character();

    if (choice.is_none()) {
        return "";
    }
    if (choice.is_fixed()) {
        return std::string(1, choice.value());
    }
    if (!config_.separator_alphabet().empty()) {
        return std::string(1, pick_symbol(config_.separator_alphabet(), "separator"));
    }
    return std::string(1, pick_symbol(config_.symbol_alphabet(), "separator"));
}

std::string PassphraseGenerator::random_digits(int count) {
    std::string digits;
    if (count <= 0) return digits;

    digits.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        digits += rng_->next_digit();
    }
    return digits;
}

std::string PassphraseGenerator::assemble_core(const WordList& words, const std::string& separator) {
    const int digits_before = config_.padding_digits_before();
    const int digits_after = config_.padding_digits_after();

    std::string result = random_digits(digits_before);
    if (digits_before > 0) {
        result += separator;
    }

    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) result += separator;
        result += words[i];
    }

    if (digits_after > 0) {
        result += separator;
    }
    result += random_digits(digits_after);

    return result;
}

std::string PassphraseGenerator::apply_padding(std::string password, const std::string& separator) {
    const CharChoice configured = config_.padding_character();

    switch (config_.padding_type()) {
        case PaddingType::NONE:
            break;

        case PaddingType::FIXED: {
            char pad;
            if (configured.is_fixed()) {
                pad = configured.value();
            } else if (!separator.empty()) {
                pad = separator.front();
            } else {
                // No separator to borrow from
                pad = pick_symbol(config_.symbol_alphabet(), "padding character");
            }

            const int before = config_.padding_characters_before();
            const int after = config_.padding_characters_after();

            if (before > 0) {
                std::string unit(1, pad);
                unit += separator;

                std::string prefix;
                prefix.reserve(unit.size() * static_cast<size_t>(before));
                for (int i = 0; i < before; ++i) {
                    prefix += unit;
                }
                password.insert(0, prefix);
            }
            if (after > 0) {
                password.append(static_cast<size_t>(after), pad);
            }
            break;
        }

        case PaddingType::ADAPTIVE: {
            const int target = config_.pad_to_length();
            if (target <= 0) break;

            const char pad = configured.is_fixed()
                ? configured.value()
                : pick_symbol(config_.symbol_alphabet(), "padding character");

            // Target counts characters; truncation never splits one
            const size_t length = static_cast<size_t>(target);
            const size_t current = utf8_length(password);
            if (current < length) {
                password.append(length - current, pad);
            } else if (current > length) {
                password.resize(utf8_offset(password, length));
            }
            break;
        }
    }

    return password;
}

}  // namespace xkpass
