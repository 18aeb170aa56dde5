/**
 * xkpass Generator Configuration
 *
 * Options recognised by the passphrase generator. Every setter validates its
 * argument and throws InvalidConfiguration without touching the stored value
 * when the argument is out of range.
 */

#pragma once

#include "types.hpp"
#include "errors.hpp"

#include <initializer_list>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace xkpass {

/**
 * Insertion-ordered character substitution table with unique keys.
 */
class SubstitutionTable {
public:
    using Entry = std::pair<char, char>;

    SubstitutionTable() = default;
    SubstitutionTable(std::initializer_list<Entry> entries);

    /**
     * Add or replace the substitution for `from`.
     * Replacing keeps the entry's original position.
     */
    void set(char from, char to);

    bool erase(char from);
    void clear() { entries_.clear(); }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    const std::vector<Entry>& entries() const { return entries_; }
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

class GeneratorConfig {
public:
    static constexpr int DEFAULT_MIN_WORD_LENGTH = 4;
    static constexpr int DEFAULT_MAX_WORD_LENGTH = 8;
    static constexpr int DEFAULT_WORD_COUNT = 4;
    static constexpr int DEFAULT_PADDING_DIGITS = 2;
    static constexpr int DEFAULT_PADDING_CHARACTERS = 2;
    static constexpr const char* DEFAULT_WORD_LIST = "?en.gz";
    static constexpr const char* DEFAULT_SYMBOLS = "!@$%^&*-_+=:|~?";

    GeneratorConfig();

    // -------------------------------------------------------------------------
    // Word selection
    // -------------------------------------------------------------------------

    /**
     * Effective minimum word length: the smaller of the two stored bounds.
     */
    int min_word_length() const;

    /**
     * Effective maximum word length: the larger of the two stored bounds.
     */
    int max_word_length() const;

    void set_min_word_length(int length);
    void set_max_word_length(int length);

    int word_count() const { return word_count_; }
    void set_word_count(int count);

    const std::string& word_list_path() const { return word_list_path_; }
    void set_word_list_path(std::string path);

    // -------------------------------------------------------------------------
    // Alphabets and separator
    // -------------------------------------------------------------------------

    const std::set<char>& symbol_alphabet() const { return symbol_alphabet_; }
    void set_symbol_alphabet(std::set<char> alphabet) { symbol_alphabet_ = std::move(alphabet); }
    void set_symbol_alphabet(std::string_view symbols);

    // Empty means "use the symbol alphabet"
    const std::set<char>& separator_alphabet() const { return separator_alphabet_; }
    void set_separator_alphabet(std::set<char> alphabet) { separator_alphabet_ = std::move(alphabet); }
    void set_separator_alphabet(std::string_view symbols);

    CharChoice separator_character() const { return separator_character_; }
    void set_separator_character(CharChoice choice) { separator_character_ = choice; }

    // -------------------------------------------------------------------------
    // Digit and symbol padding
    // -------------------------------------------------------------------------

    int padding_digits_before() const { return padding_digits_before_; }
    int padding_digits_after() const { return padding_digits_after_; }
    void set_padding_digits_before(int count);
    void set_padding_digits_after(int count);

    PaddingType padding_type() const { return padding_type_; }
    void set_padding_type(PaddingType type) { padding_type_ = type; }

    CharChoice padding_character() const { return padding_character_; }
    void set_padding_character(CharChoice choice) { padding_character_ = choice; }

    int padding_characters_before() const { return padding_characters_before_; }
    int padding_characters_after() const { return padding_characters_after_; }
    void set_padding_characters_before(int count);
    void set_padding_characters_after(int count);

    // Only used by ADAPTIVE padding; <= 0 disables it
    int pad_to_length() const { return pad_to_length_; }
    void set_pad_to_length(int length) { pad_to_length_ = length; }

    // -------------------------------------------------------------------------
    // Word transforms
    // -------------------------------------------------------------------------

    CaseTransform case_transform() const { return case_transform_; }
    void set_case_transform(CaseTransform transform) { case_transform_ = transform; }

    const SubstitutionTable& character_substitutions() const { return substitutions_; }
    SubstitutionTable& character_substitutions() { return substitutions_; }
    void set_character_substitutions(SubstitutionTable table) { substitutions_ = std::move(table); }

private:
    int min_word_length_;
    int max_word_length_;
    int word_count_;
    std::string word_list_path_;

    std::set<char> symbol_alphabet_;
    std::set<char> separator_alphabet_;
    CharChoice separator_character_;

    int padding_digits_before_;
    int padding_digits_after_;
    PaddingType padding_type_;
    CharChoice padding_character_;
    int padding_characters_before_;
    int padding_characters_after_;
    int pad_to_length_;

    CaseTransform case_transform_;
    SubstitutionTable substitutions_;
};

}  // namespace xkpass
