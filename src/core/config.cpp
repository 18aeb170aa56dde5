/**
 * Generator Configuration Implementation
 */

#include "config.hpp"

#include <algorithm>

namespace xkpass {

namespace {

void require_positive(int value, const char* field) {
    if (value <= 0) {
        throw InvalidConfiguration(std::string(field) + " cannot be less than 1 (got " +
                                   std::to_string(value) + ")");
    }
}

void require_non_negative(int value, const char* field) {
    if (value < 0) {
        throw InvalidConfiguration(std::string(field) + " cannot be negative (got " +
                                   std::to_string(value) + ")");
    }
}

}  // namespace

// -----------------------------------------------------------------------------
// SubstitutionTable
// -----------------------------------------------------------------------------

SubstitutionTable::SubstitutionTable(std::initializer_list<Entry> entries) {
    for (const auto& [from, to] : entries) {
        set(from, to);
    }
}

void SubstitutionTable::set(char from, char to) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [from](const Entry& e) { return e.first == from; });
    if (it != entries_.end()) {
        it->second = to;
    } else {
        entries_.emplace_back(from, to);
    }
}

bool SubstitutionTable::erase(char from) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [from](const Entry& e) { return e.first == from; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

// -----------------------------------------------------------------------------
// GeneratorConfig
// -----------------------------------------------------------------------------

GeneratorConfig::GeneratorConfig()
    : min_word_length_(DEFAULT_MIN_WORD_LENGTH),
      max_word_length_(DEFAULT_MAX_WORD_LENGTH),
      word_count_(DEFAULT_WORD_COUNT),
      word_list_path_(DEFAULT_WORD_LIST),
      symbol_alphabet_(),
      separator_alphabet_(),
      separator_character_(CharChoice::random()),
      padding_digits_before_(DEFAULT_PADDING_DIGITS),
      padding_digits_after_(DEFAULT_PADDING_DIGITS),
      padding_type_(PaddingType::FIXED),
      padding_character_(CharChoice::random()),
      padding_characters_before_(DEFAULT_PADDING_CHARACTERS),
      padding_characters_after_(DEFAULT_PADDING_CHARACTERS),
      pad_to_length_(0),
      case_transform_(CaseTransform::CAPITALIZE) {
    set_symbol_alphabet(std::string_view(DEFAULT_SYMBOLS));
}

int GeneratorConfig::min_word_length() const {
    return std::min(min_word_length_, max_word_length_);
}

int GeneratorConfig::max_word_length() const {
    return std::max(min_word_length_, max_word_length_);
}

void GeneratorConfig::set_min_word_length(int length) {
    require_positive(length, "Minimum word length");
    min_word_length_ = length;
}

void GeneratorConfig::set_max_word_length(int length) {
    require_positive(length, "Maximum word length");
    max_word_length_ = length;
}

void GeneratorConfig::set_word_count(int count) {
    require_positive(count, "Word count");
    word_count_ = count;
}

void GeneratorConfig::set_word_list_path(std::string path) {
    if (path.empty()) {
        throw InvalidConfiguration("Word list path cannot be empty");
    }
    word_list_path_ = std::move(path);
}

void GeneratorConfig::set_symbol_alphabet(std::string_view symbols) {
    symbol_alphabet_ = std::set<char>(symbols.begin(), symbols.end());
}

void GeneratorConfig::set_separator_alphabet(std::string_view symbols) {
    separator_alphabet_ = std::set<char>(symbols.begin(), symbols.end());
}

void GeneratorConfig::set_padding_digits_before(int count) {
    require_non_negative(count, "Padding digits before");
    padding_digits_before_ = count;
}

void GeneratorConfig::set_padding_digits_after(int count) {
    require_non_negative(count, "Padding digits after");
    padding_digits_after_ = count;
}

void GeneratorConfig::set_padding_characters_before(int count) {
    require_non_negative(count, "Padding characters before");
    padding_characters_before_ = count;
}

void GeneratorConfig::set_padding_characters_after(int count) {
    require_non_negative(count, "Padding characters after");
    padding_characters_after_ = count;
}

}  // namespace xkpass
