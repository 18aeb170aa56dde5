/**
 * Word Transform Implementation
 */

#include "word_transform.hpp"
#include "utf8.hpp"

namespace xkpass {

std::string CaseTransformer::apply(std::string_view word, CaseTransform transform) const {
    std::string result(word);

    // Every transform walks characters, not bytes; j is the character index
    switch (transform) {
        case CaseTransform::NONE:
            break;

        case CaseTransform::UPPER:
            for (size_t pos = 0, n = 0; pos < result.size(); pos += n) {
                n = utf8_char_size(result, pos);
                utf8_upper_at(result, pos, n);
            }
            break;

        case CaseTransform::LOWER:
            for (size_t pos = 0, n = 0; pos < result.size(); pos += n) {
                n = utf8_char_size(result, pos);
                utf8_lower_at(result, pos, n);
            }
            break;

        // First character uppercased, rest untouched
        case CaseTransform::CAPITALIZE:
            if (!result.empty()) {
                utf8_upper_at(result, 0, utf8_char_size(result, 0));
            }
            break;

        // First character lowercased, rest uppercased
        case CaseTransform::INVERT:
            for (size_t pos = 0, n = 0, j = 0; pos < result.size(); pos += n, ++j) {
                n = utf8_char_size(result, pos);
                if (j == 0) utf8_lower_at(result, pos, n);
                else utf8_upper_at(result, pos, n);
            }
            break;

        case CaseTransform::ALTERNATE: {
            const size_t caps_parity = rng_.coin_flip() ? 0 : 1;
            for (size_t pos = 0, n = 0, j = 0; pos < result.size(); pos += n, ++j) {
                n = utf8_char_size(result, pos);
                if (j % 2 == caps_parity) utf8_upper_at(result, pos, n);
                else utf8_lower_at(result, pos, n);
            }
            break;
        }

        case CaseTransform::RANDOM:
            for (size_t pos = 0, n = 0; pos < result.size(); pos += n) {
                n = utf8_char_size(result, pos);
                utf8_upper_at(result, pos, n);
                if (rng_.coin_flip()) {
                    utf8_lower_at(result, pos, n);
                }
            }
            break;
    }

    return result;
}

void CaseTransformer::apply_all(WordList& words, CaseTransform transform) const {
    for (auto& word : words) {
        word = apply(word, transform);
    }
}

std::string CharacterSubstituter::apply(std::string_view word, const SubstitutionTable& table) {
    std::string result(word);
    for (const auto& [from, to] : table) {
        for (char& c : result) {
            if (c == from) c = to;
        }
    }
    return result;
}

void CharacterSubstituter::apply_all(WordList& words, const SubstitutionTable& table) {
    if (table.empty()) return;
    for (auto& word : words) {
        word = apply(word, table);
    }
}

}  // namespace xkpass
