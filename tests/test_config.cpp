/**
 * Generator Configuration Tests
 *
 * Defaults, setter validation and effective word length bounds.
 */

#include "../src/core/config.hpp"
#include <iostream>
#include <cassert>

using namespace xkpass;

void test_defaults() {
    GeneratorConfig config;

    assert(config.min_word_length() == 4);
    assert(config.max_word_length() == 8);
    assert(config.word_count() == 4);
    assert(config.word_list_path() == "?en.gz");
    assert(config.separator_character().is_random());
    assert(config.separator_alphabet().empty());
    assert(config.padding_digits_before() == 2);
    assert(config.padding_digits_after() == 2);
    assert(config.padding_type() == PaddingType::FIXED);
    assert(config.padding_character().is_random());
    assert(config.padding_characters_before() == 2);
    assert(config.padding_characters_after() == 2);
    assert(config.pad_to_length() == 0);
    assert(config.case_transform() == CaseTransform::CAPITALIZE);
    assert(config.character_substitutions().empty());

    const std::string symbols = "!@$%^&*-_+=:|~?";
    assert(config.symbol_alphabet().size() == symbols.size());
    for (char c : symbols) {
        assert(config.symbol_alphabet().count(c) == 1);
    }

    std::cout << "[PASS] Defaults\n";
}

void test_effective_bounds_are_symmetric() {
    GeneratorConfig a;
    a.set_min_word_length(8);
    a.set_max_word_length(4);

    GeneratorConfig b;
    b.set_max_word_length(4);
    b.set_min_word_length(8);

    GeneratorConfig c;
    c.set_min_word_length(4);
    c.set_max_word_length(8);

    assert(a.min_word_length() == 4 && a.max_word_length() == 8);
    assert(b.min_word_length() == 4 && b.max_word_length() == 8);
    assert(c.min_word_length() == 4 && c.max_word_length() == 8);

    std::cout << "[PASS] Effective bounds are symmetric\n";
}

template <typename Fn>
bool throws_invalid(Fn fn) {
    try {
        fn();
    } catch (const InvalidConfiguration&) {
        return true;
    }
    return false;
}

void test_word_settings_reject_non_positive() {
    GeneratorConfig config;
    config.set_min_word_length(5);
    config.set_max_word_length(9);
    config.set_word_count(3);

    assert(throws_invalid([&] { config.set_min_word_length(0); }));
    assert(throws_invalid([&] { config.set_min_word_length(-3); }));
    assert(throws_invalid([&] { config.set_max_word_length(0); }));
    assert(throws_invalid([&] { config.set_word_count(0); }));
    assert(throws_invalid([&] { config.set_word_list_path(""); }));

    // Prior values survive a rejected set
    assert(config.min_word_length() == 5);
    assert(config.max_word_length() == 9);
    assert(config.word_count() == 3);
    assert(config.word_list_path() == "?en.gz");

    std::cout << "[PASS] Word settings reject non-positive values\n";
}

void test_padding_counts_reject_negative() {
    GeneratorConfig config;

    assert(throws_invalid([&] { config.set_padding_digits_before(-1); }));
    assert(throws_invalid([&] { config.set_padding_digits_after(-1); }));
    assert(throws_invalid([&] { config.set_padding_characters_before(-1); }));
    assert(throws_invalid([&] { config.set_padding_characters_after(-1); }));

    assert(config.padding_digits_before() == 2);
    assert(config.padding_characters_after() == 2);

    // Zero is allowed
    config.set_padding_digits_before(0);
    config.set_padding_characters_after(0);
    assert(config.padding_digits_before() == 0);
    assert(config.padding_characters_after() == 0);

    // pad_to_length is unvalidated; <= 0 just disables adaptive padding
    config.set_pad_to_length(-5);
    assert(config.pad_to_length() == -5);

    std::cout << "[PASS] Padding counts reject negative values\n";
}

void test_char_choice() {
    assert(CharChoice().is_random());
    assert(CharChoice::none().is_none());
    assert(CharChoice::fixed('-').is_fixed());
    assert(CharChoice::fixed('-').value() == '-');

    // NUL means "no character"
    assert(CharChoice::fixed('\0') == CharChoice::none());
    assert(CharChoice::fixed('a') != CharChoice::fixed('b'));

    std::cout << "[PASS] CharChoice states\n";
}

void test_substitution_table_order() {
    SubstitutionTable table;
    table.set('o', '0');
    table.set('a', '@');
    table.set('s', '$');
    table.set('a', '4');  // replace in place

    assert(table.size() == 3);
    assert(table.entries()[0] == SubstitutionTable::Entry('o', '0'));
    assert(table.entries()[1] == SubstitutionTable::Entry('a', '4'));
    assert(table.entries()[2] == SubstitutionTable::Entry('s', '$'));

    assert(table.erase('a'));
    assert(!table.erase('x'));
    assert(table.size() == 2);

    SubstitutionTable listed{{'e', '3'}, {'e', 'E'}, {'i', '1'}};
    assert(listed.size() == 2);

    std::cout << "[PASS] Substitution table keeps insertion order\n";
}

void test_alphabets() {
    GeneratorConfig config;
    config.set_symbol_alphabet(std::string_view("aabbc"));
    assert(config.symbol_alphabet().size() == 3);

    config.set_separator_alphabet(std::string_view("-."));
    assert(config.separator_alphabet().size() == 2);

    config.set_separator_alphabet(std::set<char>{});
    assert(config.separator_alphabet().empty());

    std::cout << "[PASS] Alphabets are character sets\n";
}

int main() {
    std::cout << "=== Generator Configuration Tests ===\n\n";

    test_defaults();
    test_effective_bounds_are_symmetric();
    test_word_settings_reject_non_positive();
    test_padding_counts_reject_negative();
    test_char_choice();
    test_substitution_table_order();
    test_alphabets();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
