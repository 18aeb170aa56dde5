/**
 * xkpass Word Transforms
 *
 * Case transformation and literal character substitution applied to each
 * selected word before it is joined into a passphrase.
 */

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "random_source.hpp"

#include <string>
#include <string_view>

namespace xkpass {

/**
 * Applies a CaseTransform to words.
 *
 * Works on UTF-8 characters. Casing covers ASCII and the Latin-1 letters
 * (U+00C0..U+00FE) and does not depend on the global locale.
 * ALTERNATE and RANDOM draw from the supplied random source:
 * - ALTERNATE: one coin flip per word (even or odd positions uppercased)
 * - RANDOM: one coin flip per character (heads lowercases it)
 */
class CaseTransformer {
public:
    explicit CaseTransformer(RandomSource& rng) : rng_(rng) {}

    std::string apply(std::string_view word, CaseTransform transform) const;

    void apply_all(WordList& words, CaseTransform transform) const;

private:
    RandomSource& rng_;
};

/**
 * Replaces every occurrence of each key with its value, one table entry at a
 * time in insertion order. Later entries see the output of earlier ones, so
 * {a->b, b->c} turns "ab" into "cc".
 */
class CharacterSubstituter {
public:
    static std::string apply(std::string_view word, const SubstitutionTable& table);

    static void apply_all(WordList& words, const SubstitutionTable& table);
};

}  // namespace xkpass
