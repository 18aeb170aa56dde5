/**
 * xkpass Core Types
 *
 * Common type definitions shared by the configuration, the word transforms
 * and the passphrase generator.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xkpass {

// -----------------------------------------------------------------------------
// Word Types
// -----------------------------------------------------------------------------

using WordList = std::vector<std::string>;

/**
 * Case transformation applied to every selected word.
 */
enum class CaseTransform : uint8_t {
    NONE = 0,        // Words pass through untouched (transform step skipped)
    UPPER = 1,       // CORRECT
    LOWER = 2,       // correct
    CAPITALIZE = 3,  // Correct (remainder untouched)
    INVERT = 4,      // cORRECT
    ALTERNATE = 5,   // cOrReCt or CoRrEcT, chosen per word
    RANDOM = 6,      // coRReCt, chosen per character
};

/**
 * Symbol padding strategy applied after the words and digits are joined.
 */
enum class PaddingType : uint8_t {
    NONE = 0,
    FIXED = 1,     // N x (char + separator) before, M x char after
    ADAPTIVE = 2,  // Pad or truncate to an exact length
};

// -----------------------------------------------------------------------------
// Tri-state character selection
// -----------------------------------------------------------------------------

/**
 * A character option that is either picked at random, explicitly absent,
 * or fixed to a specific value.
 */
class CharChoice {
public:
    enum class Mode : uint8_t {
        RANDOM = 0,
        NONE = 1,
        FIXED = 2,
    };

    constexpr CharChoice() = default;

    static constexpr CharChoice random() { return CharChoice(Mode::RANDOM, '\0'); }
    static constexpr CharChoice none() { return CharChoice(Mode::NONE, '\0'); }

    /**
     * A fixed character. NUL is folded into the NONE state.
     */
    static constexpr CharChoice fixed(char c) {
        return c == '\0' ? none() : CharChoice(Mode::FIXED, c);
    }

    constexpr Mode mode() const { return mode_; }
    constexpr bool is_random() const { return mode_ == Mode::RANDOM; }
    constexpr bool is_none() const { return mode_ == Mode::NONE; }
    constexpr bool is_fixed() const { return mode_ == Mode::FIXED; }

    // Only meaningful when is_fixed()
    constexpr char value() const { return value_; }

    constexpr bool operator==(const CharChoice& other) const {
        return mode_ == other.mode_ && value_ == other.value_;
    }
    constexpr bool operator!=(const CharChoice& other) const {
        return !(*this == other);
    }

private:
    constexpr CharChoice(Mode mode, char value) : mode_(mode), value_(value) {}

    Mode mode_ = Mode::RANDOM;
    char value_ = '\0';
};

// -----------------------------------------------------------------------------
// Name lookups (used by the config loader and log messages)
// -----------------------------------------------------------------------------

inline const char* to_string(CaseTransform transform) {
    switch (transform) {
        case CaseTransform::NONE:       return "none";
        case CaseTransform::UPPER:      return "upper";
        case CaseTransform::LOWER:      return "lower";
        case CaseTransform::CAPITALIZE: return "capitalize";
        case CaseTransform::INVERT:     return "invert";
        case CaseTransform::ALTERNATE:  return "alternate";
        case CaseTransform::RANDOM:     return "random";
        default: return "unknown";
    }
}

inline const char* to_string(PaddingType type) {
    switch (type) {
        case PaddingType::NONE:     return "none";
        case PaddingType::FIXED:    return "fixed";
        case PaddingType::ADAPTIVE: return "adaptive";
        default: return "unknown";
    }
}

}  // namespace xkpass
