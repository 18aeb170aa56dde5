/**
 * xkpass Errors
 *
 * Exception hierarchy for configuration, word source and generation failures.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace xkpass {

class PassphraseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A configuration field was set to an out-of-range value.
 * The field keeps its previous value.
 */
class InvalidConfiguration : public PassphraseError {
public:
    using PassphraseError::PassphraseError;
};

/**
 * Length filtering removed every candidate word.
 */
class EmptyCandidateSet : public PassphraseError {
public:
    using PassphraseError::PassphraseError;
};

/**
 * The word source could not be opened or read.
 */
class WordSourceUnavailable : public PassphraseError {
public:
    using PassphraseError::PassphraseError;
};

class RandomSourceError : public PassphraseError {
public:
    using PassphraseError::PassphraseError;
};

}  // namespace xkpass
