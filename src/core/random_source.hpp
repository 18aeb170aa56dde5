/**
 * xkpass Random Sources
 *
 * Uniform random provider injected into the passphrase generator.
 * SecureRandomSource (OpenSSL RAND_bytes) is the default; MersenneRandomSource
 * gives reproducible sequences for a given seed.
 */

#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace xkpass {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * Uniform index in [0, bound). bound must be non-zero.
     */
    virtual size_t next_index(size_t bound) = 0;

    bool coin_flip() { return next_index(2) == 1; }

    char next_digit() { return static_cast<char>('0' + next_index(10)); }
};

/**
 * Cryptographically secure source backed by OpenSSL's RAND_bytes.
 * Uses rejection sampling so every index is equally likely.
 *
 * @throws RandomSourceError if OpenSSL cannot supply random bytes
 */
class SecureRandomSource : public RandomSource {
public:
    size_t next_index(size_t bound) override;

private:
    uint64_t next_u64();

    std::mutex mutex_;
};

/**
 * Seeded std::mt19937 source.
 */
class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource() : rng_(std::random_device{}()) {}
    explicit MersenneRandomSource(uint32_t seed) : rng_(seed) {}

    size_t next_index(size_t bound) override {
        if (bound <= 1) return 0;

        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<size_t> dist(0, bound - 1);
        return dist(rng_);
    }

private:
    std::mt19937 rng_;
    std::mutex mutex_;
};

std::shared_ptr<RandomSource> make_default_random_source();

}  // namespace xkpass
