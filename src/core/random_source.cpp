/**
 * Random Source Implementation
 */

#include "random_source.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <limits>
#include <string>

namespace xkpass {

uint64_t SecureRandomSource::next_u64() {
    unsigned char bytes[sizeof(uint64_t)];
    if (RAND_bytes(bytes, static_cast<int>(sizeof(bytes))) != 1) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        throw RandomSourceError(std::string("RAND_bytes failed: ") + buf);
    }

    uint64_t value = 0;
    for (unsigned char b : bytes) {
        value = (value << 8) | b;
    }
    return value;
}

size_t SecureRandomSource::next_index(size_t bound) {
    if (bound <= 1) return 0;

    std::lock_guard<std::mutex> lock(mutex_);

    // Reject the tail that would bias the modulo
    const uint64_t range = static_cast<uint64_t>(bound);
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
                           (std::numeric_limits<uint64_t>::max() % range);
    uint64_t value;
    do {
        value = next_u64();
    } while (value >= limit);

    return static_cast<size_t>(value % range);
}

std::shared_ptr<RandomSource> make_default_random_source() {
    return std::make_shared<SecureRandomSource>();
}

}  // namespace xkpass
