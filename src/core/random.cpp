#include "core/random.h"

#include <bit>
#include <stdexcept>

#include <openssl/rand.h>

namespace core {

// ---------------------------------------------------------------------------
// Cryptographic helpers
// ---------------------------------------------------------------------------

bool try_get_random_bytes(std::span<uint8_t> buf) noexcept {
    if (buf.empty()) {
        return true;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure.
    return RAND_bytes(buf.data(), static_cast<int>(buf.size())) == 1;
}

void get_random_bytes(std::span<uint8_t> buf) {
    if (!try_get_random_bytes(buf)) {
        throw std::runtime_error("core::get_random_bytes: RAND_bytes failed");
    }
}

uint64_t get_random_uint64() {
    uint64_t value = 0;
    get_random_bytes(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(&value), sizeof(value)));
    return value;
}

std::vector<uint8_t> get_random_bytes_vec(size_t count) {
    std::vector<uint8_t> result(count);
    get_random_bytes(result);
    return result;
}

// ---------------------------------------------------------------------------
// InsecureRandom
// ---------------------------------------------------------------------------

static uint64_t splitmix64(uint64_t& state) {
    state += 0x9E3779B97F4A7C15ULL;
    uint64_t z = state;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

void InsecureRandom::seed_from(uint64_t value) {
    uint64_t sm = value;
    for (auto& s : state_) {
        s = splitmix64(sm);
    }
}

InsecureRandom::InsecureRandom(uint64_t seed) {
    seed_from(seed == 0 ? get_random_uint64() | 1 : seed);
}

uint64_t InsecureRandom::next() {
    // xoshiro256** -- Blackman & Vigna 2018.
    const uint64_t result = std::rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;
    state_[3] = std::rotl(state_[3], 45);

    return result;
}

uint64_t InsecureRandom::range(uint64_t max) {
    if (max == 0) {
        throw std::invalid_argument("InsecureRandom::range: max must be > 0");
    }
    // Rejection sampling against modulo bias.
    const uint64_t threshold = (-max) % max;
    for (;;) {
        const uint64_t value = next();
        if (value >= threshold) {
            return value % max;
        }
    }
}

}  // namespace core
