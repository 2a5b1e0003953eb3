#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace core {

// Fill |buf| with cryptographically secure random bytes (OpenSSL RAND_bytes).
// Throws std::runtime_error on failure.
void get_random_bytes(std::span<uint8_t> buf);

// Non-throwing variant: returns false when the PRNG could not deliver.
[[nodiscard]] bool try_get_random_bytes(std::span<uint8_t> buf) noexcept;

// Return a single cryptographically secure random 64-bit integer.
uint64_t get_random_uint64();

// Allocates and returns |count| cryptographically secure random bytes.
std::vector<uint8_t> get_random_bytes_vec(size_t count);

// ---------------------------------------------------------------------------
// InsecureRandom -- fast, non-cryptographic PRNG (xoshiro256**)
// ---------------------------------------------------------------------------
// Reproducible operation sequences in tests and jitter. Never for secrets.
class InsecureRandom {
public:
    // A zero seed draws the state from the cryptographic RNG.
    explicit InsecureRandom(uint64_t seed = 0);

    uint64_t next();

    // Uniform in [0, max). Throws std::invalid_argument if max == 0.
    uint64_t range(uint64_t max);

private:
    void seed_from(uint64_t value);

    std::array<uint64_t, 4> state_{};
};

}  // namespace core
