#pragma once

#include <sortid/uint128.hpp>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <random>
#include <string>

namespace sortid {

// Source of random bits. Generation functions take one by reference so the
// caller decides which entropy backs an identifier and tests can inject fixed
// bytes. Implementations are not required to be thread-safe.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Fill `len` bytes at `buf`
    virtual void fill(uint8_t* buf, size_t len) = 0;

    uint64_t next_u64();

    // Uniform value with only the low `bits` bits possibly set (bits <= 128).
    // Bytes are consumed big-endian, so the first byte drawn is the most
    // significant byte of the result.
    Uint128 random_bits(unsigned bits);
};

// Operating-system entropy from /dev/urandom. When the device is missing or
// returns a short read, falls back to std::mt19937_64 seeded from
// std::random_device.
class SystemRandom : public RandomSource {
public:
    SystemRandom();

    void fill(uint8_t* buf, size_t len) override;

private:
    std::ifstream urandom_;
    std::mt19937_64 fallback_;
    bool fallback_seeded_ = false;
    bool fallback_active_ = false;
};

// Deterministic std::mt19937_64 stream. Not suitable where identifiers must be
// unpredictable.
class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(uint64_t seed);

    void fill(uint8_t* buf, size_t len) override;

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

struct RandomConfig;

// Build the source named by the configuration ("system" or "seeded")
std::unique_ptr<RandomSource> make_random_source(const RandomConfig& cfg);

} // namespace sortid
