#pragma once

#include <sortid/clock.hpp>
#include <sortid/random.hpp>
#include <sortid/result.hpp>
#include <sortid/ulid.hpp>
#include <optional>

namespace sortid {

// Stateless generation from the current wall clock and 80 random bits.
// Two calls in the same millisecond are ordered only by their random payload.
Result<Ulid> generate(RandomSource& rng);

// As generate(), with a caller-supplied time. Times before the Unix epoch
// clamp to timestamp 0.
Result<Ulid> generate_at(clock::TimePoint tp, RandomSource& rng);

// Produces strictly increasing identifiers while the clock does not move
// backward. Within one millisecond each result is the previous one with its
// randomness incremented by one.
//
// Not synchronized: serialize calls on one instance, or keep one instance per
// thread. The warnings it logs are safe to emit from several threads.
class MonotonicGenerator {
public:
    MonotonicGenerator() = default;

    Result<Ulid> generate(RandomSource& rng);
    Result<Ulid> generate_at(clock::TimePoint tp, RandomSource& rng);

    // Run the state machine against an already computed timestamp
    Result<Ulid> generate_from_ms(uint64_t now_ms, RandomSource& rng);

    const std::optional<Ulid>& previous() const { return previous_; }
    void reset() { previous_.reset(); }

private:
    std::optional<Ulid> previous_;
};

} // namespace sortid
