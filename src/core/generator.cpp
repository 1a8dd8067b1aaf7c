#include <sortid/generator.hpp>
#include <sortid/log.hpp>

namespace sortid {

static Result<Ulid> fresh_ulid(uint64_t now_ms, RandomSource& rng) {
    return Ulid::from_parts(now_ms, rng.random_bits(Ulid::RAND_BITS));
}

Result<Ulid> generate(RandomSource& rng) {
    SORTID_TRY_ASSIGN(now_ms, clock::now_ms());
    return fresh_ulid(now_ms, rng);
}

Result<Ulid> generate_at(clock::TimePoint tp, RandomSource& rng) {
    SORTID_TRY_ASSIGN(now_ms, clock::to_unix_ms(tp));
    return fresh_ulid(now_ms, rng);
}

// ---- MonotonicGenerator ----

Result<Ulid> MonotonicGenerator::generate(RandomSource& rng) {
    SORTID_TRY_ASSIGN(now_ms, clock::now_ms());
    return generate_from_ms(now_ms, rng);
}

Result<Ulid> MonotonicGenerator::generate_at(clock::TimePoint tp, RandomSource& rng) {
    SORTID_TRY_ASSIGN(now_ms, clock::to_unix_ms(tp));
    return generate_from_ms(now_ms, rng);
}

Result<Ulid> MonotonicGenerator::generate_from_ms(uint64_t now_ms, RandomSource& rng) {
    if (previous_.has_value() && now_ms == previous_->timestamp_ms()) {
        auto next = previous_->increment();
        if (!next.has_value()) {
            log::warn("monotonic generator exhausted the random space for timestamp %llu",
                      static_cast<unsigned long long>(now_ms));
            return SortidError(SortidError::MonotonicOverflow,
                "ULID random bits would overflow within one millisecond",
                "retry once the clock reaches the next millisecond");
        }
        previous_ = *next;
        return Result<Ulid>::ok(*next);
    }

    if (previous_.has_value() && now_ms < previous_->timestamp_ms()) {
        log::warn("clock moved backward by %llu ms; ordering with the previous ULID is not preserved",
                  static_cast<unsigned long long>(previous_->timestamp_ms() - now_ms));
    }

    SORTID_TRY_ASSIGN(next, fresh_ulid(now_ms, rng));
    previous_ = next;
    return Result<Ulid>::ok(next);
}

} // namespace sortid
