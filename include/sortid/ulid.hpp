#pragma once

#include <sortid/base32.hpp>
#include <sortid/clock.hpp>
#include <sortid/result.hpp>
#include <sortid/uint128.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace sortid {

// Universally Unique Lexicographically Sortable Identifier.
//
// 128 bits, most significant first:
//   [ 48-bit Unix timestamp in ms | 80-bit random payload ]
// Numeric order equals (timestamp, randomness) order equals the order of the
// canonical 26-character text. Values are immutable; the default value is
// the nil identifier (all zero).
class Ulid {
public:
    static constexpr unsigned TIME_BITS = 48;
    static constexpr unsigned RAND_BITS = 80;
    static constexpr uint64_t MAX_TIMESTAMP = (uint64_t(1) << TIME_BITS) - 1;

    Ulid() = default;

    static Ulid nil() { return Ulid(); }

    // Range error if timestamp_ms needs more than 48 bits. Randomness bits
    // above bit 79 are discarded.
    static Result<Ulid> from_parts(uint64_t timestamp_ms, const Uint128& randomness);

    static Ulid from_u128(const Uint128& value) { return Ulid(value); }
    static Ulid from_halves(uint64_t msb, uint64_t lsb) { return Ulid(Uint128(msb, lsb)); }
    static Ulid from_bytes(const std::array<uint8_t, 16>& bytes);

    // Decode the canonical text form
    static Result<Ulid> parse(const std::string& text,
                              base32::CaseMode mode = base32::CaseMode::Insensitive);

    uint64_t timestamp_ms() const;
    Uint128 randomness() const;

    const Uint128& to_u128() const { return value_; }
    uint64_t msb() const { return value_.hi; }
    uint64_t lsb() const { return value_.lo; }
    std::array<uint8_t, 16> to_bytes() const { return value_.to_be_bytes(); }

    bool is_nil() const { return value_.is_zero(); }

    // Same timestamp, randomness + 1. Empty when the randomness is already
    // all ones; never carries into the timestamp.
    std::optional<Ulid> increment() const;

    clock::MillisTimePoint datetime() const;

    // Canonical 26-character uppercase text
    std::string to_string() const;

    bool operator==(const Ulid& o) const { return value_ == o.value_; }
    bool operator!=(const Ulid& o) const { return value_ != o.value_; }
    bool operator<(const Ulid& o) const { return value_ < o.value_; }
    bool operator<=(const Ulid& o) const { return value_ <= o.value_; }
    bool operator>(const Ulid& o) const { return value_ > o.value_; }
    bool operator>=(const Ulid& o) const { return value_ >= o.value_; }

private:
    explicit Ulid(const Uint128& value) : value_(value) {}

    Uint128 value_;
};

std::string encode(const Ulid& id);
Result<Ulid> decode(const std::string& text,
                    base32::CaseMode mode = base32::CaseMode::Insensitive);

std::ostream& operator<<(std::ostream& os, const Ulid& id);

} // namespace sortid

namespace std {
template<> struct hash<sortid::Ulid> {
    size_t operator()(const sortid::Ulid& id) const {
        // The low half is random; mix in the timestamp half anyway
        uint64_t h = id.lsb() ^ (id.msb() * 0x9E3779B97F4A7C15ULL);
        return static_cast<size_t>(h);
    }
};
} // namespace std
