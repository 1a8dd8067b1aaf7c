#pragma once

#include <sortid/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace sortid {

// Unsigned 128-bit integer held as two 64-bit limbs, most significant first.
// Shifts, masks and comparisons are done limb by limb so the value never
// depends on a compiler-specific __int128.
struct Uint128 {
    uint64_t hi = 0;
    uint64_t lo = 0;

    Uint128() = default;
    Uint128(uint64_t high, uint64_t low) : hi(high), lo(low) {}

    static Uint128 from_u64(uint64_t v);
    static Uint128 max();

    // Low `bits` bits set; bits >= 128 yields max()
    static Uint128 low_mask(unsigned bits);

    Uint128 shl(unsigned n) const;
    Uint128 shr(unsigned n) const;

    // Wrapping add of one; the caller checks for all-ones beforehand when
    // wrap-around matters
    Uint128 plus_one() const;

    bool is_zero() const;

    std::array<uint8_t, 16> to_be_bytes() const;
    static Uint128 from_be_bytes(const std::array<uint8_t, 16>& bytes);

    // 32 uppercase hex digits, zero padded
    std::string to_hex() const;

    std::string to_decimal() const;
    // Strict decimal: 1..39 ASCII digits, no sign, whitespace or leading zero.
    // Errors: InvalidLength, InvalidCharacter, Overflow (value >= 2^128)
    static Result<Uint128> parse_decimal(const std::string& s);

    Uint128 operator|(const Uint128& o) const { return Uint128(hi | o.hi, lo | o.lo); }
    Uint128 operator&(const Uint128& o) const { return Uint128(hi & o.hi, lo & o.lo); }

    bool operator==(const Uint128& o) const { return hi == o.hi && lo == o.lo; }
    bool operator!=(const Uint128& o) const { return !(*this == o); }
    bool operator<(const Uint128& o) const { return hi < o.hi || (hi == o.hi && lo < o.lo); }
    bool operator<=(const Uint128& o) const { return !(o < *this); }
    bool operator>(const Uint128& o) const { return o < *this; }
    bool operator>=(const Uint128& o) const { return !(*this < o); }
};

} // namespace sortid
