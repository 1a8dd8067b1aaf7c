#include <sortid/uint128.hpp>

namespace sortid {

Uint128 Uint128::from_u64(uint64_t v) {
    return Uint128(0, v);
}

Uint128 Uint128::max() {
    return Uint128(~uint64_t(0), ~uint64_t(0));
}

Uint128 Uint128::low_mask(unsigned bits) {
    if (bits >= 128) return max();
    if (bits == 0) return Uint128();
    if (bits >= 64) {
        uint64_t high = (bits == 64) ? 0 : (~uint64_t(0) >> (128 - bits));
        return Uint128(high, ~uint64_t(0));
    }
    return Uint128(0, ~uint64_t(0) >> (64 - bits));
}

Uint128 Uint128::shl(unsigned n) const {
    if (n == 0) return *this;
    if (n >= 128) return Uint128();
    if (n >= 64) return Uint128(lo << (n - 64), 0);
    return Uint128((hi << n) | (lo >> (64 - n)), lo << n);
}

Uint128 Uint128::shr(unsigned n) const {
    if (n == 0) return *this;
    if (n >= 128) return Uint128();
    if (n >= 64) return Uint128(0, hi >> (n - 64));
    return Uint128(hi >> n, (lo >> n) | (hi << (64 - n)));
}

Uint128 Uint128::plus_one() const {
    uint64_t low = lo + 1;
    uint64_t high = (low == 0) ? hi + 1 : hi;
    return Uint128(high, low);
}

bool Uint128::is_zero() const {
    return hi == 0 && lo == 0;
}

std::array<uint8_t, 16> Uint128::to_be_bytes() const {
    std::array<uint8_t, 16> out{};
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
        out[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }
    return out;
}

Uint128 Uint128::from_be_bytes(const std::array<uint8_t, 16>& bytes) {
    uint64_t high = 0;
    uint64_t low = 0;
    for (int i = 0; i < 8; ++i) {
        high = (high << 8) | bytes[i];
        low = (low << 8) | bytes[8 + i];
    }
    return Uint128(high, low);
}

static const char hex_chars[] = "0123456789ABCDEF";

std::string Uint128::to_hex() const {
    auto bytes = to_be_bytes();
    std::string out;
    out.reserve(32);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

// ---- Decimal conversion ----
// The value is processed as a 16-byte big-endian number, one byte limb at a
// time, so intermediate products always fit in 32 bits.

// Divide a big-endian byte array (in-place) by 10, return the remainder.
static uint8_t div_by_10(uint8_t* num, size_t len) {
    uint32_t carry = 0;
    for (size_t i = 0; i < len; ++i) {
        uint32_t cur = carry * 256 + num[i];
        num[i] = static_cast<uint8_t>(cur / 10);
        carry = cur % 10;
    }
    return static_cast<uint8_t>(carry);
}

// Multiply a big-endian byte array (in-place) by 10 and add a digit.
// Returns the carry out of the top byte; non-zero means the result overflowed.
static uint32_t mul_add_10(uint8_t* num, size_t len, uint8_t digit) {
    uint32_t carry = digit;
    for (int i = static_cast<int>(len) - 1; i >= 0; --i) {
        uint32_t cur = static_cast<uint32_t>(num[i]) * 10 + carry;
        num[i] = static_cast<uint8_t>(cur & 0xFF);
        carry = cur >> 8;
    }
    return carry;
}

std::string Uint128::to_decimal() const {
    if (is_zero()) return "0";

    auto work = to_be_bytes();
    // 2^128 - 1 has 39 decimal digits
    char buf[39];
    int pos = 39;
    bool remaining = true;
    while (remaining) {
        buf[--pos] = static_cast<char>('0' + div_by_10(work.data(), work.size()));
        remaining = false;
        for (uint8_t b : work) {
            if (b != 0) { remaining = true; break; }
        }
    }
    return std::string(buf + pos, 39 - pos);
}

Result<Uint128> Uint128::parse_decimal(const std::string& s) {
    if (s.empty() || s.size() > 39) {
        return SortidError(SortidError::InvalidLength,
            "decimal 128-bit value must have 1 to 39 digits",
            "Got " + std::to_string(s.size()) + " characters");
    }

    if (s.size() > 1 && s[0] == '0') {
        return SortidError(SortidError::InvalidCharacter,
            "decimal 128-bit value has a leading zero",
            "Invalid char '0' at position 0");
    }

    std::array<uint8_t, 16> work{};
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c < '0' || c > '9') {
            return SortidError(SortidError::InvalidCharacter,
                "decimal 128-bit value contains a non-digit",
                std::string("Invalid char '") + c + "' at position " + std::to_string(i));
        }
        if (mul_add_10(work.data(), work.size(), static_cast<uint8_t>(c - '0')) != 0) {
            return SortidError(SortidError::Overflow,
                "decimal value does not fit in 128 bits",
                "Maximum is 340282366920938463463374607431768211455");
        }
    }
    return Result<Uint128>::ok(from_be_bytes(work));
}

} // namespace sortid
