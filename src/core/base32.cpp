#include <sortid/base32.hpp>
#include <array>

namespace sortid::base32 {

const char ALPHABET[33] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// ---- Lookup table: byte -> symbol value, -1 for bytes outside the alphabet ----

static const std::array<int8_t, 256>& upper_table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t;
        t.fill(-1);
        for (int i = 0; i < 32; ++i) {
            t[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

int symbol_value(char c, CaseMode mode) {
    if (mode == CaseMode::Insensitive && c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }
    return upper_table()[static_cast<unsigned char>(c)];
}

// ---- Encode ----

void encode_to(const Uint128& value, char (&out)[ENCODED_LEN]) {
    for (size_t i = 0; i < ENCODED_LEN; ++i) {
        unsigned shift = static_cast<unsigned>(5 * (ENCODED_LEN - 1 - i));
        out[i] = ALPHABET[value.shr(shift).lo & 0x1F];
    }
}

std::string encode(const Uint128& value) {
    char buf[ENCODED_LEN];
    encode_to(value, buf);
    return std::string(buf, ENCODED_LEN);
}

// ---- Decode ----

Result<Uint128> decode(const char* text, size_t len, CaseMode mode) {
    if (len != ENCODED_LEN) {
        return SortidError(SortidError::InvalidLength,
            "ULID text must be 26 characters",
            "Got " + std::to_string(len) + " characters");
    }

    uint8_t symbols[ENCODED_LEN];
    for (size_t i = 0; i < ENCODED_LEN; ++i) {
        int v = symbol_value(text[i], mode);
        if (v < 0) {
            std::string hint = std::string("Invalid char '") + text[i] +
                "' at position " + std::to_string(i);
            if (mode == CaseMode::UpperOnly && text[i] >= 'a' && text[i] <= 'z') {
                hint += " (lowercase input is rejected)";
            }
            return SortidError(SortidError::InvalidCharacter,
                "ULID text contains a character outside the Crockford base32 alphabet",
                hint);
        }
        symbols[i] = static_cast<uint8_t>(v);
    }

    // 26 symbols carry 130 bits; the top two must be zero
    if (symbols[0] > 7) {
        return SortidError(SortidError::Overflow,
            "ULID text encodes a value larger than 128 bits",
            "The first character must be between '0' and '7'");
    }

    Uint128 value;
    for (uint8_t s : symbols) {
        value = value.shl(5) | Uint128::from_u64(s);
    }
    return Result<Uint128>::ok(value);
}

Result<Uint128> decode(const std::string& text, CaseMode mode) {
    return decode(text.data(), text.size(), mode);
}

} // namespace sortid::base32
