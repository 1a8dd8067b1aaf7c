#pragma once

#include <sortid/result.hpp>
#include <sortid/uint128.hpp>
#include <cstddef>
#include <string>

namespace sortid::base32 {

// Length of the canonical text form
constexpr size_t ENCODED_LEN = 26;

// Crockford alphabet: digits and uppercase letters without I, L, O, U
extern const char ALPHABET[33];

// How decode treats lowercase letters
enum class CaseMode {
    Insensitive,  // a-z are read as their uppercase symbols
    UpperOnly     // any lowercase letter is an InvalidCharacter
};

// Write 26 symbols, most significant 5-bit group first. The first symbol
// carries only the top 3 bits of the value, so it is always 0-7.
void encode_to(const Uint128& value, char (&out)[ENCODED_LEN]);
std::string encode(const Uint128& value);

// Symbol value of `c` under `mode`, or -1 if it is not in the alphabet
int symbol_value(char c, CaseMode mode);

// Errors: InvalidLength (not 26 chars), InvalidCharacter (symbol outside the
// alphabet, checked for every position first), Overflow (first symbol above
// '7', which would need more than 128 bits)
Result<Uint128> decode(const char* text, size_t len, CaseMode mode = CaseMode::Insensitive);
Result<Uint128> decode(const std::string& text, CaseMode mode = CaseMode::Insensitive);

} // namespace sortid::base32
