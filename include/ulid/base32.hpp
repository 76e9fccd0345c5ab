#pragma once

#include <cstdint>

namespace ulid::base32 {

// Crockford Base32: digits and uppercase letters without I, L, O, U.
// Symbol order matches value order, so text sorts like the 128-bit value.
inline constexpr char ALPHABET[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
inline constexpr int ALPHABET_SIZE = 32;

// decode_symbol() result for bytes outside the alphabet
inline constexpr uint8_t INVALID = 0xFF;

// value must be in [0, 31]; higher bits are masked off.
char encode_symbol(uint8_t value);

// Returns the 5-bit value of c, or INVALID.
uint8_t decode_symbol(char c);

bool is_symbol(char c);

} // namespace ulid::base32
