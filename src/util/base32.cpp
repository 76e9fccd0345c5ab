#include <ulid/base32.hpp>

namespace ulid::base32 {

// Indexed by byte value. Only the 32 uppercase alphabet characters map to a
// value; lowercase and the excluded letters are INVALID.
static constexpr uint8_t X = INVALID;
static constexpr uint8_t DECODE_TABLE[256] = {
    // 0x00-0x2F: control characters, space, punctuation
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    // 0x30-0x3F: '0'-'9'
    0, 1, 2, 3, 4, 5, 6, 7, 8, 9, X, X, X, X, X, X,
    // 0x40-0x4F: '@' 'A'-'O'   (I at 0x49, L at 0x4C, O at 0x4F)
    X, 10, 11, 12, 13, 14, 15, 16, 17, X, 18, 19, X, 20, 21, X,
    // 0x50-0x5F: 'P'-'Z' ...   (U at 0x55)
    22, 23, 24, 25, 26, X, 27, 28, 29, 30, 31, X, X, X, X, X,
    // 0x60-0xFF: lowercase and non-ASCII
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
    X, X, X, X, X, X, X, X, X, X, X, X, X, X, X, X,
};

char encode_symbol(uint8_t value) {
    return ALPHABET[value & 0x1F];
}

uint8_t decode_symbol(char c) {
    return DECODE_TABLE[static_cast<unsigned char>(c)];
}

bool is_symbol(char c) {
    return decode_symbol(c) != INVALID;
}

} // namespace ulid::base32
