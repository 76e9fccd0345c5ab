#include <ulid/codec.hpp>
#include <ulid/base32.hpp>

namespace ulid {

// ---- 128-bit helpers ----
// The 16 bytes are handled as one big-endian 128-bit integer split into two
// 64-bit halves. Symbol i (0..25) covers the 5 bits starting at bit
// 5 * (25 - i) counted from the least significant end; for i == 0 only the
// low 3 of those 5 bits exist.

struct U128 {
    uint64_t hi = 0;
    uint64_t lo = 0;
};

static U128 load_be(const uint8_t* p) {
    U128 v;
    for (int i = 0; i < 8; ++i) {
        v.hi = (v.hi << 8) | p[i];
        v.lo = (v.lo << 8) | p[8 + i];
    }
    return v;
}

static Bytes store_be(const U128& v) {
    Bytes out;
    for (int i = 0; i < 8; ++i) {
        out[7 - i] = static_cast<uint8_t>(v.hi >> (8 * i));
        out[15 - i] = static_cast<uint8_t>(v.lo >> (8 * i));
    }
    return out;
}

static uint8_t extract5(const U128& v, unsigned shift) {
    uint64_t bits;
    if (shift >= 64) {
        bits = v.hi >> (shift - 64);
    } else if (shift + 5 <= 64) {
        bits = v.lo >> shift;
    } else {
        // field straddles the two halves
        bits = (v.lo >> shift) | (v.hi << (64 - shift));
    }
    return static_cast<uint8_t>(bits & 0x1F);
}

static void shift_in5(U128& v, uint8_t value) {
    v.hi = (v.hi << 5) | (v.lo >> 59);
    v.lo = (v.lo << 5) | value;
}

static std::string encode_raw(const uint8_t* data) {
    U128 v = load_be(data);
    std::string out(TEXT_LENGTH, '0');
    for (size_t i = 0; i < TEXT_LENGTH; ++i) {
        unsigned shift = static_cast<unsigned>(5 * (TEXT_LENGTH - 1 - i));
        out[i] = base32::encode_symbol(extract5(v, shift));
    }
    return out;
}

// ---- encode ----

Result<std::string> encode(const uint8_t* data, size_t len) {
    if (len != BINARY_LENGTH) {
        return UlidError(UlidError::InvalidLength,
            "binary ULID must be 16 bytes",
            "Got " + std::to_string(len) + " bytes");
    }
    return Result<std::string>::ok(encode_raw(data));
}

Result<std::string> encode(const std::string& bytes) {
    return encode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

std::string encode_fixed(const Bytes& bytes) {
    return encode_raw(bytes.data());
}

// ---- decode ----

Result<Bytes> decode(const char* text, size_t len) {
    if (len != TEXT_LENGTH) {
        return UlidError(UlidError::InvalidLength,
            "ULID string must be 26 characters",
            "Got " + std::to_string(len) + " characters");
    }

    U128 v;
    for (size_t i = 0; i < TEXT_LENGTH; ++i) {
        uint8_t sym = base32::decode_symbol(text[i]);
        if (sym == base32::INVALID) {
            return UlidError(UlidError::InvalidCharacter,
                "ULID string contains invalid character",
                std::string("Invalid char '") + text[i] + "' at position " + std::to_string(i));
        }
        // The first symbol only has room for the top 3 bits
        if (i == 0 && sym > 7) {
            return UlidError(UlidError::InvalidCharacter,
                "ULID string overflows 128 bits",
                std::string("First character must be 0-7, got '") + text[0] + "'");
        }
        shift_in5(v, sym);
    }
    return Result<Bytes>::ok(store_be(v));
}

Result<Bytes> decode(const std::string& text) {
    return decode(text.data(), text.size());
}

// ---- valid ----

bool valid(const char* text, size_t len) noexcept {
    if (text == nullptr || len != TEXT_LENGTH) return false;
    if (base32::decode_symbol(text[0]) > 7) return false;
    for (size_t i = 1; i < TEXT_LENGTH; ++i) {
        if (!base32::is_symbol(text[i])) return false;
    }
    return true;
}

bool valid(const std::string& text) noexcept {
    return valid(text.data(), text.size());
}

} // namespace ulid
