#include <ulid/ulid.hpp>
#include <algorithm>
#include <cstring>

namespace ulid {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- Construction ----

Ulid Ulid::nil() {
    return Ulid{};
}

Result<Ulid> Ulid::from_bytes(const uint8_t* data, size_t len) {
    if (len != BINARY_LENGTH) {
        return UlidError(UlidError::InvalidLength,
            "binary ULID must be 16 bytes",
            "Got " + std::to_string(len) + " bytes");
    }
    Ulid u;
    std::memcpy(u.bytes.data(), data, BINARY_LENGTH);
    return Result<Ulid>::ok(u);
}

Result<Ulid> Ulid::from_bytes(const std::string& raw) {
    return from_bytes(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

Result<Ulid> Ulid::parse(const std::string& text) {
    return decode(text).map([](Bytes& b) { return Ulid{b}; });
}

Result<Ulid> Ulid::from_hex(const std::string& hex) {
    if (hex.size() != 2 * BINARY_LENGTH) {
        return UlidError(UlidError::InvalidLength,
            "hex ULID must be 32 characters",
            "Got " + std::to_string(hex.size()) + " characters");
    }
    Ulid u;
    for (size_t i = 0; i < BINARY_LENGTH; ++i) {
        int hi = hex_val(hex[2 * i]);
        int lo = hex_val(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return UlidError(UlidError::InvalidCharacter,
                "hex ULID contains invalid hex character",
                "Invalid char at position " + std::to_string(hi < 0 ? 2 * i : 2 * i + 1));
        }
        u.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<Ulid>::ok(u);
}

// ---- Conversion ----

std::string Ulid::to_string() const {
    return encode_fixed(bytes);
}

std::string Ulid::to_hex() const {
    std::string out;
    out.reserve(2 * BINARY_LENGTH);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

std::string Ulid::to_binary() const {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

uint64_t Ulid::timestamp() const {
    uint64_t ts = 0;
    for (int i = 0; i < 6; ++i) {
        ts = (ts << 8) | bytes[i];
    }
    return ts;
}

std::chrono::system_clock::time_point Ulid::time_point() const {
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(static_cast<int64_t>(timestamp())));
}

bool Ulid::is_nil() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

// ---- Comparison ----

bool Ulid::operator==(const Ulid& other) const { return bytes == other.bytes; }
bool Ulid::operator!=(const Ulid& other) const { return bytes != other.bytes; }
bool Ulid::operator<(const Ulid& other) const { return bytes < other.bytes; }
bool Ulid::operator<=(const Ulid& other) const { return bytes <= other.bytes; }
bool Ulid::operator>(const Ulid& other) const { return bytes > other.bytes; }
bool Ulid::operator>=(const Ulid& other) const { return bytes >= other.bytes; }

} // namespace ulid
