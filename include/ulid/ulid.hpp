#pragma once

#include <ulid/codec.hpp>
#include <chrono>
#include <string>

namespace ulid {

// 128-bit identifier: 48-bit big-endian millisecond timestamp followed by
// 80 bits of randomness. Ordering is byte-wise, which is also time order.
struct Ulid {
    Bytes bytes{};

    static Ulid nil();
    static Result<Ulid> from_bytes(const uint8_t* data, size_t len);
    static Result<Ulid> from_bytes(const std::string& raw);
    static Result<Ulid> parse(const std::string& text);
    static Result<Ulid> from_hex(const std::string& hex);

    std::string to_string() const;
    std::string to_hex() const;
    // Raw 16 bytes, e.g. for a BLOB column
    std::string to_binary() const;

    uint64_t timestamp() const;
    std::chrono::system_clock::time_point time_point() const;
    bool is_nil() const;

    bool operator==(const Ulid& other) const;
    bool operator!=(const Ulid& other) const;
    bool operator<(const Ulid& other) const;
    bool operator<=(const Ulid& other) const;
    bool operator>(const Ulid& other) const;
    bool operator>=(const Ulid& other) const;
};

} // namespace ulid
