#pragma once

#include <ulid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulid {

constexpr size_t BINARY_LENGTH = 16;
constexpr size_t TEXT_LENGTH = 26;
// Leading characters of the text form that cover the 48-bit timestamp
constexpr size_t TIMESTAMP_TEXT_LENGTH = 10;
constexpr uint64_t MAX_TIMESTAMP = (uint64_t(1) << 48) - 1;

using Bytes = std::array<uint8_t, BINARY_LENGTH>;

// Binary -> text. Fails with InvalidLength unless len == 16.
Result<std::string> encode(const uint8_t* data, size_t len);
Result<std::string> encode(const std::string& bytes);

// Binary -> text for an already fixed-size buffer; cannot fail.
std::string encode_fixed(const Bytes& bytes);

// Text -> binary. InvalidLength unless 26 characters, InvalidCharacter for
// any byte outside the alphabet or a first character above '7'.
Result<Bytes> decode(const char* text, size_t len);
Result<Bytes> decode(const std::string& text);

// True iff decode() would succeed. Never throws, never allocates.
bool valid(const char* text, size_t len) noexcept;
bool valid(const std::string& text) noexcept;

} // namespace ulid
