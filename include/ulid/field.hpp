#pragma once

#include <ulid/result.hpp>
#include <string>

// Adapter for host persistence layers that keep ULIDs in a 16-byte column
// and hand them to application code as 26-character text.
namespace ulid::field {

// Column type the binary form maps onto
const char* storage_type();

// Accepts a valid 26-character ULID text unchanged.
Result<std::string> cast(const std::string& value);

// Text -> 16 raw bytes for storage.
Result<std::string> dump(const std::string& text);

// 16 raw bytes from storage -> text.
Result<std::string> load(const std::string& raw);

std::string autogenerate();

} // namespace ulid::field
