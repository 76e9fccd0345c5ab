#include <ulid/field.hpp>
#include <ulid/codec.hpp>
#include <ulid/generator.hpp>

namespace ulid::field {

const char* storage_type() {
    return "uuid";
}

Result<std::string> cast(const std::string& value) {
    ULID_TRY(decode(value));
    return Result<std::string>::ok(value);
}

Result<std::string> dump(const std::string& text) {
    auto decoded = decode(text);
    if (decoded.is_err()) {
        return std::move(decoded).error();
    }
    const Bytes& b = decoded.value();
    return Result<std::string>::ok(
        std::string(reinterpret_cast<const char*>(b.data()), b.size()));
}

Result<std::string> load(const std::string& raw) {
    return encode(raw);
}

std::string autogenerate() {
    return generate();
}

} // namespace ulid::field
