#include <catch2/catch.hpp>
#include <ulid/result.hpp>
#include <ulid/generator.hpp>
#include <ulid/ulid.hpp>
#include <string>

using namespace ulid;

namespace {

class ZeroClock : public Clock {
public:
    uint64_t now_ms() override { return 0; }
};

class ZeroRandom : public RandomSource {
public:
    void fill(uint8_t* buf, size_t len) override {
        for (size_t i = 0; i < len; ++i) buf[i] = 0;
    }
};

// Text -> timestamp, short-circuiting on the first decode failure
Result<uint64_t> timestamp_of(const std::string& text) {
    auto u = Ulid::parse(text);
    ULID_TRY(u);
    return Result<uint64_t>::ok(u.value().timestamp());
}

} // namespace

TEST_CASE("ULID_TRY forwards decode errors unchanged", "[result]") {
    auto short_text = timestamp_of("01ARZ3NDEK");
    REQUIRE(short_text.failed_with(UlidError::InvalidLength));
    REQUIRE(short_text.error().hint == "Got 10 characters");

    auto bad_char = timestamp_of("01ARZ3NDEKTSV4RRFFQ69G5FAU");
    REQUIRE(bad_char.failed_with(UlidError::InvalidCharacter));
    REQUIRE(bad_char.error().hint.find("position 25") != std::string::npos);

    auto ok = timestamp_of("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 1469922850259ULL);
}

TEST_CASE("and_then chains decode into encode", "[result]") {
    auto text = decode("01ARYZ6S41ZZZZZZZZZZZZZZZZ").and_then([](Bytes& b) {
        return encode(b.data(), b.size());
    });
    REQUIRE(text.is_ok());
    REQUIRE(text.value() == "01ARYZ6S41ZZZZZZZZZZZZZZZZ");

    bool called = false;
    auto failed = decode(std::string(26, 'I')).and_then([&](Bytes& b) {
        called = true;
        return encode(b.data(), b.size());
    });
    REQUIRE_FALSE(called);
    REQUIRE(failed.failed_with(UlidError::InvalidCharacter));
}

TEST_CASE("map carries TimestampOutOfRange through", "[result]") {
    ZeroClock clock;
    ZeroRandom random;
    Generator gen(clock, random);

    auto text = gen.at_checked(MAX_TIMESTAMP + 1).map([](Ulid& u) { return u.to_string(); });
    REQUIRE(text.failed_with(UlidError::TimestampOutOfRange));
    REQUIRE(text.error().message.find("281474976710656") != std::string::npos);

    auto in_range = gen.at_checked(MAX_TIMESTAMP).map([](Ulid& u) { return u.to_string(); });
    REQUIRE(in_range.value() == "7ZZZZZZZZZ0000000000000000");
}

TEST_CASE("or_else recovers from a length error only", "[result]") {
    auto fallback = [](UlidError& e) {
        if (e.code == UlidError::InvalidLength) return Result<Ulid>::ok(Ulid::nil());
        return Result<Ulid>::err(e);
    };

    auto recovered = Ulid::parse("").or_else(fallback);
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value().is_nil());

    auto still_bad = Ulid::parse(std::string(26, 'U')).or_else(fallback);
    REQUIRE(still_bad.failed_with(UlidError::InvalidCharacter));
}

TEST_CASE("value_or falls back on decode failure", "[result]") {
    Bytes ff;
    ff.fill(0xFF);
    REQUIRE(decode("7ZZZZZZZZZZZZZZZZZZZZZZZZZ").value_or(Bytes{}) == ff);
    REQUIRE(decode("not a ulid").value_or(Bytes{}) == Bytes{});
    REQUIRE(Ulid::from_hex("zz").value_or(Ulid::nil()).is_nil());
}

TEST_CASE("failed_with matches only the held code", "[result]") {
    auto err = decode("0");
    REQUIRE(err.failed_with(UlidError::InvalidLength));
    REQUIRE_FALSE(err.failed_with(UlidError::InvalidCharacter));
    REQUIRE_FALSE(decode("00000000000000000000000000").failed_with(UlidError::InvalidLength));
}

TEST_CASE("Status from ok_status and from an error", "[result]") {
    REQUIRE(ok_status().is_ok());
    Status s = UlidError{UlidError::Duplicate, "id already stored"};
    REQUIRE(s.failed_with(UlidError::Duplicate));
}

TEST_CASE("format() renders codec errors with hint", "[error]") {
    auto r = decode("01ARZ3NDEKTSV4RRFFQ69G5FAL");
    REQUIRE(r.is_err());
    auto formatted = r.error().format();
    REQUIRE(formatted.find("error[InvalidCharacter]: ULID string contains invalid character")
            != std::string::npos);
    REQUIRE(formatted.find("hint: Invalid char 'L' at position 25") != std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("format() includes file and line when set", "[error]") {
    UlidError e{UlidError::Config, "unknown log level 'loud'", "", "config.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("--> config.toml:3") != std::string::npos);
}

TEST_CASE("code_name covers the codec codes", "[error]") {
    REQUIRE(std::string(UlidError::code_name(UlidError::InvalidLength)) == "InvalidLength");
    REQUIRE(std::string(UlidError::code_name(UlidError::InvalidCharacter)) == "InvalidCharacter");
    REQUIRE(std::string(UlidError::code_name(UlidError::TimestampOutOfRange))
            == "TimestampOutOfRange");
    REQUIRE(std::string(UlidError::code_name(UlidError::Duplicate)) == "Duplicate");
}
