#include <catch2/catch.hpp>
#include <ulid/generator.hpp>
#include <set>
#include <string>

using namespace ulid;

namespace {

class FixedClock : public Clock {
public:
    explicit FixedClock(uint64_t ms) : ms_(ms) {}
    uint64_t now_ms() override { return ms_; }
    void advance(uint64_t delta) { ms_ += delta; }
private:
    uint64_t ms_;
};

// Fills with a constant byte
class FixedRandom : public RandomSource {
public:
    explicit FixedRandom(uint8_t byte) : byte_(byte) {}
    void fill(uint8_t* buf, size_t len) override {
        for (size_t i = 0; i < len; ++i) buf[i] = byte_;
        ++calls;
    }
    int calls = 0;
private:
    uint8_t byte_;
};

// 1, 2, 3, ... across calls
class CountingRandom : public RandomSource {
public:
    void fill(uint8_t* buf, size_t len) override {
        for (size_t i = 0; i < len; ++i) buf[i] = ++next_;
    }
private:
    uint8_t next_ = 0;
};

} // namespace

TEST_CASE("golden vector with zero randomness", "[generator]") {
    FixedClock clock(0);
    FixedRandom random(0x00);
    Generator gen(clock, random);
    REQUIRE(gen.at(1469918176385ULL) == "01ARYZ6S410000000000000000");
}

TEST_CASE("golden vector with saturated randomness", "[generator]") {
    FixedClock clock(0);
    FixedRandom random(0xFF);
    Generator gen(clock, random);
    REQUIRE(gen.at(1469918176385ULL) == "01ARYZ6S41ZZZZZZZZZZZZZZZZ");
}

TEST_CASE("golden vector with counting randomness", "[generator]") {
    FixedClock clock(0);
    CountingRandom random;
    Generator gen(clock, random);
    auto u = gen.at_binary(1);
    REQUIRE(u.to_hex() == "0000000000010102030405060708090a");
    REQUIRE(u.to_string() == "0000000001041061050R3GG28A");
}

TEST_CASE("next() reads the injected clock", "[generator]") {
    FixedClock clock(1469918176385ULL);
    FixedRandom random(0x00);
    Generator gen(clock, random);
    REQUIRE(gen.next() == "01ARYZ6S410000000000000000");
    REQUIRE(gen.next_binary().timestamp() == 1469918176385ULL);
    REQUIRE(random.calls == 2);
}

TEST_CASE("timestamp occupies the top 48 bits", "[generator]") {
    FixedClock clock(0);
    FixedRandom random(0xAB);
    Generator gen(clock, random);
    auto u = gen.at_binary(0x0102030405060ULL);
    REQUIRE(u.timestamp() == 0x0102030405060ULL);
    for (size_t i = 6; i < 16; ++i) {
        REQUIRE(u.bytes[i] == 0xAB);
    }
}

TEST_CASE("max timestamp is accepted", "[generator]") {
    FixedClock clock(0);
    FixedRandom random(0x00);
    Generator gen(clock, random);
    REQUIRE(gen.at(MAX_TIMESTAMP) == "7ZZZZZZZZZ0000000000000000");
    REQUIRE(gen.at_checked(MAX_TIMESTAMP).is_ok());
}

TEST_CASE("oversized timestamps are truncated to 48 bits", "[generator]") {
    FixedClock clock(0);
    FixedRandom random(0x00);
    Generator gen(clock, random);
    uint64_t ts = (uint64_t(1) << 48) + 5;
    REQUIRE(gen.at_binary(ts).timestamp() == 5);
}

TEST_CASE("at_checked rejects oversized timestamps", "[generator]") {
    FixedClock clock(0);
    FixedRandom random(0x00);
    Generator gen(clock, random);
    auto r = gen.at_checked(uint64_t(1) << 48);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::TimestampOutOfRange);
}

TEST_CASE("timestamp prefix is monotonic", "[generator]") {
    FixedClock clock(0);
    CountingRandom random;
    Generator gen(clock, random);
    uint64_t stamps[] = {0, 1, 31, 32, 1000, 1469918176385ULL, 1469918176386ULL,
                         MAX_TIMESTAMP - 1, MAX_TIMESTAMP};
    std::string prev;
    for (uint64_t t : stamps) {
        std::string s = gen.at(t).substr(0, TIMESTAMP_TEXT_LENGTH);
        REQUIRE(prev <= s);
        prev = s;
    }
}

TEST_CASE("default generator produces valid, distinct ids", "[generator]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string s = generate();
        REQUIRE(valid(s));
        REQUIRE(seen.insert(s).second);
    }
}

TEST_CASE("default generator uses the wall clock", "[generator]") {
    SystemClock clock;
    uint64_t before = clock.now_ms();
    Ulid u = bingenerate();
    uint64_t after = clock.now_ms();
    REQUIRE(u.timestamp() >= before);
    REQUIRE(u.timestamp() <= after);
}

TEST_CASE("generate with explicit timestamp", "[generator]") {
    std::string s = generate(1469918176385ULL);
    REQUIRE(s.substr(0, 10) == "01ARYZ6S41");
    REQUIRE(bingenerate(42).timestamp() == 42);
}

TEST_CASE("SystemRandom fills the whole buffer", "[generator]") {
    SystemRandom random;
    uint8_t buf[64] = {};
    random.fill(buf, sizeof(buf));
    int nonzero = 0;
    for (uint8_t b : buf) if (b != 0) ++nonzero;
    // 64 zero bytes from a real source is practically impossible
    REQUIRE(nonzero > 0);
}
