#include <ulid/generator.hpp>
#include <chrono>
#include <fstream>
#include <random>

namespace ulid {

// ---- Providers ----

uint64_t SystemClock::now_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

void SystemRandom::fill(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    // Fallback: the platform's nondeterministic source, used directly
    std::random_device rd;
    for (size_t i = 0; i < len; ) {
        unsigned int word = rd();
        for (size_t k = 0; k < sizeof(word) && i < len; ++k, ++i) {
            buf[i] = static_cast<uint8_t>(word >> (8 * k));
        }
    }
}

static SystemClock& default_clock() {
    static SystemClock clock;
    return clock;
}

static SystemRandom& default_random() {
    static SystemRandom random;
    return random;
}

// ---- Generator ----

Generator::Generator()
    : clock_(&default_clock()), random_(&default_random()) {}

Generator::Generator(Clock& clock, RandomSource& random)
    : clock_(&clock), random_(&random) {}

Ulid Generator::at_binary(uint64_t timestamp_ms) {
    Ulid u;
    uint64_t ts = timestamp_ms & MAX_TIMESTAMP;
    for (int i = 0; i < 6; ++i) {
        u.bytes[5 - i] = static_cast<uint8_t>(ts >> (8 * i));
    }
    random_->fill(u.bytes.data() + 6, BINARY_LENGTH - 6);
    return u;
}

std::string Generator::at(uint64_t timestamp_ms) {
    return at_binary(timestamp_ms).to_string();
}

Result<Ulid> Generator::at_checked(uint64_t timestamp_ms) {
    if (timestamp_ms > MAX_TIMESTAMP) {
        return UlidError(UlidError::TimestampOutOfRange,
            "timestamp " + std::to_string(timestamp_ms) + " does not fit in 48 bits",
            "ULID timestamps must be below 2^48 ms (year 10889)");
    }
    return Result<Ulid>::ok(at_binary(timestamp_ms));
}

Ulid Generator::next_binary() {
    return at_binary(clock_->now_ms());
}

std::string Generator::next() {
    return next_binary().to_string();
}

// ---- Shortcuts ----

Ulid bingenerate() {
    return Generator().next_binary();
}

Ulid bingenerate(uint64_t timestamp_ms) {
    return Generator().at_binary(timestamp_ms);
}

std::string generate() {
    return Generator().next();
}

std::string generate(uint64_t timestamp_ms) {
    return Generator().at(timestamp_ms);
}

} // namespace ulid
