#pragma once

#include <ulid/ulid.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulid {

// Source of "now" in milliseconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_ms() = 0;
};

// Source of the 80 random bits. Implementations must be safe to call from
// several threads at once.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(uint8_t* buf, size_t len) = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now_ms() override;
};

// /dev/urandom, falling back to std::random_device. If neither is usable the
// exception from std::random_device propagates.
class SystemRandom : public RandomSource {
public:
    void fill(uint8_t* buf, size_t len) override;
};

class Generator {
public:
    // Uses the process-wide SystemClock and SystemRandom.
    Generator();
    Generator(Clock& clock, RandomSource& random);

    // Timestamps above MAX_TIMESTAMP keep only their low 48 bits.
    Ulid at_binary(uint64_t timestamp_ms);
    std::string at(uint64_t timestamp_ms);
    // Same as at_binary() but rejects timestamps above MAX_TIMESTAMP.
    Result<Ulid> at_checked(uint64_t timestamp_ms);

    Ulid next_binary();
    std::string next();

private:
    Clock* clock_;
    RandomSource* random_;
};

// Shortcuts over a default Generator.
Ulid bingenerate();
Ulid bingenerate(uint64_t timestamp_ms);
std::string generate();
std::string generate(uint64_t timestamp_ms);

} // namespace ulid
