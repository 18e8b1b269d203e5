#pragma once

#include <ulidkit/ulid.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace ulidkit {

// Source of the current time, milliseconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_ms() = 0;
};

// Source of uniformly distributed random bytes. Implementations must fill
// the whole buffer or throw; a short read is never acceptable.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(uint8_t* buf, std::size_t len) = 0;
};

// std::chrono::system_clock floored to whole milliseconds.
class SystemClock : public Clock {
public:
    uint64_t now_ms() override;
};

// Reads /dev/urandom. Throws std::runtime_error if the device cannot supply
// the requested bytes.
class UrandomSource : public RandomSource {
public:
    void fill(uint8_t* buf, std::size_t len) override;
};

// Rewrites the 80-bit randomness field of a candidate identifier, e.g. to
// reserve tag bits. The result is truncated to 80 bits.
using RandomPostprocessor = std::function<u128(u128)>;

// Produces identifiers from an injected clock and randomness source.
//
// The generator keeps no state between calls. Monotonic sequences are
// threaded through the `previous` argument; callers sharing one sequence
// across threads must serialize access to it themselves.
class Generator {
public:
    Generator(Clock& clock, RandomSource& rng) : clock_(clock), rng_(rng) {}

    // Process-wide generator over SystemClock and UrandomSource.
    static Generator& system();

    Ulid generate();

    // Same millisecond (or clock went backwards): previous + 1 in the
    // randomness field, wrapping to 0 after 2^80 - 1.
    Ulid next_monotonic(const Ulid& previous);
    Ulid next_monotonic(const Ulid& previous, const RandomPostprocessor& postprocess);

    // Like next_monotonic, but std::nullopt instead of wrapping. Any value
    // returned compares greater than `previous`.
    std::optional<Ulid> next_strictly_monotonic(const Ulid& previous);
    std::optional<Ulid> next_strictly_monotonic(const Ulid& previous,
                                                const RandomPostprocessor& postprocess);

private:
    uint64_t read_clock();
    u128 draw_random();

    // Candidate successor of `previous`; nullopt only when `strict` and the
    // randomness field is exhausted.
    std::optional<Ulid> advance(const Ulid& previous, bool strict);

    Clock& clock_;
    RandomSource& rng_;
};

// One-shot helpers on Generator::system()
Ulid new_ulid();
std::string new_ulid_string();
std::array<uint8_t, Ulid::kByteLength> new_ulid_bytes();

} // namespace ulidkit
