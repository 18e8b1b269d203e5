#pragma once

#include <ulidkit/crockford.hpp>
#include <ulidkit/result.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ulidkit {

// Universally Unique Lexicographically Sortable Identifier.
//
// 128 bits: a 48-bit millisecond Unix timestamp in the high bits followed by
// 80 bits of randomness. Values are immutable; comparison is by the full
// 128-bit value, which is also the order of the canonical text.
class Ulid {
public:
    static constexpr uint64_t kMaxTimestamp = (uint64_t(1) << 48) - 1;
    static constexpr std::size_t kRandomBits = 80;
    static constexpr std::size_t kStringLength = 26;
    static constexpr std::size_t kByteLength = 16;

    static u128 max_random() { return (u128(1) << kRandomBits) - 1; }

    // The nil identifier, all bits zero.
    Ulid() = default;

    // Throws std::out_of_range if timestamp_ms > kMaxTimestamp. Bits of
    // `random` above the low 80 are dropped.
    static Ulid from_timestamp_and_random(uint64_t timestamp_ms, u128 random);

    static Ulid from_u128(u128 value) { return Ulid(value); }
    static Ulid from_halves(uint64_t high, uint64_t low);
    static Ulid from_bytes(const std::array<uint8_t, kByteLength>& bytes);

    // Untrusted input. Never throws.
    static Result<Ulid> parse(std::string_view text);
    static Result<Ulid> try_from_bytes(const uint8_t* data, std::size_t len);
    static Result<Ulid> try_from_bytes(const std::vector<uint8_t>& bytes);

    u128 to_u128() const { return value_; }
    uint64_t high() const { return static_cast<uint64_t>(value_ >> 64); }
    uint64_t low() const { return static_cast<uint64_t>(value_); }
    std::pair<uint64_t, uint64_t> to_halves() const { return {high(), low()}; }
    std::array<uint8_t, kByteLength> to_bytes() const;

    uint64_t timestamp() const { return static_cast<uint64_t>(value_ >> kRandomBits); }
    u128 random() const { return value_ & max_random(); }

    bool is_nil() const { return value_ == 0; }

    // Canonical 26-character uppercase form
    std::string to_string() const;

    // Timestamp field as a UTC time point; display only.
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>
    datetime() const;

    // e.g. "2018-04-11T10:27:03.749Z"
    std::string to_rfc3339() const;

    bool operator==(const Ulid& o) const { return value_ == o.value_; }
    bool operator!=(const Ulid& o) const { return value_ != o.value_; }
    bool operator<(const Ulid& o) const { return value_ < o.value_; }
    bool operator<=(const Ulid& o) const { return value_ <= o.value_; }
    bool operator>(const Ulid& o) const { return value_ > o.value_; }
    bool operator>=(const Ulid& o) const { return value_ >= o.value_; }

private:
    explicit Ulid(u128 value) : value_(value) {}

    u128 value_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Ulid& ulid);

} // namespace ulidkit

namespace std {

template<>
struct hash<ulidkit::Ulid> {
    size_t operator()(const ulidkit::Ulid& u) const noexcept {
        size_t h1 = hash<uint64_t>{}(u.high());
        size_t h2 = hash<uint64_t>{}(u.low());
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace std
