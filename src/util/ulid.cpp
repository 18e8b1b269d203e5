#include <ulidkit/ulid.hpp>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace ulidkit {

// ---- Construction ----

Ulid Ulid::from_timestamp_and_random(uint64_t timestamp_ms, u128 random) {
    if (timestamp_ms > kMaxTimestamp) {
        throw std::out_of_range("ULID timestamp " + std::to_string(timestamp_ms) +
                                " exceeds 48 bits");
    }
    return Ulid((u128(timestamp_ms) << kRandomBits) | (random & max_random()));
}

Ulid Ulid::from_halves(uint64_t high, uint64_t low) {
    return Ulid((u128(high) << 64) | u128(low));
}

Ulid Ulid::from_bytes(const std::array<uint8_t, kByteLength>& bytes) {
    u128 value = 0;
    for (uint8_t b : bytes) {
        value = (value << 8) | b;
    }
    return Ulid(value);
}

Result<Ulid> Ulid::parse(std::string_view text) {
    auto value = crockford::parse_u128(text, kStringLength);
    if (value.is_err()) {
        return std::move(value).error();
    }
    return Result<Ulid>::ok(Ulid(value.value()));
}

Result<Ulid> Ulid::try_from_bytes(const uint8_t* data, std::size_t len) {
    if (data == nullptr || len != kByteLength) {
        return UlidError(UlidError::InvalidLength, "invalid length",
            "expected 16 bytes, got " + std::to_string(data ? len : 0));
    }
    std::array<uint8_t, kByteLength> bytes;
    for (std::size_t i = 0; i < kByteLength; ++i) {
        bytes[i] = data[i];
    }
    return Result<Ulid>::ok(from_bytes(bytes));
}

Result<Ulid> Ulid::try_from_bytes(const std::vector<uint8_t>& bytes) {
    return try_from_bytes(bytes.data(), bytes.size());
}

// ---- Conversion ----

std::array<uint8_t, Ulid::kByteLength> Ulid::to_bytes() const {
    std::array<uint8_t, kByteLength> out;
    u128 v = value_;
    for (int i = static_cast<int>(kByteLength) - 1; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    return out;
}

std::string Ulid::to_string() const {
    std::string out;
    out.reserve(kStringLength);
    crockford::append_u64(timestamp(), crockford::kTimestampChars, out);
    crockford::append_u128(random(), crockford::kRandomChars, out);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Ulid& ulid) {
    return os << ulid.to_string();
}

// ---- Time ----

std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>
Ulid::datetime() const {
    using namespace std::chrono;
    return time_point<system_clock, milliseconds>(
        milliseconds(static_cast<int64_t>(timestamp())));
}

std::string Ulid::to_rfc3339() const {
    const uint64_t ms = timestamp();
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);

    std::tm utc{};
    if (gmtime_r(&secs, &utc) == nullptr) {
        throw std::runtime_error("cannot convert timestamp " + std::to_string(ms) + " to UTC");
    }

    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03uZ", static_cast<unsigned>(ms % 1000));

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << millis;
    return oss.str();
}

} // namespace ulidkit
