#include <ulidkit/generator.hpp>
#include <ulidkit/log.hpp>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace ulidkit {

// ---- Capabilities ----

uint64_t SystemClock::now_ms() {
    using namespace std::chrono;
    auto since_epoch = system_clock::now().time_since_epoch();
    // duration_cast truncates toward zero; the epoch is long past, so this floors.
    return static_cast<uint64_t>(duration_cast<milliseconds>(since_epoch).count());
}

void UrandomSource::fill(uint8_t* buf, std::size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom.is_open()) {
        throw std::runtime_error("cannot open /dev/urandom");
    }
    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    if (static_cast<std::size_t>(urandom.gcount()) != len) {
        throw std::runtime_error("short read from /dev/urandom");
    }
}

// ---- Generator ----

Generator& Generator::system() {
    static SystemClock clock;
    static UrandomSource rng;
    static Generator generator(clock, rng);
    return generator;
}

uint64_t Generator::read_clock() {
    return clock_.now_ms();
}

u128 Generator::draw_random() {
    std::array<uint8_t, Ulid::kRandomBits / 8> bytes;
    rng_.fill(bytes.data(), bytes.size());
    u128 value = 0;
    for (uint8_t b : bytes) {
        value = (value << 8) | b;
    }
    return value;
}

Ulid Generator::generate() {
    uint64_t now = read_clock();
    return Ulid::from_timestamp_and_random(now, draw_random());
}

std::optional<Ulid> Generator::advance(const Ulid& previous, bool strict) {
    uint64_t now = read_clock();
    uint64_t last = previous.timestamp();

    if (now > last) {
        return Ulid::from_timestamp_and_random(now, draw_random());
    }

    if (now < last) {
        log::debug("clock is %llu ms behind %s, reusing its timestamp",
                   static_cast<unsigned long long>(last - now),
                   previous.to_string().c_str());
    }

    if (previous.random() == Ulid::max_random()) {
        if (strict) {
            log::warn("randomness exhausted for timestamp %llu after %s",
                      static_cast<unsigned long long>(last),
                      previous.to_string().c_str());
            return std::nullopt;
        }
        log::warn("randomness wrapped to zero for timestamp %llu after %s",
                  static_cast<unsigned long long>(last),
                  previous.to_string().c_str());
        return Ulid::from_timestamp_and_random(last, 0);
    }

    return Ulid::from_timestamp_and_random(last, previous.random() + 1);
}

Ulid Generator::next_monotonic(const Ulid& previous) {
    // Non-strict advance always yields a value
    return *advance(previous, false);
}

Ulid Generator::next_monotonic(const Ulid& previous, const RandomPostprocessor& postprocess) {
    Ulid candidate = *advance(previous, false);
    return Ulid::from_timestamp_and_random(candidate.timestamp(),
                                           postprocess(candidate.random()));
}

std::optional<Ulid> Generator::next_strictly_monotonic(const Ulid& previous) {
    return advance(previous, true);
}

std::optional<Ulid> Generator::next_strictly_monotonic(const Ulid& previous,
                                                       const RandomPostprocessor& postprocess) {
    auto candidate = advance(previous, true);
    if (!candidate) {
        return std::nullopt;
    }
    Ulid result = Ulid::from_timestamp_and_random(candidate->timestamp(),
                                                  postprocess(candidate->random()));
    if (result <= previous) {
        log::debug("postprocessed %s does not sort after %s",
                   result.to_string().c_str(), previous.to_string().c_str());
        return std::nullopt;
    }
    return result;
}

// ---- One-shot helpers ----

Ulid new_ulid() {
    return Generator::system().generate();
}

std::string new_ulid_string() {
    return new_ulid().to_string();
}

std::array<uint8_t, Ulid::kByteLength> new_ulid_bytes() {
    return new_ulid().to_bytes();
}

} // namespace ulidkit
