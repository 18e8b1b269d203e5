#include <catch2/catch.hpp>
#include <ulidkit/generator.hpp>
#include "fakes.hpp"
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ulidkit;

static const uint64_t NOW = 1523442423749ULL;  // 2018-04-11T10:27:03.749Z

static u128 tag_bit() {
    return u128(1) << 79;
}

// ===== generate() =====

TEST_CASE("generate combines clock and randomness", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0xFF);
    Generator gen(clock, rng);

    auto u = gen.generate();
    REQUIRE(u.timestamp() == NOW);
    REQUIRE(u.random() == Ulid::max_random());
    REQUIRE(clock.calls == 1);
    REQUIRE(rng.calls == 1);
}

TEST_CASE("generate packs random bytes big-endian", "[generator]") {
    FakeClock clock(0);
    FakeRandom rng(0x01);
    rng.counting = true;
    Generator gen(clock, rng);

    auto u = gen.generate();
    // bytes 01 02 .. 0A
    REQUIRE(u.to_bytes()[6] == 0x01);
    REQUIRE(u.to_bytes()[15] == 0x0A);

    // next draw starts one higher
    REQUIRE(gen.generate().to_bytes()[6] == 0x02);
}

TEST_CASE("generate treats a clock beyond 48 bits as fatal", "[generator]") {
    FakeClock clock(Ulid::kMaxTimestamp + 1);
    FakeRandom rng(0);
    Generator gen(clock, rng);
    REQUIRE_THROWS_AS(gen.generate(), std::out_of_range);
}

TEST_CASE("generate propagates randomness failure", "[generator]") {
    FakeClock clock(NOW);
    BrokenRandom rng;
    Generator gen(clock, rng);
    REQUIRE_THROWS_AS(gen.generate(), std::runtime_error);
}

// ===== next_monotonic() =====

TEST_CASE("next_monotonic increments randomness within the same millisecond", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0xAA);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, 5);
    auto next = gen.next_monotonic(previous);
    REQUIRE(next.timestamp() == NOW);
    REQUIRE(next.random() == u128(6));
    REQUIRE(next > previous);
    REQUIRE(rng.calls == 0);
}

TEST_CASE("next_monotonic keeps previous timestamp when the clock goes back", "[generator]") {
    FakeClock clock(NOW - 250);
    FakeRandom rng(0xAA);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, 41);
    auto next = gen.next_monotonic(previous);
    REQUIRE(next.timestamp() == NOW);
    REQUIRE(next.random() == u128(42));
}

TEST_CASE("next_monotonic draws fresh randomness once the clock advances", "[generator]") {
    FakeClock clock(NOW + 1);
    FakeRandom rng(0x00);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, Ulid::max_random());
    auto next = gen.next_monotonic(previous);
    REQUIRE(next.timestamp() == NOW + 1);
    REQUIRE(next.random() == u128(0));
    REQUIRE(rng.calls == 1);
}

TEST_CASE("next_monotonic wraps an exhausted randomness field to zero", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0xAA);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, Ulid::max_random());
    auto next = gen.next_monotonic(previous);
    REQUIRE(next.timestamp() == NOW);
    REQUIRE(next.random() == u128(0));
    REQUIRE(next < previous);
}

TEST_CASE("next_monotonic chain never decreases", "[generator]") {
    FakeClock clock({NOW, NOW, NOW, NOW + 1, NOW + 1, NOW - 3, NOW + 2});
    FakeRandom rng(0x10);
    rng.counting = true;
    Generator gen(clock, rng);

    Ulid previous = gen.generate();
    for (int i = 0; i < 50; ++i) {
        Ulid next = gen.next_monotonic(previous);
        REQUIRE(next > previous);
        previous = next;
    }
    REQUIRE(previous.timestamp() == NOW + 2);
}

// ===== next_strictly_monotonic() =====

TEST_CASE("next_strictly_monotonic matches next_monotonic when not exhausted", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0xAA);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, Ulid::max_random() - 1);
    auto strict = gen.next_strictly_monotonic(previous);
    REQUIRE(strict.has_value());
    REQUIRE(*strict == gen.next_monotonic(previous));
    REQUIRE(strict->random() == Ulid::max_random());
}

TEST_CASE("next_strictly_monotonic returns nothing when randomness is exhausted", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0xAA);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, Ulid::max_random());
    REQUIRE_FALSE(gen.next_strictly_monotonic(previous).has_value());

    // A later millisecond frees it up again
    clock.set(NOW + 1);
    auto next = gen.next_strictly_monotonic(previous);
    REQUIRE(next.has_value());
    REQUIRE(*next > previous);
}

// ===== Postprocessor =====

TEST_CASE("postprocessor applies to fresh randomness", "[generator]") {
    FakeClock clock(NOW + 1);
    FakeRandom rng(0x00);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, 0);
    auto next = gen.next_monotonic(previous, [](u128 r) { return r | tag_bit(); });
    REQUIRE(next.timestamp() == NOW + 1);
    REQUIRE(next.random() == tag_bit());
}

TEST_CASE("postprocessor applies to incremented randomness", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0x00);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, 5);
    auto next = gen.next_monotonic(previous, [](u128 r) { return r | tag_bit(); });
    REQUIRE(next.timestamp() == NOW);
    REQUIRE(next.random() == (u128(6) | tag_bit()));
}

TEST_CASE("postprocessor output is truncated to 80 bits", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0x00);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, 1);
    auto next = gen.next_monotonic(previous, [](u128 r) { return r | (u128(1) << 100); });
    REQUIRE(next.timestamp() == NOW);
    REQUIRE(next.random() == u128(2));
}

TEST_CASE("strict postprocessor result must still sort after previous", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0x00);
    Generator gen(clock, rng);

    auto previous = Ulid::from_timestamp_and_random(NOW, 5);
    auto clear = [](u128) { return u128(0); };
    REQUIRE_FALSE(gen.next_strictly_monotonic(previous, clear).has_value());

    auto tag = [](u128 r) { return r | tag_bit(); };
    auto tagged = gen.next_strictly_monotonic(previous, tag);
    REQUIRE(tagged.has_value());
    REQUIRE(tagged->random() == (u128(6) | tag_bit()));

    auto exhausted = Ulid::from_timestamp_and_random(NOW, Ulid::max_random());
    REQUIRE_FALSE(gen.next_strictly_monotonic(exhausted, tag).has_value());
}

// ===== Shared sequences =====

TEST_CASE("monotonic sequence shared across threads under a mutex", "[generator]") {
    FakeClock clock(NOW);
    FakeRandom rng(0x00);
    Generator gen(clock, rng);

    std::mutex mu;
    Ulid shared = Ulid::from_timestamp_and_random(NOW, 0);
    std::vector<std::vector<Ulid>> produced(4);

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < produced.size(); ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 250; ++i) {
                std::lock_guard<std::mutex> lock(mu);
                shared = gen.next_monotonic(shared);
                produced[t].push_back(shared);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<Ulid> all;
    for (const auto& ids : produced) {
        for (std::size_t i = 1; i < ids.size(); ++i) {
            REQUIRE(ids[i] > ids[i - 1]);
        }
        all.insert(ids.begin(), ids.end());
    }
    REQUIRE(all.size() == 1000);
    REQUIRE(shared.random() == u128(1000));
}

// ===== System generator =====

TEST_CASE("system generator produces current identifiers", "[generator]") {
    using namespace std::chrono;
    auto before = static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    auto u = new_ulid();
    auto after = static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());

    REQUIRE(u.timestamp() >= before);
    REQUIRE(u.timestamp() <= after);
    REQUIRE(new_ulid_string().size() == Ulid::kStringLength);
    REQUIRE(new_ulid_bytes().size() == Ulid::kByteLength);
}

TEST_CASE("system generator values are unique", "[generator]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto s = new_ulid_string();
        REQUIRE(seen.insert(s).second);
        REQUIRE(Ulid::parse(s).is_ok());
    }
}

TEST_CASE("system generator monotonic chain", "[generator]") {
    auto& gen = Generator::system();
    Ulid previous = gen.generate();
    for (int i = 0; i < 100; ++i) {
        auto next = gen.next_strictly_monotonic(previous);
        REQUIRE(next.has_value());
        REQUIRE(*next > previous);
        previous = *next;
    }
}
