#include "catch.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "fakes.hpp"
#include "generator.hpp"

using ulid::ErrorKind;
using ulid::Generator;
using ulid::Ulid;

namespace {

struct Fixture {
    std::shared_ptr<FakeClock> clock;
    std::shared_ptr<ScriptedRandom> random;
    Generator gen;

    Fixture(uint64_t now, std::vector<ulid::uint128> values)
        : clock(std::make_shared<FakeClock>(now))
        , random(std::make_shared<ScriptedRandom>(std::move(values)))
        , gen(clock, random) { }
};

} // namespace

TEST_CASE("generate stamps the clock and draws fresh randomness", "[generator]") {
    Fixture f(1469922850259ULL, { 11, 22 });

    auto a = f.gen.generate();
    auto b = f.gen.generate();
    REQUIRE(a.timestamp_ms() == 1469922850259ULL);
    REQUIRE(a.random() == 11);
    REQUIRE(b.random() == 22);
    REQUIRE(f.random->calls() == 2);
    REQUIRE_FALSE(f.gen.last().has_value());
}

TEST_CASE("monotonic ULIDs count up inside a frozen millisecond", "[generator]") {
    const ulid::uint128 r = u128(0x1234, 0x5678);
    Fixture f(1000, { r });

    std::vector<Ulid> ids;
    for (int i = 0; i < 100; ++i) {
        ids.push_back(f.gen.generate_monotonic());
    }
    for (int i = 0; i < 100; ++i) {
        REQUIRE(ids[i].timestamp_ms() == 1000);
        REQUIRE(ids[i].random() == r + i);
    }
    REQUIRE(std::is_sorted(ids.begin(), ids.end()));
    REQUIRE(f.random->calls() == 1);
    REQUIRE(f.gen.last() == ids.back());
}

TEST_CASE("a new millisecond draws new randomness", "[generator]") {
    Fixture f(1000, { 500, 7 });

    auto a = f.gen.generate_monotonic();
    f.clock->advance(1);
    auto b = f.gen.generate_monotonic();

    REQUIRE(b.timestamp_ms() == 1001);
    REQUIRE(b.random() == 7);
    REQUIRE(a < b);
}

TEST_CASE("a clock moving backwards keeps the sequence increasing", "[generator]") {
    Fixture f(5000, { 40 });

    auto a = f.gen.generate_monotonic();
    f.clock->set(4000);
    auto b = f.gen.generate_monotonic();
    auto c = f.gen.generate_monotonic();

    REQUIRE(b.timestamp_ms() == 5000);
    REQUIRE(b.random() == 41);
    REQUIRE(c.random() == 42);
    REQUIRE(a < b);
    REQUIRE(b < c);
}

TEST_CASE("an exhausted millisecond fails without touching the state", "[generator]") {
    Fixture f(2000, { 3 });
    f.gen.resume_from(Ulid::max_at(2000));

    auto r = f.gen.try_generate_monotonic();
    REQUIRE_FALSE(r);
    REQUIRE(r.error.kind == ErrorKind::Exhausted);
    REQUIRE(f.gen.last() == Ulid::max_at(2000));
    REQUIRE_THROWS_AS(f.gen.generate_monotonic(), ulid::UlidError);

    SECTION("the next millisecond recovers") {
        f.clock->advance(1);
        auto next = f.gen.generate_monotonic();
        REQUIRE(next.timestamp_ms() == 2001);
        REQUIRE(next.random() == 3);
    }
}

TEST_CASE("the value before exhaustion is still issued", "[generator]") {
    Fixture f(2000, { 0 });
    f.gen.resume_from(Ulid::from_parts(2000, Ulid::RAND_MASK - 1));

    auto last = f.gen.try_generate_monotonic();
    REQUIRE(last);
    REQUIRE(last.value == Ulid::max_at(2000));
    REQUIRE(f.gen.try_generate_monotonic().error.kind == ErrorKind::Exhausted);
}

TEST_CASE("try_generate_monotonic_at ignores the clock", "[generator]") {
    Fixture f(9999, { 10 });

    auto a = f.gen.try_generate_monotonic_at(100);
    REQUIRE(a);
    REQUIRE(a.value.timestamp_ms() == 100);

    auto b = f.gen.try_generate_monotonic_at(100);
    REQUIRE(b.value.random() == 11);

    auto too_far = f.gen.try_generate_monotonic_at(Ulid::MAX_TIMESTAMP + 1);
    REQUIRE_FALSE(too_far);
    REQUIRE(too_far.error.kind == ErrorKind::Range);
    REQUIRE(f.gen.last() == b.value);
}

TEST_CASE("a clock beyond 48 bits is a range error", "[generator]") {
    Fixture f(Ulid::MAX_TIMESTAMP + 1, { 1 });
    REQUIRE(f.gen.try_generate().error.kind == ErrorKind::Range);
    REQUIRE(f.gen.try_generate_monotonic().error.kind == ErrorKind::Range);
    REQUIRE_FALSE(f.gen.last().has_value());
}

TEST_CASE("reset forgets the last value", "[generator]") {
    Fixture f(3000, { 100, 200 });

    f.gen.generate_monotonic();
    f.gen.reset();
    REQUIRE_FALSE(f.gen.last().has_value());

    auto fresh = f.gen.generate_monotonic();
    REQUIRE(fresh.random() == 200);
}

TEST_CASE("null sources are rejected", "[generator]") {
    REQUIRE_THROWS_AS(Generator(nullptr, std::make_shared<ScriptedRandom>(std::vector<ulid::uint128> {})), std::runtime_error);
    REQUIRE_THROWS_AS(Generator(std::make_shared<FakeClock>(0), nullptr), std::runtime_error);
}

TEST_CASE("MtRandom honours the requested width", "[generator]") {
    ulid::MtRandom a(42);
    ulid::MtRandom b(42);
    for (int i = 0; i < 16; ++i) {
        auto v = a.draw(80);
        REQUIRE(v <= Ulid::RAND_MASK);
        REQUIRE(v == b.draw(80));
    }
    REQUIRE(a.draw(0) == 0);
    REQUIRE(a.draw(1) <= 1);
}

TEST_CASE("the system clock is past 2016", "[generator]") {
    ulid::SystemClock clock;
    REQUIRE(clock.now_ms() > 1469922850259ULL);

    Generator gen;
    auto a = gen.generate_monotonic();
    auto b = gen.generate_monotonic();
    REQUIRE(a < b);
}

TEST_CASE("a shared generator never repeats across threads", "[generator][threads]") {
    Generator gen(std::make_shared<FakeClock>(7000), std::make_shared<ulid::MtRandom>(1));

    const int threads = 8;
    const int per_thread = 1000;
    std::vector<std::vector<Ulid>> results(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&gen, &results, t] {
            for (int i = 0; i < per_thread; ++i) {
                results[t].push_back(gen.generate_monotonic());
            }
        });
    }
    for (auto& w : workers) w.join();

    std::set<Ulid> seen;
    for (const auto& per : results) {
        REQUIRE(std::is_sorted(per.begin(), per.end()));
        seen.insert(per.begin(), per.end());
    }
    REQUIRE(seen.size() == threads * per_thread);
}

TEST_CASE("overflowing mode carries into the next millisecond", "[generator]") {
    Fixture f(4000, { 77 });
    f.gen.resume_from(Ulid::max_at(4000));

    auto next = f.gen.generate_overflowing();
    REQUIRE(next == Ulid::min_at(4001));
    REQUIRE(f.gen.last() == Ulid::min_at(4001));
    REQUIRE(f.random->calls() == 0);

    SECTION("later calls at the old clock keep counting") {
        auto after = f.gen.generate_overflowing();
        REQUIRE(after == Ulid::from_parts(4001, 1));
    }
    SECTION("the clock catching up draws fresh randomness") {
        f.clock->set(4002);
        auto fresh = f.gen.generate_overflowing();
        REQUIRE(fresh == Ulid::from_parts(4002, 77));
    }
    SECTION("monotonic mode continues from the carried value") {
        REQUIRE(f.gen.generate_monotonic() == Ulid::from_parts(4001, 1));
    }
}

TEST_CASE("overflowing mode within a millisecond matches monotonic mode", "[generator]") {
    Fixture f(4000, { 10 });
    REQUIRE(f.gen.generate_overflowing() == Ulid::from_parts(4000, 10));
    REQUIRE(f.gen.generate_overflowing() == Ulid::from_parts(4000, 11));
    f.clock->set(3000);
    REQUIRE(f.gen.generate_overflowing() == Ulid::from_parts(4000, 12));
}

TEST_CASE("overflowing mode stops at the largest ulid", "[generator]") {
    Fixture f(Ulid::MAX_TIMESTAMP, { 0 });
    f.gen.resume_from(Ulid::max());

    auto r = f.gen.try_generate_overflowing();
    REQUIRE_FALSE(r);
    REQUIRE(r.error.kind == ErrorKind::Range);
    REQUIRE(f.gen.last() == Ulid::max());
    REQUIRE_THROWS_AS(f.gen.generate_overflowing(), ulid::UlidError);
}

TEST_CASE("MtRandom seeds from every seed_seq word", "[generator]") {
    std::seed_seq a_seq { 1u, 2u, 3u, 4u, 5u, 6u, 7u, 8u };
    std::seed_seq same_seq { 1u, 2u, 3u, 4u, 5u, 6u, 7u, 8u };
    std::seed_seq last_word_differs { 1u, 2u, 3u, 4u, 5u, 6u, 7u, 9u };
    ulid::MtRandom a(a_seq);
    ulid::MtRandom same(same_seq);
    ulid::MtRandom other(last_word_differs);

    auto first = a.draw(80);
    REQUIRE(first == same.draw(80));
    REQUIRE(first != other.draw(80));

    ulid::MtRandom d1;
    ulid::MtRandom d2;
    REQUIRE(d1.draw(128) != d2.draw(128));
}
