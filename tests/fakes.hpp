#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "catch.hpp"
#include "codec.hpp"
#include "generator.hpp"

// ---- Test helpers ----
inline ulid::uint128 u128(uint64_t hi, uint64_t lo) {
    return (ulid::uint128(hi) << 64) | lo;
}

namespace Catch {
template <>
struct StringMaker<ulid::uint128> {
    static std::string convert(ulid::uint128 value) { return "0x" + ulid::codec::to_hex(value); }
};
} // namespace Catch

// ---- Fake sources ----

// Clock that only moves when told to.
class FakeClock final : public ulid::TimeSource {
public:
    explicit FakeClock(uint64_t now)
        : now_(now) { }

    uint64_t now_ms() override { return now_.load(); }

    void set(uint64_t now) { now_.store(now); }
    void advance(uint64_t ms) { now_.fetch_add(ms); }

private:
    std::atomic<uint64_t> now_;
};

// Hands out a fixed list of values in order, then repeats the last one.
class ScriptedRandom final : public ulid::RandomSource {
public:
    explicit ScriptedRandom(std::vector<ulid::uint128> values)
        : values_(std::move(values)) { }

    ulid::uint128 draw(int bits) override {
        ++calls_;
        ulid::uint128 v = values_.empty() ? 0 : values_[std::min(next_++, values_.size() - 1)];
        if (bits >= 128) return v;
        return v & ((ulid::uint128(1) << bits) - 1);
    }

    int calls() const { return calls_; }

private:
    std::vector<ulid::uint128> values_;
    std::size_t next_ = 0;
    int calls_ = 0;
};
