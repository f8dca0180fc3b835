#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include "ulid.hpp"

namespace ulid {

// Milliseconds since the unix epoch.
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual uint64_t now_ms() = 0;
};

class RandomSource {
public:
    virtual ~RandomSource() = default;
    // Returns a value whose low `bits` bits are random and the rest zero (bits <= 128).
    virtual uint128 draw(int bits) = 0;
};

// Wall clock; readings before the epoch clamp to 0.
class SystemClock final : public TimeSource {
public:
    uint64_t now_ms() override;
};

// Mersenne Twister. The default constructor seeds the whole engine state
// from SEED_WORDS random_device words.
class MtRandom final : public RandomSource {
private:
    std::random_device rd;
    std::mt19937_64 gen;

public:
    static constexpr int SEED_WORDS = 8;

    MtRandom();
    explicit MtRandom(std::seed_seq& seq)
        : gen(seq) { }
    explicit MtRandom(uint64_t seed)
        : gen(seed) { }

    uint128 draw(int bits) override;
};

/**
 * @brief ULID generator owning its clock, its random source and the state
 *        of monotonic mode.
 *
 * generate() is stateless: every call reads the clock and draws 80 fresh
 * random bits, so two calls in the same millisecond are unordered.
 *
 * generate_monotonic() returns strictly increasing values on one instance:
 *   - clock ahead of the last value: fresh random bits at the new timestamp;
 *   - same millisecond, or clock behind the last value: last value + 1,
 *     keeping the last timestamp. A clock that moved backwards therefore
 *     yields ULIDs whose timestamp is ahead of the wall clock.
 * Once the random part of a millisecond is all ones the call fails with
 * ErrorKind::Exhausted and the state is left as is; retry in the next
 * millisecond or fall back to generate().
 *
 * The monotonic read-modify-write is guarded by a mutex so an instance can be
 * shared between threads; one generator per thread avoids the contention.
 */
class Generator {
public:
    Generator();
    Generator(std::shared_ptr<TimeSource> clock, std::shared_ptr<RandomSource> random);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    Result<Ulid> try_generate();
    Ulid generate();

    Result<Ulid> try_generate_monotonic();
    Ulid generate_monotonic();

    // Monotonic generation with the clock reading replaced by timestamp_ms.
    Result<Ulid> try_generate_monotonic_at(uint64_t timestamp_ms);

    // Monotonic mode that never reports Exhausted: an all-ones random part
    // carries into the timestamp, so the result can be ahead of the clock.
    // Fails with Range only once Ulid::max() has been issued.
    Result<Ulid> try_generate_overflowing();
    Ulid generate_overflowing();

    // Continue a monotonic sequence from a previously issued value.
    void resume_from(const Ulid& last);
    std::optional<Ulid> last() const;
    void reset();

private:
    // Caller holds mutex_.
    Result<Ulid> start_millisecond_(uint64_t timestamp_ms);

    std::shared_ptr<TimeSource> clock_;
    std::shared_ptr<RandomSource> random_;

    mutable std::mutex mutex_;
    bool hasLast_ = false;
    uint64_t lastTimestamp_ = 0;
    uint128 lastRandom_ = 0;
};

} // namespace ulid
