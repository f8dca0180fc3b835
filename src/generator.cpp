#include "generator.hpp"
#include <array>
#include <chrono>

namespace ulid {

uint64_t SystemClock::now_ms() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

MtRandom::MtRandom() {
    std::array<std::seed_seq::result_type, SEED_WORDS> words {};
    for (auto& w : words) w = rd();
    std::seed_seq seq(words.begin(), words.end());
    gen.seed(seq);
}

uint128 MtRandom::draw(int bits) {
    if (bits <= 0) return 0;
    uint128 value = (uint128(gen()) << 64) | gen();
    if (bits >= 128) return value;
    return value & ((uint128(1) << bits) - 1);
}

Generator::Generator()
    : Generator(std::make_shared<SystemClock>(), std::make_shared<MtRandom>()) { }

Generator::Generator(std::shared_ptr<TimeSource> clock, std::shared_ptr<RandomSource> random)
    : clock_(std::move(clock))
    , random_(std::move(random)) {
    if (!clock_) ULID_THROW("Generator: null time source");
    if (!random_) ULID_THROW("Generator: null random source");
}

Result<Ulid> Generator::try_generate() {
    uint64_t timestamp = clock_->now_ms();
    std::lock_guard<std::mutex> lock(mutex_); // random sources are not thread-safe
    return Ulid::try_from_parts(timestamp, random_->draw(Ulid::RAND_BITS));
}

Ulid Generator::generate() {
    return try_generate().get();
}

Result<Ulid> Generator::try_generate_monotonic() {
    return try_generate_monotonic_at(clock_->now_ms());
}

Ulid Generator::generate_monotonic() {
    return try_generate_monotonic().get();
}

Result<Ulid> Generator::try_generate_monotonic_at(uint64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Time moved forward (or first call): start a fresh random sequence.
    if (!hasLast_ || timestamp_ms > lastTimestamp_) return start_millisecond_(timestamp_ms);

    // Same millisecond, or the clock moved backwards: keep counting from the
    // last value instead of regressing.
    if (lastRandom_ == Ulid::RAND_MASK) {
        return failure<Ulid>(make_failure(ErrorKind::Exhausted,
            "ulid: random bits exhausted for timestamp %llu ms",
            static_cast<unsigned long long>(lastTimestamp_)));
    }
    ++lastRandom_;
    return Ulid::try_from_parts(lastTimestamp_, lastRandom_);
}

Result<Ulid> Generator::try_generate_overflowing() {
    uint64_t timestamp_ms = clock_->now_ms();
    std::lock_guard<std::mutex> lock(mutex_);

    if (!hasLast_ || timestamp_ms > lastTimestamp_) return start_millisecond_(timestamp_ms);

    Ulid last = Ulid::from_parts(lastTimestamp_, lastRandom_);
    if (last == Ulid::max()) {
        return failure<Ulid>(make_failure(ErrorKind::Range, "ulid: no value after %s", last.to_string().c_str()));
    }
    Ulid next = last.increment_overflowing();
    lastTimestamp_ = next.timestamp_ms();
    lastRandom_ = next.random();
    return success(next);
}

Ulid Generator::generate_overflowing() {
    return try_generate_overflowing().get();
}

Result<Ulid> Generator::start_millisecond_(uint64_t timestamp_ms) {
    auto next = Ulid::try_from_parts(timestamp_ms, random_->draw(Ulid::RAND_BITS));
    if (!next) return next;
    hasLast_ = true;
    lastTimestamp_ = timestamp_ms;
    lastRandom_ = next.value.random();
    return next;
}

void Generator::resume_from(const Ulid& last) {
    std::lock_guard<std::mutex> lock(mutex_);
    hasLast_ = true;
    lastTimestamp_ = last.timestamp_ms();
    lastRandom_ = last.random();
}

std::optional<Ulid> Generator::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hasLast_) return std::nullopt;
    return Ulid::from_parts(lastTimestamp_, lastRandom_);
}

void Generator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    hasLast_ = false;
    lastTimestamp_ = 0;
    lastRandom_ = 0;
}

} // namespace ulid
