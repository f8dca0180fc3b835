#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "lib.hpp"

namespace ulid {

using uint128 = unsigned __int128;

/**
 * @brief Universally Unique Lexicographically Sortable Identifier.
 *
 * 128 bits: the high 48 are a unix timestamp in milliseconds, the low 80 are
 * random. Values compare as unsigned 128-bit integers, which is also the
 * order of their canonical 26 character Crockford base32 strings.
 *
 * Usage:
 *   Ulid id = Ulid::from_parts(ts, random);
 *   std::string s = id.to_string();      // "01ARZ3NDEKTSV4RRFFQ69G5FAV"
 *   auto bytes = id.to_bytes();           // 16 bytes, big-endian
 *   auto parsed = Ulid::try_from_string(s);
 */
class Ulid {
public:
    static constexpr int TIME_BITS = 48;
    static constexpr int RAND_BITS = 80;
    static constexpr std::size_t STRING_LEN = 26;
    static constexpr std::size_t BYTES_LEN = 16;
    static constexpr uint64_t MAX_TIMESTAMP = (uint64_t(1) << TIME_BITS) - 1;
    static constexpr uint128 RAND_MASK = (uint128(1) << RAND_BITS) - 1;

    using Bytes = std::array<uint8_t, BYTES_LEN>;
    // Millisecond precision keeps the whole 48-bit range representable.
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    constexpr Ulid() = default;
    constexpr explicit Ulid(uint128 value)
        : value_(value) { }

    // Fails with Range when timestamp_ms does not fit in 48 bits.
    // random is masked to its low 80 bits.
    static Result<Ulid> try_from_parts(uint64_t timestamp_ms, uint128 random);
    static Ulid from_parts(uint64_t timestamp_ms, uint128 random);

    // Times before the unix epoch clamp to the epoch.
    static Result<Ulid> try_from_datetime(std::chrono::system_clock::time_point tp, uint128 random);
    static Ulid from_datetime(std::chrono::system_clock::time_point tp, uint128 random);

    static Result<Ulid> try_from_string(std::string_view text);
    static Ulid from_string(std::string_view text);

    static Result<Ulid> try_from_bytes(const uint8_t* data, std::size_t len);
    static Ulid from_bytes(const uint8_t* data, std::size_t len);
    static Ulid from_bytes(const std::vector<uint8_t>& data) { return from_bytes(data.data(), data.size()); }
    static Ulid from_bytes(const Bytes& data) { return from_bytes(data.data(), data.size()); }

    // Most and least significant 64-bit halves.
    static constexpr Ulid from_pair(uint64_t msb, uint64_t lsb) { return Ulid((uint128(msb) << 64) | lsb); }
    std::pair<uint64_t, uint64_t> to_pair() const {
        return { static_cast<uint64_t>(value_ >> 64), static_cast<uint64_t>(value_) };
    }

    static constexpr Ulid nil() { return Ulid(); }
    static constexpr Ulid max() { return Ulid(~uint128(0)); }

    // Smallest and largest values carrying the given timestamp.
    static Ulid min_at(uint64_t timestamp_ms) { return from_parts(timestamp_ms, 0); }
    static Ulid max_at(uint64_t timestamp_ms) { return from_parts(timestamp_ms, RAND_MASK); }

    uint64_t timestamp_ms() const { return static_cast<uint64_t>(value_ >> RAND_BITS); }
    uint128 random() const { return value_ & RAND_MASK; }
    uint128 value() const { return value_; }
    TimePoint datetime() const;
    bool is_nil() const { return value_ == 0; }

    // Next value in the same millisecond, nothing once the random part is exhausted.
    std::optional<Ulid> increment() const;
    // Next 128-bit value; an all-ones random part carries into the timestamp.
    // Throws UlidError (Range) on max().
    Ulid increment_overflowing() const;

    std::string to_string() const;
    Bytes to_bytes() const;

    bool operator==(const Ulid& other) const { return value_ == other.value_; }
    bool operator!=(const Ulid& other) const { return value_ != other.value_; }
    bool operator<(const Ulid& other) const { return value_ < other.value_; }
    bool operator<=(const Ulid& other) const { return value_ <= other.value_; }
    bool operator>(const Ulid& other) const { return value_ > other.value_; }
    bool operator>=(const Ulid& other) const { return value_ >= other.value_; }

private:
    uint128 value_ { 0 };
};

std::ostream& operator<<(std::ostream& os, const Ulid& id);

} // namespace ulid

template <>
struct std::hash<ulid::Ulid> {
    std::size_t operator()(const ulid::Ulid& id) const noexcept {
        uint64_t hi = static_cast<uint64_t>(id.value() >> 64);
        uint64_t lo = static_cast<uint64_t>(id.value());
        return std::hash<uint64_t> {}(hi ^ (lo + 0x9e3779b97f4a7c15ULL + (hi << 6) + (hi >> 2)));
    }
};
