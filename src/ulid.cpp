#include "ulid.hpp"
#include "codec.hpp"

namespace ulid {

Result<Ulid> Ulid::try_from_parts(uint64_t timestamp_ms, uint128 random) {
    if (timestamp_ms > MAX_TIMESTAMP) {
        return failure<Ulid>(make_failure(ErrorKind::Range,
            "ulid: timestamp %llu ms exceeds the 48-bit maximum %llu",
            static_cast<unsigned long long>(timestamp_ms),
            static_cast<unsigned long long>(MAX_TIMESTAMP)));
    }
    return success(Ulid((uint128(timestamp_ms) << RAND_BITS) | (random & RAND_MASK)));
}

Ulid Ulid::from_parts(uint64_t timestamp_ms, uint128 random) {
    return try_from_parts(timestamp_ms, random).get();
}

Result<Ulid> Ulid::try_from_datetime(std::chrono::system_clock::time_point tp, uint128 random) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    uint64_t timestamp = ms < 0 ? 0 : static_cast<uint64_t>(ms);
    return try_from_parts(timestamp, random);
}

Ulid Ulid::from_datetime(std::chrono::system_clock::time_point tp, uint128 random) {
    return try_from_datetime(tp, random).get();
}

Result<Ulid> Ulid::try_from_string(std::string_view text) {
    auto r = codec::decode_base32(text);
    if (!r) return failure<Ulid>(r.error);
    return success(Ulid(r.value));
}

Ulid Ulid::from_string(std::string_view text) {
    return try_from_string(text).get();
}

Result<Ulid> Ulid::try_from_bytes(const uint8_t* data, std::size_t len) {
    auto r = codec::from_bytes(data, len);
    if (!r) return failure<Ulid>(r.error);
    return success(Ulid(r.value));
}

Ulid Ulid::from_bytes(const uint8_t* data, std::size_t len) {
    return try_from_bytes(data, len).get();
}

Ulid::TimePoint Ulid::datetime() const {
    return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(timestamp_ms())));
}

std::optional<Ulid> Ulid::increment() const {
    if (random() == RAND_MASK) return std::nullopt;
    return Ulid(value_ + 1);
}

Ulid Ulid::increment_overflowing() const {
    if (value_ == ~uint128(0)) {
        throw UlidError(make_failure(ErrorKind::Range, "ulid: %s has no successor", to_string().c_str()));
    }
    return Ulid(value_ + 1);
}

std::string Ulid::to_string() const {
    return codec::encode_base32(value_);
}

Ulid::Bytes Ulid::to_bytes() const {
    Bytes out {};
    codec::to_bytes(value_, out.data());
    return out;
}

std::ostream& operator<<(std::ostream& os, const Ulid& id) {
    char buf[Ulid::STRING_LEN];
    codec::encode_base32(id.value(), buf);
    return os.write(buf, Ulid::STRING_LEN);
}

} // namespace ulid
