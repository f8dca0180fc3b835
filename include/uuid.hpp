#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include "ulid.hpp"

namespace ulid {

// 128-bit UUID-shaped value. Conversions to and from Ulid reinterpret the
// bits as they are: byte i of one is byte i of the other.
struct Uuid {
    std::array<uint8_t, 16> data {};

    // Lowercase hyphenated form, 8-4-4-4-12.
    std::string to_string() const;

    // Accepts the simple (32), hyphenated (36), braced (38) and urn (45) forms.
    static Result<Uuid> try_parse(std::string_view text);
    static Uuid parse(std::string_view text) { return try_parse(text).get(); }

    bool operator==(const Uuid& other) const {
        return std::memcmp(data.data(), other.data.data(), data.size()) == 0;
    }
    bool operator!=(const Uuid& other) const { return !(*this == other); }
};

Uuid to_uuid(const Ulid& id);
Ulid from_uuid(const Uuid& uuid);

// A 26 character ULID or any textual UUID form.
Result<Ulid> try_parse_any(std::string_view text);

} // namespace ulid
