#include "uuid.hpp"
#include <iomanip>
#include <sstream>

namespace ulid {

namespace {

constexpr std::size_t SIMPLE_LEN = 32;
constexpr std::size_t HYPHENATED_LEN = 36;
constexpr std::size_t BRACED_LEN = 38;
constexpr std::size_t URN_LEN = 45;
constexpr std::string_view URN_PREFIX = "urn:uuid:";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_hyphen_slot(std::size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::string Uuid::to_string() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
        if (i == 3 || i == 5 || i == 7 || i == 9) ss << "-";
    }
    return ss.str();
}

Result<Uuid> Uuid::try_parse(std::string_view text) {
    std::string_view body = text;
    std::size_t offset = 0; // index of body[0] within text, for error positions

    switch (text.size()) {
        case SIMPLE_LEN:
        case HYPHENATED_LEN:
            break;
        case BRACED_LEN:
            if (text.front() != '{') return failure<Uuid>(invalid_char(0, text.front(), "uuid"));
            if (text.back() != '}') return failure<Uuid>(invalid_char(text.size() - 1, text.back(), "uuid"));
            body = text.substr(1, HYPHENATED_LEN);
            offset = 1;
            break;
        case URN_LEN:
            for (std::size_t i = 0; i < URN_PREFIX.size(); ++i) {
                char c = text[i];
                char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
                if (lower != URN_PREFIX[i]) return failure<Uuid>(invalid_char(i, c, "uuid"));
            }
            body = text.substr(URN_PREFIX.size());
            offset = URN_PREFIX.size();
            break;
        default: {
            Failure f = make_failure(ErrorKind::Length,
                "uuid: expected 32, 36, 38 or 45 characters, got %zu", text.size());
            f.position = text.size();
            return failure<Uuid>(std::move(f));
        }
    }

    bool hyphenated = body.size() == HYPHENATED_LEN;
    Uuid out;
    std::size_t nibble = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (hyphenated && is_hyphen_slot(i)) {
            if (c != '-') return failure<Uuid>(invalid_char(offset + i, c, "uuid"));
            continue;
        }
        int v = hex_value(c);
        if (v < 0) return failure<Uuid>(invalid_char(offset + i, c, "uuid"));
        out.data[nibble / 2] |= static_cast<uint8_t>(nibble % 2 == 0 ? v << 4 : v);
        ++nibble;
    }
    return success(out);
}

Uuid to_uuid(const Ulid& id) {
    Uuid out;
    out.data = id.to_bytes();
    return out;
}

Ulid from_uuid(const Uuid& uuid) {
    return Ulid::from_bytes(uuid.data);
}

Result<Ulid> try_parse_any(std::string_view text) {
    if (text.size() == Ulid::STRING_LEN) return Ulid::try_from_string(text);
    auto uuid = Uuid::try_parse(text);
    if (!uuid) {
        // Report a bad length in terms of the canonical ULID form.
        if (uuid.error.kind == ErrorKind::Length) {
            Failure f = make_failure(ErrorKind::Length,
                "expected a 26 character ulid or a uuid, got %zu characters", text.size());
            f.position = text.size();
            return failure<Ulid>(std::move(f));
        }
        return failure<Ulid>(uuid.error);
    }
    return success(from_uuid(uuid.value));
}

} // namespace ulid
