#include "codec.hpp"
#include <array>

namespace ulid::codec {

namespace {

constexpr int BITS_PER_SYMBOL = 5;
constexpr int SYMBOL_MASK = 0x1F;
// 26 symbols carry 130 bits; the first one only holds the top 3 of 128.
constexpr int MAX_FIRST_SYMBOL = 7;

struct DecodeTable {
    std::array<int8_t, 256> values {};

    DecodeTable() {
        values.fill(-1);
        for (int i = 0; i < 32; ++i) {
            unsigned char c = static_cast<unsigned char>(ALPHABET[i]);
            values[c] = static_cast<int8_t>(i);
            if (c >= 'A' && c <= 'Z') {
                values[c + ('a' - 'A')] = static_cast<int8_t>(i);
            }
        }
    }
};

const DecodeTable& table() {
    static const DecodeTable t;
    return t;
}

} // namespace

int decode_symbol(char c) {
    return table().values[static_cast<unsigned char>(c)];
}

void encode_base32(uint128 value, char* out) {
    for (std::size_t i = 0; i < Ulid::STRING_LEN; ++i) {
        int shift = static_cast<int>(Ulid::STRING_LEN - 1 - i) * BITS_PER_SYMBOL;
        out[i] = ALPHABET[static_cast<unsigned>((value >> shift) & SYMBOL_MASK)];
    }
}

std::string encode_base32(uint128 value) {
    std::string out(Ulid::STRING_LEN, '0');
    encode_base32(value, out.data());
    return out;
}

Result<uint128> decode_base32(std::string_view text) {
    if (text.size() != Ulid::STRING_LEN) {
        Failure f = make_failure(ErrorKind::Length, "ulid: expected %zu characters, got %zu",
            Ulid::STRING_LEN, text.size());
        f.position = text.size();
        return failure<uint128>(std::move(f));
    }

    uint128 value = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        int symbol = decode_symbol(text[i]);
        if (symbol < 0) {
            return failure<uint128>(invalid_char(i, text[i], "ulid"));
        }
        if (i == 0 && symbol > MAX_FIRST_SYMBOL) {
            Failure f = invalid_char(i, text[i], "ulid");
            f.message += " (first symbol must be 0-7)";
            return failure<uint128>(std::move(f));
        }
        value = (value << BITS_PER_SYMBOL) | static_cast<uint128>(symbol);
    }
    return success(value);
}

void to_bytes(uint128 value, uint8_t* out) {
    for (std::size_t i = 0; i < Ulid::BYTES_LEN; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * (Ulid::BYTES_LEN - 1 - i)));
    }
}

Result<uint128> from_bytes(const uint8_t* data, std::size_t len) {
    if (len != Ulid::BYTES_LEN) {
        Failure f = make_failure(ErrorKind::Length, "ulid: expected %zu bytes, got %zu",
            Ulid::BYTES_LEN, len);
        f.position = len;
        return failure<uint128>(std::move(f));
    }
    uint128 value = 0;
    for (std::size_t i = 0; i < len; ++i) {
        value = (value << 8) | data[i];
    }
    return success(value);
}

std::string to_hex(uint128 value) {
    static const char* digits = "0123456789ABCDEF";
    std::string out(32, '0');
    for (int i = 31; i >= 0; --i) {
        out[i] = digits[static_cast<int>(value & 0xF)];
        value >>= 4;
    }
    return out;
}

std::string to_decimal(uint128 value) {
    if (value == 0) return "0";
    char buf[40];
    int pos = sizeof(buf);
    while (value != 0) {
        buf[--pos] = static_cast<char>('0' + static_cast<int>(value % 10));
        value /= 10;
    }
    return std::string(buf + pos, sizeof(buf) - pos);
}

Result<uint128> try_from_decimal(std::string_view text) {
    if (text.empty()) {
        return failure<uint128>(make_failure(ErrorKind::Length, "decimal: empty input"));
    }
    const uint128 limit = ~uint128(0);
    uint128 value = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return failure<uint128>(invalid_char(i, c, "decimal"));
        }
        unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (limit - digit) / 10) {
            return failure<uint128>(make_failure(ErrorKind::Range,
                "decimal: '%.*s' does not fit in 128 bits", static_cast<int>(text.size()), text.data()));
        }
        value = value * 10 + digit;
    }
    return success(value);
}

} // namespace ulid::codec
