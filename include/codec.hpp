#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "ulid.hpp"

// Crockford base32 and big-endian byte codecs for 128-bit ULID values.
namespace ulid::codec {

static constexpr const char* ALPHABET = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// 5-bit value of c, case-insensitive; -1 when c is not in the alphabet.
int decode_symbol(char c);

// Writes exactly Ulid::STRING_LEN uppercase symbols to out.
void encode_base32(uint128 value, char* out);
std::string encode_base32(uint128 value);
Result<uint128> decode_base32(std::string_view text);

void to_bytes(uint128 value, uint8_t* out);
Result<uint128> from_bytes(const uint8_t* data, std::size_t len);

std::string to_hex(uint128 value);
std::string to_decimal(uint128 value);
Result<uint128> try_from_decimal(std::string_view text);

} // namespace ulid::codec
