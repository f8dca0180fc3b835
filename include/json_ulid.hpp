#pragma once
#include <nlohmann/json.hpp>
#include "ulid.hpp"

namespace ulid {

// nlohmann/json serialization, found by ADL:
//   nlohmann::json j = id;            // canonical string
//   auto id = j.get<ulid::Ulid>();
// from_json also takes UUID strings, 16-byte binary values (CBOR,
// MessagePack) and unsigned integers up to 64 bits. Throws UlidError.
void to_json(nlohmann::json& j, const Ulid& id);
void from_json(const nlohmann::json& j, Ulid& id);

// 16-byte binary value, for the binary formats.
nlohmann::json to_json_binary(const Ulid& id);

} // namespace ulid
