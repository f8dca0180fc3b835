#include "json_ulid.hpp"
#include <string>
#include <vector>
#include "uuid.hpp"

namespace ulid {

void to_json(nlohmann::json& j, const Ulid& id) {
    j = id.to_string();
}

void from_json(const nlohmann::json& j, Ulid& id) {
    if (j.is_string()) {
        id = try_parse_any(j.get_ref<const std::string&>()).get();
        return;
    }
    if (j.is_binary()) {
        const auto& bin = j.get_binary();
        id = Ulid::try_from_bytes(bin.data(), bin.size()).get();
        return;
    }
    if (j.is_number_unsigned()) {
        id = Ulid(j.get<uint64_t>());
        return;
    }
    if (j.is_number_integer()) {
        auto v = j.get<int64_t>();
        if (v < 0) throw UlidError(make_failure(ErrorKind::Range, "json: negative value %lld", static_cast<long long>(v)));
        id = Ulid(static_cast<uint64_t>(v));
        return;
    }
    throw UlidError(make_failure(ErrorKind::Type, "json: cannot read a ulid from a %s value", j.type_name()));
}

nlohmann::json to_json_binary(const Ulid& id) {
    auto bytes = id.to_bytes();
    return nlohmann::json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

} // namespace ulid
