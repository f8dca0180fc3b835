// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <iostream>
#include <string>
#include <string_view>
#include "codec.hpp"
#include "ulid.hpp"
#include "uuid.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jdaloc = rapidjson::Document::AllocatorType;

namespace ulid {

// Serialized representation of a Ulid: the canonical 26 character string,
// or the raw 128-bit value as a JSON number.
enum class Shape { String,
    Integer };

} // namespace ulid

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a RapidJSON Document; prints the error and
    // returns false on failure. With numbers_as_strings every number keeps its
    // source digits as a string value, which preserves 128-bit integers.
    inline bool parse_str(const std::string& json_string, jdoc& document, bool numbers_as_strings = false) {
        if (numbers_as_strings) {
            document.Parse<rapidjson::kParseNumbersAsStringsFlag>(json_string.c_str());
        } else {
            document.Parse(json_string.c_str());
        }
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error: " << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    // Helper function to stringify a RapidJSON Document into a std::string.
    inline std::string stringify(const jdoc& document) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        document.Accept(writer);
        return buffer.GetString();
    }

    // Emit id through a SAX writer. The integer shape is written as a bare
    // number of up to 39 digits, beyond what a DOM value can hold.
    template <typename Writer>
    inline void write_ulid(Writer& writer, const ulid::Ulid& id, ulid::Shape shape) {
        if (shape == ulid::Shape::Integer) {
            std::string digits = ulid::codec::to_decimal(id.value());
            writer.RawValue(digits.c_str(), digits.size(), rapidjson::kNumberType);
            return;
        }
        std::string text = id.to_string();
        writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    }

    inline std::string to_json(const ulid::Ulid& id, ulid::Shape shape) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_ulid(writer, id, shape);
        return buffer.GetString();
    }

    // String shape accepts a ULID or UUID string. Integer shape accepts a
    // uint64 number; digit strings are accepted only with numbers_as_strings,
    // i.e. for documents parsed with parse_str(..., true). Without it a JSON
    // string such as "123" is a Type failure.
    inline ulid::Result<ulid::Ulid> read_ulid(const jval& value, ulid::Shape shape, bool numbers_as_strings = false) {
        using ulid::ErrorKind;
        if (shape == ulid::Shape::String) {
            if (!value.IsString()) {
                return ulid::failure<ulid::Ulid>(ulid::make_failure(ErrorKind::Type, "json: expected a ulid string"));
            }
            return ulid::try_parse_any(std::string_view(value.GetString(), value.GetStringLength()));
        }

        if (value.IsUint64()) return ulid::success(ulid::Ulid(value.GetUint64()));
        if (value.IsString() && numbers_as_strings) {
            auto r = ulid::codec::try_from_decimal(std::string_view(value.GetString(), value.GetStringLength()));
            if (!r) return ulid::failure<ulid::Ulid>(r.error);
            return ulid::success(ulid::Ulid(r.value));
        }
        if (value.IsNumber()) {
            return ulid::failure<ulid::Ulid>(ulid::make_failure(ErrorKind::Range,
                "json: number does not fit in 64 bits, parse with numbers as strings"));
        }
        return ulid::failure<ulid::Ulid>(ulid::make_failure(ErrorKind::Type, "json: expected a ulid integer"));
    }

    inline ulid::Result<ulid::Ulid> get_ulid(const jval& parent, const std::string& key, ulid::Shape shape,
                                             bool numbers_as_strings = false) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) {
            return ulid::failure<ulid::Ulid>(ulid::make_failure(ulid::ErrorKind::Type,
                "json: missing member '%s'", key.c_str()));
        }
        return read_ulid(parent.FindMember(key.c_str())->value, shape, numbers_as_strings);
    }

    // DOM values hold the string shape only.
    inline void set_ulid(jdoc& document, const std::string& key, const ulid::Ulid& id) {
        jdaloc& allocator = document.GetAllocator();
        std::string text = id.to_string();
        document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                           rapidjson::Value(text.c_str(), allocator).Move(),
                           allocator);
    }

} // namespace jhlp
