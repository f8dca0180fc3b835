#include "cli.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include "codec.hpp"
#include "uuid.hpp"

namespace ulid::cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

bool parse_count(const std::string& text, uint32_t& out) {
    if (text.empty() || text.size() > 10) return false;
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    if (v > UINT32_MAX) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace

bool parse_format(const std::string& name, OutputFormat& out) {
    if (name == "string") {
        out = OutputFormat::String;
        return true;
    }
    if (name == "integer") {
        out = OutputFormat::Integer;
        return true;
    }
    if (name == "hex") {
        out = OutputFormat::Hex;
        return true;
    }
    if (name == "uuid") {
        out = OutputFormat::Uuid;
        return true;
    }
    return false;
}

std::string format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::String:
            return "string";
        case OutputFormat::Integer:
            return "integer";
        case OutputFormat::Hex:
            return "hex";
        case OutputFormat::Uuid:
            return "uuid";
    }
    return "string";
}

std::string find_config_path(int argc, const char* const* argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") return argv[i + 1];
    }
    return "";
}

bool load_config(const std::string& path, Options& options, std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = "cannot open config file: " + path;
        return false;
    }
    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        error = "invalid config file " + path + ": " + e.what();
        return false;
    }
    if (!j.is_object()) {
        error = "invalid config file " + path + ": expected a JSON object";
        return false;
    }

    if (j.contains("count")) {
        const auto& c = j["count"];
        if (!c.is_number_unsigned() || c.get<uint64_t>() > UINT32_MAX) {
            error = "invalid config file " + path + ": 'count' must be a non-negative integer";
            return false;
        }
        options.count = c.get<uint32_t>();
    }
    if (j.contains("monotonic")) {
        const auto& m = j["monotonic"];
        if (!m.is_boolean()) {
            error = "invalid config file " + path + ": 'monotonic' must be a boolean";
            return false;
        }
        options.monotonic = m.get<bool>();
    }
    if (j.contains("format")) {
        const auto& fm = j["format"];
        if (!fm.is_string() || !parse_format(fm.get<std::string>(), options.format)) {
            error = "invalid config file " + path + ": unknown 'format'";
            return false;
        }
    }
    options.config_path = path;
    return true;
}

ParseResult parse_args(int argc, const char* const* argv, Options base) {
    ParseResult r;
    r.options = std::move(base);
    Options& o = r.options;

    auto value_of = [&](int& i, const std::string& flag, std::string& out) -> bool {
        if (i + 1 >= argc) {
            r.error = "missing value for " + flag;
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (arg == "-h" || arg == "--help") {
            o.help = true;
        } else if (arg == "-m" || arg == "--monotonic") {
            o.monotonic = true;
        } else if (arg == "-j" || arg == "--json") {
            o.json = true;
        } else if (arg == "-n" || arg == "--count") {
            if (!value_of(i, arg, value)) return r;
            if (!parse_count(value, o.count)) {
                r.error = "invalid count: " + value;
                return r;
            }
            o.count_given = true;
        } else if (arg == "-f" || arg == "--format") {
            if (!value_of(i, arg, value)) return r;
            if (!parse_format(value, o.format)) {
                r.error = "unknown format: " + value;
                return r;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (!value_of(i, arg, value)) return r;
            o.config_path = value;
        } else if (arg.size() > 1 && arg[0] == '-') {
            r.error = "unknown option: " + arg;
            return r;
        } else {
            o.ulids.push_back(arg);
        }
    }

    if (o.count_given && !o.ulids.empty()) {
        r.error = "--count cannot be combined with values to inspect";
        return r;
    }
    r.ok = true;
    return r;
}

std::string render(const Ulid& id, OutputFormat format) {
    switch (format) {
        case OutputFormat::String:
            return id.to_string();
        case OutputFormat::Integer:
            return codec::to_decimal(id.value());
        case OutputFormat::Hex:
            return codec::to_hex(id.value());
        case OutputFormat::Uuid:
            return to_uuid(id).to_string();
    }
    return id.to_string();
}

std::string iso8601(const Ulid& id) {
    uint64_t ts = id.timestamp_ms();
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm {};
    gmtime_r(&secs, &tm);
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf, n) + format(".%03uZ", static_cast<unsigned>(ts % 1000));
}

std::string describe(const Ulid& id) {
    std::string hex = codec::to_hex(id.value());
    std::stringstream ss;
    ss << "\nREPRESENTATION:\n\n"
       << "  String: " << id.to_string() << "\n"
       << "     Raw: " << hex << "\n"
       << "    UUID: " << to_uuid(id).to_string() << "\n"
       << "\nCOMPONENTS:\n\n"
       << "       Time: " << iso8601(id) << "\n"
       << "  Timestamp: " << id.timestamp_ms() << "\n"
       << "    Payload: " << hex.substr(12) << "\n";
    return ss.str();
}

nlohmann::json describe_json(const Ulid& id) {
    std::string hex = codec::to_hex(id.value());
    return nlohmann::json {
        { "ulid", id.to_string() },
        { "raw", hex },
        { "uuid", to_uuid(id).to_string() },
        { "time", iso8601(id) },
        { "timestamp", id.timestamp_ms() },
        { "payload", hex.substr(12) },
    };
}

int generate(const Options& options, Generator& generator, std::ostream& out, std::ostream& err) {
    uint32_t i = 0;
    while (i < options.count) {
        auto next = options.monotonic ? generator.try_generate_monotonic() : generator.try_generate();
        if (next) {
            out << render(next.value, options.format) << "\n";
            ++i;
            continue;
        }
        if (next.error.kind == ErrorKind::Exhausted) {
            err << "Failed to create new ulid due to overflow, sleeping 1 ms" << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue; // do not count the failed attempt
        }
        err << "Error: " << next.error.message << std::endl;
        return EXIT_INVALID;
    }
    out.flush();
    return EXIT_OK;
}

int inspect(const std::vector<std::string>& values, bool json, std::ostream& out) {
    int rc = EXIT_OK;
    for (const auto& val : values) {
        auto id = try_parse_any(val);
        if (!id) {
            rc = EXIT_INVALID;
            if (json) {
                nlohmann::json j {
                    { "input", val },
                    { "error", error_kind_name(id.error.kind) },
                    { "message", id.error.message },
                };
                out << j.dump() << "\n";
            } else {
                out << val << " is not a valid ULID: " << id.error.message << "\n";
            }
            continue;
        }
        if (json) {
            out << describe_json(id.value).dump() << "\n";
        } else {
            out << describe(id.value);
        }
    }
    return rc;
}

const char* usage() {
    return "Usage: ulid [OPTIONS] [ULID...]\n"
           "\n"
           "Generate ULIDs, or inspect the ULIDs (or UUIDs) given as arguments.\n"
           "\n"
           "Options:\n"
           "  -n, --count N      number of ULIDs to generate (default 1)\n"
           "  -m, --monotonic    generate monotonically increasing ULIDs\n"
           "  -f, --format FMT   output format: string, integer, hex, uuid\n"
           "  -j, --json         print inspection results as JSON\n"
           "  -c, --config FILE  JSON file with defaults for count, monotonic, format\n"
           "  -h, --help         print this help\n";
}

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    Options base;
    std::string config = find_config_path(argc, argv);
    if (!config.empty()) {
        std::string error;
        if (!load_config(config, base, error)) {
            err << "Error: " << error << std::endl;
            return EXIT_USAGE;
        }
    }

    ParseResult parsed = parse_args(argc, argv, base);
    if (!parsed.ok) {
        err << "Error: " << parsed.error << "\n\n" << usage();
        return EXIT_USAGE;
    }
    const Options& o = parsed.options;
    if (o.help) {
        out << usage();
        return EXIT_OK;
    }
    if (!o.ulids.empty()) {
        return inspect(o.ulids, o.json, out);
    }

    Generator generator;
    return generate(o, generator, out, err);
}

} // namespace ulid::cli
