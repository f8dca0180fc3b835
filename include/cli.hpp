#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "generator.hpp"
#include "ulid.hpp"

namespace ulid::cli {

enum class OutputFormat { String,
    Integer,
    Hex,
    Uuid };

struct Options {
    uint32_t count = 1;
    bool count_given = false;
    bool monotonic = false;
    OutputFormat format = OutputFormat::String;
    bool json = false;
    bool help = false;
    std::string config_path;
    std::vector<std::string> ulids; // values to inspect
};

struct ParseResult {
    bool ok { false };
    Options options {};
    std::string error;
};

bool parse_format(const std::string& name, OutputFormat& out);
std::string format_name(OutputFormat format);

// Value of -c/--config, empty when absent.
std::string find_config_path(int argc, const char* const* argv);

// Applies a JSON config file {"count", "monotonic", "format"} onto options.
bool load_config(const std::string& path, Options& options, std::string& error);

// Parses argv on top of base (the config file defaults).
ParseResult parse_args(int argc, const char* const* argv, Options base = {});

std::string render(const Ulid& id, OutputFormat format);
std::string iso8601(const Ulid& id);

std::string describe(const Ulid& id);
nlohmann::json describe_json(const Ulid& id);

int generate(const Options& options, Generator& generator, std::ostream& out, std::ostream& err);
int inspect(const std::vector<std::string>& values, bool json, std::ostream& out);

const char* usage();

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace ulid::cli
