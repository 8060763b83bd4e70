#ifndef CMCPS_CARGO_REQUESTS_HPP
#define CMCPS_CARGO_REQUESTS_HPP

// Validated tool call arguments: one struct per tool, gathered into closed
// variants so execution is a single exhaustive std::visit.

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace cargo_requests {

using json = nlohmann::json;

using EnvironmentMap = std::map<std::string, std::string>;

// Tool arguments failed validation. The message names the offending field.
class ArgumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Options every cargo tool accepts.
struct CargoOptions {
    std::optional<std::string> toolchain;
    EnvironmentMap cargo_env;
};

struct CargoCheck {
    std::optional<std::string> package;
    CargoOptions options;
};

struct CargoClippy {
    std::optional<std::string> package;
    bool fix = false;
    CargoOptions options;
};

struct CargoTest {
    std::optional<std::string> package;
    std::optional<std::string> test_name;
    CargoOptions options;
};

struct CargoFmtCheck {
    CargoOptions options;
};

struct CargoBuild {
    std::optional<std::string> package;
    bool release = false;
    CargoOptions options;
};

struct CargoBench {
    std::optional<std::string> package;
    std::optional<std::string> bench_name;
    std::optional<std::string> baseline;
    CargoOptions options;
};

struct CargoAdd {
    std::vector<std::string> dependencies; // never empty
    std::optional<std::string> package;
    bool dev = false;
    bool optional = false;
    std::vector<std::string> features;
    CargoOptions options;
};

struct CargoRemove {
    std::vector<std::string> dependencies; // never empty
    std::optional<std::string> package;
    bool dev = false;
    CargoOptions options;
};

struct CargoUpdate {
    std::optional<std::string> package;
    std::vector<std::string> dependencies;
    bool dry_run = false;
    CargoOptions options;
};

struct CargoClean {
    std::optional<std::string> package;
    CargoOptions options;
};

struct CargoRun {
    std::optional<std::string> package;
    std::optional<std::string> bin;
    std::optional<std::string> example;
    bool release = false;
    std::optional<std::string> features;
    bool all_features = false;
    bool no_default_features = false;
    std::vector<std::string> args; // passed to the binary after "--"
    CargoOptions options;
};

using CargoRequest = std::variant<CargoCheck, CargoClippy, CargoTest, CargoFmtCheck, CargoBuild,
                                  CargoBench, CargoAdd, CargoRemove, CargoUpdate, CargoClean,
                                  CargoRun>;

// Session configuration tools.

struct SetWorkingDirectory {
    std::string path; // absolute, relative to the server's cwd, or "~/..."
};

struct SetDefaultToolchain {
    std::optional<std::string> toolchain; // absent or empty clears the default
};

struct SetCargoEnv {
    // A null value (std::nullopt) removes the variable from the session.
    std::map<std::string, std::optional<std::string>> cargo_env;
    bool replace = false;
};

struct GetSessionInfo {
};

using ToolRequest = std::variant<CargoRequest, SetWorkingDirectory, SetDefaultToolchain,
                                 SetCargoEnv, GetSessionInfo>;

const CargoOptions &common_options(const CargoRequest &request);

// --- Argument decoding helpers (throw ArgumentError) ---
// Absent and null members decode as "not given".

std::optional<std::string> optional_string(const json &arguments, const std::string &field);
std::string required_string(const json &arguments, const std::string &field);
bool optional_bool(const json &arguments, const std::string &field);
std::vector<std::string> optional_string_list(const json &arguments, const std::string &field);

// Environment map: bool -> "true"/"false", number -> decimal text,
// string -> verbatim, null -> "". Arrays and objects are rejected.
EnvironmentMap environment_map(const json &arguments, const std::string &field);

// "toolchain" and "cargo_env".
CargoOptions cargo_options(const json &arguments);

// Names must be non-empty and free of '=' and NUL; throws ArgumentError.
void validate_environment_name(const std::string &name);

// Encode one environment value; throws ArgumentError for arrays and objects.
std::string encode_environment_value(const std::string &name, const json &value);

} // namespace cargo_requests

#endif // CMCPS_CARGO_REQUESTS_HPP
