#include "session/session_records.hpp"

#include <stdexcept>

namespace session_records {

bool operator==(const CargoSessionData &left, const CargoSessionData &right) {
    return left.default_toolchain == right.default_toolchain && left.cargo_env == right.cargo_env;
}

bool operator==(const SharedContextData &left, const SharedContextData &right) {
    return left.context_path == right.context_path;
}

void to_json(json &output, const CargoSessionData &data) {
    output = json::object();
    if (data.default_toolchain) {
        output["default_toolchain"] = *data.default_toolchain;
    }
    if (!data.cargo_env.empty()) {
        output["cargo_env"] = data.cargo_env;
    }
}

void from_json(const json &input, CargoSessionData &data) {
    data = CargoSessionData{};
    if (!input.is_object()) {
        throw std::invalid_argument("cargo session record must be an object");
    }
    auto toolchain = input.find("default_toolchain");
    if (toolchain != input.end() && !toolchain->is_null()) {
        data.default_toolchain = toolchain->get<std::string>();
    }
    auto environment = input.find("cargo_env");
    if (environment != input.end() && !environment->is_null()) {
        data.cargo_env = environment->get<std::map<std::string, std::string>>();
    }
}

void to_json(json &output, const SharedContextData &data) {
    output = json::object();
    if (data.context_path) {
        output["context_path"] = *data.context_path;
    }
}

void from_json(const json &input, SharedContextData &data) {
    data = SharedContextData{};
    if (!input.is_object()) {
        throw std::invalid_argument("shared context record must be an object");
    }
    auto path = input.find("context_path");
    if (path != input.end() && !path->is_null()) {
        data.context_path = path->get<std::string>();
    }
}

} // namespace session_records
