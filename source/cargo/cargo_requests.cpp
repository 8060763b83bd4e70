#include "cargo/cargo_requests.hpp"

namespace cargo_requests {

static const json *find_member(const json &arguments, const std::string &field) {
    if (!arguments.is_object()) {
        return nullptr;
    }
    auto member = arguments.find(field);
    if (member == arguments.end() || member->is_null()) {
        return nullptr;
    }
    return &*member;
}

const CargoOptions &common_options(const CargoRequest &request) {
    return std::visit([](const auto &typed_request) -> const CargoOptions & { return typed_request.options; },
                      request);
}

std::optional<std::string> optional_string(const json &arguments, const std::string &field) {
    const json *value = find_member(arguments, field);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw ArgumentError("Invalid argument '" + field + "': expected a string");
    }
    return value->get<std::string>();
}

std::string required_string(const json &arguments, const std::string &field) {
    std::optional<std::string> value = optional_string(arguments, field);
    if (!value) {
        throw ArgumentError("Missing required argument '" + field + "' (string)");
    }
    return *value;
}

bool optional_bool(const json &arguments, const std::string &field) {
    const json *value = find_member(arguments, field);
    if (value == nullptr) {
        return false;
    }
    if (!value->is_boolean()) {
        throw ArgumentError("Invalid argument '" + field + "': expected a boolean");
    }
    return value->get<bool>();
}

std::vector<std::string> optional_string_list(const json &arguments, const std::string &field) {
    const json *value = find_member(arguments, field);
    if (value == nullptr) {
        return {};
    }
    if (!value->is_array()) {
        throw ArgumentError("Invalid argument '" + field + "': expected an array of strings");
    }

    std::vector<std::string> items;
    for (const auto &item : *value) {
        if (!item.is_string()) {
            throw ArgumentError("Invalid argument '" + field + "': expected an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

void validate_environment_name(const std::string &name) {
    if (name.empty() || name.find_first_of(std::string("=\0", 2)) != std::string::npos) {
        throw ArgumentError("Invalid environment variable name '" + name +
                            "': must be non-empty and contain no '=' or NUL");
    }
}

std::string encode_environment_value(const std::string &name, const json &value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    throw ArgumentError("Invalid value for environment variable '" + name +
                        "': arrays and objects are not supported");
}

EnvironmentMap environment_map(const json &arguments, const std::string &field) {
    const json *value = find_member(arguments, field);
    if (value == nullptr) {
        return {};
    }
    if (!value->is_object()) {
        throw ArgumentError("Invalid argument '" + field + "': expected an object of environment variables");
    }

    EnvironmentMap environment;
    for (auto entry = value->begin(); entry != value->end(); ++entry) {
        validate_environment_name(entry.key());
        environment[entry.key()] = encode_environment_value(entry.key(), entry.value());
    }
    return environment;
}

CargoOptions cargo_options(const json &arguments) {
    CargoOptions options;
    options.toolchain = optional_string(arguments, "toolchain");
    options.cargo_env = environment_map(arguments, "cargo_env");
    return options;
}

} // namespace cargo_requests
