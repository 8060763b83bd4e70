#include "utils/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace environment {

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

std::string get_variable(const std::string &name) {
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

bool is_truthy(const std::string &value) {
    if (value.empty()) {
        return false;
    }
    std::string normalized = to_lower(value);
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

std::string sessions_directory() {
    std::string override_directory = get_variable("CMCPS_SESSION_DIR");
    if (!override_directory.empty()) {
        return override_directory;
    }

    std::string home = get_variable("HOME");
    std::filesystem::path base = home.empty() ? std::filesystem::path(".") : std::filesystem::path(home);
    return (base / ".ai-tools" / "sessions").string();
}

std::string expand_tilde(const std::string &path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // "~user" forms are not expanded.
        return path;
    }
    std::string home = get_variable("HOME");
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

} // namespace environment
