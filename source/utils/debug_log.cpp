#include "utils/debug_log.hpp"
#include "utils/environment.hpp"

#include <iostream>
#include <string>

namespace debug_log {

bool is_debug_enabled() {
    return environment::is_truthy(environment::get_variable("CMCPS_DEBUG"));
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[cmcps] " << message << std::endl;
}

} // namespace debug_log
