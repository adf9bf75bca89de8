#include "Env.hpp"
#include <cstdlib>

namespace ads_mcp {

std::optional<std::string> system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace ads_mcp
