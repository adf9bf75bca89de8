#pragma once

#include <functional>
#include <optional>
#include <string>

namespace ads_mcp {

/**
 * @brief Environment variable lookup; returns nullopt for unset or empty variables
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief EnvLookup backed by the process environment
 */
std::optional<std::string> system_env(const std::string& name);

} // namespace ads_mcp
