#pragma once

#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief Minimal JSON Schema check for tool arguments
 *
 * Supports:
 * - type: object, array, string, number, integer, boolean, null
 *   (a single name or an array of names)
 * - required: [..]
 * - properties: { name: { type: ..., items: { type: ... } } }
 *
 * Unknown keywords are ignored.
 */
class SchemaValidator {
public:
    /**
     * @brief Validate an argument object against a tool's input schema
     * @throws std::invalid_argument describing the first violation found
     */
    static void validate(const json& schema, const json& instance);

private:
    static bool matches_type(const json& instance, const json& type);
    static bool is_type(const json& instance, const std::string& type);
    static void validate_property(const std::string& name, const json& schema, const json& value);
};

} // namespace ads_mcp
