#include "SchemaValidator.hpp"
#include <stdexcept>

namespace ads_mcp {

bool SchemaValidator::is_type(const json& instance, const std::string& type) {
    if (type == "object") return instance.is_object();
    if (type == "array") return instance.is_array();
    if (type == "string") return instance.is_string();
    if (type == "number") return instance.is_number();
    if (type == "integer") return instance.is_number_integer();
    if (type == "boolean") return instance.is_boolean();
    if (type == "null") return instance.is_null();
    return true;  // unknown type names pass
}

bool SchemaValidator::matches_type(const json& instance, const json& type) {
    if (type.is_string()) {
        return is_type(instance, type.get<std::string>());
    }
    if (type.is_array()) {
        for (const auto& candidate : type) {
            if (candidate.is_string() && is_type(instance, candidate.get<std::string>())) {
                return true;
            }
        }
        return false;
    }
    return true;
}

void SchemaValidator::validate_property(const std::string& name, const json& schema,
                                        const json& value) {
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("type") && !matches_type(value, schema["type"])) {
        throw std::invalid_argument("Invalid type for argument '" + name + "': expected " +
                                    schema["type"].dump() + ", got " + value.type_name());
    }
    if (value.is_array() && schema.contains("items") && schema["items"].is_object() &&
        schema["items"].contains("type")) {
        const auto& item_type = schema["items"]["type"];
        for (size_t i = 0; i < value.size(); ++i) {
            if (!matches_type(value[i], item_type)) {
                throw std::invalid_argument("Invalid type for argument '" + name + "[" +
                                            std::to_string(i) + "]': expected " +
                                            item_type.dump());
            }
        }
    }
}

void SchemaValidator::validate(const json& schema, const json& instance) {
    if (!schema.is_object()) {
        return;
    }

    if (schema.contains("type") && !matches_type(instance, schema["type"])) {
        throw std::invalid_argument(std::string("Arguments must be of type ") +
                                    schema["type"].dump());
    }
    if (!instance.is_object()) {
        return;
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& key : schema["required"]) {
            if (key.is_string() && !instance.contains(key.get<std::string>())) {
                throw std::invalid_argument("Missing required parameter: " +
                                            key.get<std::string>());
            }
        }
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        for (const auto& [name, subschema] : schema["properties"].items()) {
            auto it = instance.find(name);
            if (it != instance.end()) {
                validate_property(name, subschema, *it);
            }
        }
    }
}

} // namespace ads_mcp
