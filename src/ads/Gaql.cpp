#include "Gaql.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ads_mcp {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out << separator;
        }
        out << parts[i];
    }
    return out.str();
}

} // namespace

std::string GaqlQuery::to_string() const {
    if (resource.empty()) {
        throw std::invalid_argument("GAQL query requires a resource");
    }
    if (fields.empty()) {
        throw std::invalid_argument("GAQL query requires at least one field");
    }

    std::string query = "SELECT " + join(fields, ", ") + " FROM " + resource;
    if (!conditions.empty()) {
        query += " WHERE " + join(conditions, " AND ");
    }
    if (!orderings.empty()) {
        query += " ORDER BY " + join(orderings, ", ");
    }
    if (limit) {
        query += " LIMIT " + std::to_string(*limit);
    }
    return query;
}

std::string normalize_customer_id(const std::string& customer_id) {
    std::string digits;
    for (char c : customer_id) {
        if (c == '-' || c == ' ') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid customer id: " + customer_id);
        }
        digits += c;
    }
    if (digits.empty()) {
        throw std::invalid_argument("Customer id cannot be empty");
    }
    return digits;
}

std::string snake_to_camel(const std::string& segment) {
    std::string result;
    result.reserve(segment.size());
    bool upper_next = false;
    for (char c : segment) {
        if (c == '_') {
            upper_next = !result.empty();
            continue;
        }
        result += upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        upper_next = false;
    }
    return result;
}

json format_row(const json& row, const std::vector<std::string>& fields) {
    json formatted = json::object();
    for (const auto& field : fields) {
        const json* current = &row;
        std::istringstream path(field);
        std::string segment;
        while (current != nullptr && std::getline(path, segment, '.')) {
            if (!current->is_object()) {
                current = nullptr;
                break;
            }
            auto it = current->find(snake_to_camel(segment));
            current = it == current->end() ? nullptr : &*it;
        }
        formatted[field] = current != nullptr ? *current : json(nullptr);
    }
    return formatted;
}

} // namespace ads_mcp
