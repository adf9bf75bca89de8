#include "JsonRpc.hpp"
#include <algorithm>
#include <optional>
#include <regex>

namespace ads_mcp {

namespace {

constexpr size_t kMaxIdScanBytes = 64 * 1024;
constexpr size_t kMaxIdLiteralBytes = 256;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Parses `: <literal>` starting right after a closing key quote.
std::optional<json> parse_id_value(const std::string& raw, size_t pos, size_t limit) {
    while (pos < limit && is_space(raw[pos])) {
        ++pos;
    }
    if (pos >= limit || raw[pos] != ':') {
        return std::nullopt;
    }
    ++pos;
    while (pos < limit && is_space(raw[pos])) {
        ++pos;
    }
    if (pos >= limit) {
        return std::nullopt;
    }

    static const std::regex literal_re(
        R"(^("(?:[^"\\]|\\.)*"|-?\d+(?:\.\d+)?(?:[eE][+-]?\d+)?|null))");

    std::string window = raw.substr(pos, std::min(kMaxIdLiteralBytes, limit - pos));
    std::smatch match;
    if (!std::regex_search(window, match, literal_re)) {
        return std::nullopt;
    }

    json value = json::parse(match.str(1), nullptr, false);
    if (value.is_discarded()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

json make_result(const json& id, json result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", std::move(result)}
    };
}

json make_error(const json& id, ErrorCode code, const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", static_cast<int>(code)},
            {"message", message}
        }}
    };
}

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

json scan_request_id(const std::string& raw) {
    const size_t limit = std::min(raw.size(), kMaxIdScanBytes);
    int depth = 0;
    bool in_string = false;
    size_t string_start = 0;

    for (size_t i = 0; i < limit; ++i) {
        char c = raw[i];

        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
                if (depth == 1 && raw.compare(string_start, i - string_start, "id") == 0) {
                    if (auto value = parse_id_value(raw, i + 1, limit)) {
                        return *value;
                    }
                }
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            string_start = i + 1;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        }
    }

    return nullptr;
}

} // namespace ads_mcp
