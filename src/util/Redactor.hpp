#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ads_mcp {

/**
 * @brief Scrubs credential material from text before it leaves the process
 *
 * Replaces every configured secret value, plus token-shaped substrings
 * (bearer tokens, OAuth access/refresh tokens, JSON credential members),
 * with "[REDACTED]".
 */
class Redactor {
public:
    Redactor() = default;
    explicit Redactor(std::vector<std::string> secrets);

    /**
     * @brief Add a literal secret value; values shorter than 4 characters are ignored
     */
    void add_secret(const std::string& secret);

    /**
     * @brief Mask secrets in text; runs in time linear in the text length
     */
    std::string redact(const std::string& text) const;

    /**
     * @brief Cut text to at most max_length bytes plus a truncation marker
     */
    static std::string truncate(const std::string& text, size_t max_length);

private:
    std::vector<std::string> secrets_;
};

} // namespace ads_mcp
