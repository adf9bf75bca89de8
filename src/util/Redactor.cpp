#include "Redactor.hpp"
#include <cctype>
#include <optional>

namespace ads_mcp {

namespace {

constexpr const char* kMask = "[REDACTED]";
constexpr size_t kMinSecretLength = 4;

const char* const kCredentialMembers[] = {
    "access_token", "refresh_token", "client_secret", "id_token", "developer_token"
};

// A hit at some position: text up to keep_end is copied, [keep_end, end) is masked.
struct Match {
    size_t keep_end;
    size_t end;
};

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

bool is_bearer_char(char c) {
    return is_token_char(c) || c == '~' || c == '+' || c == '/' || c == '=';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t skip(const std::string& text, size_t pos, bool (*pred)(char)) {
    while (pos < text.size() && pred(text[pos])) {
        ++pos;
    }
    return pos;
}

bool starts_with_at(const std::string& text, size_t pos, const std::string& prefix,
                    bool ignore_case = false) {
    if (text.size() - pos < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        char c = text[pos + i];
        if (ignore_case) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (c != prefix[i]) {
            return false;
        }
    }
    return true;
}

// Single left-to-right pass; a hit resumes scanning after the masked run.
template <typename Matcher>
std::string replace_matches(const std::string& text, Matcher match) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        if (auto hit = match(text, pos)) {
            out.append(text, pos, hit->keep_end - pos);
            out += kMask;
            pos = hit->end;
        } else {
            out += text[pos++];
        }
    }
    return out;
}

// "Bearer <token>": keeps the scheme, masks the token
std::optional<Match> match_bearer(const std::string& text, size_t pos) {
    if (!starts_with_at(text, pos, "bearer", true)) {
        return std::nullopt;
    }
    size_t token_start = skip(text, pos + 6, is_space);
    if (token_start == pos + 6) {
        return std::nullopt;
    }
    size_t end = skip(text, token_start, is_bearer_char);
    if (end == token_start) {
        return std::nullopt;
    }
    return Match{token_start, end};
}

// OAuth token shapes such as "ya29.<token>" and "1//<token>", masked whole
std::optional<Match> match_prefixed_token(const std::string& text, size_t pos,
                                          const std::string& prefix) {
    if (!starts_with_at(text, pos, prefix)) {
        return std::nullopt;
    }
    size_t end = skip(text, pos + prefix.size(), is_token_char);
    if (end == pos + prefix.size()) {
        return std::nullopt;
    }
    return Match{pos, end};
}

// "<credential member>": "<value>", masks the value
std::optional<Match> match_credential_member(const std::string& text, size_t pos) {
    if (text[pos] != '"') {
        return std::nullopt;
    }
    for (const std::string key : kCredentialMembers) {
        if (!starts_with_at(text, pos + 1, key + "\"")) {
            continue;
        }
        size_t p = skip(text, pos + key.size() + 2, is_space);
        if (p >= text.size() || text[p] != ':') {
            return std::nullopt;
        }
        p = skip(text, p + 1, is_space);
        if (p >= text.size() || text[p] != '"') {
            return std::nullopt;
        }
        size_t close = text.find('"', p + 1);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        return Match{p + 1, close};
    }
    return std::nullopt;
}

void replace_all(std::string& text, const std::string& needle) {
    size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), kMask);
        pos += std::char_traits<char>::length(kMask);
    }
}

} // namespace

Redactor::Redactor(std::vector<std::string> secrets) {
    for (const auto& secret : secrets) {
        add_secret(secret);
    }
}

void Redactor::add_secret(const std::string& secret) {
    if (secret.size() >= kMinSecretLength) {
        secrets_.push_back(secret);
    }
}

std::string Redactor::redact(const std::string& text) const {
    std::string result = text;
    for (const auto& secret : secrets_) {
        replace_all(result, secret);
    }

    result = replace_matches(result, match_bearer);
    result = replace_matches(result, [](const std::string& s, size_t pos) {
        return match_prefixed_token(s, pos, "ya29.");
    });
    result = replace_matches(result, [](const std::string& s, size_t pos) {
        return match_prefixed_token(s, pos, "1//");
    });
    return replace_matches(result, match_credential_member);
}

std::string Redactor::truncate(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length) + "... (truncated)";
}

} // namespace ads_mcp
