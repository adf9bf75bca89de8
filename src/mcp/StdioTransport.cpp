#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>

namespace ads_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_message() {
    std::string line;

    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            spdlog::debug("Reached end of input stream");
        } else {
            spdlog::error("Error reading from input stream");
        }
        return std::nullopt;
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    spdlog::debug("Read message: {}", line);
    return line;
}

void StdioTransport::write_message(const std::string& message) {
    out_ << message << std::endl;  // std::endl flushes automatically
    spdlog::debug("Wrote message: {}", message);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace ads_mcp
