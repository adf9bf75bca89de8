#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace ads_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from stdin
 * Writes JSON messages line-by-line to stdout with flush
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_message() override;
    void write_message(const std::string& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace ads_mcp
