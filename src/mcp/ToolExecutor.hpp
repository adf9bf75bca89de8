#pragma once

#include "ContentBlock.hpp"
#include "ToolRegistry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ads_mcp {

/**
 * @brief Bridges a tools/call request to the registered callable
 *
 * Validates arguments against the tool's input schema, invokes the handler
 * and normalizes its return value. Knows nothing about JSON-RPC envelopes.
 */
class ToolExecutor {
public:
    explicit ToolExecutor(std::shared_ptr<const IToolRegistry> registry);

    /**
     * @brief Run a tool
     *
     * @param name Registered tool name
     * @param arguments JSON object with tool arguments
     * @return Normalized content blocks
     * @throws ToolNotFoundError if no tool has this name
     * @throws ToolExecutionError if arguments violate the schema or the handler throws
     * @throws NormalizationError if the handler result cannot be converted
     */
    std::vector<ContentBlock> execute(const std::string& name, const json& arguments) const;

private:
    std::shared_ptr<const IToolRegistry> registry_;
};

} // namespace ads_mcp
