#include "ToolExecutor.hpp"
#include "Errors.hpp"
#include "SchemaValidator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ads_mcp {

ToolExecutor::ToolExecutor(std::shared_ptr<const IToolRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }
}

std::vector<ContentBlock> ToolExecutor::execute(const std::string& name,
                                                const json& arguments) const {
    const RegisteredTool* tool = registry_->find(name);
    if (tool == nullptr) {
        throw ToolNotFoundError(name);
    }

    json result;
    try {
        SchemaValidator::validate(tool->info.input_schema, arguments);
        result = tool->handler(arguments);
    } catch (const McpError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::debug("Tool {} raised an exception, reporting it as an execution error", name);
        throw ToolExecutionError(name, e.what());
    }

    auto blocks = normalize_result(result);
    spdlog::debug("Tool {} produced {} content block(s)", name, blocks.size());
    return blocks;
}

} // namespace ads_mcp
