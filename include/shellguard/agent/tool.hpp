#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "shellguard/core/error.hpp"

namespace shellguard::agent {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Describes a single parameter for a tool.
struct ToolParameter {
    std::string name;
    std::string type;         // JSON Schema type: "string", "number", "boolean", "object", "array"
    std::string description;
    bool required = true;
    std::optional<json> default_value;
};

/// Full definition of a tool, used to describe the tool to a model provider.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    /// JSON Schema object for the parameters: {"type": "object", "properties": ..., "required": [...]}.
    [[nodiscard]] auto parameters_schema() const -> json;

    /// {"name", "description", "input_schema"}.
    [[nodiscard]] auto to_json() const -> json;

    /// OpenAI function tool format.
    [[nodiscard]] auto to_openai_json() const -> json;
};

/// Abstract base class for tools that can be invoked by an agent.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    /// Execute the tool with the given parameters.
    /// Returns the tool result as JSON, or an error for malformed parameters.
    virtual auto execute(json params) -> awaitable<Result<json>> = 0;
};

} // namespace shellguard::agent
