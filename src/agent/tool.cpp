#include "shellguard/agent/tool.hpp"

namespace shellguard::agent {

auto ToolDefinition::parameters_schema() const -> json {
    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& param : parameters) {
        json prop;
        prop["type"] = param.type;
        prop["description"] = param.description;

        if (param.default_value.has_value()) {
            prop["default"] = *param.default_value;
        }

        properties[param.name] = prop;

        if (param.required) {
            required_params.push_back(param.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }
    return schema;
}

auto ToolDefinition::to_json() const -> json {
    json j;
    j["name"] = name;
    j["description"] = description;
    j["input_schema"] = parameters_schema();
    return j;
}

auto ToolDefinition::to_openai_json() const -> json {
    // {"type": "function", "function": {"name", "description", "parameters"}}
    json func;
    func["name"] = name;
    func["description"] = description;
    func["parameters"] = parameters_schema();

    json j;
    j["type"] = "function";
    j["function"] = func;
    return j;
}

} // namespace shellguard::agent
