#include "protocol/tool_contract.hpp"

#include <nlohmann/json.hpp>

namespace autoloop::protocol {

std::string ToolSpec::parameters_json() const {
    nlohmann::ordered_json properties = nlohmann::ordered_json::object();
    nlohmann::ordered_json required = nlohmann::ordered_json::array();
    for (const auto& parameter : parameters) {
        properties[parameter.name] = {{"type", "string"},
                                      {"description", parameter.description}};
        if (parameter.type == ParameterType::String) {
            required.push_back(parameter.name);
        }
    }

    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"] = properties;
    schema["required"] = required;
    return schema.dump();
}

}  // namespace autoloop::protocol
