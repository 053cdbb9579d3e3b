/*
 * ScriptCell C++ - Agent Tool Interface Implementation
 */
#include <scriptcell/core/tool.hpp>

namespace scriptcell {

Json AgentTool::to_json() const {
    Json properties = Json::object();
    Json required = Json::array();

    for (size_t i = 0; i < params.size(); ++i) {
        const ToolParamSchema& param = params[i];
        Json prop;
        prop["type"] = param.type;
        prop["description"] = param.description;
        properties[param.name] = prop;
        if (param.required) {
            required.push_back(param.name);
        }
    }

    Json j;
    j["name"] = name;
    j["description"] = description;
    j["parameters"]["type"] = "object";
    j["parameters"]["properties"] = properties;
    j["parameters"]["required"] = required;
    return j;
}

std::vector<AgentTool> ToolProvider::get_agent_tools() const {
    // Default implementation: create a generic wrapper for each action
    // Subclasses should override this to provide detailed descriptions
    std::vector<AgentTool> tools;

    const std::vector<std::string> action_list = actions();
    const std::string id = tool_id();
    const std::string desc = description();

    for (size_t i = 0; i < action_list.size(); ++i) {
        AgentTool tool;
        tool.name = id + "_" + action_list[i];
        tool.description = desc + " - " + action_list[i] + " action";
        tool.params.push_back(ToolParamSchema("params", "object", "Action parameters", false));

        ToolProvider* self = const_cast<ToolProvider*>(this);
        std::string action = action_list[i];
        tool.execute = [self, action](const Json& params) -> AgentToolResult {
            ToolResult result = self->execute(action, params);
            if (result.success) {
                return AgentToolResult::ok(dump_json(result.data));
            }
            return AgentToolResult::fail(result.error);
        };
        tools.push_back(tool);
    }

    return tools;
}

} // namespace scriptcell
