/*
 * ScriptCell C++ - Agent Tool Interface
 *
 * Types an agent-coordination channel uses to discover and call tools.
 * A ToolProvider exposes a set of named actions; each action can also be
 * described as an AgentTool with a parameter schema.
 */
#ifndef scriptcell_CORE_TOOL_HPP
#define scriptcell_CORE_TOOL_HPP

#include "json.hpp"
#include <functional>
#include <string>
#include <vector>

namespace scriptcell {

// Tool parameter schema
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result
struct AgentToolResult {
    bool success;
    std::string output;     // Text handed back to the caller
    std::string error;      // Error message if failed

    AgentToolResult() : success(false) {}

    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }

    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Tool execution function type
typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

// Tool definition
struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;

    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}

    // Function-calling definition:
    // {"name", "description", "parameters": {"type": "object", "properties", "required"}}
    Json to_json() const;
};

// Structured result of ToolProvider::execute
struct ToolResult {
    bool success;
    Json data;
    std::string error;

    ToolResult() : success(false) {}

    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }

    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.error = err;
        return r;
    }
};

class ToolProvider {
public:
    virtual ~ToolProvider() {}

    virtual const char* tool_id() const = 0;
    virtual const char* description() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;

    // One generic tool per action unless a provider describes its own
    virtual std::vector<AgentTool> get_agent_tools() const;
};

} // namespace scriptcell

#endif // scriptcell_CORE_TOOL_HPP
