/*
 * ScriptCell C++ - Script Execution Tool
 *
 * Exposes the engine to an agent as the run_python_script tool:
 *   script   (string, required)  source text, or a path when is_file is set
 *   is_file  (boolean)           treat script as a file path
 * The tool output is the response JSON.
 */
#ifndef scriptcell_CORE_SCRIPT_TOOL_HPP
#define scriptcell_CORE_SCRIPT_TOOL_HPP

#include "tool.hpp"
#include "engine.hpp"

namespace scriptcell {

class ScriptToolProvider : public ToolProvider {
public:
    explicit ScriptToolProvider(const ScriptEngine& engine);

    const char* tool_id() const override { return "python"; }
    const char* description() const override {
        return "Run a short Python script in an isolated sandbox";
    }

    std::vector<std::string> actions() const override;
    ToolResult execute(const std::string& action, const Json& params) override;
    std::vector<AgentTool> get_agent_tools() const override;

    AgentToolResult run_script(const Json& params) const;

private:
    const ScriptEngine& engine_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_SCRIPT_TOOL_HPP
