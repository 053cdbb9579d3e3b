/*
 * ScriptCell C++ - Script Execution Tool Implementation
 */
#include <scriptcell/core/script_tool.hpp>
#include <scriptcell/core/utils.hpp>

#include <sstream>

namespace scriptcell {

namespace {

const char* const ACTION_RUN = "run_python_script";

std::string tool_description(const ScriptEngine& engine) {
    const ResourceLimits& limits = engine.limits();
    std::ostringstream oss;
    oss << "Execute a Python script in a sandbox and return its stdout, stderr, "
        << "exception and exit code as JSON. Runs for at most "
        << format_seconds(limits.timeout_seconds) << " seconds with "
        << limits.memory_mb() << " MB of memory. Scripts may import only: "
        << join(std::vector<std::string>(engine.policy().allowed_modules().begin(),
                                         engine.policy().allowed_modules().end()), ", ")
        << ". Files, processes, sockets and dynamic code evaluation are not available.";
    return oss.str();
}

} // anonymous namespace

ScriptToolProvider::ScriptToolProvider(const ScriptEngine& engine)
    : engine_(engine) {}

std::vector<std::string> ScriptToolProvider::actions() const {
    std::vector<std::string> acts;
    acts.push_back(ACTION_RUN);
    return acts;
}

ToolResult ScriptToolProvider::execute(const std::string& action, const Json& params) {
    if (action != ACTION_RUN) {
        return ToolResult::fail("Unknown action: " + action);
    }

    ExecutionRequest request;
    std::string error;
    if (!ExecutionRequest::from_json(params, request, error)) {
        return ToolResult::fail(error);
    }

    EngineResult result = engine_.run(request);
    if (!result.accepted) {
        return ToolResult::fail(result.message);
    }
    return ToolResult::ok(result.to_json());
}

std::vector<AgentTool> ScriptToolProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    const ScriptToolProvider* self = this;

    AgentTool tool;
    tool.name = ACTION_RUN;
    tool.description = tool_description(engine_);
    tool.params.push_back(ToolParamSchema(
        "script", "string",
        "The Python source to run, or a file path when is_file is true",
        true
    ));
    tool.params.push_back(ToolParamSchema(
        "is_file", "boolean",
        "Treat script as the path of a file holding the source (default: false)"
    ));
    tool.execute = [self](const Json& params) -> AgentToolResult {
        return self->run_script(params);
    };
    tools.push_back(tool);

    return tools;
}

AgentToolResult ScriptToolProvider::run_script(const Json& params) const {
    ExecutionRequest request;
    std::string error;
    if (!ExecutionRequest::from_json(params, request, error)) {
        return AgentToolResult::fail(error);
    }

    EngineResult result = engine_.run(request);
    if (!result.accepted) {
        return AgentToolResult::fail(result.message);
    }

    std::string response = dump_json(result.to_json());
    const ExecutionOutcome& outcome = result.outcome;
    if (outcome.success) {
        return AgentToolResult::ok(response);
    }

    AgentToolResult failed = AgentToolResult::fail(
        outcome.has_exception ? outcome.exception
                              : "Script exited with status " + std::to_string(outcome.exit_code));
    failed.output = response;
    return failed;
}

} // namespace scriptcell
