/*
 * ScriptCell C++ - Agent Tool Tests
 */
#include <scriptcell/core/script_tool.hpp>
#include <scriptcell/core/tool.hpp>

#include <gtest/gtest.h>

using namespace scriptcell;

namespace {

class EchoProvider : public ToolProvider {
public:
    const char* tool_id() const override { return "fake"; }
    const char* description() const override { return "Echo provider"; }
    std::vector<std::string> actions() const override {
        std::vector<std::string> acts;
        acts.push_back("echo");
        acts.push_back("fail");
        return acts;
    }
    ToolResult execute(const std::string& action, const Json& params) override {
        if (action == "echo") return ToolResult::ok(params);
        return ToolResult::fail("asked to fail");
    }
};

class ScriptToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits_.timeout_seconds = 10;
        options_.worker_path = SCRIPTCELL_WORKER_PATH;
    }

    CapabilityPolicy policy_;
    ResourceLimits limits_;
    LocalFileStore store_;
    SandboxOptions options_;
};

} // anonymous namespace

TEST(ToolProviderTest, DefaultAgentToolsWrapEachAction) {
    EchoProvider provider;
    std::vector<AgentTool> tools = provider.get_agent_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "fake_echo");
    EXPECT_EQ(tools[1].name, "fake_fail");

    Json params;
    params["value"] = 42;
    AgentToolResult r = tools[0].execute(params);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(Json::parse(r.output)["value"].get<int>(), 42);

    r = tools[1].execute(params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "asked to fail");
}

TEST(ToolProviderTest, AgentToolSchema) {
    AgentTool tool;
    tool.name = "t";
    tool.description = "d";
    tool.params.push_back(ToolParamSchema("a", "string", "first", true));
    tool.params.push_back(ToolParamSchema("b", "boolean", "second"));

    Json j = tool.to_json();
    EXPECT_EQ(j["name"].get<std::string>(), "t");
    EXPECT_EQ(j["parameters"]["type"].get<std::string>(), "object");
    EXPECT_EQ(j["parameters"]["properties"]["b"]["type"].get<std::string>(), "boolean");
    ASSERT_EQ(j["parameters"]["required"].size(), 1u);
    EXPECT_EQ(j["parameters"]["required"][0].get<std::string>(), "a");
}

TEST_F(ScriptToolTest, DescribesRunPythonScript) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    EXPECT_STREQ(provider.tool_id(), "python");
    ASSERT_EQ(provider.actions().size(), 1u);
    EXPECT_EQ(provider.actions()[0], "run_python_script");

    std::vector<AgentTool> tools = provider.get_agent_tools();
    ASSERT_EQ(tools.size(), 1u);
    Json j = tools[0].to_json();
    EXPECT_EQ(j["name"].get<std::string>(), "run_python_script");
    EXPECT_EQ(j["parameters"]["properties"]["script"]["type"].get<std::string>(), "string");
    EXPECT_EQ(j["parameters"]["properties"]["is_file"]["type"].get<std::string>(), "boolean");
    ASSERT_EQ(j["parameters"]["required"].size(), 1u);
    EXPECT_EQ(j["parameters"]["required"][0].get<std::string>(), "script");
    EXPECT_NE(tools[0].description.find("math"), std::string::npos);
    EXPECT_NE(tools[0].description.find("10 seconds"), std::string::npos);
}

TEST_F(ScriptToolTest, RunScriptSuccess) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    Json params;
    params["script"] = "print(6 * 7)";
    AgentToolResult r = provider.get_agent_tools()[0].execute(params);
    ASSERT_TRUE(r.success) << r.error;

    Json response = Json::parse(r.output);
    EXPECT_EQ(response["stdout"].get<std::string>(), "42\n");
    EXPECT_EQ(response["exit_code"].get<int>(), 0);
}

TEST_F(ScriptToolTest, RunScriptFailureCarriesResponse) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    Json params;
    params["script"] = "print('partial')\n1/0";
    AgentToolResult r = provider.run_script(params);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("ZeroDivisionError"), std::string::npos);

    Json response = Json::parse(r.output);
    EXPECT_EQ(response["stdout"].get<std::string>(), "partial\n");
    EXPECT_FALSE(response["success"].get<bool>());
}

TEST_F(ScriptToolTest, RunScriptNonZeroExit) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    Json params;
    params["script"] = "raise SystemExit(4)";
    AgentToolResult r = provider.run_script(params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Script exited with status 4");
}

TEST_F(ScriptToolTest, InvalidParams) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    AgentToolResult r = provider.run_script(Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Missing required parameter: script");
}

TEST_F(ScriptToolTest, ExecuteAction) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    Json params;
    params["script"] = "print('hi')";
    ToolResult r = provider.execute("run_python_script", params);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.data["stdout"].get<std::string>(), "hi\n");

    r = provider.execute("delete_everything", params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Unknown action: delete_everything");
}

TEST_F(ScriptToolTest, ExecuteRejectedSource) {
    limits_.max_source_bytes = 8;
    ScriptEngine engine(policy_, limits_, store_, options_);
    ScriptToolProvider provider(engine);

    Json params;
    params["script"] = "print('this is too long')";
    ToolResult r = provider.execute("run_python_script", params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Script exceeds maximum size of 8 bytes");
}
