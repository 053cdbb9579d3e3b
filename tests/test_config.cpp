/*
 * ScriptCell C++ - Configuration / Limits Tests
 */
#include <scriptcell/core/config.hpp>
#include <scriptcell/core/limits.hpp>
#include <scriptcell/core/policy.hpp>
#include <scriptcell/core/engine.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace scriptcell;

TEST(ConfigTest, DottedKeysReadNestedValues) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"limits": {"timeout_seconds": 2.5, "memory_mb": 64},
                                    "log_level": "debug",
                                    "sandbox": {"require_landlock": true}})"));

    EXPECT_DOUBLE_EQ(cfg.get_double("limits.timeout_seconds", 30), 2.5);
    EXPECT_EQ(cfg.get_int("limits.memory_mb", 256), 64);
    EXPECT_EQ(cfg.get_string("log_level", "info"), "debug");
    EXPECT_TRUE(cfg.get_bool("sandbox.require_landlock", false));
    EXPECT_TRUE(cfg.has("limits.memory_mb"));
    EXPECT_FALSE(cfg.has("limits.nothing"));
}

TEST(ConfigTest, WrongTypesFallBackToDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"a": "text", "b": 3, "list": ["x", 1]})"));

    EXPECT_EQ(cfg.get_int("a", 7), 7);
    EXPECT_EQ(cfg.get_string("b", "def"), "def");
    EXPECT_FALSE(cfg.get_bool("b", false));

    std::vector<std::string> def;
    def.push_back("fallback");
    EXPECT_EQ(cfg.get_string_list("list", def), def);
    EXPECT_EQ(cfg.get_string_list("missing", def), def);
}

TEST(ConfigTest, RejectsNonObjectDocumentAndKeepsContent) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"x": 1})"));

    EXPECT_FALSE(cfg.load_string("[1, 2, 3]"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_EQ(cfg.get_int("x", 0), 1);
}

TEST(ConfigTest, LoadFileReportsMissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.load_file("/nonexistent/scriptcell/config.json"));
    EXPECT_NE(cfg.last_error().find("cannot open"), std::string::npos);
}

TEST(ConfigTest, LoadFileReadsDocument) {
    char path[] = "/tmp/scriptcell_config_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    {
        std::ofstream out(path);
        out << R"({"server": {"max_concurrent": 8}})";
    }

    Config cfg;
    EXPECT_TRUE(cfg.load_file(path));
    EXPECT_EQ(cfg.get_int("server.max_concurrent", 4), 8);
    unlink(path);
}

TEST(ConfigTest, SettersCreateIntermediateObjects) {
    Config cfg;
    cfg.set_int("limits.memory_mb", 32);
    cfg.set_string("worker.path", "/opt/worker");

    EXPECT_EQ(cfg.get_int("limits.memory_mb", 0), 32);
    EXPECT_EQ(cfg.get_string("worker.path", ""), "/opt/worker");
}

// ============ ResourceLimits ============

TEST(LimitsTest, Defaults) {
    ResourceLimits limits;
    EXPECT_DOUBLE_EQ(limits.timeout_seconds, 30.0);
    EXPECT_EQ(limits.memory_mb(), 256);
    EXPECT_EQ(limits.max_source_bytes, 1024 * 1024);
    EXPECT_EQ(limits.timeout_ms(), 30000);
}

TEST(LimitsTest, FromConfigOverridesValidValues) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"limits": {"timeout_seconds": 1.5, "memory_mb": 64,
                                               "max_source_bytes": 100, "max_output_bytes": 50,
                                               "recursion_limit": 200, "poll_interval_ms": 5}})"));
    ResourceLimits limits = ResourceLimits::from_config(cfg);

    EXPECT_DOUBLE_EQ(limits.timeout_seconds, 1.5);
    EXPECT_EQ(limits.timeout_ms(), 1500);
    EXPECT_EQ(limits.memory_bytes, 64LL * 1024 * 1024);
    EXPECT_EQ(limits.max_source_bytes, 100);
    EXPECT_EQ(limits.max_output_bytes, 50);
    EXPECT_EQ(limits.recursion_limit, 200);
    EXPECT_EQ(limits.poll_interval_ms, 5);
}

TEST(LimitsTest, FromConfigKeepsDefaultsForInvalidValues) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"limits": {"timeout_seconds": 0, "memory_mb": -4,
                                               "recursion_limit": 3, "poll_interval_ms": 5000}})"));
    ResourceLimits limits = ResourceLimits::from_config(cfg);
    ResourceLimits defaults;

    EXPECT_DOUBLE_EQ(limits.timeout_seconds, defaults.timeout_seconds);
    EXPECT_EQ(limits.memory_bytes, defaults.memory_bytes);
    EXPECT_EQ(limits.recursion_limit, defaults.recursion_limit);
    EXPECT_EQ(limits.poll_interval_ms, defaults.poll_interval_ms);
}

// ============ SandboxOptions ============

TEST(SandboxOptionsTest, FromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"worker": {"path": "/opt/scriptcell-worker"},
                                    "sandbox": {"require_landlock": true,
                                                "readonly_paths": ["/srv/data"]}})"));
    SandboxOptions options = SandboxOptions::from_config(cfg);

    EXPECT_EQ(options.worker_path, "/opt/scriptcell-worker");
    EXPECT_TRUE(options.require_landlock);
    ASSERT_EQ(options.readonly_paths.size(), 1u);
    EXPECT_EQ(options.readonly_paths[0], "/srv/data");
}

TEST(SandboxOptionsTest, DefaultWorkerSitsBesideExecutable) {
    SandboxOptions options = SandboxOptions::from_config(Config());
    EXPECT_FALSE(options.require_landlock);
    EXPECT_EQ(options.worker_path, SandboxOptions::default_worker_path());

    std::string path = options.worker_path;
    const std::string name = "scriptcell-worker";
    ASSERT_GE(path.size(), name.size());
    EXPECT_EQ(path.substr(path.size() - name.size()), name);
}
