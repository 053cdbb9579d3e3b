/*
 * ScriptCell C++ - Script Engine Tests
 *
 * End-to-end runs through the real scriptcell-worker.
 */
#include <scriptcell/core/engine.hpp>
#include <scriptcell/core/utils.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace scriptcell;

namespace {

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits_.timeout_seconds = 10;
        options_.worker_path = SCRIPTCELL_WORKER_PATH;
    }

    ExecutionOutcome run(const std::string& code) {
        ScriptEngine engine(policy_, limits_, store_, options_);
        EngineResult result = engine.run(ExecutionRequest(code, false));
        EXPECT_TRUE(result.accepted) << result.message;
        return result.outcome;
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    CapabilityPolicy policy_;
    ResourceLimits limits_;
    LocalFileStore store_;
    SandboxOptions options_;
};

} // anonymous namespace

// ============ Normal completion ============

TEST_F(EngineTest, HelloWorld) {
    ExecutionOutcome outcome = run("print('ok')");
    EXPECT_TRUE(outcome.success) << outcome.exception;
    EXPECT_EQ(outcome.state, ExecutionState::COMPLETED);

    Json j = outcome.to_json();
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["stdout"].get<std::string>(), "ok\n");
    EXPECT_EQ(j["stderr"].get<std::string>(), "");
    EXPECT_TRUE(j["exception"].is_null());
    EXPECT_EQ(j["exit_code"].get<int>(), 0);
    EXPECT_FALSE(j["execution_id"].get<std::string>().empty());
}

TEST_F(EngineTest, EmptyScript) {
    ExecutionOutcome outcome = run("");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, AllowedModules) {
    ExecutionOutcome outcome = run(
        "import math, random, json, itertools, functools, time, datetime\n"
        "from collections import Counter\n"
        "random.seed(1)\n"
        "print(math.sqrt(16))\n"
        "print(json.dumps({'a': Counter('aab')['a']}))\n"
        "print(functools.reduce(lambda a, b: a + b, itertools.repeat(2, 3)))\n"
        "print(datetime.date(2024, 1, 2).isoformat())\n");
    EXPECT_TRUE(outcome.success) << outcome.exception;
    EXPECT_EQ(outcome.stdout_text, "4.0\n{\"a\": 2}\n6\n2024-01-02\n");
}

TEST_F(EngineTest, UnicodeOutput) {
    ExecutionOutcome outcome = run("print('h\\u00e9llo \\u2603')");
    EXPECT_TRUE(outcome.success) << outcome.exception;
    EXPECT_EQ(outcome.stdout_text, "h\xc3\xa9llo \xe2\x98\x83\n");
}

TEST_F(EngineTest, RepeatedRunsAreIndependent) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    EngineResult first = engine.run(ExecutionRequest("x = 40\nprint(x + 2)", false));
    EngineResult second = engine.run(ExecutionRequest("print(globals().get('x'))", false));

    EXPECT_EQ(first.outcome.stdout_text, "42\n");
    EXPECT_EQ(second.outcome.stdout_text, "None\n");
    EXPECT_NE(first.outcome.execution_id, second.outcome.execution_id);
}

TEST_F(EngineTest, SameScriptSameResult) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    const std::string code = "import random\nrandom.seed(7)\nprint(random.randint(0, 1000))";
    EngineResult a = engine.run(ExecutionRequest(code, false));
    EngineResult b = engine.run(ExecutionRequest(code, false));
    EXPECT_EQ(a.outcome.stdout_text, b.outcome.stdout_text);
    EXPECT_EQ(a.outcome.exit_code, b.outcome.exit_code);
}

TEST_F(EngineTest, ConcurrentRuns) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    const int N = 4;
    std::vector<ExecutionOutcome> outcomes(N);
    std::vector<std::thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.push_back(std::thread([&engine, &outcomes, i]() {
            std::string code = "print(" + std::to_string(i) + " * 10)";
            outcomes[i] = engine.run(ExecutionRequest(code, false)).outcome;
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    for (int i = 0; i < N; ++i) {
        EXPECT_TRUE(outcomes[i].success) << outcomes[i].exception;
        EXPECT_EQ(outcomes[i].stdout_text, std::to_string(i * 10) + "\n");
    }
}

TEST_F(EngineTest, RunsScriptFromFile) {
    char path[] = "/tmp/scriptcell_job_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    {
        std::ofstream out(path);
        out << "total = sum(range(5))\nprint(total)\n";
    }

    ScriptEngine engine(policy_, limits_, store_, options_);
    EngineResult result = engine.run(ExecutionRequest(path, true));
    unlink(path);

    ASSERT_TRUE(result.accepted) << result.message;
    EXPECT_TRUE(result.outcome.success);
    EXPECT_EQ(result.outcome.stdout_text, "10\n");
}

// ============ Rejections ============

TEST_F(EngineTest, OversizeSourceIsRejectedBeforeRunning) {
    limits_.max_source_bytes = 100;
    ScriptEngine engine(policy_, limits_, store_, options_);
    EngineResult result = engine.run(ExecutionRequest("print('x')\n" + std::string(200, '#'), false));

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.source_error, SourceError::TOO_LARGE);
    Json j = result.to_json();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j["rejected"].get<bool>());
    EXPECT_EQ(j["source_error"].get<std::string>(), "too_large");
}

TEST_F(EngineTest, MissingFileIsRejected) {
    ScriptEngine engine(policy_, limits_, store_, options_);
    EngineResult result = engine.run(ExecutionRequest("/nonexistent/scriptcell/job.py", true));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.source_error, SourceError::NOT_FOUND);
}

// ============ Guest failures ============

TEST_F(EngineTest, UncaughtExceptionKeepsOutputAndTraceback) {
    ExecutionOutcome outcome = run("print('before')\n1/0\n");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::COMPLETED);
    EXPECT_EQ(outcome.error_kind, ErrorKind::GUEST_EXCEPTION);
    EXPECT_EQ(outcome.stdout_text, "before\n");
    EXPECT_TRUE(contains(outcome.exception, "Traceback"));
    EXPECT_TRUE(contains(outcome.exception, "ZeroDivisionError: division by zero"));
    EXPECT_TRUE(contains(outcome.exception, "<script>"));
    EXPECT_EQ(outcome.exit_code, 1);
}

TEST_F(EngineTest, SyntaxError) {
    ExecutionOutcome outcome = run("def broken(:\n    pass\n");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::SYNTAX_ERROR);
    EXPECT_EQ(outcome.exception.compare(0, 22, "Invalid Python syntax:"), 0) << outcome.exception;
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, NullByteIsSyntaxError) {
    ExecutionOutcome outcome = run(std::string("print(1)\0", 9));
    EXPECT_EQ(outcome.error_kind, ErrorKind::SYNTAX_ERROR);
}

TEST_F(EngineTest, SystemExitCode) {
    ExecutionOutcome outcome = run("print('bye')\nraise SystemExit(3)");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::COMPLETED);
    EXPECT_FALSE(outcome.has_exception);
    EXPECT_TRUE(outcome.has_exit_code);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stdout_text, "bye\n");
}

TEST_F(EngineTest, SystemExitZeroIsSuccess) {
    ExecutionOutcome outcome = run("raise SystemExit(0)");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.exit_code, 0);
}

TEST_F(EngineTest, SystemExitMessageGoesToStderr) {
    ExecutionOutcome outcome = run("raise SystemExit('fatal problem')");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.stderr_text, "fatal problem\n");
    EXPECT_EQ(outcome.exit_code, 1);
}

TEST_F(EngineTest, RecursionLimit) {
    ExecutionOutcome outcome = run("def f(n):\n    return f(n + 1)\nf(0)\n");
    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(contains(outcome.exception, "RecursionError")) << outcome.exception;
}

TEST_F(EngineTest, OutputCeiling) {
    limits_.max_output_bytes = 1000;
    ExecutionOutcome outcome = run("print('x' * 5000)");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.stdout_text.size(), 1000u);
    EXPECT_TRUE(outcome.stdout_truncated);
}

// ============ Capability enforcement ============

TEST_F(EngineTest, DeniedModule) {
    ExecutionOutcome outcome = run("print('start')\nimport os\nprint('unreachable')");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::MODULE_DENIED);
    EXPECT_EQ(outcome.exception, "CapabilityError: Import of module 'os' is not allowed");
    EXPECT_EQ(outcome.stdout_text, "start\n");
    EXPECT_FALSE(outcome.has_exit_code);
}

TEST_F(EngineTest, DeniedModuleCannotBeCaught) {
    ExecutionOutcome outcome = run(
        "try:\n"
        "    import subprocess\n"
        "except BaseException:\n"
        "    print('caught')\n");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, SubmoduleOfAllowedModuleIsDenied) {
    ExecutionOutcome outcome = run("import json.decoder");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.exception, "CapabilityError: Import of module 'json.decoder' is not allowed");
}

TEST_F(EngineTest, DynamicImportIsChecked) {
    ExecutionOutcome outcome = run("m = __import__('so' + 'cket')");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.exception, "CapabilityError: Import of module 'socket' is not allowed");
}

TEST_F(EngineTest, CustomAllowListDeniesDefaultModule) {
    std::vector<std::string> mods;
    mods.push_back("math");
    CapabilityPolicy narrow(mods, CapabilityPolicy::default_denied_operations());
    ScriptEngine engine(narrow, limits_, store_, options_);

    EngineResult ok = engine.run(ExecutionRequest("import math\nprint(math.floor(2.5))", false));
    EXPECT_TRUE(ok.outcome.success) << ok.outcome.exception;

    EngineResult denied = engine.run(ExecutionRequest("import random", false));
    EXPECT_EQ(denied.outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(denied.outcome.error_kind, ErrorKind::MODULE_DENIED);
}

TEST_F(EngineTest, OpenIsDenied) {
    ExecutionOutcome outcome = run("open('/etc/passwd').read()");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::OPERATION_DENIED);
    EXPECT_EQ(outcome.exception, "CapabilityError: Operation 'open' is not allowed");
}

TEST_F(EngineTest, OpenThroughGetattrIsDenied) {
    ExecutionOutcome outcome = run("f = getattr(__builtins__, 'op' + 'en')\nf('/etc/hostname')");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::OPERATION_DENIED);
}

TEST_F(EngineTest, HiddenOsModuleCannotRunCommands) {
    ExecutionOutcome outcome = run("import random\nrandom._os.system('echo pwned')");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.exception, "CapabilityError: Operation 'os.system' is not allowed");
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, ImportMachineryCannotLoadDeniedModule) {
    ExecutionOutcome outcome = run(
        "import random\n"
        "bootstrap = random._os.sys.modules['_frozen_importlib']\n"
        "m = bootstrap._gcd_import('_posixsubprocess')\n"
        "print('loaded', m)\n");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::MODULE_DENIED);
    EXPECT_EQ(outcome.exception, "CapabilityError: Import of module '_posixsubprocess' is not allowed");
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, BuiltinLoaderCannotCreateDeniedModule) {
    ExecutionOutcome outcome = run(
        "import random\n"
        "modules = random._os.sys.modules\n"
        "spec = modules['_frozen_importlib'].ModuleSpec('_socket', None)\n"
        "try:\n"
        "    m = modules['_imp'].create_builtin(spec)\n"
        "except BaseException:\n"
        "    print('caught')\n"
        "print('after')\n");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::MODULE_DENIED);
    EXPECT_EQ(outcome.exception, "CapabilityError: Import of module '_socket' is not allowed");
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, ForkIsStoppedEvenWhenPolicyPermitsIt) {
    std::vector<std::string> ops = CapabilityPolicy::default_denied_operations();
    ops.erase(std::remove(ops.begin(), ops.end(), "os.fork"), ops.end());
    CapabilityPolicy permissive(CapabilityPolicy::default_allowed_modules(), ops);
    ScriptEngine engine(permissive, limits_, store_, options_);

    ExecutionOutcome outcome = engine.run(ExecutionRequest(
        "import random\n"
        "pid = random._os.fork()\n"
        "print('forked', pid)\n", false)).outcome;
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::OPERATION_DENIED);
    EXPECT_EQ(outcome.exception, "CapabilityError: Operation 'clone' is not allowed");
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, SpawnIsStoppedEvenWhenPolicyPermitsIt) {
    std::vector<std::string> ops = CapabilityPolicy::default_denied_operations();
    ops.erase(std::remove(ops.begin(), ops.end(), "os.posix_spawn"), ops.end());
    CapabilityPolicy permissive(CapabilityPolicy::default_allowed_modules(), ops);
    ScriptEngine engine(permissive, limits_, store_, options_);

    ExecutionOutcome outcome = engine.run(ExecutionRequest(
        "import random\n"
        "pid = random._os.posix_spawn('/bin/true', ['true'], {})\n"
        "print('spawned', pid)\n", false)).outcome;
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::OPERATION_DENIED);
    EXPECT_EQ(outcome.exception, "CapabilityError: Operation 'clone' is not allowed");
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(EngineTest, EvalAndExecAreDenied) {
    ExecutionOutcome outcome = run("print(eval('1 + 1'))");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.error_kind, ErrorKind::OPERATION_DENIED);

    outcome = run("exec('x = 1')");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);

    outcome = run("compile('x = 1', 'f', 'exec')");
    EXPECT_EQ(outcome.state, ExecutionState::CAPABILITY_VIOLATION);
    EXPECT_EQ(outcome.exception, "CapabilityError: Operation 'compile' is not allowed");
}

// ============ Resource limits ============

TEST_F(EngineTest, BusyLoopTimesOutWithPartialOutput) {
    limits_.timeout_seconds = 1;
    int64_t started = monotonic_ms();
    ExecutionOutcome outcome = run("print('started', flush=True)\nwhile True:\n    pass\n");
    int64_t elapsed = monotonic_ms() - started;

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::TIMED_OUT);
    EXPECT_EQ(outcome.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(outcome.exception, "TimeoutError: Script execution timed out after 1 seconds");
    EXPECT_EQ(outcome.stdout_text, "started\n");
    EXPECT_FALSE(outcome.has_exit_code);
    EXPECT_LT(elapsed, 6000);
}

TEST_F(EngineTest, SleepTimesOut) {
    limits_.timeout_seconds = 1;
    ExecutionOutcome outcome = run("import time\ntime.sleep(60)");
    EXPECT_EQ(outcome.state, ExecutionState::TIMED_OUT);
}

TEST_F(EngineTest, LargeAllocationExceedsMemory) {
    limits_.memory_bytes = 128LL * 1024 * 1024;
    ExecutionOutcome outcome = run("data = bytearray(1024 * 1024 * 1024)\nprint(len(data))");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::MEMORY_EXCEEDED);
    EXPECT_EQ(outcome.error_kind, ErrorKind::MEMORY);
    EXPECT_EQ(outcome.exception, "MemoryError: Script exceeded the memory limit of 128 MB");
}

TEST_F(EngineTest, GradualGrowthExceedsMemory) {
    limits_.memory_bytes = 128LL * 1024 * 1024;
    ExecutionOutcome outcome = run(
        "chunks = []\n"
        "while True:\n"
        "    chunks.append(bytearray(8 * 1024 * 1024))\n");
    EXPECT_EQ(outcome.state, ExecutionState::MEMORY_EXCEEDED);
}

TEST_F(EngineTest, CaughtMemoryErrorIsStillMemoryViolation) {
    limits_.memory_bytes = 128LL * 1024 * 1024;
    ExecutionOutcome outcome = run(
        "print('before', flush=True)\n"
        "try:\n"
        "    data = bytearray(400 * 1024 * 1024)\n"
        "except MemoryError:\n"
        "    print('caught')\n"
        "print('after')\n");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::MEMORY_EXCEEDED);
    EXPECT_EQ(outcome.error_kind, ErrorKind::MEMORY);
    EXPECT_EQ(outcome.exception, "MemoryError: Script exceeded the memory limit of 128 MB");
    EXPECT_EQ(outcome.stdout_text, "before\n");
}

// ============ Worker failures ============

TEST_F(EngineTest, MissingWorkerIsCrash) {
    options_.worker_path = "/nonexistent/scriptcell-worker";
    ExecutionOutcome outcome = run("print('ok')");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, ExecutionState::CRASHED);
    EXPECT_EQ(outcome.error_kind, ErrorKind::WORKER_CRASH);
    EXPECT_EQ(outcome.exception.compare(0, 45, "WorkerError: Failed to start sandbox worker: "), 0)
        << outcome.exception;
}
