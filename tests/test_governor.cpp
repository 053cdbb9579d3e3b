/*
 * ScriptCell C++ - Resource Governor / Worker Process Tests
 *
 * Uses small shell scripts as stand-in workers so the supervision loop
 * is exercised without the embedded interpreter.
 */
#include <scriptcell/core/governor.hpp>
#include <scriptcell/core/result_collector.hpp>
#include <scriptcell/core/worker_process.hpp>
#include <scriptcell/core/utils.hpp>

#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

using namespace scriptcell;

namespace {

class FakeWorker {
public:
    explicit FakeWorker(const std::string& body) {
        char tmpl[] = "/tmp/scriptcell_worker_XXXXXX";
        int fd = mkstemp(tmpl);
        if (fd >= 0) close(fd);
        path_ = tmpl;
        std::ofstream out(path_.c_str());
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        chmod(path_.c_str(), 0700);
    }
    ~FakeWorker() { unlink(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class GovernorTest : public ::testing::Test {
protected:
    void SetUp() override {
        signal(SIGPIPE, SIG_IGN);
        limits_.timeout_seconds = 0.5;
        limits_.poll_interval_ms = 10;
    }

    ResourceLimits limits_;
};

} // anonymous namespace

TEST_F(GovernorTest, ReadRssOfSelf) {
    EXPECT_GT(ResourceGovernor::read_rss_bytes(getpid()), 0);
}

TEST_F(GovernorTest, ReadRssOfMissingProcess) {
    EXPECT_EQ(ResourceGovernor::read_rss_bytes(0x7ffffff0), -1);
}

TEST_F(GovernorTest, StartFailsForMissingExecutable) {
    WorkerProcess worker;
    std::string error;
    EXPECT_FALSE(worker.start("/nonexistent/scriptcell-worker", limits_, error));
    EXPECT_NE(error.find("not runnable"), std::string::npos);
    EXPECT_FALSE(worker.running());
}

TEST_F(GovernorTest, WallClockDeadlineKillsWorkerAndKeepsOutput) {
    FakeWorker fake("echo partial\nexec /bin/sleep 30");

    WorkerProcess worker;
    std::string error;
    ASSERT_TRUE(worker.start(fake.path(), limits_, error)) << error;

    ResultCollector collector(limits_, "");
    ResourceGovernor governor(limits_);
    int64_t started = monotonic_ms();
    SupervisionResult result = governor.supervise(worker, "{}", collector);
    int64_t elapsed = monotonic_ms() - started;

    EXPECT_EQ(result.verdict, GovernorVerdict::TIMED_OUT);
    EXPECT_TRUE(result.exit.reaped);
    EXPECT_TRUE(result.exit.signaled);
    EXPECT_EQ(result.exit.term_signal, SIGKILL);
    EXPECT_GE(elapsed, 450);
    EXPECT_LT(elapsed, 5000);
    EXPECT_EQ(collector.stdout_capture().data(), "partial\n");
    EXPECT_FALSE(worker.running());

    ExecutionOutcome outcome = collector.finish(result);
    EXPECT_EQ(outcome.state, ExecutionState::TIMED_OUT);
    EXPECT_EQ(outcome.stdout_text, "partial\n");
}

TEST_F(GovernorTest, PumpsReportAndStreams) {
    FakeWorker fake(
        "echo out\n"
        "echo err >&2\n"
        "printf '\\n{\"event\":\"finished\",\"status\":\"completed\",\"exit_code\":0}\\n' >&4\n"
        "exit 0");

    WorkerProcess worker;
    std::string error;
    ASSERT_TRUE(worker.start(fake.path(), limits_, error)) << error;

    ResultCollector collector(limits_, "");
    ResourceGovernor governor(limits_);
    SupervisionResult result = governor.supervise(worker, "{\"source\":\"\"}", collector);

    EXPECT_EQ(result.verdict, GovernorVerdict::NONE);
    EXPECT_TRUE(result.exit.exited);
    EXPECT_EQ(result.exit.exit_status, 0);
    EXPECT_EQ(collector.stdout_capture().data(), "out\n");
    EXPECT_EQ(collector.stderr_capture().data(), "err\n");
    EXPECT_TRUE(collector.report().has_finished());

    ExecutionOutcome outcome = collector.finish(result);
    EXPECT_TRUE(outcome.success);
}

TEST_F(GovernorTest, WorkerSeesEmptyEnvironment) {
    FakeWorker fake("if [ -z \"$HOME\" ]; then echo clean; else echo leaked; fi");

    WorkerProcess worker;
    std::string error;
    ASSERT_TRUE(worker.start(fake.path(), limits_, error)) << error;

    ResultCollector collector(limits_, "");
    ResourceGovernor governor(limits_);
    SupervisionResult result = governor.supervise(worker, "{}", collector);

    EXPECT_TRUE(result.exit.exited);
    EXPECT_EQ(collector.stdout_capture().data(), "clean\n");
}

TEST_F(GovernorTest, DestructorReapsRunningWorker) {
    FakeWorker fake("exec /bin/sleep 30");
    pid_t pid;
    {
        WorkerProcess worker;
        std::string error;
        ASSERT_TRUE(worker.start(fake.path(), limits_, error)) << error;
        pid = worker.pid();
        EXPECT_TRUE(worker.running());
    }
    EXPECT_NE(kill(pid, 0), 0);
}
