/*
 * ScriptCell C++ - Application
 *
 * Central application singleton: parses the command line, loads the
 * configuration, builds the process-wide policy, limits and engine, and
 * runs one of the front ends:
 *   -c CODE | --file PATH   run one script, print the response JSON
 *   --serve                 newline-delimited JSON requests on stdin
 *   --describe-tools        print the agent tool definitions
 */
#ifndef scriptcell_CORE_APPLICATION_HPP
#define scriptcell_CORE_APPLICATION_HPP

#include "config.hpp"
#include "engine.hpp"
#include "limits.hpp"
#include "policy.hpp"
#include "script_tool.hpp"
#include "source_loader.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace scriptcell {

struct AppInfo {
    static constexpr const char* NAME = "ScriptCell";
    static constexpr const char* VERSION = "1.0.0";
};

// Process exit statuses of the host
const int EXIT_EXECUTED = 0;        // Request ran, whatever the outcome
const int EXIT_STARTUP_FAILED = 1;  // Usage or startup error
const int EXIT_REJECTED = 2;        // Request rejected before running

class Application {
public:
    static Application& instance();

    // Returns false for --help/--version or fatal errors; exit_code() tells which
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    // SIGINT/SIGTERM call stop(). Installed without SA_RESTART, so a
    // blocking read of stdin returns once one arrives.
    void setup_signals();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }
    int exit_code() const { return exit_code_; }

    // One serve-mode request line to one response line
    std::string handle_request_line(const std::string& line) const;

private:
    enum class Mode {
        NONE,
        INLINE,
        FILE,
        SERVE,
        DESCRIBE_TOOLS
    };

    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    void setup_engine();

    int run_once();
    int run_serve();
    int describe_tools();

    std::atomic<bool> running_;
    int exit_code_;
    Mode mode_;
    std::string script_arg_;
    std::string config_file_;
    bool config_explicit_;

    Config config_;
    std::unique_ptr<CapabilityPolicy> policy_;
    std::unique_ptr<ResourceLimits> limits_;
    std::unique_ptr<LocalFileStore> store_;
    std::unique_ptr<ScriptEngine> engine_;
    std::unique_ptr<ScriptToolProvider> tools_;
    std::mutex output_mutex_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_APPLICATION_HPP
