/*
 * ScriptCell C++ - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <scriptcell/core/application.hpp>
#include <scriptcell/core/logger.hpp>
#include <scriptcell/core/thread_pool.hpp>
#include <scriptcell/core/utils.hpp>

#include <iostream>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <unistd.h>

namespace scriptcell {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Sandboxed Python script execution\n\n"
              << "Usage: " << prog << " [options] (-c CODE | --file PATH | --serve | --describe-tools)\n\n"
              << "Options:\n"
              << "  -c CODE           Run CODE and print the result as JSON\n"
              << "  --file PATH       Run the script stored in PATH\n"
              << "  --serve           Read one JSON request per line from stdin,\n"
              << "                    write one JSON response per line\n"
              << "  --describe-tools  Print the agent tool definitions\n"
              << "  --config FILE     Configuration file (default: config.json if present)\n"
              << "  -h, --help        Show this help message\n"
              << "  -v, --version     Show version\n\n"
              << "Example:\n"
              << "  " << prog << " -c 'print(sum(range(10)))'\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , exit_code_(EXIT_EXECUTED)
    , mode_(Mode::NONE)
    , config_file_("config.json")
    , config_explicit_(false)
{}

void Application::setup_signals() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    const int signals[] = { SIGINT, SIGTERM };
    for (int i = 0; i < 2; ++i) {
        if (sigaction(signals[i], &action, NULL) != 0) {
            LOG_WARN("Cannot install handler for signal %d: %s", signals[i], strerror(errno));
        }
    }
}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            mode_ = Mode::INLINE;
            script_arg_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            mode_ = Mode::FILE;
            script_arg_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--serve") == 0) {
            mode_ = Mode::SERVE;
            continue;
        }
        if (strcmp(argv[i], "--describe-tools") == 0) {
            mode_ = Mode::DESCRIBE_TOOLS;
            continue;
        }

        std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
        print_usage(argv[0]);
        exit_code_ = EXIT_STARTUP_FAILED;
        return false;
    }

    if (mode_ == Mode::NONE) {
        print_usage(argv[0]);
        exit_code_ = EXIT_STARTUP_FAILED;
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (!config_explicit_ && access(config_file_.c_str(), F_OK) != 0) {
        LOG_DEBUG("No %s, using built-in defaults", config_file_.c_str());
        return true;
    }

    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s (%s), aborting!",
                  config_file_.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

void Application::setup_engine() {
    policy_.reset(new CapabilityPolicy(CapabilityPolicy::from_config(config_)));
    limits_.reset(new ResourceLimits(ResourceLimits::from_config(config_)));
    store_.reset(new LocalFileStore(config_.get_string("sources.root_dir", "")));

    SandboxOptions options = SandboxOptions::from_config(config_);
    engine_.reset(new ScriptEngine(*policy_, *limits_, *store_, options));
    tools_.reset(new ScriptToolProvider(*engine_));

    LOG_INFO("Policy: %zu allowed modules, %zu denied operations",
             policy_->allowed_modules().size(), policy_->denied_operations().size());
    LOG_INFO("Limits: timeout=%ss memory=%lldMB source<=%lld bytes output<=%lld bytes",
             format_seconds(limits_->timeout_seconds).c_str(),
             static_cast<long long>(limits_->memory_mb()),
             static_cast<long long>(limits_->max_source_bytes),
             static_cast<long long>(limits_->max_output_bytes));
    LOG_DEBUG("Worker: %s (landlock %s)", options.worker_path.c_str(),
              options.require_landlock ? "required" : "best effort");
}

bool Application::init(int argc, char* argv[]) {
    // Parse command line
    if (!parse_args(argc, argv)) {
        return false;
    }

    setup_signals();

    // Load configuration
    if (!load_config()) {
        exit_code_ = EXIT_STARTUP_FAILED;
        return false;
    }

    setup_logging();
    LOG_DEBUG("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);
    setup_engine();
    return true;
}

int Application::run() {
    switch (mode_) {
        case Mode::INLINE:
        case Mode::FILE:
            return run_once();
        case Mode::SERVE:
            return run_serve();
        case Mode::DESCRIBE_TOOLS:
            return describe_tools();
        default:
            return EXIT_STARTUP_FAILED;
    }
}

int Application::run_once() {
    ExecutionRequest request(script_arg_, mode_ == Mode::FILE);
    EngineResult result = engine_->run(request);

    std::cout << dump_json(result.to_json(), 2) << std::endl;
    return result.accepted ? EXIT_EXECUTED : EXIT_REJECTED;
}

std::string Application::handle_request_line(const std::string& line) const {
    Json response;
    Json id;   // null unless the request carries one

    Json request_json;
    try {
        request_json = Json::parse(line);
    } catch (const Json::exception& e) {
        response["success"] = false;
        response["rejected"] = true;
        response["source_error"] = "invalid_request";
        response["message"] = std::string("Malformed request: ") + e.what();
        response["id"] = id;
        return dump_json(response);
    }

    if (request_json.is_object() && request_json.contains("id")) {
        id = request_json["id"];
    }

    ExecutionRequest request;
    std::string error;
    if (!ExecutionRequest::from_json(request_json, request, error)) {
        response["success"] = false;
        response["rejected"] = true;
        response["source_error"] = "invalid_request";
        response["message"] = error;
    } else {
        response = engine_->run(request).to_json();
    }
    response["id"] = id;
    return dump_json(response);
}

int Application::run_serve() {
    int64_t concurrent_setting = config_.get_int("server.max_concurrent", 4);
    size_t max_concurrent = concurrent_setting > 0 ? static_cast<size_t>(concurrent_setting) : 1;
    int64_t queued_setting = config_.get_int("server.max_queued", 64);
    size_t max_queued = queued_setting > 0 ? static_cast<size_t>(queued_setting) : 1;

    // Pool threads never take the stop signals; they must reach this
    // thread while it is blocked reading stdin
    sigset_t stop_signals;
    sigset_t previous;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, &previous);
    ThreadPool pool(max_concurrent, max_queued);
    pthread_sigmask(SIG_SETMASK, &previous, NULL);

    LOG_INFO("Serving requests on stdin (%zu concurrent, %zu queued)", max_concurrent, max_queued);

    std::string line;
    size_t received = 0;
    while (running_.load() && std::getline(std::cin, line)) {
        if (trim(line).empty()) continue;
        ++received;

        std::string request_line = line;
        bool queued = pool.enqueue([this, request_line]() {
            std::string response = handle_request_line(request_line);
            std::lock_guard<std::mutex> lock(output_mutex_);
            std::cout << response << "\n" << std::flush;
        });
        if (!queued) {
            LOG_WARN("Request dropped, server is shutting down");
        }
    }

    LOG_DEBUG("Input closed after %zu requests (pending: %zu)", received, pool.pending());
    pool.shutdown();
    return EXIT_EXECUTED;
}

int Application::describe_tools() {
    Json tools = Json::array();
    std::vector<AgentTool> agent_tools = tools_->get_agent_tools();
    for (size_t i = 0; i < agent_tools.size(); ++i) {
        tools.push_back(agent_tools[i].to_json());
    }
    std::cout << dump_json(tools, 2) << std::endl;
    return EXIT_EXECUTED;
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down...");
    tools_.reset();
    engine_.reset();
}

} // namespace scriptcell
