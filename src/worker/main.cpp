/*
 * ScriptCell C++ - Sandbox Worker
 *
 * Started by the host once per execution with:
 *   fd 0  /dev/null
 *   fd 1  guest stdout
 *   fd 2  guest stderr
 *   fd 3  request (JSON, read to EOF)
 *   fd 4  report records (newline-delimited JSON)
 * The worker never logs: its stderr belongs to the guest.
 */
#include <scriptcell/worker/guest_runtime.hpp>
#include <scriptcell/worker/protocol.hpp>
#include <scriptcell/core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

using namespace scriptcell;

static bool read_request(std::string& payload, std::string& error) {
    char buffer[65536];
    for (;;) {
        ssize_t n = read(protocol::REQUEST_FD, buffer, sizeof(buffer));
        if (n > 0) {
            payload.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        error = std::string("Cannot read request: ") + strerror(errno);
        return false;
    }
    close(protocol::REQUEST_FD);
    return true;
}

static int run_worker() {
    std::string payload;
    std::string error;
    protocol::WorkerRequest request;

    Json document;
    bool parsed = read_request(payload, error);
    if (parsed) {
        try {
            document = Json::parse(payload);
            parsed = protocol::WorkerRequest::from_json(document, request, error);
        } catch (const Json::exception& e) {
            error = std::string("Malformed request: ") + e.what();
            parsed = false;
        }
    }

    if (!parsed) {
        // Without the token the host would discard the report
        if (document.is_object() && document.contains("token") && document["token"].is_string()) {
            request.token = document["token"].get<std::string>();
        }
        worker::GuestRuntime runtime(request);
        runtime.send(protocol::ReportRecord::setup_failed(error));
        return protocol::EXIT_SETUP_FAILED;
    }

    worker::GuestRuntime runtime(request);
    return runtime.run();
}

int main() {
    Logger::instance().set_sink(nullptr);

    int status;
    try {
        status = run_worker();
    } catch (const std::exception& e) {
        protocol::WorkerRequest empty;
        worker::GuestRuntime runtime(empty);
        runtime.send(protocol::ReportRecord::setup_failed(std::string("Worker failure: ") + e.what()));
        status = protocol::EXIT_SETUP_FAILED;
    }

    // Skip interpreter finalization: nothing guest-defined runs after the report
    _exit(status);
}
