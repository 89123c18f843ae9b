/*
 * HiveMem C++ - Application Implementation
 */
#include <hivemem/app/application.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <curl/curl.h>

namespace hivemem {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - shared memory node for agent swarms\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config FILE  Load configuration from FILE (default: hivemem.json)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Requests are read from stdin, one JSON object per line:\n"
              << "  {\"action\":\"memory_store\",\"params\":{\"key\":\"k\",\"value\":1}}\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

std::string dump_line(const Json& j) {
    // Values may carry invalid UTF-8 from storage; never throw on output
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , curl_ready_(false)
    , config_explicit_(false)
    , config_file_("hivemem.json")
{}

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
        LOG_WARN("Ignoring unknown argument: %s", argv[i]);
    }
    return true;
}

bool Application::load_config() {
    if (config_.load_file(config_file_)) {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
        return true;
    }
    if (config_explicit_) {
        LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_INFO("No %s found, using defaults", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before any timer thread starts)
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ready_ = true;

    if (!parse_args(argc, argv)) {
        running_ = false;
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!load_config()) {
        return false;
    }
    setup_logging();

    engine_.reset(new Engine(EngineConfig::from_config(config_)));
    Status started = engine_->start();
    if (!started) {
        LOG_ERROR("Engine failed to start: %s", started.error.c_str());
        return false;
    }
    tool_.reset(new MemoryTool(*engine_));

    LOG_INFO("Ready: %zu actions available", tool_->actions().size());
    return true;
}

std::string Application::handle_line(const std::string& line) {
    Json request = Json::parse(line, nullptr, false);
    ToolResult result;
    Json id;

    if (request.is_discarded() || !request.is_object()) {
        result = ToolResult::fail(Status::fail(ErrorCode::VALIDATION, "request must be a JSON object"));
    } else {
        if (request.contains("id")) id = request["id"];
        if (!request.contains("action") || !request["action"].is_string()) {
            result = ToolResult::fail(Status::fail(ErrorCode::VALIDATION, "missing required field: action"));
        } else {
            std::string action = request["action"].get<std::string>();
            Json params = request.contains("params") ? request["params"] : Json::object();
            LOG_DEBUG("[App] Request: %s", action.c_str());
            result = tool_->execute(action, params);
        }
    }

    Json response = result.to_json();
    if (!id.is_null()) response["id"] = id;
    return dump_line(response);
}

int Application::run() {
    LOG_INFO("Entering main loop (poll interval: 100ms)");

    std::string pending;
    char buf[4096];

    while (running_.load()) {
        pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll() on stdin failed: %s", strerror(errno));
            return 1;
        }
        if (ret == 0) continue;

        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR("read() on stdin failed: %s", strerror(errno));
            return 1;
        }
        if (n == 0) {
            // EOF: answer a final unterminated line, then leave
            if (!trim(pending).empty()) {
                std::cout << handle_line(pending) << std::endl;
            }
            LOG_INFO("stdin closed");
            break;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (trim(line).empty()) continue;
            std::cout << handle_line(line) << std::endl;
        }
    }

    if (!running_.load()) {
        LOG_INFO("Received shutdown signal");
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    tool_.reset();
    if (engine_) {
        engine_->stop();
        engine_.reset();
    }

    if (curl_ready_) {
        curl_global_cleanup();
        curl_ready_ = false;
    }

    LOG_INFO("Goodbye!");
}

} // namespace hivemem
