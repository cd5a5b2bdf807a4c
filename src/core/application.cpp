/*
 * warden C++17 - Application Implementation
 *
 * Central application singleton managing the lifecycle of the security core.
 */
#include <warden/core/application.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>
#include <warden/security/orchestrator.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace warden {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Multi-project security isolation daemon\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config <file>  Configuration file (default: config.json)\n"
              << "  --report         Print the comprehensive security report and exit\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n\n"
              << "Example:\n"
              << "  " << prog << " --config /etc/warden/config.json\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
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
    , report_only_(false)
    , config_file_("config.json")
{}

Application::~Application() = default;

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "--report") == 0) {
            report_only_ = true;
            continue;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        std::cerr << "Unknown argument: " << argv[i] << "\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(Logger::parse_level(config_.get_string("log_level", "info")));
    Logger::instance().set_retention(static_cast<size_t>(config_.get_int("log_retention_lines", 200)));
}

bool Application::setup_security() {
    security_config_ = SecurityConfig::from_config(config_);
    orchestrator_ = std::make_unique<SecurityOrchestrator>(security_config_);

    orchestrator_->set_listener([](const std::string& kind, const Json& payload) {
        if (kind == "securityPostureUpdated") {
            LOG_DEBUG("[Event] %s %s", kind.c_str(), dump_json(payload).c_str());
        } else {
            LOG_INFO("[Event] %s %s", kind.c_str(), dump_json(payload).c_str());
        }
    });

    if (!orchestrator_->start()) {
        LOG_WARN("Filesystem monitoring unavailable; the access gate remains active");
    }
    return true;
}

void Application::setup_projects() {
    const Json& root = config_.raw();
    if (!root.contains("projects") || !root["projects"].is_array()) {
        return;
    }

    int created = 0;
    for (const auto& entry : root["projects"]) {
        if (!entry.is_object()) continue;
        std::string id = entry.value("id", "");
        std::string path = entry.value("path", "");
        std::string level_name = entry.value("security_level", "standard");

        SecurityLevel level;
        try {
            level = parse_security_level(level_name);
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Project %s: %s", id.c_str(), e.what());
            continue;
        }

        SecureProjectResult result = orchestrator_->create_secure_project(id, path, level);
        if (result.success) {
            created++;
        } else {
            LOG_ERROR("Project %s not isolated: %s", id.c_str(), result.error.c_str());
        }
    }
    LOG_INFO("Isolated %d configured project(s)", created);
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before any alert is sent)
    curl_global_init(CURL_GLOBAL_ALL);

    if (!parse_args(argc, argv)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!config_.load_file(config_file_)) {
        LOG_WARN("Failed to load config from %s, using defaults", config_file_.c_str());
    } else {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    setup_logging();
    if (!setup_security()) {
        return false;
    }
    setup_projects();

    if (report_only_) {
        orchestrator_->dispatch_pending();
        std::cout << dump_json(orchestrator_->export_comprehensive_security_report(), 2) << std::endl;
        running_ = false;
        return false;
    }
    return true;
}

int Application::run() {
    LOG_INFO("Entering main loop (poll interval: 100ms)");

    bool paused_reported = false;
    while (running_.load()) {
        orchestrator_->poll(monotonic_ms());

        bool paused = orchestrator_->operations_paused();
        if (paused && !paused_reported) {
            LOG_ERROR("Framework operations paused by the emergency protocol");
        }
        paused_reported = paused;

        sleep_ms(100);
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (orchestrator_) {
        orchestrator_->stop();
        orchestrator_.reset();
    }

    curl_global_cleanup();
    LOG_INFO("Goodbye!");
}

} // namespace warden
