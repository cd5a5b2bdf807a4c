/*
 * warden C++17 - Application
 *
 * Process singleton hosting the security orchestrator in a poll loop.
 */
#ifndef warden_CORE_APPLICATION_HPP
#define warden_CORE_APPLICATION_HPP

#include <warden/core/config.hpp>
#include <warden/security/security_config.hpp>

#include <string>
#include <memory>
#include <atomic>

namespace warden {

class SecurityOrchestrator;

struct AppInfo {
    static constexpr const char* NAME = "wardend";
    static constexpr const char* VERSION = "0.3.0";
};

class Application {
public:
    static Application& instance();

    // False for --help/--version/--report or a fatal setup error
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    SecurityOrchestrator* orchestrator() { return orchestrator_.get(); }

private:
    Application();
    ~Application();
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_security();
    void setup_projects();

    std::atomic<bool> running_;
    bool report_only_;
    std::string config_file_;
    Config config_;
    SecurityConfig security_config_;
    std::unique_ptr<SecurityOrchestrator> orchestrator_;
};

} // namespace warden

#endif // warden_CORE_APPLICATION_HPP
