#include <warden/security/security_config.hpp>
#include <warden/core/config.hpp>
#include <warden/core/utils.hpp>
#include <cstdlib>

namespace warden {

namespace {

std::string default_home() {
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.warden";
    }
    return ".warden";
}

std::string absolute(const std::string& path) {
    if (path.empty()) return path;
    if (path[0] == '/') return normalize_path(path);
    return normalize_path(join_path(current_directory(), path));
}

} // anonymous namespace

SecurityConfig::SecurityConfig()
    : framework_root(current_directory())
    , home_dir(default_home())
    , sandbox_roots(1, "/tmp/warden-projects")
    , decode_iterations(4)
    , attempt_ring_size(1000)
    , debounce_ms(300)
    , integrity_check_interval_ms(30000)
    , posture_interval_ms(60000)
    , incident_retention(10000)
    , threat_confidence_threshold(0.75)
    , threat_scan_interval_ms(5000)
    , failure_window_ms(300000)
    , activity_journal_size(5000)
    , auto_approve_actions(false)
    , alert_timeout_seconds(5)
{}

SecurityConfig SecurityConfig::from_config(const Config& config) {
    SecurityConfig sc;

    sc.framework_root = absolute(config.get_string("security.framework_root", sc.framework_root));
    sc.home_dir = absolute(config.get_string("security.home_dir", sc.home_dir));

    auto sandboxes = config.get_string_list("security.sandbox_roots");
    if (!sandboxes.empty()) {
        sc.sandbox_roots.clear();
        for (const auto& s : sandboxes) {
            sc.sandbox_roots.push_back(absolute(s));
        }
    }
    for (const auto& p : config.get_string_list("security.protected_paths")) {
        sc.protected_paths.push_back(absolute(p));
    }
    for (const auto& p : config.get_string_list("security.read_only_roots")) {
        sc.read_only_roots.push_back(absolute(p));
    }

    sc.decode_iterations = static_cast<int>(clamp<int64_t>(
        config.get_int("security.decode_iterations", sc.decode_iterations), 1, 16));
    sc.attempt_ring_size = static_cast<size_t>(clamp<int64_t>(
        config.get_int("security.attempt_ring_size", static_cast<int64_t>(sc.attempt_ring_size)), 1, 1000000));
    sc.debounce_ms = clamp<int64_t>(config.get_int("security.debounce_ms", sc.debounce_ms), 0, 60000);
    sc.integrity_check_interval_ms = clamp<int64_t>(
        config.get_int("security.integrity_check_interval_ms", sc.integrity_check_interval_ms), 100, 86400000);
    sc.posture_interval_ms = clamp<int64_t>(
        config.get_int("security.posture_interval_ms", sc.posture_interval_ms), 100, 86400000);
    sc.incident_retention = static_cast<size_t>(clamp<int64_t>(
        config.get_int("security.incident_retention", static_cast<int64_t>(sc.incident_retention)), 100, 10000000));
    sc.threat_confidence_threshold = clamp(
        config.get_double("security.threat_confidence_threshold", sc.threat_confidence_threshold), 0.0, 1.0);
    sc.threat_scan_interval_ms = clamp<int64_t>(
        config.get_int("security.threat_scan_interval_ms", sc.threat_scan_interval_ms), 100, 86400000);
    sc.failure_window_ms = clamp<int64_t>(
        config.get_int("security.failure_window_ms", sc.failure_window_ms), 1000, 86400000);
    sc.activity_journal_size = static_cast<size_t>(clamp<int64_t>(
        config.get_int("security.activity_journal_size", static_cast<int64_t>(sc.activity_journal_size)), 100, 1000000));
    sc.auto_approve_actions = config.get_bool("security.auto_approve_actions", sc.auto_approve_actions);

    sc.alert_webhook_url = config.get_string("security.alerts.webhook_url", "");
    sc.alert_timeout_seconds = static_cast<int>(clamp<int64_t>(
        config.get_int("security.alerts.timeout_seconds", sc.alert_timeout_seconds), 1, 120));

    return sc;
}

std::string SecurityConfig::security_dir() const { return join_path(home_dir, "security"); }
std::string SecurityConfig::quarantine_dir() const { return join_path(security_dir(), "quarantine"); }
std::string SecurityConfig::forensics_dir() const { return join_path(security_dir(), "forensics"); }
std::string SecurityConfig::evidence_dir() const { return join_path(security_dir(), "evidence"); }
std::string SecurityConfig::backups_dir() const { return join_path(security_dir(), "backups"); }
std::string SecurityConfig::audit_log_path() const { return join_path(security_dir(), "audit.log"); }
std::string SecurityConfig::violations_log_path() const { return join_path(security_dir(), "violations.log"); }
std::string SecurityConfig::traversal_log_path() const { return join_path(security_dir(), "traversal.log"); }
std::string SecurityConfig::incident_db_path() const { return join_path(security_dir(), "incidents.db"); }

std::string SecurityConfig::primary_sandbox_root() const {
    return sandbox_roots.empty() ? std::string("/tmp/warden-projects") : sandbox_roots.front();
}

} // namespace warden
