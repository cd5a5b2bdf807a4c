/*
 * warden C++17 - Security configuration
 *
 * Every tunable of the security core, with defaults, collected from the
 * "security.*" section of the JSON configuration.
 */
#ifndef warden_SECURITY_SECURITY_CONFIG_HPP
#define warden_SECURITY_SECURITY_CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace warden {

class Config;

struct SecurityConfig {
    std::string framework_root;
    std::string home_dir;
    std::vector<std::string> sandbox_roots;
    std::vector<std::string> protected_paths;   // appended to the built-in list
    std::vector<std::string> read_only_roots;   // appended to the built-in list

    int decode_iterations;
    size_t attempt_ring_size;
    int64_t debounce_ms;
    int64_t integrity_check_interval_ms;
    int64_t posture_interval_ms;
    size_t incident_retention;
    double threat_confidence_threshold;
    int64_t threat_scan_interval_ms;
    int64_t failure_window_ms;
    size_t activity_journal_size;
    bool auto_approve_actions;

    std::string alert_webhook_url;
    int alert_timeout_seconds;

    SecurityConfig();

    static SecurityConfig from_config(const Config& config);

    // <home>/security
    std::string security_dir() const;
    std::string quarantine_dir() const;
    std::string forensics_dir() const;
    std::string evidence_dir() const;
    std::string backups_dir() const;
    std::string audit_log_path() const;
    std::string violations_log_path() const;
    std::string traversal_log_path() const;
    std::string incident_db_path() const;

    // First sandbox root (projects without a registered root live here)
    std::string primary_sandbox_root() const;
};

} // namespace warden

#endif // warden_SECURITY_SECURITY_CONFIG_HPP
