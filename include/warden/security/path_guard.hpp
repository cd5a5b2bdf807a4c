/*
 * warden C++17 - PathGuard
 *
 * Path normalization, traversal-attack classification and safe-path
 * synthesis. inspect() is side-effect free; validate() additionally records
 * every unsafe result and raises an event for the orchestrator.
 */
#ifndef warden_SECURITY_PATH_GUARD_HPP
#define warden_SECURITY_PATH_GUARD_HPP

#include <warden/security/events.hpp>
#include <warden/security/security_config.hpp>

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <mutex>
#include <optional>

namespace warden {

// Project ids are single path components: [A-Za-z0-9._-], not "." or ".."
bool is_valid_project_id(const std::string& project_id);

struct PathGuardStatistics {
    size_t total_attempts;
    size_t blocked_attempts;
    std::map<std::string, size_t> attempts_by_type;
    std::map<std::string, size_t> attempts_by_severity;
    size_t protected_paths;
    size_t allowed_roots;
    std::optional<int64_t> last_attempt_ms;

    PathGuardStatistics()
        : total_attempts(0), blocked_attempts(0), protected_paths(0), allowed_roots(0) {}
};

class PathGuard {
public:
    PathGuard(const SecurityConfig& config, EventQueue& events);

    // Classify without recording anything
    SafePath inspect(const std::string& input_path,
                     const std::optional<std::string>& project_id,
                     Operation operation) const;

    // Classify; unsafe results are recorded and raised. Never throws.
    SafePath validate(const std::string& input_path,
                      const std::optional<std::string>& project_id = std::nullopt,
                      Operation operation = Operation::READ);

    // ---- roots ----
    void add_protected_path(const std::string& path);
    void add_allowed_root(const std::string& path);
    void register_project_root(const std::string& project_id, const std::string& root);
    void unregister_project_root(const std::string& project_id);

    // Registered root, else <primary sandbox>/<project_id>
    std::string project_root(const std::string& project_id) const;
    std::vector<std::string> protected_paths() const;
    bool is_protected(const std::string& normalized_path) const;

    // Resolve an input against the project root and canonicalize lexically
    std::string resolve(const std::string& input_path,
                        const std::optional<std::string>& project_id) const;

    // ---- queries ----
    std::vector<PathTraversalAttempt> attempts(size_t limit = 100) const;
    std::vector<PathTraversalAttempt> attempts_for_project(const std::string& project_id) const;
    std::vector<PathTraversalAttempt> attempts_by_severity(Severity severity) const;
    PathGuardStatistics statistics() const;
    Json export_report() const;

    // max(70, 100 - 0.1 * total attempts)
    double health_score() const;

    // Filename with illegal characters replaced; "safe_file" if nothing is left
    static std::string sanitize_filename(const std::string& name);

    // Best guess at what a traversal was aiming for
    static std::string guess_intended_target(const std::string& normalized_path);

private:
    struct Analysis {
        SafePath result;
        std::vector<AttackType> detected;
        std::string decoded;
        int decode_depth;
        bool targets_protected;

        Analysis() : decode_depth(0), targets_protected(false) {}
    };

    Analysis analyze(const std::string& input_path,
                     const std::optional<std::string>& project_id,
                     Operation operation) const;

    std::vector<std::string> allowed_roots_for(const std::optional<std::string>& project_id,
                                               Operation operation) const;
    std::string project_root_locked(const std::string& project_id) const;

    void record(const Analysis& analysis,
                const std::optional<std::string>& project_id,
                Operation operation);

    SecurityConfig config_;
    EventQueue& events_;

    mutable std::mutex roots_mutex_;
    std::vector<std::string> protected_paths_;
    std::vector<std::string> extra_allowed_roots_;
    std::vector<std::string> read_only_roots_;
    std::map<std::string, std::string> project_roots_;

    mutable std::mutex attempts_mutex_;
    std::deque<PathTraversalAttempt> attempts_;
    size_t total_recorded_;
    size_t blocked_recorded_;
    int64_t last_attempt_ms_;
    std::map<std::string, size_t> by_type_;
    std::map<std::string, size_t> by_severity_;
};

} // namespace warden

#endif // warden_SECURITY_PATH_GUARD_HPP
