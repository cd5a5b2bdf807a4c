/*
 * warden C++17 - PathGuard Implementation
 */
#include <warden/security/path_guard.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <climits>
#include <regex>
#include <unistd.h>

namespace warden {

// ============================================================================
// Decoding helpers
// ============================================================================

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// One pass of %XX decoding; malformed escapes are kept verbatim
std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

struct UnicodeFold {
    const char* pattern;
    char replacement;
    bool ascii_escape;
};

// Code points and escape spellings that fold to path syntax
const UnicodeFold kUnicodeFolds[] = {
    {"\xEF\xBC\x8E", '.', false},   // U+FF0E fullwidth full stop
    {"\xEF\xBC\x8F", '/', false},   // U+FF0F fullwidth solidus
    {"\xEF\xBC\xBC", '\\', false},  // U+FF3C fullwidth reverse solidus
    {"\xE2\x80\xA4", '.', false},   // U+2024 one dot leader
    {"\xE2\x88\x95", '/', false},   // U+2215 division slash
    {"\xC0\xAE", '.', false},       // overlong '.'
    {"\xC0\xAF", '/', false},       // overlong '/'
    {"\xC1\x9C", '\\', false},      // overlong '\'
    {"\xE0\x80\xAE", '.', false},
    {"\xE0\x80\xAF", '/', false},
    {"\\u002e", '.', true},
    {"\\u002f", '/', true},
    {"\\u005c", '\\', true},
    {"%u002e", '.', true},
    {"%u002f", '/', true},
    {"%u005c", '\\', true},
};

bool matches_at(const std::string& s, size_t pos, const char* pattern, bool icase) {
    size_t n = strlen(pattern);
    if (pos + n > s.size()) return false;
    for (size_t i = 0; i < n; ++i) {
        char a = s[pos + i];
        char b = pattern[i];
        if (icase) {
            a = static_cast<char>(std::tolower(static_cast<unsigned char>(a)));
        }
        if (a != b) return false;
    }
    return true;
}

std::string unicode_normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        bool folded = false;
        for (const auto& fold : kUnicodeFolds) {
            if (matches_at(s, i, fold.pattern, fold.ascii_escape)) {
                out.push_back(fold.replacement);
                i += strlen(fold.pattern);
                folded = true;
                break;
            }
        }
        if (!folded) {
            out.push_back(s[i]);
            ++i;
        }
    }
    return out;
}

std::vector<std::string> split_any(const std::string& s, const char* separators) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (strchr(separators, c) != NULL && c != '\0') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

bool has_dotdot_segment(const std::string& s) {
    for (const auto& part : split_any(s, "/\\")) {
        if (part == "..") return true;
    }
    return false;
}

bool has_drive_or_unc_prefix(const std::string& s) {
    if (s.size() >= 3 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':' &&
        (s[2] == '\\' || s[2] == '/')) {
        return true;
    }
    return s.size() >= 2 && s[0] == '\\' && s[1] == '\\';
}

// Drop NUL and control bytes, convert backslashes to forward slashes
std::string clean_separators(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) continue;
        out.push_back(c == '\\' ? '/' : c);
    }
    return out;
}

// realpath() of the longest existing prefix, with the remainder re-appended
std::string resolve_existing(const std::string& path) {
    std::string current = path;
    std::string suffix;
    for (int guard = 0; guard < 4096; ++guard) {
        char buf[PATH_MAX];
        if (realpath(current.c_str(), buf) != NULL) {
            std::string real(buf);
            return suffix.empty() ? real : normalize_path(join_path(real, suffix));
        }
        if (current.empty() || current == "/" || current == ".") {
            break;
        }
        std::string base = base_name(current);
        suffix = suffix.empty() ? base : base + "/" + suffix;
        current = dir_name(current);
    }
    return path;
}

Severity base_severity(AttackType type) {
    switch (type) {
        case AttackType::NULL_BYTE_INJECTION:
        case AttackType::SYMLINK_TRAVERSAL:
            return Severity::CRITICAL;
        case AttackType::ENCODED_TRAVERSAL:
        case AttackType::DOUBLE_ENCODING:
            return Severity::HIGH;
        default:
            return Severity::MEDIUM;
    }
}

// Tie-break order among attacks of equal severity
int attack_rank(AttackType type) {
    switch (type) {
        case AttackType::NULL_BYTE_INJECTION: return 0;
        case AttackType::SYMLINK_TRAVERSAL: return 1;
        case AttackType::DOUBLE_ENCODING: return 2;
        case AttackType::ENCODED_TRAVERSAL: return 3;
        case AttackType::BASIC_TRAVERSAL: return 4;
        case AttackType::UNICODE_TRAVERSAL: return 5;
        case AttackType::WINDOWS_TRAVERSAL: return 6;
        case AttackType::MIXED_SEPARATORS: return 7;
    }
    return 8;
}

void add_unique(std::vector<AttackType>& list, AttackType type) {
    if (std::find(list.begin(), list.end(), type) == list.end()) {
        list.push_back(type);
    }
}

} // anonymous namespace

bool is_valid_project_id(const std::string& project_id) {
    if (project_id.empty() || project_id.size() > 128) return false;
    if (project_id == "." || project_id == "..") return false;
    for (char c : project_id) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-')) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// PathGuard
// ============================================================================

PathGuard::PathGuard(const SecurityConfig& config, EventQueue& events)
    : config_(config)
    , events_(events)
    , total_recorded_(0)
    , blocked_recorded_(0)
    , last_attempt_ms_(0)
{
    const char* home_env = getenv("HOME");
    std::string home = (home_env && home_env[0] != '\0') ? std::string(home_env) : std::string();

    std::vector<std::string> critical = {
        config_.framework_root,
        config_.home_dir,
        "/etc", "/usr", "/var", "/root", "/proc", "/sys", "/dev", "/boot", "/bin", "/sbin", "/lib",
    };
    if (!home.empty()) {
        critical.push_back(join_path(home, ".ssh"));
        critical.push_back(join_path(home, ".aws"));
        critical.push_back(join_path(home, ".env"));
    }
    for (const auto& p : config_.protected_paths) {
        critical.push_back(p);
    }
    for (const auto& p : critical) {
        if (p.empty()) continue;
        std::string n = normalize_path(p);
        if (std::find(protected_paths_.begin(), protected_paths_.end(), n) == protected_paths_.end()) {
            protected_paths_.push_back(n);
        }
    }

    read_only_roots_.push_back(join_path(config_.framework_root, "docs"));
    read_only_roots_.push_back(join_path(config_.framework_root, "examples"));
    read_only_roots_.push_back(join_path(config_.home_dir, "rag"));
    read_only_roots_.push_back(join_path(config_.home_dir, "logs"));
    for (const auto& p : config_.read_only_roots) {
        read_only_roots_.push_back(normalize_path(p));
    }

    LOG_INFO("[PathGuard] Initialized with %zu protected paths, %zu sandbox roots",
             protected_paths_.size(), config_.sandbox_roots.size());
}

void PathGuard::add_protected_path(const std::string& path) {
    std::string n = normalize_path(path);
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        if (std::find(protected_paths_.begin(), protected_paths_.end(), n) != protected_paths_.end()) {
            return;
        }
        protected_paths_.push_back(n);
    }
    LOG_INFO("[PathGuard] Added protected path %s", n.c_str());
}

void PathGuard::add_allowed_root(const std::string& path) {
    std::string n = normalize_path(path);
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        if (std::find(extra_allowed_roots_.begin(), extra_allowed_roots_.end(), n) != extra_allowed_roots_.end()) {
            return;
        }
        extra_allowed_roots_.push_back(n);
    }
    LOG_INFO("[PathGuard] Added allowed root %s", n.c_str());
}

void PathGuard::register_project_root(const std::string& project_id, const std::string& root) {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    project_roots_[project_id] = normalize_path(root);
}

void PathGuard::unregister_project_root(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    project_roots_.erase(project_id);
}

std::string PathGuard::project_root(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    return project_root_locked(project_id);
}

std::string PathGuard::project_root_locked(const std::string& project_id) const {
    auto it = project_roots_.find(project_id);
    if (it != project_roots_.end()) {
        return it->second;
    }
    return join_path(config_.primary_sandbox_root(), project_id);
}

std::vector<std::string> PathGuard::protected_paths() const {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    return protected_paths_;
}

bool PathGuard::is_protected(const std::string& normalized_path) const {
    std::lock_guard<std::mutex> lock(roots_mutex_);

    std::vector<std::string> carve_outs = config_.sandbox_roots;
    carve_outs.insert(carve_outs.end(), extra_allowed_roots_.begin(), extra_allowed_roots_.end());
    carve_outs.insert(carve_outs.end(), read_only_roots_.begin(), read_only_roots_.end());
    for (const auto& entry : project_roots_) {
        carve_outs.push_back(entry.second);
    }

    for (const auto& prot : protected_paths_) {
        if (!path_is_under(normalized_path, prot)) continue;
        bool carved = false;
        for (const auto& root : carve_outs) {
            if (root != prot && path_is_under(root, prot) && path_is_under(normalized_path, root)) {
                carved = true;
                break;
            }
        }
        if (!carved) return true;
    }
    return false;
}

std::string PathGuard::resolve(const std::string& input_path,
                               const std::optional<std::string>& project_id) const {
    std::string cleaned = clean_separators(input_path);
    if (!cleaned.empty() && cleaned[0] == '/') {
        return normalize_path(cleaned);
    }
    std::string base;
    if (project_id && is_valid_project_id(*project_id)) {
        base = project_root(*project_id);
    } else {
        base = current_directory();
    }
    return normalize_path(join_path(base, cleaned));
}

std::vector<std::string> PathGuard::allowed_roots_for(const std::optional<std::string>& project_id,
                                                      Operation operation) const {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    std::vector<std::string> roots;
    if (project_id) {
        if (is_valid_project_id(*project_id)) {
            roots.push_back(project_root_locked(*project_id));
        }
    } else {
        roots = config_.sandbox_roots;
    }
    roots.insert(roots.end(), extra_allowed_roots_.begin(), extra_allowed_roots_.end());
    if (operation == Operation::READ) {
        roots.insert(roots.end(), read_only_roots_.begin(), read_only_roots_.end());
    }
    return roots;
}

std::string PathGuard::sanitize_filename(const std::string& name) {
    std::string safe;
    safe.reserve(name.size());
    bool in_space = false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) && uc != '\0') {
            if (!in_space) safe.push_back('_');
            in_space = true;
            continue;
        }
        in_space = false;
        if (strchr("<>:\"|?*", c) != NULL && c != '\0') {
            safe.push_back('_');
        } else if (uc < 0x20 || uc == 0x7f) {
            safe.push_back('_');
        } else {
            safe.push_back(c);
        }
    }
    size_t first = safe.find_first_not_of('.');
    safe = (first == std::string::npos) ? std::string() : safe.substr(first);
    safe = truncate_safe(safe, 255);
    if (safe.empty() || safe == "_") {
        return "safe_file";
    }
    return safe;
}

std::string PathGuard::guess_intended_target(const std::string& normalized_path) {
    static const char* kCommonTargets[] = {
        "/etc/passwd", "/etc/shadow", "/root/.ssh/id_rsa", "/.env", "/config.json",
        "/package.json", "/.aws/credentials", "/proc/version", "/etc/hosts",
    };
    for (const char* target : kCommonTargets) {
        if (normalized_path.find(target) != std::string::npos) {
            return target;
        }
    }
    std::string lower = to_lower(normalized_path);
    if (lower.find("passwd") != std::string::npos) return "Password files";
    if (lower.find("ssh") != std::string::npos) return "SSH keys";
    if (lower.find(".env") != std::string::npos) return "Environment variables";
    if (lower.find("config") != std::string::npos) return "Configuration files";
    if (lower.find("aws") != std::string::npos) return "AWS credentials";
    if (lower.find("key") != std::string::npos) return "API keys or certificates";
    return "Unknown system file";
}

PathGuard::Analysis PathGuard::analyze(const std::string& input_path,
                                       const std::optional<std::string>& project_id,
                                       Operation operation) const {
    Analysis a;
    a.result.original_path = input_path;

    // (1) bounded percent-decoding, then Unicode folding
    std::vector<std::string> stages(1, input_path);
    std::string current = input_path;
    for (int i = 0; i < config_.decode_iterations; ++i) {
        std::string next = percent_decode(current);
        if (next == current) break;
        stages.push_back(next);
        current = next;
    }
    a.decode_depth = static_cast<int>(stages.size()) - 1;
    bool depth_exhausted = a.decode_depth >= config_.decode_iterations &&
                           percent_decode(current) != current;
    a.decoded = unicode_normalize(current);

    // (2) null byte
    if (a.decoded.find('\0') != std::string::npos) {
        add_unique(a.detected, AttackType::NULL_BYTE_INJECTION);
    }

    // (3) separators and Windows prefixes
    bool has_forward = a.decoded.find('/') != std::string::npos;
    bool has_back = a.decoded.find('\\') != std::string::npos;
    if (has_forward && has_back) {
        add_unique(a.detected, AttackType::MIXED_SEPARATORS);
    }
    if (has_drive_or_unc_prefix(a.decoded)) {
        add_unique(a.detected, AttackType::WINDOWS_TRAVERSAL);
    }

    // (4) ".." segments, by the earliest stage they appear in
    if (has_dotdot_segment(input_path)) {
        add_unique(a.detected, AttackType::BASIC_TRAVERSAL);
    } else {
        bool found = false;
        for (size_t k = 1; k < stages.size(); ++k) {
            if (has_dotdot_segment(stages[k])) {
                add_unique(a.detected, k == 1 ? AttackType::ENCODED_TRAVERSAL
                                              : AttackType::DOUBLE_ENCODING);
                found = true;
                break;
            }
        }
        if (!found && has_dotdot_segment(a.decoded)) {
            add_unique(a.detected, AttackType::UNICODE_TRAVERSAL);
        }
    }
    if (depth_exhausted) {
        add_unique(a.detected, AttackType::DOUBLE_ENCODING);
    }

    // (6) canonical form
    std::string resolved = resolve(a.decoded, project_id);
    a.result.sanitized_path = resolved;

    std::vector<std::string> roots = allowed_roots_for(project_id, operation);
    std::string matched_root;
    for (const auto& root : roots) {
        if (path_is_under(resolved, root) && root.size() > matched_root.size()) {
            matched_root = root;
        }
    }

    // (5) symlinks: inside lexically, outside once resolved
    if (!matched_root.empty()) {
        std::string real = resolve_existing(resolved);
        if (real != resolved) {
            bool inside = false;
            for (const auto& root : roots) {
                if (path_is_under(real, resolve_existing(root)) || path_is_under(real, root)) {
                    inside = true;
                    break;
                }
            }
            if (!inside) {
                add_unique(a.detected, AttackType::SYMLINK_TRAVERSAL);
            }
        }
    }

    std::vector<std::string> protected_hits;
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        for (const auto& prot : protected_paths_) {
            if (!path_is_under(resolved, prot)) continue;
            if (!matched_root.empty() && matched_root != prot && path_is_under(matched_root, prot)) {
                continue;
            }
            protected_hits.push_back(prot);
        }
    }

    std::string intended = guess_intended_target(resolved);
    if (intended == "Unknown system file") {
        intended = guess_intended_target(clean_separators(a.decoded));
    }
    a.targets_protected = !protected_hits.empty() || (!intended.empty() && intended[0] == '/');

    // Primary attack: highest severity, then fixed rank
    std::optional<AttackType> primary;
    Severity primary_severity = Severity::LOW;
    for (auto type : a.detected) {
        Severity s = base_severity(type);
        if (s == Severity::MEDIUM && a.targets_protected) {
            s = escalate(s);
        }
        if (!primary || s > primary_severity ||
            (s == primary_severity && attack_rank(type) < attack_rank(*primary))) {
            primary = type;
            primary_severity = s;
        }
    }

    std::vector<std::string>& violations = a.result.violations;
    if (primary) {
        violations.push_back("Path traversal attempt detected: " + to_string(*primary));
    }
    if (depth_exhausted) {
        violations.push_back("Encoding depth exceeds limit of " +
                             std::to_string(config_.decode_iterations) + " decode passes");
    }
    if (project_id && !is_valid_project_id(*project_id)) {
        violations.push_back("Invalid project id");
    }
    for (const auto& prot : protected_hits) {
        violations.push_back("Access to protected path: " + prot);
    }
    if (matched_root.empty()) {
        violations.push_back("Path outside allowed roots: " + resolved);
    }

    a.result.is_safe = violations.empty();
    a.result.blocked = !a.result.is_safe;
    a.result.attack_type = primary;
    if (primary) {
        a.result.severity = primary_severity;
    } else if (!a.result.is_safe) {
        a.result.severity = protected_hits.empty() ? Severity::LOW : Severity::MEDIUM;
    } else {
        a.result.severity = Severity::LOW;
    }

    if (a.result.is_safe) {
        a.result.recommended_path = resolved;
    } else {
        std::string safe_root;
        if (project_id && is_valid_project_id(*project_id)) {
            safe_root = project_root(*project_id);
        } else {
            safe_root = join_path(config_.primary_sandbox_root(), "_unscoped");
        }
        std::vector<std::string> parts = split_any(a.decoded, "/\\");
        std::string leaf;
        for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
            if (!it->empty()) {
                leaf = *it;
                break;
            }
        }
        a.result.recommended_path = join_path(safe_root, sanitize_filename(leaf));
    }
    return a;
}

SafePath PathGuard::inspect(const std::string& input_path,
                            const std::optional<std::string>& project_id,
                            Operation operation) const {
    return analyze(input_path, project_id, operation).result;
}

SafePath PathGuard::validate(const std::string& input_path,
                             const std::optional<std::string>& project_id,
                             Operation operation) {
    Analysis analysis = analyze(input_path, project_id, operation);
    if (!analysis.result.is_safe) {
        record(analysis, project_id, operation);
    }
    return analysis.result;
}

void PathGuard::record(const Analysis& analysis,
                       const std::optional<std::string>& project_id,
                       Operation operation) {
    const SafePath& result = analysis.result;
    const std::string& raw = result.original_path;
    std::string lower = to_lower(raw);

    PathTraversalAttempt attempt;
    attempt.id = make_record_id("traversal");
    attempt.timestamp_ms = current_timestamp_ms();
    attempt.attack_type = result.attack_type;
    attempt.original_path = raw;
    attempt.normalized_path = result.sanitized_path;
    attempt.intended_target = guess_intended_target(result.sanitized_path);
    attempt.severity = result.severity;
    attempt.blocked = true;
    attempt.project_id = project_id;

    Json components = Json::array();
    for (const auto& part : split_any(raw, "/\\")) {
        components.push_back(sanitize_utf8(part));
    }
    Json indicators = Json::array();
    if (raw.find("../") != std::string::npos || raw.find("..\\") != std::string::npos) {
        indicators.push_back("dot-dot-slash sequence");
    }
    if (lower.find("%2e") != std::string::npos) {
        indicators.push_back("URL encoded dots");
    }
    if (lower.find("%00") != std::string::npos || analysis.decoded.find('\0') != std::string::npos) {
        indicators.push_back("null byte injection");
    }
    if (lower.find("\\u002e") != std::string::npos || unicode_normalize(raw) != raw) {
        indicators.push_back("Unicode escape sequence");
    }
    static const std::regex kMultipleSeparators("\\.\\.[/\\\\]{2,}");
    if (std::regex_search(raw, kMultipleSeparators)) {
        indicators.push_back("multiple separators");
    }
    if (raw.size() > 1000) {
        indicators.push_back("unusually long path");
    }
    const char* user = getenv("USER");
    attempt.evidence = Json{
        {"path_components", components},
        {"attack_indicators", indicators},
        {"decode_depth", analysis.decode_depth},
        {"operation", to_string(operation)},
        {"violations", to_json(result)["violations"]},
        {"system_info", {
            {"cwd", current_directory()},
            {"user", user ? user : ""},
            {"pid", static_cast<int64_t>(getpid())}
        }}
    };

    {
        std::lock_guard<std::mutex> lock(attempts_mutex_);
        attempts_.push_back(attempt);
        while (attempts_.size() > config_.attempt_ring_size) {
            attempts_.pop_front();
        }
        ++total_recorded_;
        if (attempt.blocked) ++blocked_recorded_;
        by_type_[attempt.attack_type ? to_string(*attempt.attack_type) : std::string("out_of_bounds")]++;
        by_severity_[to_string(attempt.severity)]++;
        last_attempt_ms_ = attempt.timestamp_ms;
    }

    if (!append_line(config_.traversal_log_path(), dump_json(to_json(attempt)))) {
        LOG_ERROR("[PathGuard] Failed to append %s: %s",
                  config_.traversal_log_path().c_str(), strerror(errno));
    }

    std::string shown = sanitize_utf8(truncate_safe(raw, 200));
    if (attempt.attack_type) {
        LOG_WARN("[PathGuard] Blocked %s (%s) for project %s: %s",
                 to_string(*attempt.attack_type).c_str(), to_string(attempt.severity).c_str(),
                 project_id ? project_id->c_str() : "-", shown.c_str());
        TraversalAttemptEvent event;
        event.attempt = attempt;
        events_.push(std::move(event));
    } else {
        LOG_WARN("[PathGuard] Unsafe path blocked for project %s: %s (%s)",
                 project_id ? project_id->c_str() : "-", shown.c_str(),
                 result.violations.empty() ? "" : result.violations.front().c_str());
        UnsafePathEvent event;
        event.attempt_id = attempt.id;
        event.result = result;
        event.project_id = project_id;
        event.operation = operation;
        events_.push(std::move(event));
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PathTraversalAttempt> PathGuard::attempts(size_t limit) const {
    std::lock_guard<std::mutex> lock(attempts_mutex_);
    std::vector<PathTraversalAttempt> out;
    for (auto it = attempts_.rbegin(); it != attempts_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::vector<PathTraversalAttempt> PathGuard::attempts_for_project(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(attempts_mutex_);
    std::vector<PathTraversalAttempt> out;
    for (const auto& a : attempts_) {
        if (a.project_id && *a.project_id == project_id) {
            out.push_back(a);
        }
    }
    return out;
}

std::vector<PathTraversalAttempt> PathGuard::attempts_by_severity(Severity severity) const {
    std::lock_guard<std::mutex> lock(attempts_mutex_);
    std::vector<PathTraversalAttempt> out;
    for (const auto& a : attempts_) {
        if (a.severity == severity) {
            out.push_back(a);
        }
    }
    return out;
}

PathGuardStatistics PathGuard::statistics() const {
    PathGuardStatistics stats;
    {
        std::lock_guard<std::mutex> lock(attempts_mutex_);
        stats.total_attempts = total_recorded_;
        stats.blocked_attempts = blocked_recorded_;
        stats.attempts_by_type = by_type_;
        stats.attempts_by_severity = by_severity_;
        if (total_recorded_ > 0) {
            stats.last_attempt_ms = last_attempt_ms_;
        }
    }
    std::lock_guard<std::mutex> lock(roots_mutex_);
    stats.protected_paths = protected_paths_.size();
    stats.allowed_roots = config_.sandbox_roots.size() + extra_allowed_roots_.size() +
                          read_only_roots_.size() + project_roots_.size();
    return stats;
}

double PathGuard::health_score() const {
    std::lock_guard<std::mutex> lock(attempts_mutex_);
    double score = 100.0 - 0.1 * static_cast<double>(total_recorded_);
    return score < 70.0 ? 70.0 : score;
}

Json PathGuard::export_report() const {
    PathGuardStatistics stats = statistics();
    size_t critical = attempts_by_severity(Severity::CRITICAL).size();

    Json recent = Json::array();
    for (const auto& a : attempts(20)) {
        recent.push_back(to_json(a));
    }

    Json report;
    report["generated_at"] = format_timestamp_ms(current_timestamp_ms());
    report["path_traversal_prevention"] = {
        {"total_attempts_blocked", stats.blocked_attempts},
        {"critical_attempts", critical},
        {"protected_paths_count", stats.protected_paths},
        {"allowed_roots_count", stats.allowed_roots}
    };
    report["statistics"] = {
        {"total_attempts", stats.total_attempts},
        {"attempts_by_type", stats.attempts_by_type},
        {"attempts_by_severity", stats.attempts_by_severity},
        {"last_attempt", stats.last_attempt_ms ? Json(format_timestamp_ms(*stats.last_attempt_ms)) : Json()}
    };
    report["protected_paths"] = protected_paths();
    report["recent_attempts"] = recent;
    report["health_score"] = health_score();
    return report;
}

} // namespace warden
