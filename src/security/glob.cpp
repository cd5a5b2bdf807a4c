#include <warden/security/glob.hpp>

namespace warden {

static bool match_from(const std::string& p, size_t pi, const std::string& s, size_t si) {
    while (pi < p.size()) {
        if (p[pi] == '*' && pi + 1 < p.size() && p[pi + 1] == '*') {
            size_t rest = pi + 2;
            while (rest < p.size() && p[rest] == '*') ++rest;
            if (rest < p.size() && p[rest] == '/' && match_from(p, rest + 1, s, si)) {
                return true;
            }
            for (size_t t = si; t <= s.size(); ++t) {
                if (match_from(p, rest, s, t)) return true;
            }
            return false;
        }
        if (p[pi] == '*') {
            for (size_t t = si; t <= s.size(); ++t) {
                if (match_from(p, pi + 1, s, t)) return true;
                if (t < s.size() && s[t] == '/') break;
            }
            return false;
        }
        // trailing "/**" also matches the directory itself
        if (p[pi] == '/' && si == s.size() && p.compare(pi, std::string::npos, "/**") == 0) {
            return true;
        }
        if (si >= s.size()) return false;
        if (p[pi] == '?') {
            if (s[si] == '/') return false;
        } else if (p[pi] != s[si]) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == s.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(pattern, 0, path, 0);
}

} // namespace warden
