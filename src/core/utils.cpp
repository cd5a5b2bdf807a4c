#include <warden/core/utils.hpp>
#include <warden/core/logger.hpp>
#include <algorithm>
#include <atomic>
#include <numeric>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <climits>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <dirent.h>
#include <fcntl.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace warden {

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(timestamp_ms % 1000));
    return std::string(out);
}

std::string compact_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_buf);
    char out[48];
    snprintf(out, sizeof(out), "%s%03dZ", buf, static_cast<int>(timestamp_ms % 1000));
    return std::string(out);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    static const char* kSpace = " \t\n\r";
    size_t first = s.find_first_not_of(kSpace);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(kSpace) - first + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    // Find a safe truncation point (don't break UTF-8 multi-byte sequences)
    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;  // Back up if in the middle of a multi-byte sequence
    }
    return s.substr(0, len);
}

std::string sanitize_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ) {
        unsigned char c = static_cast<unsigned char>(s[i]);

        // Determine expected byte count from leading byte
        int expected = 0;
        if (c < 0x80) {
            // ASCII range: allow tab (0x09), newline (0x0A), and printable chars.
            // Other control characters (NUL included) are made visible.
            if (c == 0x09 || c == 0x0A || c >= 0x20) {
                out.push_back(static_cast<char>(c));
            } else {
                char esc[8];
                snprintf(esc, sizeof(esc), "\\x%02x", c);
                out += esc;
            }
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            expected = 2;
        } else if ((c & 0xF0) == 0xE0) {
            expected = 3;
        } else if ((c & 0xF8) == 0xF0) {
            expected = 4;
        } else {
            // Invalid leading byte, replace with replacement char
            out += "\xEF\xBF\xBD"; // U+FFFD
            ++i;
            continue;
        }

        // Validate continuation bytes
        bool valid = true;
        if (i + expected > s.size()) {
            valid = false;
        } else {
            for (int j = 1; j < expected; ++j) {
                if ((static_cast<unsigned char>(s[i + j]) & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
            }
        }
        // Overlong two-byte forms (C0/C1 lead) are invalid UTF-8
        if (valid && expected == 2 && c < 0xC2) {
            valid = false;
        }

        if (valid) {
            for (int j = 0; j < expected; ++j) {
                out.push_back(s[i + j]);
            }
            i += expected;
        } else {
            out += "\xEF\xBF\xBD"; // U+FFFD
            ++i;
        }
    }

    return out;
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;

    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") {
            continue;
        }
        if (parts[i] == "..") {
            if (!result.empty() && result.back() != "..") {
                result.pop_back();
            } else if (path[0] != '/') {
                result.push_back("..");
            }
        } else {
            result.push_back(parts[i]);
        }
    }

    std::string normalized = join(result, "/");
    if (path[0] == '/') {
        normalized = "/" + normalized;
    }

    return normalized.empty() ? "." : normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = !a.empty() && a.back() == '/';
    bool b_starts_slash = !b.empty() && b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t pos = p.rfind('/');
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

std::string dir_name(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

bool path_is_under(const std::string& path, const std::string& root) {
    if (root.empty()) return false;
    if (root == "/") return !path.empty() && path[0] == '/';
    if (path.size() < root.size()) return false;
    if (path.compare(0, root.size(), root) != 0) return false;
    return path.size() == root.size() || path[root.size()] == '/';
}

bool create_parent_directory(const std::string& filepath) {
    // Find last '/' to get directory
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component

    return ensure_directory(filepath.substr(0, pos));
}

bool ensure_directory(const std::string& path, unsigned int mode) {
    if (path.empty()) return false;

    std::string current;
    for (size_t i = 0; i < path.size(); ++i) {
        current += path[i];
        if ((path[i] == '/' && i > 0) || i == path.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST) {
                    return false;
                }
            } else if (!S_ISDIR(st.st_mode)) {
                errno = ENOTDIR;
                return false;
            }
        }
    }
    return true;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_symlink(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

std::string current_directory() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == NULL) {
        return "/";
    }
    return std::string(buf);
}

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

bool write_file(const std::string& path, const std::string& content) {
    if (!create_parent_directory(path)) {
        return false;
    }
    std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << content;
    return static_cast<bool>(out);
}

bool append_line(const std::string& path, const std::string& line) {
    if (!create_parent_directory(path)) {
        return false;
    }
    std::ofstream out(path.c_str(), std::ios::out | std::ios::app);
    if (!out) return false;
    out << line << '\n';
    return static_cast<bool>(out);
}

static void collect_files(const std::string& root, const std::string& rel,
                          std::vector<std::string>& out) {
    std::string dir = rel.empty() ? root : join_path(root, rel);
    DIR* d = opendir(dir.c_str());
    if (!d) return;

    struct dirent* entry;
    while ((entry = readdir(d)) != NULL) {
        const char* name = entry->d_name;
        if (strcmp(name, ".") == 0 || strcmp(name, "..") == 0) continue;

        std::string child_rel = rel.empty() ? std::string(name) : rel + "/" + name;
        std::string child = join_path(root, child_rel);
        struct stat st;
        if (lstat(child.c_str(), &st) != 0) continue;

        if (S_ISDIR(st.st_mode)) {
            collect_files(root, child_rel, out);
        } else if (S_ISREG(st.st_mode)) {
            out.push_back(child_rel);
        }
    }
    closedir(d);
}

std::vector<std::string> list_files_recursive(const std::string& root) {
    std::vector<std::string> files;
    collect_files(root, "", files);
    std::sort(files.begin(), files.end());
    return files;
}

bool remove_recursive(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }

    DIR* d = opendir(path.c_str());
    if (!d) return false;
    bool ok = true;
    struct dirent* entry;
    while ((entry = readdir(d)) != NULL) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        if (!remove_recursive(join_path(path, entry->d_name))) {
            ok = false;
        }
    }
    closedir(d);
    return rmdir(path.c_str()) == 0 && ok;
}

static bool copy_file(const std::string& from, const std::string& to, mode_t mode) {
    std::ifstream in(from.c_str(), std::ios::in | std::ios::binary);
    if (!in) return false;
    if (!create_parent_directory(to)) return false;
    std::ofstream out(to.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << in.rdbuf();
    out.close();
    if (!out) return false;
    chmod(to.c_str(), mode & 0777);
    return true;
}

bool copy_tree(const std::string& from, const std::string& to) {
    if (!ensure_directory(to)) return false;
    bool ok = true;
    std::vector<std::string> files = list_files_recursive(from);
    for (size_t i = 0; i < files.size(); ++i) {
        std::string src = join_path(from, files[i]);
        struct stat st;
        if (stat(src.c_str(), &st) != 0 || !copy_file(src, join_path(to, files[i]), st.st_mode)) {
            LOG_WARN("[utils] Failed to copy %s (%s)", src.c_str(), strerror(errno));
            ok = false;
        }
    }
    return ok;
}

bool move_file(const std::string& from, const std::string& to) {
    if (!create_parent_directory(to)) return false;
    if (rename(from.c_str(), to.c_str()) == 0) {
        return true;
    }
    if (errno != EXDEV) {
        return false;
    }
    struct stat st;
    if (lstat(from.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    if (!copy_file(from, to, st.st_mode)) {
        return false;
    }
    return unlink(from.c_str()) == 0;
}

// ============ Identifiers ============

std::string random_hex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (bytes > 0 && RAND_bytes(buf.data(), static_cast<int>(bytes)) != 1) {
        // CSPRNG unavailable
        static std::atomic<uint64_t> counter(0);
        uint64_t v = counter.fetch_add(1) ^ static_cast<uint64_t>(monotonic_ms());
        for (size_t i = 0; i < bytes; ++i) {
            buf[i] = static_cast<unsigned char>(v >> ((i % 8) * 8));
        }
        LOG_WARN("[utils] RAND_bytes failed, using counter-based id suffix");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < buf.size(); ++i) {
        oss << std::setw(2) << static_cast<int>(buf[i]);
    }
    return oss.str();
}

std::string make_record_id(const std::string& prefix) {
    return prefix + "_" + std::to_string(current_timestamp_ms()) + "_" + random_hex(8);
}

// ============ Hashing utilities ============

static std::string digest_to_hex(const unsigned char* digest, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), NULL) != 1) {
        return "";
    }
    return digest_to_hex(digest, len);
}

// Streams one file into an already-initialized digest context
static bool digest_file(EVP_MD_CTX* ctx, const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) return false;
    char buf[65536];
    ssize_t n;
    bool ok = true;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        if (EVP_DigestUpdate(ctx, buf, static_cast<size_t>(n)) != 1) {
            ok = false;
            break;
        }
    }
    if (n < 0) ok = false;
    close(fd);
    return ok;
}

std::string sha256_file(const std::string& path) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";
    std::string result;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), NULL) == 1 && digest_file(ctx, path)) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, digest, &len) == 1) {
            result = digest_to_hex(digest, len);
        }
    }
    EVP_MD_CTX_free(ctx);
    return result;
}

std::string hash_directory(const std::string& root) {
    if (!is_directory(root)) return "";

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), NULL) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    std::vector<std::string> files = list_files_recursive(root);
    for (size_t i = 0; i < files.size(); ++i) {
        EVP_DigestUpdate(ctx, files[i].data(), files[i].size());
        EVP_DigestUpdate(ctx, "\0", 1);
        if (!digest_file(ctx, join_path(root, files[i]))) {
            // Unreadable files still contribute their name and a marker
            EVP_DigestUpdate(ctx, "<unreadable>", 12);
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    std::string result;
    if (EVP_DigestFinal_ex(ctx, digest, &len) == 1) {
        result = digest_to_hex(digest, len);
    }
    EVP_MD_CTX_free(ctx);
    return result;
}

} // namespace warden
