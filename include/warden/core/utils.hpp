#ifndef warden_CORE_UTILS_HPP
#define warden_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace warden {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (for timers and debouncing)
int64_t monotonic_ms();

// Format millisecond timestamp as ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// Filesystem-safe compact timestamp (YYYYMMDDTHHMMSSmmmZ)
std::string compact_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if string ends with suffix
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Sanitize a string for safe JSON serialization
// Replaces invalid UTF-8 sequences and problematic control characters
std::string sanitize_utf8(const std::string& s);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Last path component ("" for "/")
std::string base_name(const std::string& path);

// Everything before the last component ("/" for top-level entries)
std::string dir_name(const std::string& path);

// True if `path` equals `root` or lies beneath it (both must be normalized)
bool path_is_under(const std::string& path, const std::string& root);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Create a directory and all missing parents
bool ensure_directory(const std::string& path, unsigned int mode = 0755);

bool file_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_symlink(const std::string& path);

// Current working directory ("/" if it cannot be determined)
std::string current_directory();

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out);

// Write (truncate) a file, creating parent directories
bool write_file(const std::string& path, const std::string& content);

// Append a line terminated by '\n'
bool append_line(const std::string& path, const std::string& line);

// Regular files beneath `root`, as relative paths in sorted order.
// Symbolic links are not followed.
std::vector<std::string> list_files_recursive(const std::string& root);

// Remove a file or a directory tree
bool remove_recursive(const std::string& path);

// Copy a directory tree (regular files and directories only)
bool copy_tree(const std::string& from, const std::string& to);

// Move a file, falling back to copy+unlink across filesystems
bool move_file(const std::string& from, const std::string& to);

// ============ Identifiers ============

// Random bytes rendered as lowercase hex (2 * bytes characters)
std::string random_hex(size_t bytes);

// "<prefix>_<unix_ms>_<16 hex chars>"
std::string make_record_id(const std::string& prefix);

// ============ Hashing utilities ============

// SHA-256 of a byte string, lowercase hex
std::string sha256_hex(const std::string& data);

// SHA-256 of a file's content; empty string if unreadable
std::string sha256_file(const std::string& path);

// SHA-256 over every regular file beneath root (relative path, then content),
// in sorted path order. Returns empty string if root is not a directory.
std::string hash_directory(const std::string& root);

} // namespace warden

#endif // warden_CORE_UTILS_HPP
