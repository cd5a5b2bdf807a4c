/*
 * warden C++17 - FileWatcher
 *
 * Recursive inotify watcher. The descriptor is non-blocking; poll() drains
 * whatever the kernel has queued and returns it, so the watcher runs inside
 * the owner's poll loop with no thread of its own.
 */
#ifndef warden_SECURITY_FILE_WATCHER_HPP
#define warden_SECURITY_FILE_WATCHER_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace warden {

struct WatchEvent {
    enum Kind {
        CREATED,
        MODIFIED,
        DELETED
    };

    std::string path;
    Kind kind;
    bool is_directory;

    WatchEvent() : kind(MODIFIED), is_directory(false) {}
    WatchEvent(const std::string& p, Kind k, bool dir) : path(p), kind(k), is_directory(dir) {}
};

class FileWatcher {
public:
    FileWatcher();
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    bool valid() const { return fd_ >= 0; }

    // Watch root and every directory beneath it
    bool add_tree(const std::string& root);
    void remove_tree(const std::string& root);
    void remove_all();

    size_t watch_count() const { return watches_.size(); }

    // Non-blocking; returns every event queued since the last call
    std::vector<WatchEvent> poll();

private:
    bool add_directory(const std::string& dir);
    void add_subtree(const std::string& dir, std::vector<WatchEvent>* discovered);

    int fd_;
    std::map<int, std::string> watches_;
};

} // namespace warden

#endif // warden_SECURITY_FILE_WATCHER_HPP
