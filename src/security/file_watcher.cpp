#include <warden/security/file_watcher.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/inotify.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden {

static const uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB |
                                   IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
                                   IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR | IN_DONT_FOLLOW;

FileWatcher::FileWatcher() {
    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR("[FileWatcher] inotify_init1 failed: %s", strerror(errno));
    }
}

FileWatcher::~FileWatcher() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

bool FileWatcher::add_directory(const std::string& dir) {
    if (fd_ < 0) return false;
    int wd = inotify_add_watch(fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        LOG_WARN("[FileWatcher] Cannot watch %s: %s", dir.c_str(), strerror(errno));
        return false;
    }
    watches_[wd] = dir;
    return true;
}

void FileWatcher::add_subtree(const std::string& dir, std::vector<WatchEvent>* discovered) {
    if (!add_directory(dir)) return;

    DIR* d = opendir(dir.c_str());
    if (!d) return;
    struct dirent* entry;
    while ((entry = readdir(d)) != NULL) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        std::string child = join_path(dir, entry->d_name);
        struct stat st;
        if (lstat(child.c_str(), &st) != 0) continue;
        if (S_ISDIR(st.st_mode)) {
            add_subtree(child, discovered);
        } else if (discovered) {
            // Created before the watch existed; report it as a creation
            discovered->push_back(WatchEvent(child, WatchEvent::CREATED, false));
        }
    }
    closedir(d);
}

bool FileWatcher::add_tree(const std::string& root) {
    if (fd_ < 0) return false;
    if (!is_directory(root)) {
        LOG_WARN("[FileWatcher] Not a directory: %s", root.c_str());
        return false;
    }
    size_t before = watches_.size();
    add_subtree(root, nullptr);
    LOG_DEBUG("[FileWatcher] Watching %s (%zu directories)", root.c_str(), watches_.size() - before);
    return watches_.size() > before;
}

void FileWatcher::remove_tree(const std::string& root) {
    for (auto it = watches_.begin(); it != watches_.end(); ) {
        if (path_is_under(it->second, root)) {
            inotify_rm_watch(fd_, it->first);
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }
}

void FileWatcher::remove_all() {
    for (const auto& w : watches_) {
        inotify_rm_watch(fd_, w.first);
    }
    watches_.clear();
}

std::vector<WatchEvent> FileWatcher::poll() {
    std::vector<WatchEvent> events;
    if (fd_ < 0) return events;

    char buf[65536] __attribute__((aligned(__alignof__(struct inotify_event))));
    for (;;) {
        ssize_t len = read(fd_, buf, sizeof(buf));
        if (len <= 0) {
            if (len < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_ERROR("[FileWatcher] read failed: %s", strerror(errno));
            }
            break;
        }

        for (char* ptr = buf; ptr < buf + len; ) {
            auto* ev = reinterpret_cast<struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                LOG_WARN("[FileWatcher] Event queue overflow, some changes were missed");
                continue;
            }
            auto it = watches_.find(ev->wd);
            if (it == watches_.end()) continue;

            if (ev->mask & IN_IGNORED) {
                watches_.erase(it);
                continue;
            }
            if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
                continue;
            }
            if (ev->len == 0) continue;

            std::string path = join_path(it->second, ev->name);
            bool is_dir = (ev->mask & IN_ISDIR) != 0;

            if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
                events.push_back(WatchEvent(path, WatchEvent::CREATED, is_dir));
                if (is_dir) {
                    add_subtree(path, &events);
                }
            } else if (ev->mask & (IN_DELETE | IN_MOVED_FROM)) {
                events.push_back(WatchEvent(path, WatchEvent::DELETED, is_dir));
            } else if (ev->mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) {
                events.push_back(WatchEvent(path, WatchEvent::MODIFIED, is_dir));
            }
        }
    }
    return events;
}

} // namespace warden
