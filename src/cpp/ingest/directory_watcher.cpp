#include "directory_watcher.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace credingest {
namespace fs = std::filesystem;

DirectoryWatcher::DirectoryWatcher(std::string directory, std::string suffix,
                                   FileCallback on_file)
    : directory_(std::move(directory)), suffix_(std::move(suffix)),
      on_file_(std::move(on_file)) {}

DirectoryWatcher::~DirectoryWatcher() { stop(); }

bool DirectoryWatcher::has_suffix(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> DirectoryWatcher::list_candidates(const std::string& dir,
                                                           const std::string& suffix) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if (ec) {
        LOG_ERR("[watcher] Cannot list %s: %s", dir.c_str(), ec.message().c_str());
        return out;
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WRN("[watcher] Listing %s interrupted: %s", dir.c_str(), ec.message().c_str());
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        std::string name = it->path().filename().string();
        if (has_suffix(name, suffix)) out.push_back(it->path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool DirectoryWatcher::start(std::string* error) {
    if (running_.load()) return true;

    auto fail = [&](const std::string& msg) {
        LOG_ERR("[watcher] %s", msg.c_str());
        if (error) *error = msg;
        close_fds();
        return false;
    };

    std::error_code ec;
    if (!fs::exists(directory_, ec)) {
        if (!fs::create_directories(directory_, ec) || ec) {
            return fail("cannot create directory " + directory_ + ": " +
                        (ec ? ec.message() : std::string("unknown error")));
        }
        LOG_INF("[watcher] Created directory: %s", directory_.c_str());
    } else if (!fs::is_directory(directory_, ec)) {
        return fail(directory_ + " exists and is not a directory");
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return fail(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    watch_fd_ = inotify_add_watch(inotify_fd_, directory_.c_str(),
                                  IN_CREATE | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF);
    if (watch_fd_ < 0) {
        return fail("cannot watch " + directory_ + ": " + std::strerror(errno));
    }

    stop_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0) {
        return fail(std::string("eventfd failed: ") + std::strerror(errno));
    }

    LOG_INF("[watcher] Watching %s for *%s", directory_.c_str(), suffix_.c_str());

    stop_requested_.store(false);
    running_.store(true);
    thread_ = std::thread(&DirectoryWatcher::watch_loop, this);
    return true;
}

void DirectoryWatcher::stop() {
    stop_requested_.store(true);
    if (thread_.joinable()) {
        uint64_t one = 1;
        if (write(stop_fd_, &one, sizeof(one)) < 0) {
            LOG_WRN("[watcher] Stop signal write failed: %s", std::strerror(errno));
        }
        thread_.join();
        LOG_INF("[watcher] Stopped watching %s", directory_.c_str());
    }
    running_.store(false);
    close_fds();
}

void DirectoryWatcher::close_fds() {
    if (inotify_fd_ >= 0) {
        if (watch_fd_ >= 0) inotify_rm_watch(inotify_fd_, watch_fd_);
        close(inotify_fd_);
    }
    if (stop_fd_ >= 0) close(stop_fd_);
    inotify_fd_ = watch_fd_ = stop_fd_ = -1;
}

void DirectoryWatcher::scan_existing() {
    auto files = list_candidates(directory_, suffix_);
    if (!files.empty()) {
        LOG_INF("[watcher] Found %zu existing files", files.size());
    }
    for (const auto& f : files) {
        if (stop_requested_.load()) {
            LOG_DBG("[watcher] Stop requested -- scan of %s abandoned", directory_.c_str());
            return;
        }
        deliver(f);
    }
}

void DirectoryWatcher::deliver(const std::string& path) {
    if (!seen_.insert(path).second) return;
    LOG_DBG("[watcher] Discovered %s", path.c_str());
    try {
        on_file_(path);
    } catch (const std::exception& e) {
        LOG_ERR("[watcher] Handler failed for %s: %s", path.c_str(), e.what());
    }
}

void DirectoryWatcher::watch_loop() {
    alignas(struct inotify_event) char buf[16 * 1024];

    // The watch is already registered, so nothing created during the scan is
    // missed; seen_ absorbs a file reported by both
    scan_existing();

    while (!stop_requested_.load()) {
        struct pollfd fds[2];
        fds[0] = {inotify_fd_, POLLIN, 0};
        fds[1] = {stop_fd_, POLLIN, 0};

        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERR("[watcher] poll failed: %s", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        bool gone = false;
        for (;;) {
            ssize_t n = read(inotify_fd_, buf, sizeof(buf));
            if (n <= 0) {
                if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    LOG_ERR("[watcher] read failed: %s", std::strerror(errno));
                }
                break;
            }

            for (char* p = buf; p < buf + n;) {
                auto* ev = reinterpret_cast<struct inotify_event*>(p);
                p += sizeof(struct inotify_event) + ev->len;

                if (ev->mask & IN_Q_OVERFLOW) {
                    LOG_WRN("[watcher] Event queue overflow -- rescanning %s", directory_.c_str());
                    scan_existing();
                    continue;
                }
                if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
                    gone = true;
                    continue;
                }
                if ((ev->mask & IN_ISDIR) || ev->len == 0) continue;
                if (!(ev->mask & (IN_CREATE | IN_MOVED_TO))) continue;

                std::string name(ev->name);
                if (!has_suffix(name, suffix_)) continue;
                deliver((fs::path(directory_) / name).string());
            }
        }

        if (gone) {
            LOG_ERR("[watcher] Directory %s was removed or moved -- watch ended",
                directory_.c_str());
            break;
        }
    }

    running_.store(false);
}

} // namespace credingest
