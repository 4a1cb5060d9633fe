#pragma once
// =============================================================================
// DirectoryWatcher -- discovers new dump files in one directory (Linux inotify)
//
// start():
//   1. creates the directory if it does not exist
//   2. registers an inotify watch (IN_CREATE | IN_MOVED_TO)
//   3. spawns the watch loop thread, which first enumerates files already
//      present (watch events never fire for them) and then waits for events
// start() never invokes the callback itself. Every path with the configured suffix is delivered to the callback at most
// once per watcher lifetime. The callback runs on the watch thread and must
// not call stop(). On queue overflow the directory is rescanned.
// =============================================================================

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace credingest {

class DirectoryWatcher {
public:
    using FileCallback = std::function<void(const std::string& path)>;

    DirectoryWatcher(std::string directory, std::string suffix, FileCallback on_file);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    // False if the directory cannot be created or watched; `error` gets the reason
    bool start(std::string* error = nullptr);

    // Releases the watch and joins the loop thread. Idempotent.
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] const std::string& directory() const { return directory_; }
    [[nodiscard]] const std::string& suffix() const { return suffix_; }

    // Sorted paths of regular files in `dir` whose name ends with `suffix`
    static std::vector<std::string> list_candidates(const std::string& dir,
                                                    const std::string& suffix);
    static bool has_suffix(const std::string& name, const std::string& suffix);

private:
    void watch_loop();
    void scan_existing();
    void deliver(const std::string& path);
    void close_fds();

    std::string directory_;
    std::string suffix_;
    FileCallback on_file_;

    int inotify_fd_ = -1;
    int watch_fd_ = -1;
    int stop_fd_ = -1;      // eventfd, written by stop()

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::unordered_set<std::string> seen_;   // watch thread only
};

} // namespace credingest
