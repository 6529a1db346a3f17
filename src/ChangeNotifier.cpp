#include "ChangeNotifier.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/inotify.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO;
constexpr int kPollIntervalMs = 200;

std::optional<double> modificationTime(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
}

}  // namespace

InotifyChangeNotifier::InotifyChangeNotifier(const PathSanitizer& sanitizer, size_t capacity)
    : sanitizer_(sanitizer), ring_(capacity) {}

InotifyChangeNotifier::~InotifyChangeNotifier() {
    stop();
}

bool InotifyChangeNotifier::start() {
    if (running_) {
        return true;
    }
    // The monitor loop may have exited on its own after an error.
    if (monitorThread_.joinable()) {
        stop();
    }
    inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) {
        spdlog::info("File monitoring unavailable: inotify_init1 failed: {}", std::strerror(errno));
        return false;
    }
    addWatchTree(sanitizer_.base());
    if (watchDescriptors_.empty()) {
        ::close(inotifyFd_);
        inotifyFd_ = -1;
        spdlog::info("File monitoring unavailable: could not watch {}", sanitizer_.base().string());
        return false;
    }
    running_ = true;
    monitorThread_ = std::thread(&InotifyChangeNotifier::monitorLoop, this);
    spdlog::info("File monitoring enabled ({} directories watched)", watchDescriptors_.size());
    return true;
}

void InotifyChangeNotifier::stop() {
    running_ = false;
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }
    if (inotifyFd_ >= 0) {
        ::close(inotifyFd_);
        inotifyFd_ = -1;
    }
    watchDescriptors_.clear();
}

void InotifyChangeNotifier::setListener(Listener listener) {
    std::lock_guard lock(listenerMtx_);
    listener_ = std::move(listener);
}

void InotifyChangeNotifier::record(const fs::path& absolutePath, const std::string& type) {
    ChangeRecord change;
    change.path = sanitizer_.relative(absolutePath);
    change.type = type;
    change.time = modificationTime(absolutePath);
    spdlog::debug("Change recorded: {} {}", change.type, change.path);
    ring_.push(change);

    Listener listener;
    {
        std::lock_guard lock(listenerMtx_);
        listener = listener_;
    }
    if (listener) {
        listener(change);
    }
}

void InotifyChangeNotifier::addWatch(const fs::path& dir) {
    int wd = inotify_add_watch(inotifyFd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        spdlog::warn("Cannot watch {}: {}", dir.string(), std::strerror(errno));
        return;
    }
    watchDescriptors_[wd] = dir;
}

void InotifyChangeNotifier::addWatchTree(const fs::path& dir) {
    addWatch(dir);
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) {
            addWatch(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Incomplete watch setup under {}: {}", dir.string(), ec.message());
    }
}

void InotifyChangeNotifier::monitorLoop() {
    alignas(struct inotify_event) char buffer[8192];
    struct pollfd pfd;
    pfd.fd = inotifyFd_;
    pfd.events = POLLIN;

    while (running_) {
        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("File monitoring stopped: poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }
        ssize_t length = ::read(inotifyFd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            spdlog::error("File monitoring stopped: read failed: {}", std::strerror(errno));
            break;
        }
        handleEvents(buffer, static_cast<size_t>(length));
    }
    running_ = false;
}

void InotifyChangeNotifier::handleEvents(const char* buffer, size_t length) {
    size_t offset = 0;
    while (offset < length) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += sizeof(struct inotify_event) + event->len;

        if (event->mask & IN_IGNORED) {
            watchDescriptors_.erase(event->wd);
            continue;
        }
        if (event->mask & IN_Q_OVERFLOW) {
            spdlog::warn("File monitoring queue overflow, some changes were dropped");
            continue;
        }
        auto dir = watchDescriptors_.find(event->wd);
        if (dir == watchDescriptors_.end() || event->len == 0) {
            continue;
        }
        fs::path path = dir->second / event->name;

        if (event->mask & IN_ISDIR) {
            // Directory events are not recorded, but new directories need watches
            if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
                addWatchTree(path);
            }
            continue;
        }

        if (event->mask & IN_CREATE) {
            record(path, "created");
        } else if (event->mask & IN_MODIFY) {
            record(path, "modified");
        } else if (event->mask & IN_DELETE) {
            record(path, "deleted");
        } else if (event->mask & IN_MOVED_FROM) {
            pendingMoveCookie_ = event->cookie;
            record(path, "moved");
        } else if (event->mask & IN_MOVED_TO) {
            if (event->cookie != 0 && event->cookie == pendingMoveCookie_) {
                pendingMoveCookie_ = 0;
            } else {
                record(path, "created");
            }
        }
    }
}

std::unique_ptr<ChangeNotifier> makeChangeNotifier(const PathSanitizer& sanitizer, bool enabled, size_t capacity) {
    if (!enabled) {
        spdlog::info("File monitoring disabled by configuration");
        return std::make_unique<NullChangeNotifier>();
    }
    auto notifier = std::make_unique<InotifyChangeNotifier>(sanitizer, capacity);
    if (!notifier->start()) {
        return std::make_unique<NullChangeNotifier>();
    }
    return notifier;
}
