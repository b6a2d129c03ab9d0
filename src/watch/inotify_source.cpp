#include "shiplot/watch/inotify_source.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace shiplot::watch {
namespace {

constexpr std::uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_ONLYDIR;

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

Result<std::unique_ptr<InotifySource>> InotifySource::create() {
    const int notify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (notify_fd < 0) {
        return Err<std::unique_ptr<InotifySource>>(ErrorCode::Io, errno_message("inotify_init1"));
    }

    const int wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd < 0) {
        auto error = errno_message("eventfd");
        ::close(notify_fd);
        return Err<std::unique_ptr<InotifySource>>(ErrorCode::Io, std::move(error));
    }

    return Ok(std::unique_ptr<InotifySource>(new InotifySource(notify_fd, wake_fd)));
}

InotifySource::InotifySource(int notify_fd, int wake_fd)
    : notify_fd_(notify_fd), wake_fd_(wake_fd) {
    reader_ = std::thread([this] { read_loop(); });
}

InotifySource::~InotifySource() {
    close();
}

Result<void> InotifySource::add_directory(const std::filesystem::path& directory) {
    std::lock_guard lock(watches_mutex_);
    const int wd = inotify_add_watch(notify_fd_, directory.c_str(), kWatchMask);
    if (wd < 0) {
        return Err<void>(ErrorCode::Io, errno_message(("inotify_add_watch " + directory.string()).c_str()));
    }
    watches_[wd] = directory;
    spdlog::debug("Watching {} (wd {})", directory.string(), wd);
    return Ok();
}

std::optional<FileEvent> InotifySource::next(const CancellationToken& token) {
    // Cancellation ends the stream the same way close() does
    auto registration = token.on_cancel([this] { queue_.shutdown(); });
    if (token.is_cancelled()) {
        return std::nullopt;
    }
    return queue_.pop();
}

void InotifySource::close() {
    std::call_once(close_once_, [this] {
        const std::uint64_t one = 1;
        if (::write(wake_fd_, &one, sizeof(one)) < 0) {
            spdlog::warn("Failed to wake inotify reader: {}", std::strerror(errno));
        }
        if (reader_.joinable()) {
            reader_.join();
        }
        queue_.shutdown();

        ::close(notify_fd_);
        ::close(wake_fd_);
        notify_fd_ = -1;
        wake_fd_ = -1;
    });
}

void InotifySource::read_loop() {
    pollfd fds[2];
    fds[0].fd = notify_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wake_fd_;
    fds[1].events = POLLIN;

    for (;;) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("File watcher error: {}", std::strerror(errno));
            break;
        }

        if (fds[1].revents != 0) {
            break;
        }
        if ((fds[0].revents & POLLIN) != 0) {
            drain_notifications();
        }
    }
}

void InotifySource::drain_notifications() {
    alignas(inotify_event) char buffer[sizeof(inotify_event) + NAME_MAX + 1];

    ssize_t length = 0;
    while ((length = ::read(notify_fd_, buffer, sizeof(buffer))) > 0) {
        const inotify_event* event = nullptr;
        for (ssize_t offset = 0; offset < length;
             offset += static_cast<ssize_t>(offsetof(inotify_event, name) + event->len)) {
            event = reinterpret_cast<const inotify_event*>(buffer + offset);

            if ((event->mask & IN_Q_OVERFLOW) != 0) {
                spdlog::error("inotify queue overflow, notifications were lost");
                continue;
            }

            std::lock_guard lock(watches_mutex_);
            if ((event->mask & IN_IGNORED) != 0) {
                watches_.erase(event->wd);
                continue;
            }
            if ((event->mask & IN_ISDIR) != 0 || event->len == 0) {
                continue;
            }
            if ((event->mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) == 0) {
                continue;
            }

            auto it = watches_.find(event->wd);
            if (it == watches_.end()) {
                continue;
            }
            queue_.push(FileEvent{it->second / event->name});
        }
    }

    if (length < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        spdlog::error("File watcher error: {}", std::strerror(errno));
    }
}

} // namespace shiplot::watch
