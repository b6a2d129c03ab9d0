#pragma once

#include "shiplot/events/event_queue.hpp"
#include "shiplot/watch/notification_source.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace shiplot::watch {

/**
 * @brief Linux inotify notification source
 *
 * A reader thread polls the inotify descriptor together with an eventfd used
 * to wake it for shutdown, and queues an event for every file closed after
 * writing (IN_CLOSE_WRITE) or renamed into a watched directory (IN_MOVED_TO).
 * Both mean the file is complete; IN_CREATE would fire while a plotter is
 * still writing.
 */
class InotifySource : public NotificationSource {
public:
    static Result<std::unique_ptr<InotifySource>> create();

    ~InotifySource() override;

    InotifySource(const InotifySource&) = delete;
    InotifySource& operator=(const InotifySource&) = delete;

    Result<void> add_directory(const std::filesystem::path& directory) override;
    std::optional<FileEvent> next(const CancellationToken& token) override;
    void close() override;

private:
    InotifySource(int notify_fd, int wake_fd);

    void read_loop();
    void drain_notifications();

    int notify_fd_ = -1;
    int wake_fd_ = -1;

    std::mutex watches_mutex_;
    std::unordered_map<int, std::filesystem::path> watches_;

    events::ThreadSafeQueue<FileEvent> queue_;
    std::once_flag close_once_;
    std::thread reader_;
};

} // namespace shiplot::watch
