#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"

#include <filesystem>
#include <optional>

namespace shiplot::watch {

/**
 * @brief A file that has appeared, complete, in a watched directory
 */
struct FileEvent {
    std::filesystem::path path;
};

/**
 * @brief Stream of "file created" notifications for a set of directories
 *
 * Directories can be added at any time. close() ends the stream: a blocked
 * next() returns nullopt, and so does every later call.
 */
class NotificationSource {
public:
    virtual ~NotificationSource() = default;

    virtual Result<void> add_directory(const std::filesystem::path& directory) = 0;

    /**
     * BLOCKS: until an event arrives, the token fires or close() is called
     * RETURNS: nullopt once the stream has ended
     */
    virtual std::optional<FileEvent> next(const CancellationToken& token) = 0;

    virtual void close() = 0;
};

} // namespace shiplot::watch
