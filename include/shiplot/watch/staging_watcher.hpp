#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/watch/notification_source.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace shiplot::watch {

/**
 * @brief Receives each plot found in a staging directory
 *
 * RETURNS: false when the file was not queued (already in flight, or the
 * pool is stopping); the watcher only logs it.
 */
using PlotHandler = std::function<bool(const std::filesystem::path&)>;

struct WatchOptions {
    std::vector<std::string> staging_patterns;
    std::vector<std::string> plot_suffixes;
};

/**
 * @brief Feeds plots from staging directories into the transfer queue
 *
 * USAGE:
 * StagingWatcher watcher(source, options, [&](const fs::path& p) {
 *     return orchestrator.enqueue_move(p);
 * });
 * watcher.start();        // register directories, queue existing plots
 * watcher.run(token);     // blocks until the token fires
 */
class StagingWatcher {
public:
    StagingWatcher(NotificationSource& source, WatchOptions options, PlotHandler on_plot);

    /**
     * @brief Resolve staging directories, watch them, queue existing plots
     *
     * Directories are registered before they are listed, so a plot landing
     * in between is seen at least once (the orchestrator drops duplicates).
     *
     * RETURNS: error if a pattern is malformed or a directory cannot be
     * watched or listed
     */
    Result<void> start();

    /**
     * @brief Dispatch notifications until the token fires, then close the source
     */
    void run(const CancellationToken& token);

    const std::vector<std::filesystem::path>& directories() const { return directories_; }

private:
    Result<void> scan_directory(const std::filesystem::path& directory);
    void dispatch(const std::filesystem::path& path);

    NotificationSource& source_;
    WatchOptions options_;
    PlotHandler on_plot_;
    std::vector<std::filesystem::path> directories_;
};

} // namespace shiplot::watch
