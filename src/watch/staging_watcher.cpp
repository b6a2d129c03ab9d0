#include "shiplot/watch/staging_watcher.hpp"

#include "shiplot/core/plot_file.hpp"
#include "shiplot/volume/path_pattern.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace shiplot::watch {
namespace fs = std::filesystem;

StagingWatcher::StagingWatcher(NotificationSource& source, WatchOptions options, PlotHandler on_plot)
    : source_(source), options_(std::move(options)), on_plot_(std::move(on_plot)) {}

Result<void> StagingWatcher::start() {
    auto directories = volume::expand_directories(options_.staging_patterns);
    if (directories.is_error()) {
        return Err<void>(directories.error());
    }
    directories_ = std::move(directories.value());

    for (const auto& directory : directories_) {
        spdlog::info("Starting watcher on {}", directory.string());
        if (auto added = source_.add_directory(directory); added.is_error()) {
            return added;
        }
    }

    for (const auto& directory : directories_) {
        if (auto scanned = scan_directory(directory); scanned.is_error()) {
            return scanned;
        }
    }
    return Ok();
}

void StagingWatcher::run(const CancellationToken& token) {
    while (!token.is_cancelled()) {
        auto event = source_.next(token);
        if (!event) {
            break;
        }
        if (token.is_cancelled()) {
            break;
        }
        dispatch(event->path);
    }

    source_.close();
    spdlog::debug("Staging watcher stopped");
}

Result<void> StagingWatcher::scan_directory(const fs::path& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "cannot list " + directory.string() + ": " + ec.message());
    }

    std::vector<fs::path> existing;
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) &&
            is_plot_file_name(entry.path().filename().string(), options_.plot_suffixes)) {
            existing.push_back(entry.path());
        }
    }
    std::sort(existing.begin(), existing.end());

    for (const auto& path : existing) {
        dispatch(path);
    }
    return Ok();
}

void StagingWatcher::dispatch(const fs::path& path) {
    if (!is_plot_file_name(path.filename().string(), options_.plot_suffixes)) {
        return;
    }
    if (!on_plot_(path)) {
        spdlog::debug("{} was not queued", path.string());
    }
}

} // namespace shiplot::watch
