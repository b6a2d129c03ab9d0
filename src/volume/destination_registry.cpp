#include "shiplot/volume/destination_registry.hpp"

#include "shiplot/volume/path_pattern.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace shiplot::volume {
namespace fs = std::filesystem;

namespace {

std::string normalized(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    return (ec ? path.lexically_normal() : canonical).generic_string();
}

} // namespace

DestinationRegistry::DestinationRegistry(FreeSpaceQuery free_space)
    : free_space_(std::move(free_space)) {}

Result<void> DestinationRegistry::populate(const std::vector<std::string>& patterns) {
    auto directories = expand_directories(patterns);
    if (directories.is_error()) {
        return Err<void>(directories.error());
    }

    for (const auto& directory : directories.value()) {
        if (add(directory)) {
            spdlog::info("Added destination {}", directory.string());
        } else {
            spdlog::warn("Destination {} listed more than once, ignoring duplicate", directory.string());
        }
    }
    return Ok();
}

bool DestinationRegistry::add(const fs::path& path) {
    const std::uint64_t free_bytes = free_space_(path);

    std::lock_guard lock(mutex_);
    const auto key = normalized(path);
    const bool duplicate = std::any_of(volumes_.begin(), volumes_.end(), [&](const DestinationVolume& v) {
        return normalized(v.path) == key;
    });
    if (duplicate) {
        return false;
    }

    volumes_.push_back(DestinationVolume{path, free_bytes, true});
    released_cv_.notify_all();
    return true;
}

std::optional<DestinationVolume> DestinationRegistry::select_and_claim() {
    std::lock_guard lock(mutex_);
    return claim_locked();
}

std::optional<DestinationVolume> DestinationRegistry::wait_and_claim(const CancellationToken& token) {
    auto registration = token.on_cancel([this] {
        // Taking the lock orders the notify after a waiter's predicate check
        { std::lock_guard lock(mutex_); }
        released_cv_.notify_all();
    });

    std::unique_lock lock(mutex_);
    for (;;) {
        if (token.is_cancelled()) {
            return std::nullopt;
        }
        if (auto volume = claim_locked()) {
            return volume;
        }
        released_cv_.wait(lock);
    }
}

void DestinationRegistry::release(const DestinationVolume& volume, bool refresh_free_space) {
    std::optional<std::uint64_t> refreshed;
    if (refresh_free_space) {
        refreshed = free_space_(volume.path);
    }

    {
        std::lock_guard lock(mutex_);
        auto it = find_locked(volume.path);
        if (it == volumes_.end()) {
            spdlog::warn("Release of unknown destination {}", volume.path.string());
            return;
        }
        if (it->available) {
            spdlog::warn("Destination {} released while not claimed", volume.path.string());
        }
        it->available = true;
        if (refreshed) {
            it->free_bytes = *refreshed;
        }
        sort_locked();
    }
    released_cv_.notify_all();
}

std::size_t DestinationRegistry::evict(const DestinationVolume& volume) {
    std::size_t remaining = 0;
    CountListener listener;
    {
        std::lock_guard lock(mutex_);
        auto it = find_locked(volume.path);
        if (it == volumes_.end()) {
            return volumes_.size();
        }
        volumes_.erase(it);
        remaining = volumes_.size();
        listener = count_listener_;
    }
    released_cv_.notify_all();

    if (listener) {
        listener(remaining);
    }
    return remaining;
}

void DestinationRegistry::set_count_listener(CountListener listener) {
    std::lock_guard lock(mutex_);
    count_listener_ = std::move(listener);
}

std::size_t DestinationRegistry::size() const {
    std::lock_guard lock(mutex_);
    return volumes_.size();
}

std::size_t DestinationRegistry::available_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(volumes_.begin(), volumes_.end(),
        [](const DestinationVolume& v) { return v.available; }));
}

std::vector<DestinationVolume> DestinationRegistry::volumes() const {
    std::lock_guard lock(mutex_);
    return volumes_;
}

std::optional<DestinationVolume> DestinationRegistry::claim_locked() {
    sort_locked();
    for (auto& volume : volumes_) {
        if (volume.available) {
            volume.available = false;
            return volume;
        }
    }
    return std::nullopt;
}

void DestinationRegistry::sort_locked() {
    // Stable so equally free volumes keep their configured order
    std::stable_sort(volumes_.begin(), volumes_.end(), [](const DestinationVolume& lhs, const DestinationVolume& rhs) {
        return lhs.free_bytes > rhs.free_bytes;
    });
}

std::vector<DestinationVolume>::iterator DestinationRegistry::find_locked(const fs::path& path) {
    return std::find_if(volumes_.begin(), volumes_.end(), [&](const DestinationVolume& v) {
        return v.path == path;
    });
}

} // namespace shiplot::volume
