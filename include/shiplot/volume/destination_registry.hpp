#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/volume/disk_usage.hpp"

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shiplot::volume {

/**
 * @brief A destination directory and its scheduling state
 *
 * Values handed out by the registry are snapshots; the registry matches
 * them back to its entries by path.
 */
struct DestinationVolume {
    std::filesystem::path path;
    std::uint64_t free_bytes = 0;
    bool available = true;  ///< false while a transfer holds the claim
};

/**
 * @brief Capacity-aware set of destination volumes
 *
 * THREAD SAFETY:
 * Every operation runs under one mutex, held only for the list operation
 * itself. Selection and claim are a single step, so a volume is never handed
 * to two transfers before it has been released.
 *
 * LIFECYCLE OF A CLAIM:
 * select_and_claim()/wait_and_claim() -> exactly one of release() or evict()
 */
class DestinationRegistry {
public:
    /// Called outside the lock with the new volume count after an eviction
    using CountListener = std::function<void(std::size_t)>;

    explicit DestinationRegistry(FreeSpaceQuery free_space = filesystem_free_bytes);

    DestinationRegistry(const DestinationRegistry&) = delete;
    DestinationRegistry& operator=(const DestinationRegistry&) = delete;

    /**
     * @brief Expand patterns and add every resulting directory as available
     *
     * Directories already present (or reached twice by overlapping patterns)
     * are added once. Nothing is added if expansion fails.
     */
    Result<void> populate(const std::vector<std::string>& patterns);

    /**
     * @brief Add one volume, querying its free space
     *
     * RETURNS: false if the path is already registered
     */
    bool add(const std::filesystem::path& path);

    /**
     * @brief Claim the available volume with the most free space
     *
     * RETURNS: nullopt when every volume is claimed (or none are left)
     * BLOCKS: No
     */
    std::optional<DestinationVolume> select_and_claim();

    /**
     * @brief Claim a volume, waiting for a release if none is available
     *
     * Wakes on release(), evict() or cancellation; no polling interval.
     * With an empty registry this waits until the token fires.
     *
     * RETURNS: nullopt only when cancelled
     */
    std::optional<DestinationVolume> wait_and_claim(const CancellationToken& token);

    /**
     * @brief Return a claimed volume to the pool
     *
     * @param refresh_free_space re-query the storage layer before the volume
     *        becomes selectable again
     */
    void release(const DestinationVolume& volume, bool refresh_free_space);

    /**
     * @brief Permanently drop a volume that cannot hold the file at hand
     *
     * RETURNS: number of volumes left
     */
    std::size_t evict(const DestinationVolume& volume);

    void set_count_listener(CountListener listener);

    std::size_t size() const;
    std::size_t available_count() const;
    std::vector<DestinationVolume> volumes() const;

private:
    std::optional<DestinationVolume> claim_locked();
    void sort_locked();
    std::vector<DestinationVolume>::iterator find_locked(const std::filesystem::path& path);

    FreeSpaceQuery free_space_;
    CountListener count_listener_;

    mutable std::mutex mutex_;
    std::condition_variable released_cv_;
    std::vector<DestinationVolume> volumes_;
};

} // namespace shiplot::volume
