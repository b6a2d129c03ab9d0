/**
 * @file orchestrator.hpp
 * @brief Schedules plot transfers onto destination volumes
 *
 * Every job follows the same path: claim the freest volume, write
 * `<volume>/<name>.tmp`, verify the byte count, rename to the final name,
 * release the volume. Volumes too small for the file are evicted and the
 * worker pool shrinks with them.
 *
 * EXAMPLE:
 * DestinationRegistry registry;
 * registry.populate({"/mnt/disk*"});
 * TransferOrchestrator orchestrator(registry, bus, cancel.token());
 * orchestrator.enqueue_move("/staging/plot-k32-1.plot");
 * orchestrator.drain();
 */

#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/events/event_bus.hpp"
#include "shiplot/transfer/session.hpp"
#include "shiplot/transfer/types.hpp"
#include "shiplot/transfer/uploader.hpp"
#include "shiplot/transfer/worker_pool.hpp"
#include "shiplot/volume/destination_registry.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace shiplot::transfer {

struct OrchestratorOptions {
    std::size_t max_transfers = 4;  ///< 0 = one transfer per destination
    SinkFactory sink_factory;       ///< empty = io::FileWriter
};

/**
 * @brief Owns the worker pool and runs write-verify-commit jobs
 *
 * THREAD SAFETY:
 * - enqueue_* may be called from any thread (watcher, network server)
 * - The synchronous forms run in the calling thread and are what the
 *   enqueued jobs execute
 * - A source path already queued or running is not accepted twice
 */
class TransferOrchestrator {
public:
    /// Local and receiving mode: files land on the registry's volumes
    TransferOrchestrator(volume::DestinationRegistry& registry,
                         events::EventBus& bus,
                         CancellationToken token,
                         OrchestratorOptions options = {});

    /// Sending mode: files are forwarded to a remote receiver
    TransferOrchestrator(Uploader& uploader,
                         events::EventBus& bus,
                         CancellationToken token,
                         OrchestratorOptions options = {});

    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    /**
     * @brief Queue a local staging file for a local destination
     *
     * RETURNS: false if the file is already in flight or the pool is stopped
     */
    bool enqueue_move(const std::filesystem::path& source);

    /**
     * @brief Queue an inbound stream of `size` bytes named `name`
     *
     * The body must stay readable until `on_complete` has been called;
     * holding it by shared_ptr lets the connection keep itself alive.
     *
     * RETURNS: false if a file with the same name is already being received
     * or the pool is stopped; `on_complete` is not called in that case
     */
    bool enqueue_save(std::string name,
                      std::uint64_t size,
                      std::shared_ptr<io::ByteReader> body,
                      CompletionHandler on_complete);

    /**
     * @brief Queue a local staging file for the remote receiver
     */
    bool enqueue_upload(const std::filesystem::path& source);

    /**
     * BLOCKS: until every queued and running job has finished
     */
    void drain();

    /**
     * @brief Finish queued jobs, join the workers, stop accepting new ones
     */
    void shutdown();

    Result<TransferReport> move_file(const std::filesystem::path& source);
    Result<TransferReport> save_stream(const std::string& name, std::uint64_t size, io::ByteReader& body);
    Result<TransferReport> upload_file(const std::filesystem::path& source);

    std::size_t pool_capacity() const { return pool_.capacity(); }
    std::size_t in_flight() const;

private:
    Result<TransferReport> run_to_volume(TransferSession& session, const TransferJob& job);
    Result<TransferReport> run_upload(TransferSession& session, const TransferJob& job);
    Result<TransferReport> finish(TransferSession& session, Result<TransferReport> outcome);

    Result<std::unique_ptr<io::ByteWriter>> open_sink(const std::filesystem::path& path) const;

    bool track(const std::string& key);
    void untrack(const std::string& key);
    bool submit_tracked(std::string key, WorkerPool::Job job);

    void on_volume_count_changed(std::size_t volume_count);

    volume::DestinationRegistry* registry_ = nullptr;
    Uploader* uploader_ = nullptr;
    events::EventBus& bus_;
    CancellationToken token_;
    OrchestratorOptions options_;

    mutable std::mutex in_flight_mutex_;
    std::unordered_set<std::string> in_flight_;

    // Declared last: destroyed first, so running jobs never see dead members
    WorkerPool pool_;
};

} // namespace shiplot::transfer
