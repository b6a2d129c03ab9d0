#pragma once

#include "shiplot/config/config.hpp"
#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/events/event_bus.hpp"
#include "shiplot/network/transfer_client.hpp"
#include "shiplot/network/transfer_server.hpp"
#include "shiplot/transfer/orchestrator.hpp"
#include "shiplot/volume/destination_registry.hpp"
#include "shiplot/watch/notification_source.hpp"
#include "shiplot/watch/staging_watcher.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace shiplot::server {

using NotificationSourceFactory = std::function<Result<std::unique_ptr<watch::NotificationSource>>()>;

/**
 * @brief Collaborators replaced in tests
 */
struct ServiceDependencies {
    volume::FreeSpaceQuery free_space = volume::filesystem_free_bytes;
    NotificationSourceFactory notification_source;  ///< empty = inotify
};

/**
 * @brief Wires configuration, registry, orchestrator, server and watcher
 *
 * LIFECYCLE:
 * start() -> (transfers run) -> stop()
 *
 * stop() cancels everything in flight, stops accepting connections, joins
 * the watcher, drains the worker pool and finally lets the network thread
 * deliver the last result bytes.
 */
class ShiplotService {
public:
    ShiplotService(config::Config config, events::EventBus& bus, ServiceDependencies dependencies = {});
    ~ShiplotService();

    ShiplotService(const ShiplotService&) = delete;
    ShiplotService& operator=(const ShiplotService&) = delete;

    /**
     * RETURNS: setup error (bad pattern, unwatchable directory, bind failure);
     * nothing is left running on error
     */
    Result<void> start();

    /**
     * @brief Shut down; idempotent
     */
    void stop(const std::string& reason);

    bool running() const { return running_.load(); }

    /**
     * @brief Bound receiver port in server mode
     */
    std::optional<std::uint16_t> server_port() const;

    const config::Config& config() const noexcept { return config_; }
    volume::DestinationRegistry& registry() noexcept { return registry_; }
    transfer::TransferOrchestrator* orchestrator() noexcept { return orchestrator_.get(); }
    CancellationToken token() const { return cancel_.token(); }

private:
    Result<void> start_server();
    Result<void> start_watcher();
    void shutdown_components();

    config::Config config_;
    events::EventBus& bus_;
    ServiceDependencies dependencies_;

    CancellationSource cancel_;
    volume::DestinationRegistry registry_;

    std::unique_ptr<network::TransferClient> client_;
    std::unique_ptr<transfer::TransferOrchestrator> orchestrator_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<network::TransferServer> server_;
    std::thread io_thread_;

    std::unique_ptr<watch::NotificationSource> source_;
    std::unique_ptr<watch::StagingWatcher> watcher_;
    std::thread watcher_thread_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    bool stopped_ = false;
};

} // namespace shiplot::server
