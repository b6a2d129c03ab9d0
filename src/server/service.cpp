#include "shiplot/server/service.hpp"

#include "shiplot/events/events.hpp"
#include "shiplot/watch/inotify_source.hpp"

#include <spdlog/spdlog.h>

namespace shiplot::server {
namespace fs = std::filesystem;

ShiplotService::ShiplotService(config::Config config, events::EventBus& bus, ServiceDependencies dependencies)
    : config_(std::move(config))
    , bus_(bus)
    , dependencies_(std::move(dependencies))
    , registry_(dependencies_.free_space ? dependencies_.free_space : volume::filesystem_free_bytes) {}

ShiplotService::~ShiplotService() {
    stop("service destroyed");
}

Result<void> ShiplotService::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load() || stopped_) {
        return Err<void>(ErrorCode::InvalidArgument, "service can only be started once");
    }

    if (auto valid = config::validate(config_); valid.is_error()) {
        return valid;
    }

    const auto mode = config_.mode();
    transfer::OrchestratorOptions options;
    options.max_transfers = config_.max_transfers;

    if (mode == config::Mode::Client) {
        client_ = std::make_unique<network::TransferClient>(config_.client.server_ip, config_.client.server_port);
        orchestrator_ = std::make_unique<transfer::TransferOrchestrator>(*client_, bus_, cancel_.token(), options);
    } else {
        if (auto populated = registry_.populate(config_.destination_paths); populated.is_error()) {
            return populated;
        }
        if (registry_.size() == 0) {
            spdlog::warn("No destination directories found; transfers will wait for one");
        }
        orchestrator_ = std::make_unique<transfer::TransferOrchestrator>(registry_, bus_, cancel_.token(), options);
    }

    if (mode == config::Mode::Server) {
        if (auto started = start_server(); started.is_error()) {
            shutdown_components();
            stopped_ = true;
            return started;
        }
    }

    if (!config_.staging_paths.empty()) {
        if (auto started = start_watcher(); started.is_error()) {
            shutdown_components();
            stopped_ = true;
            return started;
        }
    }

    running_ = true;
    bus_.emit(events::ServiceStartedEvent{config::mode_name(mode), orchestrator_->pool_capacity(), registry_.size()});
    return Ok();
}

void ShiplotService::stop(const std::string& reason) {
    std::lock_guard lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (running_.exchange(false)) {
        bus_.emit(events::ServiceStoppingEvent{reason});
    }
    shutdown_components();
}

std::optional<std::uint16_t> ShiplotService::server_port() const {
    if (!server_) {
        return std::nullopt;
    }
    return server_->port();
}

Result<void> ShiplotService::start_server() {
    network::ServerOptions server_options;
    server_options.ip = config_.server.ip;
    server_options.port = config_.server.port;
    server_options.plot_suffixes = config_.plot_suffixes;

    server_ = std::make_unique<network::TransferServer>(io_context_, *orchestrator_, server_options, cancel_.token());
    if (auto started = server_->start(); started.is_error()) {
        server_.reset();
        return started;
    }

    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    io_thread_ = std::thread([this] {
        io_context_.run();
        spdlog::debug("Network thread finished");
    });
    return Ok();
}

Result<void> ShiplotService::start_watcher() {
    if (dependencies_.notification_source) {
        auto created = dependencies_.notification_source();
        if (created.is_error()) {
            return Err<void>(created.error());
        }
        source_ = std::move(created.value());
    } else {
        auto created = watch::InotifySource::create();
        if (created.is_error()) {
            return Err<void>(created.error());
        }
        source_ = std::move(created.value());
    }

    watch::WatchOptions watch_options{config_.staging_paths, config_.plot_suffixes};
    auto* orchestrator = orchestrator_.get();
    watch::PlotHandler on_plot;
    if (config_.mode() == config::Mode::Client) {
        on_plot = [orchestrator](const fs::path& path) { return orchestrator->enqueue_upload(path); };
    } else {
        on_plot = [orchestrator](const fs::path& path) { return orchestrator->enqueue_move(path); };
    }

    watcher_ = std::make_unique<watch::StagingWatcher>(*source_, std::move(watch_options), std::move(on_plot));
    if (auto started = watcher_->start(); started.is_error()) {
        return started;
    }

    auto token = cancel_.token();
    watcher_thread_ = std::thread([this, token] { watcher_->run(token); });
    return Ok();
}

void ShiplotService::shutdown_components() {
    cancel_.cancel();

    if (server_) {
        server_->stop();
    }

    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
    if (source_) {
        source_->close();
    }

    // Queued jobs see the cancelled token and abort without claiming
    if (orchestrator_) {
        orchestrator_->shutdown();
    }

    work_guard_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

} // namespace shiplot::server
