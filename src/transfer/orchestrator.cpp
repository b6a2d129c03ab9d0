#include "shiplot/transfer/orchestrator.hpp"

#include "shiplot/events/events.hpp"
#include "shiplot/io/cancellable_stream.hpp"
#include "shiplot/io/file_stream.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace shiplot::transfer {
namespace fs = std::filesystem;

namespace {

constexpr const char* kTempSuffix = ".tmp";

/**
 * @brief Releases a claimed volume on every exit path
 *
 * Free space is always re-queried: after a commit the volume has less of
 * it, after an abort the temp file is gone again.
 */
class ClaimGuard {
public:
    ClaimGuard(volume::DestinationRegistry& registry, volume::DestinationVolume volume)
        : registry_(registry), volume_(std::move(volume)) {}

    ~ClaimGuard() { registry_.release(volume_, true); }

    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;

    const volume::DestinationVolume& volume() const { return volume_; }

private:
    volume::DestinationRegistry& registry_;
    volume::DestinationVolume volume_;
};

void remove_temp(const fs::path& temp_path) {
    std::error_code ec;
    fs::remove(temp_path, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary file {}: {}", temp_path.string(), ec.message());
    }
}

std::string in_flight_key(const fs::path& source) {
    return source.lexically_normal().string();
}

// Wire names carry no separator, so the prefix keeps them apart from local paths
std::string inbound_key(const std::string& name) {
    return "inbound:/" + name;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(volume::DestinationRegistry& registry,
                                           events::EventBus& bus,
                                           CancellationToken token,
                                           OrchestratorOptions options)
    : registry_(&registry)
    , bus_(bus)
    , token_(std::move(token))
    , options_(std::move(options))
    , pool_(compute_pool_size(options_.max_transfers, registry.size())) {
    spdlog::info("Creating worker pool with max size {}", pool_.capacity());
    registry_->set_count_listener([this](std::size_t volume_count) {
        on_volume_count_changed(volume_count);
    });
}

TransferOrchestrator::TransferOrchestrator(Uploader& uploader,
                                           events::EventBus& bus,
                                           CancellationToken token,
                                           OrchestratorOptions options)
    : uploader_(&uploader)
    , bus_(bus)
    , token_(std::move(token))
    , options_(std::move(options))
    , pool_(std::max<std::size_t>(options_.max_transfers, 1)) {
    spdlog::info("Creating upload pool with max size {}", pool_.capacity());
}

TransferOrchestrator::~TransferOrchestrator() {
    shutdown();
    if (registry_ != nullptr) {
        registry_->set_count_listener(nullptr);
    }
}

bool TransferOrchestrator::enqueue_move(const fs::path& source) {
    return submit_tracked(in_flight_key(source), [this, source] {
        // Outcome is reported through the event bus
        (void)move_file(source);
    });
}

bool TransferOrchestrator::enqueue_save(std::string name,
                                        std::uint64_t size,
                                        std::shared_ptr<io::ByteReader> body,
                                        CompletionHandler on_complete) {
    if (!body) {
        return false;
    }
    std::string key = inbound_key(name);
    return submit_tracked(std::move(key), [this, name = std::move(name), size, body = std::move(body),
                                           on_complete = std::move(on_complete)] {
        auto outcome = save_stream(name, size, *body);
        if (on_complete) {
            on_complete(outcome);
        }
    });
}

bool TransferOrchestrator::enqueue_upload(const fs::path& source) {
    return submit_tracked(in_flight_key(source), [this, source] {
        (void)upload_file(source);
    });
}

void TransferOrchestrator::drain() {
    pool_.drain();
}

void TransferOrchestrator::shutdown() {
    pool_.shutdown();
}

std::size_t TransferOrchestrator::in_flight() const {
    std::lock_guard lock(in_flight_mutex_);
    return in_flight_.size();
}

Result<TransferReport> TransferOrchestrator::move_file(const fs::path& source) {
    TransferSession session(source.filename().string(), TransferKind::Move);

    if (registry_ == nullptr) {
        return finish(session, Err<TransferReport>(ErrorCode::InvalidArgument,
                                                   "no destination registry for local moves"));
    }

    auto reader = io::FileReader::open(source);
    if (reader.is_error()) {
        return finish(session, Err<TransferReport>(reader.error()));
    }

    TransferJob job;
    job.kind = TransferKind::Move;
    job.source_id = source.string();
    job.file_name = source.filename().string();
    job.expected_size = reader.value()->size();
    job.source = reader.value().get();

    auto outcome = run_to_volume(session, job);
    if (outcome.is_ok()) {
        std::error_code ec;
        fs::remove(source, ec);
        if (ec) {
            spdlog::warn("Moved {} but could not remove source: {}", source.string(), ec.message());
        }
        (void)session.transition_to(TransferState::Complete);
    }
    return finish(session, std::move(outcome));
}

Result<TransferReport> TransferOrchestrator::save_stream(const std::string& name,
                                                         std::uint64_t size,
                                                         io::ByteReader& body) {
    TransferSession session(name, TransferKind::Save);

    if (registry_ == nullptr) {
        return finish(session, Err<TransferReport>(ErrorCode::InvalidArgument,
                                                   "no destination registry for inbound files"));
    }

    TransferJob job;
    job.kind = TransferKind::Save;
    job.source_id = "network";
    job.file_name = name;
    job.expected_size = size;
    job.source = &body;
    // The body is followed by the result exchange, never read past it
    job.source_limit = size;

    auto outcome = run_to_volume(session, job);
    if (outcome.is_ok()) {
        (void)session.transition_to(TransferState::Complete);
    }
    return finish(session, std::move(outcome));
}

Result<TransferReport> TransferOrchestrator::upload_file(const fs::path& source) {
    TransferSession session(source.filename().string(), TransferKind::Upload);

    if (uploader_ == nullptr) {
        return finish(session, Err<TransferReport>(ErrorCode::InvalidArgument,
                                                   "no remote receiver configured"));
    }

    auto reader = io::FileReader::open(source);
    if (reader.is_error()) {
        return finish(session, Err<TransferReport>(reader.error()));
    }

    TransferJob job;
    job.kind = TransferKind::Upload;
    job.source_id = source.string();
    job.file_name = source.filename().string();
    job.expected_size = reader.value()->size();
    job.source = reader.value().get();

    auto outcome = run_upload(session, job);
    if (outcome.is_ok()) {
        // Close before unlinking; the receiver already holds its copy
        if (auto closed = reader.value()->close(); closed.is_error()) {
            spdlog::warn("Closing {} failed: {}", source.string(), closed.error().to_string());
        }
        std::error_code ec;
        fs::remove(source, ec);
        if (ec) {
            spdlog::warn("Uploaded {} but could not remove source: {}", source.string(), ec.message());
        }
        (void)session.transition_to(TransferState::Complete);
    }
    return finish(session, std::move(outcome));
}

Result<TransferReport> TransferOrchestrator::run_to_volume(TransferSession& session, const TransferJob& job) {
    if (auto started = session.start(job.expected_size); started.is_error()) {
        return Err<TransferReport>(started.error());
    }

    // Select a volume that can hold the file, evicting the ones that cannot
    std::optional<volume::DestinationVolume> claimed;
    for (;;) {
        claimed = registry_->wait_and_claim(token_);
        if (!claimed) {
            return Err<TransferReport>(ErrorCode::Cancelled,
                                       "cancelled while waiting for a destination for " + job.file_name);
        }
        if (job.expected_size < claimed->free_bytes) {
            break;
        }

        spdlog::info("Destination {} has {} bytes free, {} needs {}; removing it",
                     claimed->path.string(), claimed->free_bytes, job.file_name, job.expected_size);
        const std::size_t remaining = registry_->evict(*claimed);
        bus_.emit(events::VolumeEvictedEvent{claimed->path, claimed->free_bytes, job.expected_size, remaining});
    }

    ClaimGuard guard(*registry_, *claimed);
    const fs::path directory = guard.volume().path;
    const fs::path final_path = directory / job.file_name;
    const fs::path temp_path = directory / (job.file_name + kTempSuffix);

    session.set_destination(final_path);
    if (auto res = session.transition_to(TransferState::Writing); res.is_error()) {
        return Err<TransferReport>(res.error());
    }
    bus_.emit(events::TransferStartedEvent{job.kind, job.file_name, directory, job.expected_size});

    auto sink = open_sink(temp_path);
    if (sink.is_error()) {
        remove_temp(temp_path);
        return Err<TransferReport>(sink.error());
    }
    auto& writer = *sink.value();

    auto copied = io::copy_stream(*job.source, writer, token_, job.source_limit);
    if (copied.is_error()) {
        if (auto closed = writer.close(); closed.is_error()) {
            spdlog::debug("Closing {} after failed copy: {}", temp_path.string(), closed.error().to_string());
        }
        remove_temp(temp_path);
        return Err<TransferReport>(copied.error());
    }
    session.set_bytes_written(copied.value());

    if (auto res = session.transition_to(TransferState::Verifying); res.is_error()) {
        return Err<TransferReport>(res.error());
    }
    if (copied.value() != job.expected_size) {
        if (auto closed = writer.close(); closed.is_error()) {
            spdlog::debug("Closing {} after size mismatch: {}", temp_path.string(), closed.error().to_string());
        }
        remove_temp(temp_path);
        return Err<TransferReport>(ErrorCode::SizeMismatch,
                                   "file size mismatch on " + job.file_name + ": wrote " +
                                       std::to_string(copied.value()) + " of " +
                                       std::to_string(job.expected_size) + " bytes");
    }

    if (auto res = session.transition_to(TransferState::Committing); res.is_error()) {
        return Err<TransferReport>(res.error());
    }
    // Both handles are closed before the rename
    if (auto closed = writer.close(); closed.is_error()) {
        remove_temp(temp_path);
        return Err<TransferReport>(closed.error());
    }
    if (auto closed = job.source->close(); closed.is_error()) {
        spdlog::warn("Closing source {} failed: {}", job.source_id, closed.error().to_string());
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        return Err<TransferReport>(ErrorCode::Io,
                                   "failed to rename " + temp_path.string() + " to " +
                                       final_path.string() + ": " + ec.message());
    }

    if (auto res = session.transition_to(TransferState::Cleanup); res.is_error()) {
        return Err<TransferReport>(res.error());
    }

    TransferReport report;
    report.file_name = job.file_name;
    report.destination = final_path;
    report.bytes_written = copied.value();
    report.duration = session.elapsed();
    return Ok(std::move(report));
}

Result<TransferReport> TransferOrchestrator::run_upload(TransferSession& session, const TransferJob& job) {
    if (auto started = session.start(job.expected_size); started.is_error()) {
        return Err<TransferReport>(started.error());
    }

    const fs::path destination = fs::path(uploader_->endpoint()) / job.file_name;
    session.set_destination(destination);
    if (auto res = session.transition_to(TransferState::Writing); res.is_error()) {
        return Err<TransferReport>(res.error());
    }
    bus_.emit(events::TransferStartedEvent{job.kind, job.file_name, uploader_->endpoint(), job.expected_size});

    auto sent = uploader_->upload(job.file_name, job.expected_size, *job.source, token_);
    if (sent.is_error()) {
        return Err<TransferReport>(sent.error());
    }
    session.set_bytes_written(sent.value());

    if (auto res = session.transition_to(TransferState::Verifying); res.is_error()) {
        return Err<TransferReport>(res.error());
    }
    if (sent.value() != job.expected_size) {
        return Err<TransferReport>(ErrorCode::SizeMismatch,
                                   "sent " + std::to_string(sent.value()) + " of " +
                                       std::to_string(job.expected_size) + " bytes for " + job.file_name);
    }

    // The receiver has renamed its temp file by the time it acknowledges
    if (auto res = session.transition_to(TransferState::Committing); res.is_error()) {
        return Err<TransferReport>(res.error());
    }
    if (auto res = session.transition_to(TransferState::Cleanup); res.is_error()) {
        return Err<TransferReport>(res.error());
    }

    TransferReport report;
    report.file_name = job.file_name;
    report.destination = destination;
    report.bytes_written = sent.value();
    report.duration = session.elapsed();
    return Ok(std::move(report));
}

Result<TransferReport> TransferOrchestrator::finish(TransferSession& session, Result<TransferReport> outcome) {
    const auto& info = session.info();
    if (outcome.is_ok()) {
        const auto& report = outcome.value();
        bus_.emit(events::TransferCompletedEvent{info.kind, report.file_name, report.destination,
                                                 report.bytes_written, report.duration});
    } else {
        const TransferState failed_in = info.state;
        (void)session.mark_failed(outcome.error().to_string());
        spdlog::debug("Transfer of {} failed while {}", info.file_name, transfer_state_name(failed_in));
        bus_.emit(events::TransferFailedEvent{info.kind, info.file_name, info.last_error});
    }
    return outcome;
}

Result<std::unique_ptr<io::ByteWriter>> TransferOrchestrator::open_sink(const fs::path& path) const {
    if (options_.sink_factory) {
        return options_.sink_factory(path);
    }
    auto writer = io::FileWriter::create(path);
    if (writer.is_error()) {
        return Err<std::unique_ptr<io::ByteWriter>>(writer.error());
    }
    return Ok(std::unique_ptr<io::ByteWriter>(std::move(writer.value())));
}

bool TransferOrchestrator::track(const std::string& key) {
    std::lock_guard lock(in_flight_mutex_);
    return in_flight_.insert(key).second;
}

void TransferOrchestrator::untrack(const std::string& key) {
    std::lock_guard lock(in_flight_mutex_);
    in_flight_.erase(key);
}

bool TransferOrchestrator::submit_tracked(std::string key, WorkerPool::Job job) {
    if (!track(key)) {
        spdlog::debug("{} is already queued, skipping", key);
        return false;
    }

    const bool submitted = pool_.submit([this, key, job = std::move(job)] {
        try {
            job();
        } catch (...) {
            untrack(key);
            throw;
        }
        untrack(key);
    });
    if (!submitted) {
        untrack(key);
    }
    return submitted;
}

void TransferOrchestrator::on_volume_count_changed(std::size_t volume_count) {
    const std::size_t next = compute_pool_size(options_.max_transfers, volume_count);
    const std::size_t previous = pool_.capacity();
    if (next == previous) {
        return;
    }
    spdlog::info("Adjusting worker pool max size to {}", next);
    pool_.set_capacity(next);
    bus_.emit(events::PoolResizedEvent{previous, next});
}

} // namespace shiplot::transfer
