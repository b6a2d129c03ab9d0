#include <gtest/gtest.h>
#include "shiplot/events/events.hpp"
#include "shiplot/io/cancellable_stream.hpp"
#include "shiplot/io/file_stream.hpp"
#include "shiplot/transfer/orchestrator.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace shiplot;
using namespace shiplot::transfer;
using shiplot::testing::FakeDisks;
using shiplot::testing::MemoryReader;
using shiplot::testing::wait_until;
namespace fs = std::filesystem;

namespace {

/**
 * @brief Collects emitted events; workers emit from their own threads
 */
struct EventLog {
    explicit EventLog(events::EventBus& bus) {
        bus.subscribe<events::TransferCompletedEvent>([this](const events::TransferCompletedEvent& e) {
            std::lock_guard lock(mutex);
            completed.push_back(e);
        });
        bus.subscribe<events::TransferFailedEvent>([this](const events::TransferFailedEvent& e) {
            std::lock_guard lock(mutex);
            failed.push_back(e);
        });
        bus.subscribe<events::VolumeEvictedEvent>([this](const events::VolumeEvictedEvent& e) {
            std::lock_guard lock(mutex);
            evicted.push_back(e);
        });
        bus.subscribe<events::PoolResizedEvent>([this](const events::PoolResizedEvent& e) {
            std::lock_guard lock(mutex);
            resized.push_back(e);
        });
    }

    std::size_t completed_count() {
        std::lock_guard lock(mutex);
        return completed.size();
    }

    std::mutex mutex;
    std::vector<events::TransferCompletedEvent> completed;
    std::vector<events::TransferFailedEvent> failed;
    std::vector<events::VolumeEvictedEvent> evicted;
    std::vector<events::PoolResizedEvent> resized;
};

class RecordingUploader : public Uploader {
public:
    Result<std::uint64_t> upload(const std::string& name,
                                 std::uint64_t size,
                                 io::ByteReader& body,
                                 const CancellationToken& token) override {
        if (fail) {
            return Err<std::uint64_t>(ErrorCode::Network, "connection refused");
        }
        shiplot::testing::MemoryWriter sink;
        auto copied = io::copy_stream(body, sink, token, size);
        if (copied.is_error()) {
            return copied;
        }
        names.push_back(name);
        received = sink.data();
        return copied;
    }

    std::string endpoint() const override { return "10.0.0.2:9000"; }

    bool fail = false;
    std::vector<std::string> names;
    std::string received;
};

// Raises cancellation after the first chunk reaches the destination
class CancellingSink : public io::ByteWriter {
public:
    explicit CancellingSink(CancellationSource& source) : source_(source) {}

    Result<void> write(const char*, std::size_t) override {
        source_.cancel();
        return Ok();
    }

private:
    CancellationSource& source_;
};

// Forwards to a real temp file, then raises cancellation after the first chunk
class CancelAfterWrite : public io::ByteWriter {
public:
    CancelAfterWrite(std::unique_ptr<io::ByteWriter> inner, CancellationSource& source)
        : inner_(std::move(inner)), source_(source) {}

    Result<void> write(const char* data, std::size_t size) override {
        auto written = inner_->write(data, size);
        source_.cancel();
        return written;
    }

    Result<void> close() override { return inner_->close(); }

private:
    std::unique_ptr<io::ByteWriter> inner_;
    CancellationSource& source_;
};

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = shiplot::testing::create_temp_dir("shiplot_orchestrator");
        staging_ = root_ / "staging";
        fs::create_directories(staging_);
        for (const char* name : {"disk1", "disk2", "disk3", "disk4"}) {
            fs::create_directories(root_ / name);
        }
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path stage(const std::string& name, const std::string& content) {
        auto path = staging_ / name;
        shiplot::testing::write_file(path, content);
        return path;
    }

    fs::path disk(int index) const {
        return root_ / ("disk" + std::to_string(index));
    }

    fs::path root_;
    fs::path staging_;
    FakeDisks disks_;
    events::EventBus bus_;
};

TEST_F(OrchestratorTest, MoveCommitsToFreestVolume) {
    disks_.set(disk(1), 1000);
    disks_.set(disk(2), 5000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));
    registry.add(disk(2));
    EventLog log(bus_);

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    auto source = stage("a.plot", "plot-bytes");

    auto result = orchestrator.move_file(source);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().destination, disk(2) / "a.plot");
    EXPECT_EQ(result.value().bytes_written, 10u);
    EXPECT_EQ(shiplot::testing::read_file(disk(2) / "a.plot"), "plot-bytes");
    EXPECT_FALSE(fs::exists(disk(2) / "a.plot.tmp"));
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(registry.available_count(), 2u);

    ASSERT_EQ(log.completed.size(), 1u);
    EXPECT_EQ(log.completed[0].kind, TransferKind::Move);
}

TEST_F(OrchestratorTest, EvictionShrinksThePool) {
    disks_.set(disk(1), 1000);
    disks_.set(disk(2), 900);
    disks_.set(disk(3), 800);
    disks_.set(disk(4), 50);
    volume::DestinationRegistry registry(disks_.as_query());
    for (int i = 1; i <= 4; ++i) {
        registry.add(disk(i));
    }
    EventLog log(bus_);

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    ASSERT_EQ(orchestrator.pool_capacity(), 4u);

    // Three volumes are busy; the only free one is too small for the file
    auto busy1 = registry.select_and_claim();
    auto busy2 = registry.select_and_claim();
    auto busy3 = registry.select_and_claim();
    ASSERT_TRUE(busy1 && busy2 && busy3);

    auto source = stage("big.plot", std::string(100, 'b'));
    ASSERT_TRUE(orchestrator.enqueue_move(source));

    ASSERT_TRUE(wait_until([&] { return orchestrator.pool_capacity() == 3; }));
    EXPECT_EQ(registry.size(), 3u);

    registry.release(*busy1, false);
    orchestrator.drain();
    registry.release(*busy2, false);
    registry.release(*busy3, false);

    EXPECT_TRUE(fs::exists(disk(1) / "big.plot"));
    EXPECT_FALSE(fs::exists(disk(4) / "big.plot"));

    std::lock_guard lock(log.mutex);
    ASSERT_EQ(log.evicted.size(), 1u);
    EXPECT_EQ(log.evicted[0].path, disk(4));
    EXPECT_EQ(log.evicted[0].remaining_volumes, 3u);
    ASSERT_EQ(log.resized.size(), 1u);
    EXPECT_EQ(log.resized[0].previous_capacity, 4u);
    EXPECT_EQ(log.resized[0].capacity, 3u);
}

TEST_F(OrchestratorTest, FileEqualToFreeSpaceIsEvicted) {
    disks_.set(disk(1), 10);
    disks_.set(disk(2), 10);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));
    registry.add(disk(2));

    // disk1 is held, so the job can only claim disk2 and must evict it
    auto held = registry.select_and_claim();
    ASSERT_TRUE(held);
    ASSERT_EQ(held->path, disk(1));

    CancellationSource cancel;
    TransferOrchestrator orchestrator(registry, bus_, cancel.token());
    auto source = stage("exact.plot", std::string(10, 'e'));
    ASSERT_TRUE(orchestrator.enqueue_move(source));

    ASSERT_TRUE(wait_until([&] { return registry.size() == 1; }));
    cancel.cancel();
    orchestrator.drain();

    EXPECT_FALSE(fs::exists(disk(2) / "exact.plot"));
    EXPECT_TRUE(fs::exists(source));
    registry.release(*held, false);
}

TEST_F(OrchestratorTest, SizeMismatchLeavesNothingBehind) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));
    EventLog log(bus_);

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    MemoryReader body(std::string(40, 's'));

    auto result = orchestrator.save_stream("short.plot", 100, body);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::SizeMismatch);
    EXPECT_FALSE(fs::exists(disk(1) / "short.plot"));
    EXPECT_FALSE(fs::exists(disk(1) / "short.plot.tmp"));
    EXPECT_EQ(registry.available_count(), 1u);
    ASSERT_EQ(log.failed.size(), 1u);
    EXPECT_EQ(log.failed[0].kind, TransferKind::Save);
}

TEST_F(OrchestratorTest, SaveReadsExactlyTheDeclaredBytes) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    MemoryReader body("0123456789TRAILER");

    auto result = orchestrator.save_stream("net.plot", 10, body);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(shiplot::testing::read_file(disk(1) / "net.plot"), "0123456789");
    EXPECT_EQ(body.consumed(), 10u);
}

TEST_F(OrchestratorTest, CancellationDuringCopyLeavesNoFile) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));

    CancellationSource cancel;
    OrchestratorOptions options;
    options.sink_factory = [&cancel](const fs::path&) -> Result<std::unique_ptr<io::ByteWriter>> {
        return Ok(std::unique_ptr<io::ByteWriter>(new CancellingSink(cancel)));
    };
    TransferOrchestrator orchestrator(registry, bus_, cancel.token(), options);
    auto source = stage("c.plot", std::string(64, 'c'));

    auto result = orchestrator.move_file(source);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_FALSE(fs::exists(disk(1) / "c.plot"));
    EXPECT_TRUE(fs::exists(source));
    EXPECT_EQ(registry.available_count(), 1u);
}

TEST_F(OrchestratorTest, CancellationRemovesPartialTempFile) {
    disks_.set(disk(1), std::uint64_t{1} << 30);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));

    CancellationSource cancel;
    bool temp_written = false;
    OrchestratorOptions options;
    options.sink_factory = [&](const fs::path& path) -> Result<std::unique_ptr<io::ByteWriter>> {
        auto file = io::FileWriter::create(path);
        if (file.is_error()) {
            return Err<std::unique_ptr<io::ByteWriter>>(file.error());
        }
        temp_written = true;
        return Ok(std::unique_ptr<io::ByteWriter>(new CancelAfterWrite(std::move(file.value()), cancel)));
    };
    TransferOrchestrator orchestrator(registry, bus_, cancel.token(), options);
    auto source = stage("partial.plot", std::string(2 * io::kCopyBufferSize, 'p'));

    auto result = orchestrator.move_file(source);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(temp_written);
    EXPECT_FALSE(fs::exists(disk(1) / "partial.plot.tmp"));
    EXPECT_FALSE(fs::exists(disk(1) / "partial.plot"));
    EXPECT_TRUE(fs::exists(source));
    EXPECT_EQ(registry.available_count(), 1u);
}

TEST_F(OrchestratorTest, RenameFailureKeepsTempFileAndReleasesVolume) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));
    EventLog log(bus_);

    // A non-empty directory at the final name cannot be replaced by a file
    fs::create_directories(disk(1) / "r.plot" / "blocker");

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    MemoryReader body("0123456789");

    auto result = orchestrator.save_stream("r.plot", 10, body);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
    EXPECT_EQ(shiplot::testing::read_file(disk(1) / "r.plot.tmp"), "0123456789");
    EXPECT_TRUE(fs::is_directory(disk(1) / "r.plot"));
    EXPECT_EQ(registry.available_count(), 1u);
    ASSERT_EQ(log.failed.size(), 1u);
}

TEST_F(OrchestratorTest, TempFileCreationFailureReleasesVolume) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));

    const fs::path unwritable = root_ / "missing" / "dir";
    OrchestratorOptions options;
    options.sink_factory = [unwritable](const fs::path& path) -> Result<std::unique_ptr<io::ByteWriter>> {
        auto file = io::FileWriter::create(unwritable / path.filename());
        if (file.is_error()) {
            return Err<std::unique_ptr<io::ByteWriter>>(file.error());
        }
        return Ok(std::unique_ptr<io::ByteWriter>(std::move(file.value())));
    };
    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{}, options);
    auto source = stage("t.plot", "temp");

    auto result = orchestrator.move_file(source);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
    EXPECT_FALSE(fs::exists(disk(1) / "t.plot"));
    EXPECT_FALSE(fs::exists(disk(1) / "t.plot.tmp"));
    EXPECT_TRUE(fs::exists(source));
    EXPECT_EQ(registry.available_count(), 1u);
}

TEST_F(OrchestratorTest, CancelledWhileWaitingForVolume) {
    volume::DestinationRegistry registry(disks_.as_query());
    CancellationSource cancel;
    cancel.cancel();
    EventLog log(bus_);

    TransferOrchestrator orchestrator(registry, bus_, cancel.token());
    auto source = stage("w.plot", "w");

    auto result = orchestrator.move_file(source);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(fs::exists(source));
    EXPECT_EQ(log.failed.size(), 1u);
}

TEST_F(OrchestratorTest, DuplicateEnqueueIsRejectedWhileInFlight) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));

    auto held = registry.select_and_claim();
    ASSERT_TRUE(held);

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    auto source = stage("dup.plot", "dup");

    EXPECT_TRUE(orchestrator.enqueue_move(source));
    EXPECT_FALSE(orchestrator.enqueue_move(source));
    EXPECT_EQ(orchestrator.in_flight(), 1u);

    registry.release(*held, false);
    orchestrator.drain();

    EXPECT_EQ(orchestrator.in_flight(), 0u);
    EXPECT_TRUE(fs::exists(disk(1) / "dup.plot"));
}

TEST_F(OrchestratorTest, DuplicateInboundNameIsRefusedWhileReceiving) {
    disks_.set(disk(1), 1000);
    disks_.set(disk(2), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));
    registry.add(disk(2));

    // Both volumes are held so the accepted save stays in flight
    auto held1 = registry.select_and_claim();
    auto held2 = registry.select_and_claim();
    ASSERT_TRUE(held1 && held2);

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    std::atomic<int> completions{0};
    std::atomic<int> accepted{0};

    std::vector<std::thread> senders;
    for (int i = 0; i < 2; ++i) {
        senders.emplace_back([&] {
            auto body = std::make_shared<MemoryReader>("same");
            if (orchestrator.enqueue_save("same.plot", 4, body,
                                          [&](const Result<TransferReport>&) { completions++; })) {
                accepted++;
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(orchestrator.in_flight(), 1u);
    EXPECT_TRUE(orchestrator.enqueue_save("other.plot", 5, std::make_shared<MemoryReader>("other"), nullptr));

    registry.release(*held1, false);
    registry.release(*held2, false);
    orchestrator.drain();

    EXPECT_EQ(completions.load(), 1);
    EXPECT_EQ(orchestrator.in_flight(), 0u);
    const int copies = static_cast<int>(fs::exists(disk(1) / "same.plot")) +
                       static_cast<int>(fs::exists(disk(2) / "same.plot"));
    EXPECT_EQ(copies, 1);

    // Once the first save has finished the name may be received again
    EXPECT_TRUE(orchestrator.enqueue_save("same.plot", 4, std::make_shared<MemoryReader>("same"), nullptr));
    orchestrator.drain();
}

TEST_F(OrchestratorTest, ConcurrentMovesAllLand) {
    disks_.set(disk(1), 1 << 20);
    disks_.set(disk(2), 1 << 20);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));
    registry.add(disk(2));
    EventLog log(bus_);

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    EXPECT_EQ(orchestrator.pool_capacity(), 2u);

    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(orchestrator.enqueue_move(stage("p" + std::to_string(i) + ".plot", "x")));
    }
    orchestrator.drain();

    EXPECT_EQ(log.completed_count(), 8u);
    std::size_t landed = 0;
    for (int d = 1; d <= 2; ++d) {
        for (const auto& entry : fs::directory_iterator(disk(d))) {
            EXPECT_EQ(entry.path().extension(), ".plot");
            landed++;
        }
    }
    EXPECT_EQ(landed, 8u);
}

TEST_F(OrchestratorTest, UploadDeletesSourceAfterAcknowledgement) {
    RecordingUploader uploader;
    EventLog log(bus_);
    TransferOrchestrator orchestrator(uploader, bus_, CancellationToken{});
    auto source = stage("u.plot", "uploaded");

    auto result = orchestrator.upload_file(source);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(uploader.received, "uploaded");
    ASSERT_EQ(uploader.names.size(), 1u);
    EXPECT_EQ(uploader.names[0], "u.plot");
    EXPECT_FALSE(fs::exists(source));
    ASSERT_EQ(log.completed.size(), 1u);
    EXPECT_EQ(log.completed[0].kind, TransferKind::Upload);
}

TEST_F(OrchestratorTest, FailedUploadKeepsSource) {
    RecordingUploader uploader;
    uploader.fail = true;
    TransferOrchestrator orchestrator(uploader, bus_, CancellationToken{});
    auto source = stage("keep.plot", "data");

    auto result = orchestrator.upload_file(source);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Network);
    EXPECT_TRUE(fs::exists(source));
}

TEST_F(OrchestratorTest, MissingSourceFailsWithoutClaiming) {
    disks_.set(disk(1), 1000);
    volume::DestinationRegistry registry(disks_.as_query());
    registry.add(disk(1));

    TransferOrchestrator orchestrator(registry, bus_, CancellationToken{});
    auto result = orchestrator.move_file(staging_ / "gone.plot");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry.available_count(), 1u);
}
