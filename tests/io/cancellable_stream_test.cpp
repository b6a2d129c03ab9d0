#include <gtest/gtest.h>
#include "shiplot/io/cancellable_stream.hpp"
#include "test_helpers.hpp"

using namespace shiplot;
using namespace shiplot::io;
using shiplot::testing::MemoryReader;
using shiplot::testing::MemoryWriter;

namespace {

// Raises cancellation as soon as the first chunk lands
class CancellingWriter : public MemoryWriter {
public:
    explicit CancellingWriter(CancellationSource& source) : source_(source) {}

    Result<void> write(const char* data, std::size_t size) override {
        auto result = MemoryWriter::write(data, size);
        source_.cancel();
        return result;
    }

private:
    CancellationSource& source_;
};

class FailingWriter : public ByteWriter {
public:
    Result<void> write(const char*, std::size_t) override {
        return Err<void>(ErrorCode::Io, "No space left on device");
    }
};

} // namespace

TEST(CopyStream, CopiesUntilEndOfStream) {
    MemoryReader reader(std::string(10000, 'p'));
    MemoryWriter writer;

    auto result = copy_stream(reader, writer, CancellationToken{}, std::nullopt, 4096);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), 10000u);
    EXPECT_EQ(writer.data(), std::string(10000, 'p'));
}

TEST(CopyStream, StopsAtLimitAndLeavesTrailingBytes) {
    MemoryReader reader("bodybodyX");
    MemoryWriter writer;

    auto result = copy_stream(reader, writer, CancellationToken{}, 8, 3);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 8u);
    EXPECT_EQ(writer.data(), "bodybody");
    EXPECT_EQ(reader.consumed(), 8u);
}

TEST(CopyStream, ShortSourceReturnsShortCount) {
    MemoryReader reader("abc");
    MemoryWriter writer;

    auto result = copy_stream(reader, writer, CancellationToken{}, 100);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 3u);
}

TEST(CopyStream, AlreadyCancelledCopiesNothing) {
    CancellationSource source;
    source.cancel();
    MemoryReader reader("data");
    MemoryWriter writer;

    auto result = copy_stream(reader, writer, source.token());

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(writer.data().empty());
}

TEST(CopyStream, CancellationMidCopyStopsAtNextOperation) {
    CancellationSource source;
    MemoryReader reader(std::string(64, 'x'));
    CancellingWriter writer(source);

    auto result = copy_stream(reader, writer, source.token(), std::nullopt, 16);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(writer.data().size(), 16u);
}

TEST(CopyStream, PropagatesReadAndWriteErrors) {
    MemoryReader failing_reader(std::string(32, 'x'));
    failing_reader.fail_after(8);
    MemoryWriter writer;
    auto read_failure = copy_stream(failing_reader, writer, CancellationToken{}, std::nullopt, 4);
    ASSERT_TRUE(read_failure.is_error());
    EXPECT_EQ(read_failure.error().code, ErrorCode::Io);
    EXPECT_EQ(writer.data().size(), 8u);

    MemoryReader reader("abc");
    FailingWriter full_disk;
    auto write_failure = copy_stream(reader, full_disk, CancellationToken{});
    ASSERT_TRUE(write_failure.is_error());
    EXPECT_EQ(write_failure.error().code, ErrorCode::Io);
}

TEST(CopyStream, RejectsZeroBuffer) {
    MemoryReader reader("abc");
    MemoryWriter writer;
    auto result = copy_stream(reader, writer, CancellationToken{}, std::nullopt, 0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}
