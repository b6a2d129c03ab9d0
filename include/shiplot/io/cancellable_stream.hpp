#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <cstdint>
#include <optional>

namespace shiplot::io {

/**
 * @brief Reader that fails with ErrorCode::Cancelled once the token fires
 *
 * The check happens before and after each read of the wrapped stream, so a
 * copy loop stops on its next I/O operation.
 */
class CancellableReader : public ByteReader {
public:
    CancellableReader(ByteReader& inner, CancellationToken token)
        : inner_(inner), token_(std::move(token)) {}

    Result<std::size_t> read(char* buffer, std::size_t size) override;
    Result<void> close() override { return inner_.close(); }

private:
    ByteReader& inner_;
    CancellationToken token_;
};

class CancellableWriter : public ByteWriter {
public:
    CancellableWriter(ByteWriter& inner, CancellationToken token)
        : inner_(inner), token_(std::move(token)) {}

    Result<void> write(const char* data, std::size_t size) override;
    Result<void> close() override { return inner_.close(); }

private:
    ByteWriter& inner_;
    CancellationToken token_;
};

constexpr std::size_t kCopyBufferSize = 1024 * 1024;

/**
 * @brief Copy from reader to writer through cancellable adapters
 *
 * Stops at end of stream, or after `limit` bytes when a limit is given (the
 * inbound wire body is followed by the result byte, so it must not be read
 * to EOF). Returns the number of bytes written; a short count is not an
 * error here, callers verify it against the expected size.
 */
Result<std::uint64_t> copy_stream(ByteReader& reader,
                                  ByteWriter& writer,
                                  const CancellationToken& token,
                                  std::optional<std::uint64_t> limit = std::nullopt,
                                  std::size_t buffer_size = kCopyBufferSize);

} // namespace shiplot::io
