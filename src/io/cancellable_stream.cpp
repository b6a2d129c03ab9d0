#include "shiplot/io/cancellable_stream.hpp"

#include <algorithm>
#include <vector>

namespace shiplot::io {

Result<std::size_t> CancellableReader::read(char* buffer, std::size_t size) {
    if (token_.is_cancelled()) {
        return Err<std::size_t>(ErrorCode::Cancelled, "read cancelled");
    }

    auto result = inner_.read(buffer, size);
    if (token_.is_cancelled()) {
        return Err<std::size_t>(ErrorCode::Cancelled, "read cancelled");
    }
    return result;
}

Result<void> CancellableWriter::write(const char* data, std::size_t size) {
    if (token_.is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "write cancelled");
    }

    auto result = inner_.write(data, size);
    if (result.is_ok() && token_.is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "write cancelled");
    }
    return result;
}

Result<std::uint64_t> copy_stream(ByteReader& reader,
                                  ByteWriter& writer,
                                  const CancellationToken& token,
                                  std::optional<std::uint64_t> limit,
                                  std::size_t buffer_size) {
    if (buffer_size == 0) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument, "buffer_size must be > 0");
    }

    CancellableReader source(reader, token);
    CancellableWriter sink(writer, token);

    std::vector<char> buffer(buffer_size);
    std::uint64_t written = 0;

    while (!limit || written < *limit) {
        std::size_t wanted = buffer.size();
        if (limit) {
            wanted = static_cast<std::size_t>(std::min<std::uint64_t>(wanted, *limit - written));
        }

        auto read_result = source.read(buffer.data(), wanted);
        if (read_result.is_error()) {
            return Err<std::uint64_t>(read_result.error());
        }

        const std::size_t count = read_result.value();
        if (count == 0) {
            break;
        }

        auto write_result = sink.write(buffer.data(), count);
        if (write_result.is_error()) {
            return Err<std::uint64_t>(write_result.error());
        }
        written += count;
    }

    return Ok(written);
}

} // namespace shiplot::io
