#include "shiplot/io/file_stream.hpp"

#include <system_error>

namespace shiplot::io {
namespace fs = std::filesystem;

FileReader::FileReader(fs::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<FileReader>> FileReader::open(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::unique_ptr<FileReader>>(
            ErrorCode::NotFound, "Failed to stat source file " + path.string() + ": " + ec.message());
    }

    std::unique_ptr<FileReader> reader(new FileReader(path, size));
    reader->stream_.open(path, std::ios::binary);
    if (!reader->stream_) {
        return Err<std::unique_ptr<FileReader>>(
            ErrorCode::Io, "Failed to open source file: " + path.string());
    }
    return Ok(std::move(reader));
}

Result<std::size_t> FileReader::read(char* buffer, std::size_t size) {
    if (!stream_.is_open()) {
        return Err<std::size_t>(ErrorCode::Io, "File is closed: " + path_.string());
    }

    stream_.read(buffer, static_cast<std::streamsize>(size));
    const auto count = stream_.gcount();
    if (stream_.bad()) {
        return Err<std::size_t>(ErrorCode::Io, "Failed to read from " + path_.string());
    }
    return Ok(static_cast<std::size_t>(count));
}

Result<void> FileReader::close() {
    if (stream_.is_open()) {
        stream_.close();
    }
    return Ok();
}

FileWriter::FileWriter(fs::path path) : path_(std::move(path)) {}

FileWriter::~FileWriter() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

Result<std::unique_ptr<FileWriter>> FileWriter::create(const fs::path& path) {
    std::unique_ptr<FileWriter> writer(new FileWriter(path));
    writer->stream_.open(path, std::ios::binary | std::ios::trunc);
    if (!writer->stream_) {
        return Err<std::unique_ptr<FileWriter>>(
            ErrorCode::Io, "Failed to create file: " + path.string());
    }
    return Ok(std::move(writer));
}

Result<void> FileWriter::write(const char* data, std::size_t size) {
    if (!stream_.is_open()) {
        return Err<void>(ErrorCode::Io, "File is closed: " + path_.string());
    }

    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_) {
        return Err<void>(ErrorCode::Io, "Failed to write to " + path_.string());
    }
    return Ok();
}

Result<void> FileWriter::close() {
    if (!stream_.is_open()) {
        return Ok();
    }

    stream_.flush();
    const bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || stream_.fail()) {
        return Err<void>(ErrorCode::Io, "Failed to flush " + path_.string());
    }
    return Ok();
}

} // namespace shiplot::io
