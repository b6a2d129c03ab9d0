#pragma once

#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>

namespace shiplot::io {

class FileReader : public ByteReader {
public:
    static Result<std::unique_ptr<FileReader>> open(const std::filesystem::path& path);

    Result<std::size_t> read(char* buffer, std::size_t size) override;
    Result<void> close() override;

    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileReader(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::uint64_t size_ = 0;
    std::ifstream stream_;
};

/**
 * @brief Truncating file writer
 *
 * close() flushes and reports any deferred write error; the file handle is
 * gone once it returns, whatever the outcome.
 */
class FileWriter : public ByteWriter {
public:
    static Result<std::unique_ptr<FileWriter>> create(const std::filesystem::path& path);

    ~FileWriter() override;

    Result<void> write(const char* data, std::size_t size) override;
    Result<void> close() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit FileWriter(std::filesystem::path path);

    std::filesystem::path path_;
    std::ofstream stream_;
};

} // namespace shiplot::io
