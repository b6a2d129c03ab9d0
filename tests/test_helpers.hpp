#pragma once

#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace shiplot::testing {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix = "shiplot_test") {
    static std::atomic<std::uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

/**
 * @brief Poll until the predicate holds or the timeout expires
 */
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

/**
 * @brief In-memory source, optionally failing after a number of bytes
 */
class MemoryReader : public io::ByteReader {
public:
    explicit MemoryReader(std::string data) : data_(std::move(data)) {}

    void fail_after(std::size_t bytes) { fail_after_ = bytes; }

    Result<std::size_t> read(char* buffer, std::size_t size) override {
        if (fail_after_ && offset_ >= *fail_after_) {
            return Err<std::size_t>(ErrorCode::Io, "simulated read failure");
        }
        std::size_t count = std::min(size, data_.size() - offset_);
        if (fail_after_) {
            count = std::min(count, *fail_after_ - offset_);
        }
        std::copy_n(data_.data() + offset_, count, buffer);
        offset_ += count;
        return Ok(count);
    }

    Result<void> close() override {
        closed_ = true;
        return Ok();
    }

    bool closed() const { return closed_; }
    std::size_t consumed() const { return offset_; }

private:
    std::string data_;
    std::size_t offset_ = 0;
    std::optional<std::size_t> fail_after_;
    bool closed_ = false;
};

class MemoryWriter : public io::ByteWriter {
public:
    Result<void> write(const char* data, std::size_t size) override {
        data_.append(data, size);
        return Ok();
    }

    Result<void> close() override {
        closed_ = true;
        return Ok();
    }

    const std::string& data() const { return data_; }
    bool closed() const { return closed_; }

private:
    std::string data_;
    bool closed_ = false;
};

/**
 * @brief Scripted free space per directory, adjustable while tests run
 */
class FakeDisks {
public:
    void set(const fs::path& path, std::uint64_t free_bytes) {
        std::lock_guard lock(mutex_);
        free_[path.lexically_normal().string()] = free_bytes;
    }

    std::uint64_t query(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        auto it = free_.find(path.lexically_normal().string());
        return it == free_.end() ? 0 : it->second;
    }

    std::function<std::uint64_t(const fs::path&)> as_query() {
        return [this](const fs::path& path) { return query(path); };
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> free_;
};

} // namespace shiplot::testing
