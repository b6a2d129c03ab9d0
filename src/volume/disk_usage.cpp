#include "shiplot/volume/disk_usage.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace shiplot::volume {

std::uint64_t filesystem_free_bytes(const std::filesystem::path& path) {
    std::error_code ec;
    const auto info = std::filesystem::space(path, ec);
    if (ec) {
        spdlog::warn("Failed to query free space of {}: {}", path.string(), ec.message());
        return 0;
    }
    return static_cast<std::uint64_t>(info.available);
}

} // namespace shiplot::volume
