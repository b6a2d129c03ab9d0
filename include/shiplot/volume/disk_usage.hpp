#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>

namespace shiplot::volume {

/**
 * @brief Bytes available to an unprivileged writer at `path`
 *
 * Injected into the registry so tests can script free space.
 */
using FreeSpaceQuery = std::function<std::uint64_t(const std::filesystem::path&)>;

/**
 * @brief Default query backed by std::filesystem::space
 *
 * Returns 0 when the volume cannot be queried, which makes the volume
 * ineligible and leads to its eviction on first selection.
 */
std::uint64_t filesystem_free_bytes(const std::filesystem::path& path);

} // namespace shiplot::volume
