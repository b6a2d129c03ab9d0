#pragma once

#include "shiplot/core/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace shiplot::volume {

/**
 * @brief True when the pattern contains a glob metacharacter (*, ? or [)
 */
bool is_glob_pattern(const std::string& pattern);

/**
 * @brief Expand glob patterns into matching paths
 *
 * Plain paths are passed through untouched, even if they do not exist.
 * A pattern matching nothing contributes nothing. Results keep pattern
 * order; within one pattern matches are sorted.
 *
 * RETURNS: error if the pattern itself is malformed or the expansion fails
 */
Result<std::vector<std::filesystem::path>> expand_patterns(const std::vector<std::string>& patterns);

/**
 * @brief Expand patterns into a deduplicated list of directories
 *
 * A matched regular file contributes its parent directory; `lost+found`
 * entries are skipped. Two patterns reaching the same directory (compared
 * by canonical path) yield it once.
 */
Result<std::vector<std::filesystem::path>> expand_directories(const std::vector<std::string>& patterns);

} // namespace shiplot::volume
