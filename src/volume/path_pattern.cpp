#include "shiplot/volume/path_pattern.hpp"

#include <glob.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace shiplot::volume {
namespace fs = std::filesystem;

namespace {

constexpr const char* kLostAndFound = "lost+found";

Result<std::vector<fs::path>> glob_one(const std::string& pattern) {
    glob_t matches{};
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &matches);

    std::vector<fs::path> paths;
    if (rc == 0) {
        paths.reserve(matches.gl_pathc);
        for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
            paths.emplace_back(matches.gl_pathv[i]);
        }
    }
    ::globfree(&matches);

    switch (rc) {
        case 0:
        case GLOB_NOMATCH:
            return Ok(std::move(paths));
        case GLOB_NOSPACE:
            return Err<std::vector<fs::path>>(ErrorCode::Config, "out of memory expanding pattern " + pattern);
        default:
            return Err<std::vector<fs::path>>(ErrorCode::Config, "failed to expand pattern " + pattern);
    }
}

std::string canonical_key(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal().generic_string();
    }
    return canonical.generic_string();
}

} // namespace

bool is_glob_pattern(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

Result<std::vector<fs::path>> expand_patterns(const std::vector<std::string>& patterns) {
    std::vector<fs::path> expanded;
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            return Err<std::vector<fs::path>>(ErrorCode::Config, "empty path pattern");
        }

        if (!is_glob_pattern(pattern)) {
            expanded.emplace_back(pattern);
            continue;
        }

        auto matches = glob_one(pattern);
        if (matches.is_error()) {
            return matches;
        }
        auto& found = matches.value();
        std::sort(found.begin(), found.end());
        expanded.insert(expanded.end(), found.begin(), found.end());
    }
    return Ok(std::move(expanded));
}

Result<std::vector<fs::path>> expand_directories(const std::vector<std::string>& patterns) {
    auto expanded = expand_patterns(patterns);
    if (expanded.is_error()) {
        return expanded;
    }

    std::vector<fs::path> directories;
    std::set<std::string> seen;

    for (const auto& match : expanded.value()) {
        if (match.filename() == kLostAndFound) {
            continue;
        }

        std::error_code ec;
        fs::path directory = match;
        if (fs::is_regular_file(match, ec)) {
            directory = match.parent_path();
        }

        if (seen.insert(canonical_key(directory)).second) {
            directories.push_back(directory);
        }
    }
    return Ok(std::move(directories));
}

} // namespace shiplot::volume
