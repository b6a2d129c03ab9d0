#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace shiplot {

// Suffix written by the plotters; ".fpt" is the compressed-plot variant
inline std::vector<std::string> default_plot_suffixes() {
    return {".plot", ".fpt"};
}

inline bool has_suffix(std::string_view name, std::string_view suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool is_plot_file_name(std::string_view name, const std::vector<std::string>& suffixes) {
    for (const auto& suffix : suffixes) {
        if (!suffix.empty() && name.size() > suffix.size() && has_suffix(name, suffix)) {
            return true;
        }
    }
    return false;
}

} // namespace shiplot
