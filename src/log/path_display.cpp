#include "tintlog/log/path_display.hpp"

#include <filesystem>

namespace tintlog::log {

namespace {

constexpr char PATH_SEPARATOR =
    static_cast<char>(std::filesystem::path::preferred_separator);

bool is_separator(char c) { return c == '/' || c == '\\'; }

}  // namespace

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = start;
        while (end < path.size() && !is_separator(path[end])) ++end;

        auto segment = path.substr(start, end - start);
        if (!segment.empty() && segment != ".") segments.push_back(segment);

        start = end + 1;
    }
    return segments;
}

std::string_view anchor_path(std::string_view path, std::string_view anchor) {
    if (anchor.empty()) return path;

    for (const auto& segment : split_path(path)) {
        if (segment == anchor) {
            return path.substr(
                static_cast<std::size_t>(segment.data() - path.data()));
        }
    }
    return path;
}

std::string display_path(std::string_view file, std::size_t depth,
                         std::string_view anchor) {
    const std::string_view anchored = anchor_path(file, anchor);
    const auto segments = split_path(anchored);

    if (segments.empty()) return std::string(anchored);
    if (depth == 0) return std::string(segments.back());
    if (depth > segments.size()) return std::string(anchored);

    std::string result;
    for (std::size_t i = segments.size() - depth; i < segments.size(); ++i) {
        if (!result.empty()) result.push_back(PATH_SEPARATOR);
        result.append(segments[i]);
    }
    return result;
}

}  // namespace tintlog::log
