#include "tintlog/log/origin_filter.hpp"

#include <algorithm>
#include <utility>

#include "tintlog/log/path_display.hpp"

namespace tintlog::log {

namespace {

bool is_under(const std::filesystem::path& file,
              const std::filesystem::path& root) {
    auto file_it = file.begin();
    for (const auto& part : root) {
        if (part.empty()) continue;  // trailing separator
        if (file_it == file.end() || *file_it != part) return false;
        ++file_it;
    }
    return true;
}

}  // namespace

OriginFilter::OriginFilter(const std::vector<std::string>& project_roots,
                           std::vector<std::string> external_markers)
    : external_markers_(std::move(external_markers)) {
    project_roots_.reserve(project_roots.size());
    for (const auto& root : project_roots) {
        if (root.empty()) continue;
        project_roots_.push_back(std::filesystem::path(root).lexically_normal());
    }
}

Origin OriginFilter::classify(std::string_view file) const {
    const auto segments = split_path(file);

    // The last segment is the file name and never counts as a marker.
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        const bool marked =
            std::find(external_markers_.begin(), external_markers_.end(),
                      segments[i]) != external_markers_.end();
        if (!marked) continue;

        const auto component =
            i + 2 < segments.size() ? segments[i + 1] : segments[i];
        return {true, std::string(component)};
    }

    if (project_roots_.empty()) return {};

    const std::filesystem::path path(file);
    if (!path.is_absolute()) return {};

    const auto normal = path.lexically_normal();
    for (const auto& root : project_roots_) {
        if (is_under(normal, root)) return {};
    }
    return {true, "external"};
}

}  // namespace tintlog::log
