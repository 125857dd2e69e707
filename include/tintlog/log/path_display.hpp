#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tintlog::log {

// Splits on '/' and '\\'. Empty and "." segments are dropped. The views
// point into `path`.
std::vector<std::string_view> split_path(std::string_view path);

// Returns the tail of `path` starting at the first segment equal to
// `anchor`, or `path` itself when no segment matches.
std::string_view anchor_path(std::string_view path, std::string_view anchor);

// Shortens a call-site path for display:
//   depth == 0          -> base name
//   depth <= segments   -> last `depth` segments joined by the platform
//                          separator
//   depth >  segments   -> the (anchored) path unchanged
std::string display_path(std::string_view file, std::size_t depth,
                         std::string_view anchor = {});

}  // namespace tintlog::log
