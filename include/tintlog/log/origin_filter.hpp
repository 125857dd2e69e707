#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tintlog::log {

struct Origin {
    bool external = false;
    // Dependency name shown next to external call sites ("fmt" for
    // ".../third_party/fmt/src/format.cc").
    std::string component;
};

// Decides whether a call-site file belongs to the host program or to a
// dependency. Rules, first match wins:
//   1. a directory segment equals one of the external markers -> external
//   2. no project roots configured                            -> project
//   3. relative path                                          -> project
//   4. absolute path under one of the project roots           -> project
//   5. anything else                                          -> external
class OriginFilter {
public:
    OriginFilter() = default;
    OriginFilter(const std::vector<std::string>& project_roots,
                 std::vector<std::string> external_markers);

    Origin classify(std::string_view file) const;
    bool is_external(std::string_view file) const {
        return classify(file).external;
    }

private:
    std::vector<std::filesystem::path> project_roots_;
    std::vector<std::string> external_markers_;
};

}  // namespace tintlog::log
