#pragma once

namespace tintlog {

constexpr const char* VERSION = "0.3.0";
constexpr const char* PROJECT_NAME = "tintlog";

}  // namespace tintlog
