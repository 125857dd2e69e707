#pragma once

#include <string>

namespace tintlog::log {

// Labels the calling thread in THREAD and FULL lines.
void set_thread_name(std::string name);

// The name given to set_thread_name(), "main" for the process's initial
// thread, or an empty string for unnamed threads.
std::string current_thread_name();

}  // namespace tintlog::log
