#include "tintlog/log/thread_name.hpp"

#include <thread>
#include <utility>

namespace tintlog::log {

namespace {

// Dynamic initialization runs on the initial thread.
const std::thread::id g_main_thread_id = std::this_thread::get_id();

thread_local bool t_named = false;
thread_local std::string t_name;

}  // namespace

void set_thread_name(std::string name) {
    t_name = std::move(name);
    t_named = true;
}

std::string current_thread_name() {
    if (t_named) return t_name;
    if (std::this_thread::get_id() == g_main_thread_id) return "main";
    return {};
}

}  // namespace tintlog::log
