#pragma once

#include <cstddef>
#include <string>

#include "tintlog/log/logger_config.hpp"

namespace tintlog::cli {

struct CommandLineOptions {
    bool show_version = false;
    bool show_help = false;
    std::string config_file;

    // --config is applied first, the remaining flags override it.
    log::LoggerConfig logger;

    // Worker threads spawned by the demo.
    std::size_t threads = 2;

    std::string help_text;
};

class CommandLineParser {
public:
    // Throws boost::program_options::error for malformed arguments and
    // log::ConfigError for invalid logger settings.
    static CommandLineOptions parse(int argc, const char* const argv[]);
};

}  // namespace tintlog::cli
