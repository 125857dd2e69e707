#include "tintlog/cli/command_line_parser.hpp"

#include <boost/program_options.hpp>
#include <sstream>
#include <vector>

namespace po = boost::program_options;

namespace tintlog::cli {

CommandLineOptions CommandLineParser::parse(int argc,
                                            const char* const argv[]) {
    CommandLineOptions options;

    po::options_description desc("tintlog-demo options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show this help message")
        ("version,v", "Show version information")
        ("config,c", po::value<std::string>(), "Logger config file (YAML, JSON or INI)")
        ("level,l", po::value<std::string>(), "Level threshold: error, warn, info, debug, trace")
        ("preset,p", po::value<std::string>(), "Line preset: FULL, THREAD, SIMPLE")
        ("path-depth", po::value<std::size_t>(), "Trailing path segments shown (0 = file name)")
        ("time-format", po::value<std::string>(), "strftime-like timestamp format")
        ("path-anchor", po::value<std::string>(), "Directory where displayed paths start")
        ("only-project", "Suppress log lines from dependency sources")
        ("project-root", po::value<std::vector<std::string>>(), "Project source directory (repeatable)")
        ("color", po::value<std::string>(), "Color mode: auto, always, never")
        ("level-env", po::value<std::string>(), "Environment variable overriding the level")
        ("threads,t", po::value<std::size_t>()->default_value(options.threads), "Worker threads to log from");
    // clang-format on

    std::ostringstream help;
    help << desc;
    options.help_text = help.str();

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        options.show_help = true;
        return options;
    }
    if (vm.count("version")) {
        options.show_version = true;
        return options;
    }

    if (vm.count("config")) {
        options.config_file = vm["config"].as<std::string>();
        options.logger = log::load_logger_config(options.config_file);
    }

    auto& config = options.logger;
    if (vm.count("level"))
        config.level = log::level_from_string(vm["level"].as<std::string>());
    if (vm.count("preset"))
        config.preset =
            log::preset_from_string(vm["preset"].as<std::string>());
    if (vm.count("path-depth"))
        config.path_depth = vm["path-depth"].as<std::size_t>();
    if (vm.count("time-format"))
        config.time_format = vm["time-format"].as<std::string>();
    if (vm.count("path-anchor"))
        config.path_anchor = vm["path-anchor"].as<std::string>();
    if (vm.count("only-project")) config.only_project_logs = true;
    if (vm.count("project-root"))
        config.project_roots =
            vm["project-root"].as<std::vector<std::string>>();
    if (vm.count("color"))
        config.color =
            log::color_mode_from_string(vm["color"].as<std::string>());
    if (vm.count("level-env"))
        config.level_env = vm["level-env"].as<std::string>();
    config.validate();

    options.threads = vm["threads"].as<std::size_t>();
    return options;
}

}  // namespace tintlog::cli
