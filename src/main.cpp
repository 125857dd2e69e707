#include <boost/format.hpp>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "tintlog/cli/command_line_parser.hpp"
#include "tintlog/log/logger.hpp"
#include "tintlog/version.hpp"

namespace {

void run_worker(std::size_t index) {
    // Odd workers stay unnamed and show their thread id.
    if (index % 2 == 0) {
        tintlog::log::set_thread_name("worker-" + std::to_string(index));
    }
    TINTLOG_DEBUG << "worker " << index << " started";
    TINTLOG_TRACE << "worker " << index << " polling";
    TINTLOG_INFO << "worker " << index << " finished";
}

void run_demo(std::size_t threads) {
    TINTLOG_ERROR << "sample error line";
    TINTLOG_WARN << "sample warning line";
    TINTLOG_INFO << "sample info line";
    TINTLOG_DEBUG << boost::format("%1% worker(s) configured") % threads;
    TINTLOG_TRACE << "sample trace line";

    TINTLOG_INFO_NOLF << "loading assets... ";
    std::cout << "done" << std::endl;

    // A call site inside a dependency tree, hidden by --only-project.
    TINTLOG_LOG_AT(tintlog::log::Level::WARN,
                   "/opt/build/_deps/zlib/src/inflate.c", 120, true)
        << "simulated dependency warning";

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers.emplace_back(run_worker, i);
    }
    for (auto& worker : workers) worker.join();
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto options = tintlog::cli::CommandLineParser::parse(argc, argv);
        if (options.show_help) {
            std::cout << options.help_text;
            return 0;
        }
        if (options.show_version) {
            std::cout << tintlog::PROJECT_NAME << " " << tintlog::VERSION
                      << std::endl;
            return 0;
        }

        tintlog::log::init_logger(options.logger);
        run_demo(options.threads);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
