#include "BlobFS.hpp"
#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <cstdlib>
#include <vector>

#ifndef BLOBFS_VERSION
#define BLOBFS_VERSION "1.0.0"
#endif

using namespace blobfs;

namespace {

void setupLogging(bool debug, bool foreground, const std::string& logFile = "") {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        auto level = debug ? spdlog::level::debug : spdlog::level::info;

        if (foreground) {
            // Console logging for foreground mode
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(level);
            sinks.push_back(console_sink);
        }

        // File logging: explicit path, otherwise ~/.blobfs.log
        std::string log_path = logFile;
        if (log_path.empty()) {
            const char* home = std::getenv("HOME");
            if (home) {
                log_path = std::string(home) + "/.blobfs.log";
            }
        }

        if (!log_path.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "blobfs: cannot open log file " << log_path << ": "
                          << ex.what() << std::endl;
            }
        }

        if (sinks.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(level);
            sinks.push_back(console_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("blobfs", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printBanner() {
    std::cout << "\n blobfs v" BLOBFS_VERSION "\n"
              << " Browse an SQLite database as a read-only filesystem\n"
              << std::endl;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <database-path> <mountpoint-path>\n\n";
    std::cout << "Database Options:\n";
    std::cout << "  --busy-timeout <ms>    Wait this long on a locked database (default: 0)\n";
    std::cout << "  --raw-identifiers      Do not quote table and column names in SQL\n";
    std::cout << "\nCache Options:\n";
    std::cout << "  --cache-ttl <seconds>  Cache table schemas for this long (default: off)\n";
    std::cout << "\nFUSE Options:\n";
    std::cout << "  -f, --foreground       Run in foreground\n";
    std::cout << "  -d, --debug            Enable debug output\n";
    std::cout << "  --allow-other          Allow other users to access\n";
    std::cout << "  --allow-root           Allow root to access\n";
    std::cout << "\nConfiguration:\n";
    std::cout << "  -c, --config <file>    Path to configuration file\n";
    std::cout << "  --log-file <file>      Log file path (default: ~/.blobfs.log)\n";
    std::cout << "\nOther Options:\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -V, --version          Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " repo.db /mnt/repo\n";
    std::cout << "  " << program << " -f --cache-ttl 10 repo.db /mnt/repo\n";
    std::cout << "  " << program << " -c /etc/blobfs.conf\n";
    std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printBanner();
        printUsage(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printBanner();
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-V" || arg == "--version") {
            std::cout << "blobfs version " BLOBFS_VERSION << std::endl;
            return 0;
        }
    }

    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.debug, config.foreground, config.log_file);

    if (!config.foreground) {
        std::cout << "blobfs: mounting " << config.mountpoint << " (daemon mode)" << std::endl;
    }

    spdlog::info("Starting blobfs " BLOBFS_VERSION);
    spdlog::info("Database: {}", config.database.path);
    spdlog::info("Mountpoint: {}", config.mountpoint);

    if (!config.validate()) {
        return 1;
    }

    BlobFS& fs = BlobFS::instance();

    if (fs.init(config) != 0) {
        spdlog::error("Failed to initialize filesystem");
        return 1;
    }

    int result = fs.run(argv[0]);

    fs.shutdown();

    spdlog::info("blobfs stopped");

    return result == 0 ? 0 : 1;
}
