#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>

namespace blobfs {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            spdlog::warn("{}:{}: ignoring line without '='", path.string(), line_number);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "database") {
                if (key == "path") config.database.path = value;
                else if (key == "busy_timeout_ms")
                    config.database.busy_timeout = std::chrono::milliseconds(std::stoi(value));
            }
            else if (current_section == "cache") {
                if (key == "enabled")
                    config.cache.enabled = parseBool(value);
                else if (key == "schema_ttl")
                    config.cache.schema_ttl = std::chrono::seconds(std::stoi(value));
                else if (key == "max_size_mb")
                    config.cache.max_size_bytes = static_cast<size_t>(std::stoul(value)) * 1024 * 1024;
            }
            else if (current_section == "security") {
                if (key == "quote_identifiers")
                    config.security.quote_identifiers = parseBool(value);
            }
            else if (current_section == "mount") {
                if (key == "mountpoint") config.mountpoint = value;
                else if (key == "foreground") config.foreground = parseBool(value);
                else if (key == "debug") config.debug = parseBool(value);
                else if (key == "allow_other") config.allow_other = parseBool(value);
                else if (key == "allow_root") config.allow_root = parseBool(value);
            }
            else if (current_section == "logging") {
                if (key == "file") config.log_file = value;
            }
        } catch (const std::logic_error&) {
            spdlog::warn("{}:{}: invalid value '{}' for '{}'", path.string(), line_number,
                         value, key);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"blobfs - browse an SQLite database as a read-only filesystem"};

    std::string database_path;
    std::string mountpoint;
    bool foreground = false;
    bool debug = false;
    bool allow_other = false;
    bool allow_root = false;
    bool raw_identifiers = false;
    int cache_ttl = 0;
    int busy_timeout_ms = 0;
    std::string log_file;
    std::string config_file;

    app.add_option("database", database_path, "Path to the SQLite database file");
    app.add_option("mountpoint", mountpoint, "Mount point directory");

    app.add_flag("-f,--foreground", foreground, "Run in foreground");
    app.add_flag("-d,--debug", debug, "Enable debug output");
    app.add_flag("--allow-other", allow_other, "Allow other users to access");
    app.add_flag("--allow-root", allow_root, "Allow root to access");
    app.add_option("--cache-ttl", cache_ttl,
                   "Enable the schema cache with this TTL in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("--raw-identifiers", raw_identifiers,
                 "Interpolate table and column names into SQL without quoting");
    app.add_option("--busy-timeout", busy_timeout_ms,
                   "Milliseconds to wait on a locked database")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--log-file", log_file, "Log file path");
    app.add_option("-c,--config", config_file, "Path to configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Config file provides the base; anything given on the command line wins
    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (app.count("database")) config.database.path = database_path;
    if (app.count("mountpoint")) config.mountpoint = mountpoint;
    if (foreground) config.foreground = true;
    if (debug) config.debug = true;
    if (allow_other) config.allow_other = true;
    if (allow_root) config.allow_root = true;
    if (raw_identifiers) config.security.quote_identifiers = false;
    if (app.count("--cache-ttl")) {
        config.cache.enabled = true;
        config.cache.schema_ttl = std::chrono::seconds(cache_ttl);
    }
    if (app.count("--busy-timeout")) {
        config.database.busy_timeout = std::chrono::milliseconds(busy_timeout_ms);
    }
    if (!log_file.empty()) config.log_file = log_file;

    return config;
}

bool Config::validate() const {
    if (database.path.empty()) {
        spdlog::error("Database path is required");
        return false;
    }

    if (!std::filesystem::is_regular_file(database.path)) {
        spdlog::error("Database file does not exist: {}", database.path);
        return false;
    }

    if (mountpoint.empty()) {
        spdlog::error("Mountpoint is required");
        return false;
    }

    if (!std::filesystem::exists(mountpoint)) {
        spdlog::error("Mountpoint does not exist: {}", mountpoint);
        return false;
    }

    if (!std::filesystem::is_directory(mountpoint)) {
        spdlog::error("Mountpoint is not a directory: {}", mountpoint);
        return false;
    }

    if (cache.enabled && cache.schema_ttl.count() <= 0) {
        spdlog::error("Schema cache TTL must be positive");
        return false;
    }

    return true;
}

}  // namespace blobfs
