#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstddef>

namespace blobfs {

struct DatabaseConfig {
    std::string path;
    std::chrono::milliseconds busy_timeout{0};  // 0 = fail immediately when locked
};

struct CacheConfig {
    size_t max_size_bytes = 16 * 1024 * 1024;  // 16 MB
    std::chrono::seconds schema_ttl{5};
    bool enabled = false;
};

struct SecurityConfig {
    // Quote table/column identifiers in generated SQL. When false they are
    // interpolated verbatim.
    bool quote_identifiers = true;
};

struct Config {
    DatabaseConfig database;
    CacheConfig cache;
    SecurityConfig security;

    std::string mountpoint;
    std::string log_file;
    bool foreground = false;
    bool debug = false;
    bool allow_other = false;
    bool allow_root = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

}  // namespace blobfs
