#pragma once

#include "Config.hpp"
#include <string>
#include <optional>
#include <unordered_map>
#include <list>
#include <mutex>
#include <chrono>

namespace blobfs {

// Time-bounded LRU store for schema metadata. Disabled unless
// CacheConfig::enabled is set; a disabled cache never stores anything.
class CacheManager {
public:
    explicit CacheManager(const CacheConfig& config);
    ~CacheManager() = default;

    // Non-copyable
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    bool enabled() const { return m_config.enabled; }

    // Cached value, or nullopt when missing or expired
    std::optional<std::string> get(const std::string& key);

    // Store value; TTL defaults to the schema TTL
    void put(const std::string& key, std::string data,
             std::optional<std::chrono::seconds> ttl = std::nullopt);

    static std::string makeKey(const std::string& object,
                               const std::string& suffix = "");

private:
    struct CacheEntry {
        std::string key;
        std::string data;
        std::chrono::steady_clock::time_point expires;
    };
    using EntryList = std::list<CacheEntry>;

    void eraseLocked(EntryList::iterator entry);
    bool makeRoom(size_t requiredSpace);

    CacheConfig m_config;

    // Most recently used first
    EntryList m_entries;
    std::unordered_map<std::string, EntryList::iterator> m_index;
    size_t m_currentSize = 0;

    std::mutex m_mutex;
};

}  // namespace blobfs
