#include "CacheManager.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

namespace blobfs {

CacheManager::CacheManager(const CacheConfig& config)
    : m_config(config) {
}

std::optional<std::string> CacheManager::get(const std::string& key) {
    if (!m_config.enabled) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return std::nullopt;
    }

    EntryList::iterator entry = it->second;
    if (std::chrono::steady_clock::now() >= entry->expires) {
        spdlog::debug("Cache entry '{}' expired", key);
        eraseLocked(entry);
        return std::nullopt;
    }

    m_entries.splice(m_entries.begin(), m_entries, entry);
    return entry->data;
}

void CacheManager::put(const std::string& key, std::string data,
                       std::optional<std::chrono::seconds> ttl) {
    if (!m_config.enabled) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    // Replace, never duplicate
    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        eraseLocked(existing->second);
    }

    size_t data_size = data.size();
    if (!makeRoom(data_size)) {
        return;
    }

    std::chrono::seconds actual_ttl = ttl.value_or(m_config.schema_ttl);

    m_entries.push_front(CacheEntry{
        .key = key,
        .data = std::move(data),
        .expires = std::chrono::steady_clock::now() + actual_ttl
    });
    m_index[key] = m_entries.begin();
    m_currentSize += data_size;

    spdlog::debug("Cached '{}' ({} bytes, TTL {}s)", key, data_size, actual_ttl.count());
}

std::string CacheManager::makeKey(const std::string& object, const std::string& suffix) {
    std::string key = object;
    if (!suffix.empty()) {
        key += "/" + suffix;
    }
    return key;
}

void CacheManager::eraseLocked(EntryList::iterator entry) {
    m_currentSize -= entry->data.size();
    m_index.erase(entry->key);
    m_entries.erase(entry);
}

bool CacheManager::makeRoom(size_t required_space) {
    // Don't cache items larger than half the max size
    if (required_space > m_config.max_size_bytes / 2) {
        spdlog::debug("Item too large to cache ({} bytes)", required_space);
        return false;
    }

    while (m_currentSize + required_space > m_config.max_size_bytes && !m_entries.empty()) {
        spdlog::debug("Evicting '{}'", m_entries.back().key);
        eraseLocked(std::prev(m_entries.end()));
    }
    return true;
}

}  // namespace blobfs
