#pragma once

#include <QHash>
#include <QString>

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace sl {

struct QStringHash {
    size_t operator()(const QString& s) const { return qHash(s); }
};

// Thread-safe LRU map keyed by QString. A ttl of zero disables expiry;
// expired entries are dropped lazily on lookup.
template <typename Value>
class LruCache {
public:
    explicit LruCache(int maxEntries, std::chrono::seconds ttl = std::chrono::seconds(0))
        : m_maxEntries(maxEntries > 0 ? maxEntries : 1)
        , m_ttl(ttl)
    {
    }

    std::optional<Value> get(const QString& key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            ++m_misses;
            return std::nullopt;
        }

        if (m_ttl.count() > 0
            && std::chrono::steady_clock::now() - it->second->insertedAt >= m_ttl) {
            m_list.erase(it->second);
            m_index.erase(it);
            ++m_misses;
            return std::nullopt;
        }

        if (it->second != m_list.begin()) {
            m_list.splice(m_list.begin(), m_list, it->second);
        }
        ++m_hits;
        return it->second->value;
    }

    void put(const QString& key, Value value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto existing = m_index.find(key);
        if (existing != m_index.end()) {
            m_list.erase(existing->second);
            m_index.erase(existing);
        }

        while (static_cast<int>(m_list.size()) >= m_maxEntries && !m_list.empty()) {
            m_index.erase(m_list.back().key);
            m_list.pop_back();
            ++m_evictions;
        }

        m_list.push_front(Entry{key, std::move(value), std::chrono::steady_clock::now()});
        m_index[key] = m_list.begin();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_list.clear();
        m_index.clear();
    }

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int size = 0;
    };

    Stats stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
    }

private:
    struct Entry {
        QString key;
        Value value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    const int m_maxEntries;
    const std::chrono::seconds m_ttl;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list; // front = most recently used
    std::unordered_map<QString, typename std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace sl
