//
// Concurrent keyed store whose entries lapse after a period without use
//

#ifndef SDS_ARCHIVE_SERVER_SESSIONCACHE_H
#define SDS_ARCHIVE_SERVER_SESSIONCACHE_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <optional>
#include <string>

template<typename Value>
class SessionCache {
public:
    explicit SessionCache(std::chrono::milliseconds idleTimeout) : idleTimeout(idleTimeout) {}

    void put(const std::string& key, Value value) {
        entries.insert_or_assign(key, std::make_shared<sEntry>(std::move(value), now()));
    }

    // Returns nothing for a missing or lapsed key (a lapsed key is dropped). A hit restarts the idle period.
    auto get(const std::string& key) -> std::optional<Value> {
        auto iter = entries.find(key);
        if (iter == entries.end()) {
            return std::nullopt;
        }

        auto entry = iter->second;
        auto timestamp = now();
        if (lapsed(*entry, timestamp)) {
            entries.erase_if_equal(key, entry);
            return std::nullopt;
        }

        entry->lastSeen.store(timestamp);
        return entry->value;
    }

    void erase(const std::string& key) {
        entries.erase(key);
    }

    // Drops every lapsed entry, returning how many went
    auto sweep() -> size_t {
        size_t removed = 0;
        auto timestamp = now();
        for (auto iter = entries.cbegin(); iter != entries.cend(); ++iter) {
            if (lapsed(*iter->second, timestamp)) {
                removed += entries.erase_if_equal(iter->first, iter->second);
            }
        }
        return removed;
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries.size();
    }

private:
    struct sEntry {
        sEntry(Value value, int64_t lastSeen) : value(std::move(value)), lastSeen(lastSeen) {}

        const Value value;
        std::atomic<int64_t> lastSeen;
    };

    static auto now() -> int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()
        ).count();
    }

    auto lapsed(const sEntry& entry, int64_t timestamp) const -> bool {
        return timestamp - entry.lastSeen.load() >= idleTimeout.count();
    }

    std::chrono::milliseconds idleTimeout;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<sEntry>> entries;
};

#endif //SDS_ARCHIVE_SERVER_SESSIONCACHE_H
