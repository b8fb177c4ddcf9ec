// AssetCache.hpp: bounded LRU cache of decoded audio assets
//
// Maps a file path to a shared, immutable AudioAsset. Bounded both by entry
// count and by total decoded bytes; inserting evicts least-recently-used
// entries until both bounds hold.
//
// THREADING:
// - Used by the butler thread and by the refill workers it spawns. Never
//   touched by the audio thread.
// - A plain std::mutex guards the map. Handles returned by get() are
//   shared_ptr copies, so eviction only drops the cache's own reference and
//   a caller that already holds an asset keeps reading it.
//
// RECENCY:
// - Every get() hit and every insert() stamps the entry with the next value
//   of a monotonic tick counter. The entry with the smallest tick is the
//   least recently used.

#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

#include "AudioAsset.hpp"

struct CacheStats {
    size_t   entries    = 0;
    uint64_t bytes      = 0;
    size_t   maxEntries = 0;
    uint64_t maxBytes   = 0;

    double entryFill() const {
        return maxEntries == 0 ? 0.0 : static_cast<double>(entries) / static_cast<double>(maxEntries);
    }
    double byteFill() const {
        return maxBytes == 0 ? 0.0 : static_cast<double>(bytes) / static_cast<double>(maxBytes);
    }
};

class AssetCache {
public:
    AssetCache(size_t maxEntries, uint64_t maxBytes)
        : mMaxEntries(maxEntries), mMaxBytes(maxBytes) {}

    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    /// Cached asset for `path`, or nullptr. A hit makes the entry most recent.
    AssetHandle get(const std::string& path) {
        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mEntries.find(path);
        if (it == mEntries.end()) return nullptr;
        it->second.lastUsed = ++mTick;
        return it->second.asset;
    }

    /// Insert `asset` under `path`, evicting LRU entries until both bounds
    /// hold. Inserting a path that is already cached only refreshes recency.
    void insert(const std::string& path, AssetHandle asset) {
        if (!asset) return;
        std::lock_guard<std::mutex> lock(mMutex);

        auto existing = mEntries.find(path);
        if (existing != mEntries.end()) {
            existing->second.lastUsed = ++mTick;
            return;
        }

        const uint64_t size = asset->sizeBytes();

        while (!mEntries.empty() &&
               (mEntries.size() >= mMaxEntries || mBytes + size > mMaxBytes)) {
            evictOldestLocked();
        }

        mEntries.emplace(path, Entry{std::move(asset), size, ++mTick});
        mBytes += size;
    }

    bool contains(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mEntries.count(path) != 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mEntries.size();
    }

    bool empty() const { return size() == 0; }

    void clear() {
        std::lock_guard<std::mutex> lock(mMutex);
        mEntries.clear();
        mBytes = 0;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mMutex);
        CacheStats s;
        s.entries    = mEntries.size();
        s.bytes      = mBytes;
        s.maxEntries = mMaxEntries;
        s.maxBytes   = mMaxBytes;
        return s;
    }

private:
    struct Entry {
        AssetHandle asset;
        uint64_t    bytes    = 0;
        uint64_t    lastUsed = 0;
    };

    void evictOldestLocked() {
        auto oldest = mEntries.begin();
        for (auto it = mEntries.begin(); it != mEntries.end(); ++it) {
            if (it->second.lastUsed < oldest->second.lastUsed) oldest = it;
        }
        std::cout << "[Cache] Evicting " << oldest->first
                  << " (" << oldest->second.bytes << " bytes)" << std::endl;
        mBytes -= oldest->second.bytes;
        mEntries.erase(oldest);
    }

    mutable std::mutex mMutex;
    std::unordered_map<std::string, Entry> mEntries;
    size_t   mMaxEntries;
    uint64_t mMaxBytes;
    uint64_t mBytes = 0;
    uint64_t mTick  = 0;
};
