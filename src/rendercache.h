#ifndef RENDERCACHE_H
#define RENDERCACHE_H

#include "canvas.h"
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct RenderCacheStats {
    size_t size = 0;
    size_t maxEntries = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
};

/**
 * Least-recently-used cache of rasterized pages
 *
 * Entries are keyed by source identity and zoom bucket. Zoom levels are
 * rounded to the nearest ZOOM_BUCKET_PERCENT so nearby levels share an entry.
 * get/put/evict are O(1).
 */
class RenderCache {
public:
    static constexpr size_t DEFAULT_MAX_ENTRIES = 10;
    static constexpr int ZOOM_BUCKET_PERCENT = 5;

    explicit RenderCache(size_t maxEntries = DEFAULT_MAX_ENTRIES);

    RenderCache(const RenderCache&) = delete;
    RenderCache& operator=(const RenderCache&) = delete;

    /**
     * Map a zoom factor (1.0 = 100%) to its bucket in percent
     */
    static int zoomBucket(double zoom);

    /**
     * Look up a raster and mark it most recently used
     * @return Raster, or nullptr on a miss
     */
    std::shared_ptr<const Canvas> get(const std::string& sourceId, double zoom);

    /**
     * Insert or replace a raster, evicting the least recently used entry when full
     */
    void put(const std::string& sourceId, double zoom, std::shared_ptr<const Canvas> raster);

    bool contains(const std::string& sourceId, double zoom) const;

    /**
     * Drop every zoom level cached for one source
     * @return Number of entries removed
     */
    size_t evictSource(const std::string& sourceId);

    void clear();
    size_t size() const;

    RenderCacheStats getStats() const;
    void resetStats();

private:
    struct Key {
        std::string sourceId;
        int bucket = 0;

        bool operator==(const Key& other) const {
            return bucket == other.bucket && sourceId == other.sourceId;
        }
    };

    struct KeyHash {
        size_t operator()(const Key& key) const {
            size_t h = std::hash<std::string>()(key.sourceId);
            return h ^ (std::hash<int>()(key.bucket) + 0x9e3779b9 + (h << 6) + (h >> 2));
        }
    };

    struct Entry {
        Key key;
        std::shared_ptr<const Canvas> raster;
    };

    using EntryList = std::list<Entry>;

    EntryList m_entries;    // front = most recently used
    std::unordered_map<Key, EntryList::iterator, KeyHash> m_index;
    size_t m_maxEntries;
    size_t m_hits = 0;
    size_t m_misses = 0;
    size_t m_evictions = 0;
    mutable std::mutex m_mutex;
};

#endif // RENDERCACHE_H
