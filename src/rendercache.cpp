#include "rendercache.h"
#include "performancemonitor.h"
#include <cmath>

RenderCache::RenderCache(size_t maxEntries)
    : m_maxEntries(maxEntries > 0 ? maxEntries : 1) {
}

int RenderCache::zoomBucket(double zoom) {
    double percent = zoom * 100.0;
    return static_cast<int>(std::lround(percent / ZOOM_BUCKET_PERCENT)) * ZOOM_BUCKET_PERCENT;
}

std::shared_ptr<const Canvas> RenderCache::get(const std::string& sourceId, double zoom) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(Key{sourceId, zoomBucket(zoom)});
    if (it == m_index.end()) {
        m_misses++;
        return nullptr;
    }

    m_entries.splice(m_entries.begin(), m_entries, it->second);
    m_hits++;
    return it->second->raster;
}

void RenderCache::put(const std::string& sourceId, double zoom, std::shared_ptr<const Canvas> raster) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Key key{sourceId, zoomBucket(zoom)};
    auto it = m_index.find(key);
    if (it != m_index.end()) {
        it->second->raster = std::move(raster);
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return;
    }

    if (m_entries.size() >= m_maxEntries) {
        const Entry& oldest = m_entries.back();
        LOG_DEBUG("Cache", "Evicting " + oldest.key.sourceId + " @" + std::to_string(oldest.key.bucket) + "%");
        m_index.erase(oldest.key);
        m_entries.pop_back();
        m_evictions++;
    }

    m_entries.push_front(Entry{key, std::move(raster)});
    m_index[key] = m_entries.begin();
}

bool RenderCache::contains(const std::string& sourceId, double zoom) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(Key{sourceId, zoomBucket(zoom)}) > 0;
}

size_t RenderCache::evictSource(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->key.sourceId == sourceId) {
            m_index.erase(it->key);
            it = m_entries.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void RenderCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.clear();
    m_entries.clear();
}

size_t RenderCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

RenderCacheStats RenderCache::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    RenderCacheStats stats;
    stats.size = m_entries.size();
    stats.maxEntries = m_maxEntries;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.evictions = m_evictions;
    return stats;
}

void RenderCache::resetStats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hits = 0;
    m_misses = 0;
    m_evictions = 0;
}
