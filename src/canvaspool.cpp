#include "canvaspool.h"
#include "performancemonitor.h"

// ============================================================================
// CanvasPool Implementation
// ============================================================================

CanvasPool::CanvasPool(size_t maxPoolSize) : m_maxPoolSize(maxPoolSize) {
    m_pool.reserve(maxPoolSize);
}

CanvasPool::~CanvasPool() {
    std::lock_guard<std::mutex> lock(m_poolMutex);
    m_pool.clear();
}

std::unique_ptr<Canvas> CanvasPool::acquire(int width, int height) {
    std::unique_ptr<Canvas> canvas;
    {
        std::lock_guard<std::mutex> lock(m_poolMutex);
        if (!m_pool.empty()) {
            canvas = std::move(m_pool.back());
            m_pool.pop_back();
            m_reuseCount++;
        } else {
            m_createdCount++;
        }
    }

    if (canvas) {
        canvas->resize(width, height);
    } else {
        canvas = std::make_unique<Canvas>(width, height);
    }
    return canvas;
}

void CanvasPool::release(std::unique_ptr<Canvas> canvas) {
    if (!canvas) {
        return;
    }

    canvas->clear();

    std::lock_guard<std::mutex> lock(m_poolMutex);
    if (m_pool.size() < m_maxPoolSize) {
        m_pool.push_back(std::move(canvas));
    }
}

void CanvasPool::clear() {
    std::lock_guard<std::mutex> lock(m_poolMutex);
    m_pool.clear();
    LOG_DEBUG("Pool", "Canvas pool cleared");
}

CanvasPoolStats CanvasPool::getStats() const {
    std::lock_guard<std::mutex> lock(m_poolMutex);

    CanvasPoolStats stats;
    stats.poolSize = m_pool.size();
    stats.maxPoolSize = m_maxPoolSize;
    stats.createdCount = m_createdCount;
    stats.reuseCount = m_reuseCount;

    size_t total = m_createdCount + m_reuseCount;
    stats.reuseRate = total > 0 ? 100.0 * m_reuseCount / total : 0.0;
    return stats;
}

void CanvasPool::resetStats() {
    std::lock_guard<std::mutex> lock(m_poolMutex);
    m_createdCount = 0;
    m_reuseCount = 0;
}

// ============================================================================
// PooledCanvas Implementation
// ============================================================================

PooledCanvas::PooledCanvas(std::unique_ptr<Canvas> canvas, CanvasPool* pool)
    : m_canvas(std::move(canvas)), m_pool(pool) {
}

PooledCanvas::~PooledCanvas() {
    release();
}

PooledCanvas::PooledCanvas(PooledCanvas&& other) noexcept
    : m_canvas(std::move(other.m_canvas)), m_pool(other.m_pool) {
    other.m_pool = nullptr;
}

PooledCanvas& PooledCanvas::operator=(PooledCanvas&& other) noexcept {
    if (this != &other) {
        release();
        m_canvas = std::move(other.m_canvas);
        m_pool = other.m_pool;
        other.m_pool = nullptr;
    }
    return *this;
}

void PooledCanvas::release() {
    if (m_canvas && m_pool) {
        m_pool->release(std::move(m_canvas));
    }
    m_canvas.reset();
    m_pool = nullptr;
}
