#ifndef CANVASPOOL_H
#define CANVASPOOL_H

#include "canvas.h"
#include <memory>
#include <mutex>
#include <vector>

/**
 * Counters describing how well the pool is reusing surfaces
 */
struct CanvasPoolStats {
    size_t poolSize = 0;
    size_t maxPoolSize = 0;
    size_t createdCount = 0;
    size_t reuseCount = 0;
    double reuseRate = 0.0;     // percentage of acquisitions served from the pool
};

/**
 * Bounded pool of reusable Canvas objects
 *
 * acquire() hands out a pooled surface resized in place, or a new one when the
 * pool is empty. release() clears the surface and keeps it if the pool is below
 * capacity, otherwise the surface is destroyed. Access is serialized by a mutex.
 */
class CanvasPool {
public:
    static constexpr size_t DEFAULT_MAX_POOL_SIZE = 15;

    /**
     * Constructor
     * @param maxPoolSize Maximum number of idle surfaces kept for reuse
     */
    explicit CanvasPool(size_t maxPoolSize = DEFAULT_MAX_POOL_SIZE);
    ~CanvasPool();

    CanvasPool(const CanvasPool&) = delete;
    CanvasPool& operator=(const CanvasPool&) = delete;

    /**
     * Borrow a surface of the given size
     * @param width Required width
     * @param height Required height
     * @return Surface owned by the caller until released
     */
    std::unique_ptr<Canvas> acquire(int width, int height);

    /**
     * Return a surface. The caller must not keep references into it.
     * @param canvas Surface previously obtained from acquire()
     */
    void release(std::unique_ptr<Canvas> canvas);

    /**
     * Drop every idle surface
     */
    void clear();

    CanvasPoolStats getStats() const;
    void resetStats();

    size_t maxPoolSize() const { return m_maxPoolSize; }

private:
    std::vector<std::unique_ptr<Canvas>> m_pool;
    size_t m_maxPoolSize;
    size_t m_createdCount = 0;
    size_t m_reuseCount = 0;
    mutable std::mutex m_poolMutex;
};

/**
 * RAII wrapper returning its surface to the pool on destruction
 */
class PooledCanvas {
public:
    PooledCanvas() = default;
    PooledCanvas(std::unique_ptr<Canvas> canvas, CanvasPool* pool);
    ~PooledCanvas();

    PooledCanvas(PooledCanvas&& other) noexcept;
    PooledCanvas& operator=(PooledCanvas&& other) noexcept;

    PooledCanvas(const PooledCanvas&) = delete;
    PooledCanvas& operator=(const PooledCanvas&) = delete;

    Canvas& get() { return *m_canvas; }
    const Canvas& get() const { return *m_canvas; }

    Canvas* operator->() { return m_canvas.get(); }
    const Canvas* operator->() const { return m_canvas.get(); }

    Canvas& operator*() { return *m_canvas; }
    const Canvas& operator*() const { return *m_canvas; }

    explicit operator bool() const { return static_cast<bool>(m_canvas); }

    /**
     * Return the surface early (before destructor)
     */
    void release();

private:
    std::unique_ptr<Canvas> m_canvas;
    CanvasPool* m_pool = nullptr;
};

#endif // CANVASPOOL_H
