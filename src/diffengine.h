#ifndef DIFFENGINE_H
#define DIFFENGINE_H

#include "canvas.h"
#include "canvaspool.h"
#include "diffoptions.h"
#include "gpudiffrenderer.h"
#include "normalizer.h"
#include <memory>
#include <mutex>
#include <optional>

struct EngineConfig {
    bool enableGPU = true;
};

/**
 * Extra output of a comparison
 */
struct ComparisonDetails {
    DimensionInfo dimensions;
    bool usedGPU = false;
    cv::Mat originalData;   // diff-free rendering, empty after a GPU comparison
};

/**
 * Entry point tying normalization, CPU or GPU comparison and statistics together
 *
 * Safe to call from several threads at once as long as every call uses its own
 * surfaces. The GPU renderer is shared and serialized internally.
 */
class DiffEngine {
public:
    explicit DiffEngine(CanvasPool& pool, const EngineConfig& config = EngineConfig());
    ~DiffEngine();

    DiffEngine(const DiffEngine&) = delete;
    DiffEngine& operator=(const DiffEngine&) = delete;

    /**
     * Compare two page images
     * @param canvas1 First image
     * @param canvas2 Second image
     * @param output Resized to the normalized size and filled with the diff
     * @param options Comparison mode and parameters
     * @param strategy Normalization rules, defaults when not given
     * @param details Optional extra output
     * @return Difference statistics
     * @throws DiffException (CanvasError) when an input has no pixel data,
     *         (InvalidOptions) when options are out of range
     */
    DiffResult comparePdfs(const Canvas& canvas1, const Canvas& canvas2, Canvas& output,
                           const DiffOptions& options,
                           const std::optional<NormalizationStrategy>& strategy = std::nullopt,
                           ComparisonDetails* details = nullptr);

    /**
     * Replace the GPU renderer, nullptr disables the GPU path
     */
    void setGPURenderer(std::unique_ptr<GPUDiffRenderer> renderer);

    /**
     * Check if a ready GPU renderer is available, creating it on first use
     */
    bool isGPUAvailable();

    /**
     * Release the GPU renderer. Later GPU requests use the CPU path.
     */
    void dispose();

private:
    GPUDiffRenderer* gpuRenderer();

    CanvasNormalizer m_normalizer;
    EngineConfig m_config;

    std::unique_ptr<GPUDiffRenderer> m_gpuRenderer;
    bool m_gpuInitAttempted = false;
    bool m_disposed = false;
    std::mutex m_gpuMutex;
};

#endif // DIFFENGINE_H
