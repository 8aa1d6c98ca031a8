#include "diffengine.h"
#include "diffalgorithms.h"
#include "errorhandler.h"
#include "performancemonitor.h"

DiffEngine::DiffEngine(CanvasPool& pool, const EngineConfig& config)
    : m_normalizer(pool),
      m_config(config) {
}

DiffEngine::~DiffEngine() {
    dispose();
}

DiffResult DiffEngine::comparePdfs(const Canvas& canvas1, const Canvas& canvas2, Canvas& output,
                                   const DiffOptions& options,
                                   const std::optional<NormalizationStrategy>& strategy,
                                   ComparisonDetails* details) {
    PERF_TIMER_CAT("comparePdfs", "Diff");

    if (canvas1.isEmpty() || canvas2.isEmpty()) {
        throw DiffException(ErrorType::CanvasError, "Failed to get canvas contexts");
    }
    options.validate();

    const NormalizationStrategy resolved = strategy.value_or(NormalizationStrategy());
    const NormalizedDimensions target = CanvasNormalizer::calculateNormalizedDimensions(canvas1, canvas2, resolved);
    if (!DiffResult::isCountable(target.targetWidth, target.targetHeight)) {
        throw DiffException(ErrorType::CanvasError,
                            "Comparison size " + std::to_string(target.targetWidth) + "x" +
                            std::to_string(target.targetHeight) + " exceeds the countable pixel range");
    }

    NormalizedCanvases normalized = m_normalizer.normalizeCanvases(canvas1, canvas2, resolved);
    const int width = normalized.dimensions.targetWidth;
    const int height = normalized.dimensions.targetHeight;

    output.resize(width, height);

    if (details) {
        details->dimensions = CanvasNormalizer::getDimensionInfo(canvas1, canvas2, normalized.dimensions);
        details->usedGPU = false;
        details->originalData.release();
    }

    if (options.mode == DiffMode::GPU) {
        std::lock_guard<std::mutex> lock(m_gpuMutex);
        GPUDiffRenderer* renderer = gpuRenderer();
        if (renderer) {
            GPUDiffOptions gpuOptions;
            gpuOptions.threshold = options.threshold;
            gpuOptions.overlayOpacity = options.overlayOpacity;
            gpuOptions.useGrayscale = options.useGrayscale;

            DiffResult result;
            if (renderer->renderDiff(*normalized.canvas1, *normalized.canvas2, output, gpuOptions, result)) {
                if (details) {
                    details->usedGPU = true;
                }
                LOG_DEBUG("Diff", "GPU diff: " + std::to_string(result.differenceCount) + " of " +
                          std::to_string(result.totalPixels) + " pixels differ");
                return result;
            }
            LOG_WARNING("GPU", "GPU rendering failed, falling back to CPU: " + renderer->getErrorMessage());
        } else {
            LOG_WARNING("GPU", "GPU rendering unavailable, falling back to CPU");
        }
    }

    DiffOptions cpuOptions = options;
    if (cpuOptions.mode == DiffMode::GPU) {
        cpuOptions.mode = DiffMode::Pixel;
    }

    cv::Mat staging;
    cv::Mat original;
    int differenceCount = DiffAlgorithms::compare(normalized.canvas1->pixels(), normalized.canvas2->pixels(),
                                                  staging, cpuOptions, details ? &original : nullptr);
    output.putImageData(staging);

    if (details) {
        details->originalData = original;
    }

    DiffResult result = DiffResult::fromCount(differenceCount, width * height);
    LOG_DEBUG("Diff", diffModeToString(cpuOptions.mode) + " diff: " + std::to_string(result.differenceCount) +
              " of " + std::to_string(result.totalPixels) + " pixels differ");
    return result;
}

void DiffEngine::setGPURenderer(std::unique_ptr<GPUDiffRenderer> renderer) {
    std::lock_guard<std::mutex> lock(m_gpuMutex);
    m_gpuRenderer = std::move(renderer);
    m_gpuInitAttempted = true;
    m_disposed = false;
}

bool DiffEngine::isGPUAvailable() {
    std::lock_guard<std::mutex> lock(m_gpuMutex);
    GPUDiffRenderer* renderer = gpuRenderer();
    return renderer && renderer->isReady();
}

void DiffEngine::dispose() {
    std::lock_guard<std::mutex> lock(m_gpuMutex);
    m_gpuRenderer.reset();
    m_disposed = true;
}

GPUDiffRenderer* DiffEngine::gpuRenderer() {
    if (m_disposed || !m_config.enableGPU) {
        return nullptr;
    }

    if (!m_gpuInitAttempted) {
        m_gpuInitAttempted = true;
        m_gpuRenderer = GPUDiffRendererFactory::createBestRenderer();
    }
    return m_gpuRenderer.get();
}
