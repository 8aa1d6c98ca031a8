#ifndef DIFFOPTIONS_H
#define DIFFOPTIONS_H

#include <cstdint>
#include <limits>
#include <string>

/**
 * Comparison strategy selector
 *
 * GPU is the accelerated fused pixel/overlay comparison. Its wire name is
 * "webgl" for compatibility with existing option payloads.
 */
enum class DiffMode {
    Pixel,
    Threshold,
    Grayscale,
    Overlay,
    Heatmap,
    Semantic,
    GPU
};

/**
 * Options for a single comparison
 */
struct DiffOptions {
    DiffMode mode = DiffMode::Pixel;
    double threshold = 10.0;        // 0-255, tolerance on summed channel delta
    double overlayOpacity = 0.5;    // 0-1
    bool useGrayscale = false;

    /**
     * Build options with range checks
     * @throws DiffException (InvalidOptions) when a value is out of range
     */
    static DiffOptions create(DiffMode mode, double threshold = 10.0,
                              double overlayOpacity = 0.5, bool useGrayscale = false);

    /**
     * Check that threshold and opacity are inside their legal ranges
     * @throws DiffException (InvalidOptions) when they are not
     */
    void validate() const;

    bool isValid() const;
};

/**
 * Statistics of one comparison
 */
struct DiffResult {
    int differenceCount = 0;
    int totalPixels = 0;
    double percentDiff = 0.0;

    // Largest pixel count the counters can hold
    static constexpr int64_t MAX_PIXEL_COUNT = std::numeric_limits<int>::max();

    static DiffResult fromCount(int differenceCount, int totalPixels);

    /**
     * Check that a width x height surface can be counted without overflow
     */
    static bool isCountable(int width, int height);
};

std::string diffModeToString(DiffMode mode);

/**
 * Parse a mode name ("pixel", "threshold", ..., "webgl"; "gpu" is accepted too)
 * @param name Mode name, case-insensitive
 * @param ok Set to false when the name is unknown
 * @return Parsed mode, DiffMode::Pixel when unknown
 */
DiffMode diffModeFromString(const std::string& name, bool* ok = nullptr);

#endif // DIFFOPTIONS_H
