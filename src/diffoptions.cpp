#include "diffoptions.h"
#include "errorhandler.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

DiffOptions DiffOptions::create(DiffMode mode, double threshold, double overlayOpacity, bool useGrayscale) {
    DiffOptions options;
    options.mode = mode;
    options.threshold = threshold;
    options.overlayOpacity = overlayOpacity;
    options.useGrayscale = useGrayscale;
    options.validate();
    return options;
}

void DiffOptions::validate() const {
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 255.0) {
        std::ostringstream oss;
        oss << "threshold must be within [0, 255], got " << threshold;
        throw DiffException(ErrorType::InvalidOptions, oss.str());
    }
    if (!std::isfinite(overlayOpacity) || overlayOpacity < 0.0 || overlayOpacity > 1.0) {
        std::ostringstream oss;
        oss << "overlayOpacity must be within [0, 1], got " << overlayOpacity;
        throw DiffException(ErrorType::InvalidOptions, oss.str());
    }
}

bool DiffOptions::isValid() const {
    return std::isfinite(threshold) && threshold >= 0.0 && threshold <= 255.0 &&
           std::isfinite(overlayOpacity) && overlayOpacity >= 0.0 && overlayOpacity <= 1.0;
}

DiffResult DiffResult::fromCount(int differenceCount, int totalPixels) {
    DiffResult result;
    result.differenceCount = differenceCount;
    result.totalPixels = totalPixels;
    result.percentDiff = totalPixels > 0 ? 100.0 * differenceCount / totalPixels : 0.0;
    return result;
}

bool DiffResult::isCountable(int width, int height) {
    return width >= 0 && height >= 0 &&
           static_cast<int64_t>(width) * static_cast<int64_t>(height) <= MAX_PIXEL_COUNT;
}

std::string diffModeToString(DiffMode mode) {
    switch (mode) {
        case DiffMode::Pixel: return "pixel";
        case DiffMode::Threshold: return "threshold";
        case DiffMode::Grayscale: return "grayscale";
        case DiffMode::Overlay: return "overlay";
        case DiffMode::Heatmap: return "heatmap";
        case DiffMode::Semantic: return "semantic";
        case DiffMode::GPU: return "webgl";
        default: return "pixel";
    }
}

DiffMode diffModeFromString(const std::string& name, bool* ok) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ok) *ok = true;

    if (lower == "pixel") return DiffMode::Pixel;
    if (lower == "threshold") return DiffMode::Threshold;
    if (lower == "grayscale") return DiffMode::Grayscale;
    if (lower == "overlay") return DiffMode::Overlay;
    if (lower == "heatmap") return DiffMode::Heatmap;
    if (lower == "semantic") return DiffMode::Semantic;
    if (lower == "webgl" || lower == "gpu") return DiffMode::GPU;

    if (ok) *ok = false;
    return DiffMode::Pixel;
}
