#include "diffalgorithms.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {

constexpr double MAX_CHANNEL_SUM = 3.0 * 255.0;

/**
 * Shared pixel loop. `op` writes one diff pixel (and the original pixel when
 * the pointer is non-null) and returns whether the pair counts as different.
 */
template <typename PixelOp>
int forEachPixel(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff, cv::Mat* original, PixelOp op) {
    if (img1.empty() && img2.empty()) {
        return 0;
    }

    CV_Assert(img1.type() == CV_8UC4 && img2.type() == CV_8UC4);
    CV_Assert(img1.size() == img2.size());

    diff.create(img1.size(), CV_8UC4);
    if (original) {
        original->create(img1.size(), CV_8UC4);
    }

    int count = 0;
    for (int y = 0; y < img1.rows; ++y) {
        const uchar* a = img1.ptr<uchar>(y);
        const uchar* b = img2.ptr<uchar>(y);
        uchar* d = diff.ptr<uchar>(y);
        uchar* o = original ? original->ptr<uchar>(y) : nullptr;

        for (int x = 0; x < img1.cols; ++x) {
            if (op(a, b, d, o)) {
                ++count;
            }
            a += 4;
            b += 4;
            d += 4;
            if (o) o += 4;
        }
    }
    return count;
}

inline int channelDelta(const uchar* a, const uchar* b) {
    return std::abs(a[0] - b[0]) + std::abs(a[1] - b[1]) + std::abs(a[2] - b[2]);
}

inline double luminance(const uchar* p) {
    return 0.299 * p[0] + 0.587 * p[1] + 0.114 * p[2];
}

inline void writePixel(uchar* out, uchar r, uchar g, uchar b) {
    out[0] = r;
    out[1] = g;
    out[2] = b;
    out[3] = 255;
}

inline void writeRed(uchar* out) {
    writePixel(out, 255, 0, 0);
}

inline void writeCopy(uchar* out, const uchar* src) {
    writePixel(out, src[0], src[1], src[2]);
}

inline void writeBlend(uchar* out, const uchar* a, const uchar* b) {
    writePixel(out,
               cv::saturate_cast<uchar>((a[0] + b[0]) * 0.5),
               cv::saturate_cast<uchar>((a[1] + b[1]) * 0.5),
               cv::saturate_cast<uchar>((a[2] + b[2]) * 0.5));
}

// base * (1 - alpha) + tint * alpha, per channel
inline void writeTint(uchar* out, const uchar* base, double alpha, double r, double g, double b) {
    double keep = 1.0 - alpha;
    writePixel(out,
               cv::saturate_cast<uchar>(base[0] * keep + r * alpha),
               cv::saturate_cast<uchar>(base[1] * keep + g * alpha),
               cv::saturate_cast<uchar>(base[2] * keep + b * alpha));
}

} // namespace

int DiffAlgorithms::pixelDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                              const DiffOptions&, cv::Mat* original) {
    return forEachPixel(img1, img2, diff, original,
        [](const uchar* a, const uchar* b, uchar* d, uchar* o) {
            bool different = a[0] != b[0] || a[1] != b[1] || a[2] != b[2];
            if (different) {
                writeRed(d);
            } else {
                writeCopy(d, a);
            }
            if (o) writeCopy(o, a);
            return different;
        });
}

int DiffAlgorithms::thresholdDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                                  const DiffOptions& options, cv::Mat* original) {
    const double threshold = options.threshold;
    return forEachPixel(img1, img2, diff, original,
        [threshold](const uchar* a, const uchar* b, uchar* d, uchar* o) {
            bool different = channelDelta(a, b) > threshold;
            if (different) {
                writeRed(d);
            } else {
                writeCopy(d, a);
            }
            if (o) writeCopy(o, a);
            return different;
        });
}

int DiffAlgorithms::grayscaleDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                                  const DiffOptions& options, cv::Mat* original) {
    const double threshold = options.threshold;
    return forEachPixel(img1, img2, diff, original,
        [threshold](const uchar* a, const uchar* b, uchar* d, uchar* o) {
            double gray1 = luminance(a);
            double gray2 = luminance(b);
            uchar gray = cv::saturate_cast<uchar>(gray1);

            bool different = std::abs(gray1 - gray2) > threshold;
            if (different) {
                writeRed(d);
            } else {
                writePixel(d, gray, gray, gray);
            }
            if (o) writePixel(o, gray, gray, gray);
            return different;
        });
}

int DiffAlgorithms::overlayDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                                const DiffOptions& options, cv::Mat* original) {
    const double threshold = options.threshold;
    const double opacity = options.overlayOpacity;
    return forEachPixel(img1, img2, diff, original,
        [threshold, opacity](const uchar* a, const uchar* b, uchar* d, uchar* o) {
            bool different = channelDelta(a, b) > threshold;
            if (different) {
                writeTint(d, a, opacity, 255.0, 0.0, 0.0);
            } else {
                writeBlend(d, a, b);
            }
            if (o) writeBlend(o, a, b);
            return different;
        });
}

int DiffAlgorithms::heatmapDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                                const DiffOptions& options, cv::Mat* original) {
    const double normalizedThreshold = options.threshold / MAX_CHANNEL_SUM;
    return forEachPixel(img1, img2, diff, original,
        [normalizedThreshold](const uchar* a, const uchar* b, uchar* d, uchar* o) {
            double distance = channelDelta(a, b) / MAX_CHANNEL_SUM;
            cv::Vec3b color = getHeatmapColor(distance);
            writePixel(d, color[0], color[1], color[2]);
            if (o) writeBlend(o, a, b);
            return distance > normalizedThreshold;
        });
}

int DiffAlgorithms::semanticDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                                 const DiffOptions& options, cv::Mat* original) {
    const double threshold = options.threshold;
    return forEachPixel(img1, img2, diff, original,
        [threshold](const uchar* a, const uchar* b, uchar* d, uchar* o) {
            int delta = channelDelta(a, b);
            bool different = delta > threshold;

            if (!different) {
                writeBlend(d, a, b);
            } else if (delta < SEMANTIC_STRUCTURAL_DELTA) {
                // Minor styling change: yellow tint, 0.35 .. 0.70
                double alpha = 0.35 + 0.35 * delta / 255.0;
                writeTint(d, a, alpha, 255.0, 220.0, 0.0);
            } else {
                // Structural change: magenta-red, 0.70 .. 1.00
                double severity = std::min(1.0, (delta - SEMANTIC_STRUCTURAL_DELTA) / 510.0);
                double alpha = 0.7 + 0.3 * severity;
                writeTint(d, a, alpha, 255.0, 0.0, 96.0);
            }

            if (o) writeBlend(o, a, b);
            return different;
        });
}

int DiffAlgorithms::compare(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                            const DiffOptions& options, cv::Mat* original) {
    switch (options.mode) {
        case DiffMode::Threshold:
            return thresholdDiff(img1, img2, diff, options, original);
        case DiffMode::Grayscale:
            return grayscaleDiff(img1, img2, diff, options, original);
        case DiffMode::Overlay:
            return overlayDiff(img1, img2, diff, options, original);
        case DiffMode::Heatmap:
            return heatmapDiff(img1, img2, diff, options, original);
        case DiffMode::Semantic:
            return semanticDiff(img1, img2, diff, options, original);
        case DiffMode::Pixel:
        case DiffMode::GPU:
        default:
            return pixelDiff(img1, img2, diff, options, original);
    }
}

cv::Vec3b DiffAlgorithms::getHeatmapColor(double value) {
    double v = std::clamp(value, 0.0, 1.0);

    if (v < 0.25) {
        double t = v / 0.25;
        return cv::Vec3b(0, static_cast<uchar>(std::floor(t * 255)), 255);
    }
    if (v < 0.5) {
        double t = (v - 0.25) / 0.25;
        return cv::Vec3b(0, 255, static_cast<uchar>(std::floor(255 * (1 - t))));
    }
    if (v < 0.75) {
        double t = (v - 0.5) / 0.25;
        return cv::Vec3b(static_cast<uchar>(std::floor(t * 255)), 255, 0);
    }
    double t = (v - 0.75) / 0.25;
    return cv::Vec3b(255, static_cast<uchar>(std::floor(255 * (1 - t))), 0);
}
