#ifndef DIFFALGORITHMS_H
#define DIFFALGORITHMS_H

#include "diffoptions.h"
#include <opencv2/opencv.hpp>

/**
 * Per-pixel comparison strategies
 *
 * Every function takes two RGBA (CV_8UC4) images of equal size and writes a
 * rendered diff into `diff`, which is (re)allocated to the input size when
 * needed. When `original` is given it receives the same comparison rendered
 * without highlighting. Alpha is ignored on input and written as 255.
 *
 * The return value is the number of pixels that matched the mode's
 * difference predicate. Two empty inputs yield 0. Inputs of different size
 * or type violate the contract and raise cv::Exception via CV_Assert.
 */
class DiffAlgorithms {
public:
    /**
     * Exact R,G,B equality. Differences are opaque red, matches copy image 1.
     */
    static int pixelDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                         const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Summed absolute channel delta compared against options.threshold
     */
    static int thresholdDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                             const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Luminance (0.299R + 0.587G + 0.114B) delta compared against options.threshold.
     * Matching pixels are rendered as image 1's luminance.
     */
    static int grayscaleDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                             const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Differences are image 1 tinted towards red by options.overlayOpacity,
     * matches are a 50/50 blend of both images.
     */
    static int overlayDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                           const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Every pixel is colored by getHeatmapColor of its normalized distance.
     * The threshold only affects the returned count.
     */
    static int heatmapDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                           const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Splits differences into minor changes (summed delta below 255, yellow tint
     * scaled by delta) and structural changes (magenta-red, stronger with delta).
     */
    static int semanticDiff(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                            const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Run the algorithm selected by options.mode. DiffMode::GPU maps to pixelDiff.
     */
    static int compare(const cv::Mat& img1, const cv::Mat& img2, cv::Mat& diff,
                       const DiffOptions& options, cv::Mat* original = nullptr);

    /**
     * Four band gradient blue -> cyan -> green -> yellow -> red
     * @param value Normalized distance, clamped to [0, 1]
     * @return Color as (R, G, B)
     */
    static cv::Vec3b getHeatmapColor(double value);

    // Summed channel delta at which the semantic mode treats a change as structural
    static constexpr int SEMANTIC_STRUCTURAL_DELTA = 255;
};

#endif // DIFFALGORITHMS_H
