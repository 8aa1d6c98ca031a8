#ifndef NORMALIZER_H
#define NORMALIZER_H

#include "canvas.h"
#include "canvaspool.h"
#include <QColor>
#include <QString>

/**
 * How the common target size is chosen
 */
enum class NormalizationType {
    Largest,    // max width, max height
    Smallest,   // min width, min height
    First,      // size of image 1
    Second      // size of image 2
};

/**
 * Where each image is placed inside the target
 */
enum class Alignment {
    TopLeft,
    Center,
    TopCenter
};

struct NormalizationStrategy {
    NormalizationType type = NormalizationType::Largest;
    Alignment alignment = Alignment::TopLeft;
    QColor backgroundColor = QColor(255, 255, 255);
    bool scaleToFit = false;
};

/**
 * Placement of one source image inside the target surface
 */
struct CanvasTransform {
    double scale = 1.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
    double width = 0.0;     // scaled width
    double height = 0.0;    // scaled height
};

struct NormalizedDimensions {
    int targetWidth = 0;
    int targetHeight = 0;
    CanvasTransform transform1;
    CanvasTransform transform2;
};

/**
 * Source and target sizes of one normalization, kept for display
 */
struct DimensionInfo {
    int width1 = 0;
    int height1 = 0;
    int width2 = 0;
    int height2 = 0;
    int targetWidth = 0;
    int targetHeight = 0;

    bool sizesDiffer() const { return width1 != width2 || height1 != height2; }
};

/**
 * Two equal-size surfaces borrowed from a CanvasPool
 */
struct NormalizedCanvases {
    PooledCanvas canvas1;
    PooledCanvas canvas2;
    NormalizedDimensions dimensions;
};

/**
 * Reconciles two differently sized images onto one common canvas size
 */
class CanvasNormalizer {
public:
    explicit CanvasNormalizer(CanvasPool& pool);

    /**
     * Compute target size and per-image placement
     * @param canvas1 First image
     * @param canvas2 Second image
     * @param strategy Target size, alignment and scaling rules
     * @return Target dimensions and both transforms
     */
    static NormalizedDimensions calculateNormalizedDimensions(const Canvas& canvas1, const Canvas& canvas2,
                                                              const NormalizationStrategy& strategy);

    /**
     * Compute the placement of a single source inside a target
     */
    static CanvasTransform calculateTransform(int sourceWidth, int sourceHeight,
                                              int targetWidth, int targetHeight,
                                              const NormalizationStrategy& strategy);

    /**
     * Produce two pooled surfaces of the target size, filled with the
     * background color and with each source composited at its transform
     */
    NormalizedCanvases normalizeCanvases(const Canvas& canvas1, const Canvas& canvas2,
                                         const NormalizationStrategy& strategy);

    static DimensionInfo getDimensionInfo(const Canvas& canvas1, const Canvas& canvas2,
                                          const NormalizedDimensions& dimensions);

    static QString typeToString(NormalizationType type);
    static NormalizationType typeFromString(const QString& name, bool* ok = nullptr);
    static QString alignmentToString(Alignment alignment);
    static Alignment alignmentFromString(const QString& name, bool* ok = nullptr);

private:
    CanvasPool& m_pool;
};

#endif // NORMALIZER_H
