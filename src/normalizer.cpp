#include "normalizer.h"
#include "performancemonitor.h"
#include <algorithm>

CanvasNormalizer::CanvasNormalizer(CanvasPool& pool)
    : m_pool(pool)
{
}

NormalizedDimensions CanvasNormalizer::calculateNormalizedDimensions(const Canvas& canvas1, const Canvas& canvas2,
                                                                     const NormalizationStrategy& strategy)
{
    int width1 = canvas1.width();
    int height1 = canvas1.height();
    int width2 = canvas2.width();
    int height2 = canvas2.height();

    NormalizedDimensions result;
    switch (strategy.type) {
        case NormalizationType::Smallest:
            result.targetWidth = std::min(width1, width2);
            result.targetHeight = std::min(height1, height2);
            break;
        case NormalizationType::First:
            result.targetWidth = width1;
            result.targetHeight = height1;
            break;
        case NormalizationType::Second:
            result.targetWidth = width2;
            result.targetHeight = height2;
            break;
        case NormalizationType::Largest:
        default:
            result.targetWidth = std::max(width1, width2);
            result.targetHeight = std::max(height1, height2);
            break;
    }

    result.transform1 = calculateTransform(width1, height1, result.targetWidth, result.targetHeight, strategy);
    result.transform2 = calculateTransform(width2, height2, result.targetWidth, result.targetHeight, strategy);
    return result;
}

CanvasTransform CanvasNormalizer::calculateTransform(int sourceWidth, int sourceHeight,
                                                     int targetWidth, int targetHeight,
                                                     const NormalizationStrategy& strategy)
{
    CanvasTransform transform;
    if (strategy.scaleToFit && sourceWidth > 0 && sourceHeight > 0) {
        transform.scale = std::min(static_cast<double>(targetWidth) / sourceWidth,
                                   static_cast<double>(targetHeight) / sourceHeight);
    }

    transform.width = sourceWidth * transform.scale;
    transform.height = sourceHeight * transform.scale;

    switch (strategy.alignment) {
        case Alignment::Center:
            transform.offsetX = (targetWidth - transform.width) / 2.0;
            transform.offsetY = (targetHeight - transform.height) / 2.0;
            break;
        case Alignment::TopCenter:
            transform.offsetX = (targetWidth - transform.width) / 2.0;
            transform.offsetY = 0.0;
            break;
        case Alignment::TopLeft:
        default:
            transform.offsetX = 0.0;
            transform.offsetY = 0.0;
            break;
    }

    return transform;
}

NormalizedCanvases CanvasNormalizer::normalizeCanvases(const Canvas& canvas1, const Canvas& canvas2,
                                                       const NormalizationStrategy& strategy)
{
    PERF_TIMER_CAT("normalizeCanvases", "Normalize");

    NormalizedCanvases result;
    result.dimensions = calculateNormalizedDimensions(canvas1, canvas2, strategy);

    const int targetWidth = result.dimensions.targetWidth;
    const int targetHeight = result.dimensions.targetHeight;
    const QColor& bg = strategy.backgroundColor;
    const cv::Scalar background(bg.red(), bg.green(), bg.blue(), bg.alpha());

    auto prepare = [&](const Canvas& source, const CanvasTransform& transform) {
        PooledCanvas surface(m_pool.acquire(targetWidth, targetHeight), &m_pool);
        surface->fill(background);
        surface->drawImage(source, transform.offsetX, transform.offsetY, transform.width, transform.height);
        return surface;
    };

    result.canvas1 = prepare(canvas1, result.dimensions.transform1);
    result.canvas2 = prepare(canvas2, result.dimensions.transform2);

    if (canvas1.width() != canvas2.width() || canvas1.height() != canvas2.height()) {
        LOG_DEBUG("Normalize", "Normalized " + std::to_string(canvas1.width()) + "x" + std::to_string(canvas1.height()) +
                  " and " + std::to_string(canvas2.width()) + "x" + std::to_string(canvas2.height()) +
                  " to " + std::to_string(targetWidth) + "x" + std::to_string(targetHeight));
    }

    return result;
}

DimensionInfo CanvasNormalizer::getDimensionInfo(const Canvas& canvas1, const Canvas& canvas2,
                                                 const NormalizedDimensions& dimensions)
{
    DimensionInfo info;
    info.width1 = canvas1.width();
    info.height1 = canvas1.height();
    info.width2 = canvas2.width();
    info.height2 = canvas2.height();
    info.targetWidth = dimensions.targetWidth;
    info.targetHeight = dimensions.targetHeight;
    return info;
}

QString CanvasNormalizer::typeToString(NormalizationType type)
{
    switch (type) {
        case NormalizationType::Smallest: return "smallest";
        case NormalizationType::First: return "first";
        case NormalizationType::Second: return "second";
        case NormalizationType::Largest:
        default: return "largest";
    }
}

NormalizationType CanvasNormalizer::typeFromString(const QString& name, bool* ok)
{
    const QString lower = name.trimmed().toLower();
    if (ok) *ok = true;

    if (lower == "largest") return NormalizationType::Largest;
    if (lower == "smallest") return NormalizationType::Smallest;
    if (lower == "first") return NormalizationType::First;
    if (lower == "second") return NormalizationType::Second;

    if (ok) *ok = false;
    return NormalizationType::Largest;
}

QString CanvasNormalizer::alignmentToString(Alignment alignment)
{
    switch (alignment) {
        case Alignment::Center: return "center";
        case Alignment::TopCenter: return "top-center";
        case Alignment::TopLeft:
        default: return "top-left";
    }
}

Alignment CanvasNormalizer::alignmentFromString(const QString& name, bool* ok)
{
    const QString lower = name.trimmed().toLower();
    if (ok) *ok = true;

    if (lower == "top-left") return Alignment::TopLeft;
    if (lower == "center") return Alignment::Center;
    if (lower == "top-center") return Alignment::TopCenter;

    if (ok) *ok = false;
    return Alignment::TopLeft;
}
