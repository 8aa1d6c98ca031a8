#include <gtest/gtest.h>
#include "normalizer.h"
#include "testutils.h"

namespace {

NormalizationStrategy strategyWith(NormalizationType type, Alignment alignment = Alignment::TopLeft,
                                   bool scaleToFit = false)
{
    NormalizationStrategy strategy;
    strategy.type = type;
    strategy.alignment = alignment;
    strategy.scaleToFit = scaleToFit;
    return strategy;
}

} // namespace

TEST(NormalizerTest, DefaultStrategy)
{
    NormalizationStrategy strategy;

    EXPECT_EQ(strategy.type, NormalizationType::Largest);
    EXPECT_EQ(strategy.alignment, Alignment::TopLeft);
    EXPECT_EQ(strategy.backgroundColor, QColor(255, 255, 255));
    EXPECT_FALSE(strategy.scaleToFit);
}

TEST(NormalizerTest, LargestCoversBothImages)
{
    const int sizes[][4] = {{10, 20, 30, 5}, {1, 1, 1, 1}, {100, 3, 7, 250}, {64, 64, 32, 128}};

    for (const auto& s : sizes) {
        Canvas image1(s[0], s[1]);
        Canvas image2(s[2], s[3]);
        for (bool scaleToFit : {false, true}) {
            NormalizedDimensions dims = CanvasNormalizer::calculateNormalizedDimensions(
                image1, image2, strategyWith(NormalizationType::Largest, Alignment::TopLeft, scaleToFit));
            EXPECT_EQ(dims.targetWidth, std::max(s[0], s[2]));
            EXPECT_EQ(dims.targetHeight, std::max(s[1], s[3]));
        }
    }
}

TEST(NormalizerTest, TargetSizeSelection)
{
    Canvas image1(10, 40);
    Canvas image2(30, 20);

    NormalizedDimensions smallest = CanvasNormalizer::calculateNormalizedDimensions(
        image1, image2, strategyWith(NormalizationType::Smallest));
    EXPECT_EQ(smallest.targetWidth, 10);
    EXPECT_EQ(smallest.targetHeight, 20);

    NormalizedDimensions first = CanvasNormalizer::calculateNormalizedDimensions(
        image1, image2, strategyWith(NormalizationType::First));
    EXPECT_EQ(first.targetWidth, 10);
    EXPECT_EQ(first.targetHeight, 40);

    NormalizedDimensions second = CanvasNormalizer::calculateNormalizedDimensions(
        image1, image2, strategyWith(NormalizationType::Second));
    EXPECT_EQ(second.targetWidth, 30);
    EXPECT_EQ(second.targetHeight, 20);
}

TEST(NormalizerTest, AlignmentOffsets)
{
    CanvasTransform topLeft = CanvasNormalizer::calculateTransform(
        20, 10, 40, 30, strategyWith(NormalizationType::Largest, Alignment::TopLeft));
    EXPECT_DOUBLE_EQ(topLeft.offsetX, 0.0);
    EXPECT_DOUBLE_EQ(topLeft.offsetY, 0.0);

    CanvasTransform center = CanvasNormalizer::calculateTransform(
        20, 10, 40, 30, strategyWith(NormalizationType::Largest, Alignment::Center));
    EXPECT_DOUBLE_EQ(center.offsetX, 10.0);
    EXPECT_DOUBLE_EQ(center.offsetY, 10.0);

    CanvasTransform topCenter = CanvasNormalizer::calculateTransform(
        20, 10, 40, 30, strategyWith(NormalizationType::Largest, Alignment::TopCenter));
    EXPECT_DOUBLE_EQ(topCenter.offsetX, 10.0);
    EXPECT_DOUBLE_EQ(topCenter.offsetY, 0.0);
}

TEST(NormalizerTest, ScaleToFitKeepsAspectRatio)
{
    CanvasTransform transform = CanvasNormalizer::calculateTransform(
        20, 10, 40, 40, strategyWith(NormalizationType::Largest, Alignment::Center, true));

    EXPECT_DOUBLE_EQ(transform.scale, 2.0);
    EXPECT_DOUBLE_EQ(transform.width, 40.0);
    EXPECT_DOUBLE_EQ(transform.height, 20.0);
    EXPECT_DOUBLE_EQ(transform.offsetX, 0.0);
    EXPECT_DOUBLE_EQ(transform.offsetY, 10.0);
}

TEST(NormalizerTest, WithoutScaleToFitScaleIsOne)
{
    CanvasTransform transform = CanvasNormalizer::calculateTransform(
        20, 10, 40, 40, strategyWith(NormalizationType::Largest));

    EXPECT_DOUBLE_EQ(transform.scale, 1.0);
    EXPECT_DOUBLE_EQ(transform.width, 20.0);
    EXPECT_DOUBLE_EQ(transform.height, 10.0);
}

TEST(NormalizerTest, NormalizedCanvasesArePaddedWithBackground)
{
    CanvasPool pool;
    CanvasNormalizer normalizer(pool);
    Canvas small = makeSolidCanvas(2, 2, 0, 0, 0);
    Canvas large = makeSolidCanvas(4, 4, 0, 0, 0);

    NormalizationStrategy strategy;
    strategy.backgroundColor = QColor(10, 20, 30);
    NormalizedCanvases result = normalizer.normalizeCanvases(small, large, strategy);

    ASSERT_EQ(result.canvas1->width(), 4);
    ASSERT_EQ(result.canvas1->height(), 4);
    ASSERT_EQ(result.canvas2->width(), 4);
    ASSERT_EQ(result.canvas2->height(), 4);

    EXPECT_EQ(pixelAt(*result.canvas1, 1, 1), cv::Vec4b(0, 0, 0, 255));
    EXPECT_EQ(pixelAt(*result.canvas1, 3, 3), cv::Vec4b(10, 20, 30, 255));
    EXPECT_EQ(pixelAt(*result.canvas1, 2, 0), cv::Vec4b(10, 20, 30, 255));
    EXPECT_EQ(pixelAt(*result.canvas2, 3, 3), cv::Vec4b(0, 0, 0, 255));
}

TEST(NormalizerTest, CenterAlignmentPlacesImageInTheMiddle)
{
    CanvasPool pool;
    CanvasNormalizer normalizer(pool);
    Canvas small = makeSolidCanvas(2, 2, 255, 0, 0);
    Canvas large = makeSolidCanvas(4, 4, 255, 0, 0);

    NormalizedCanvases result = normalizer.normalizeCanvases(
        small, large, strategyWith(NormalizationType::Largest, Alignment::Center));

    EXPECT_EQ(pixelAt(*result.canvas1, 0, 0), cv::Vec4b(255, 255, 255, 255));
    EXPECT_EQ(pixelAt(*result.canvas1, 1, 1), cv::Vec4b(255, 0, 0, 255));
    EXPECT_EQ(pixelAt(*result.canvas1, 2, 2), cv::Vec4b(255, 0, 0, 255));
    EXPECT_EQ(pixelAt(*result.canvas1, 3, 3), cv::Vec4b(255, 255, 255, 255));
}

TEST(NormalizerTest, SurfacesReturnToPool)
{
    CanvasPool pool;
    CanvasNormalizer normalizer(pool);
    Canvas image = makeSolidCanvas(3, 3, 1, 1, 1);

    {
        NormalizedCanvases result = normalizer.normalizeCanvases(image, image, NormalizationStrategy());
        EXPECT_TRUE(result.canvas1);
        EXPECT_EQ(pool.getStats().poolSize, 0u);
    }
    EXPECT_EQ(pool.getStats().poolSize, 2u);

    NormalizedCanvases again = normalizer.normalizeCanvases(image, image, NormalizationStrategy());
    EXPECT_TRUE(again.canvas2);
    EXPECT_EQ(pool.getStats().reuseCount, 2u);
}

TEST(NormalizerTest, DimensionInfoReportsSizes)
{
    Canvas image1(10, 20);
    Canvas image2(30, 5);
    NormalizedDimensions dims = CanvasNormalizer::calculateNormalizedDimensions(image1, image2, NormalizationStrategy());

    DimensionInfo info = CanvasNormalizer::getDimensionInfo(image1, image2, dims);
    EXPECT_EQ(info.width1, 10);
    EXPECT_EQ(info.height2, 5);
    EXPECT_EQ(info.targetWidth, 30);
    EXPECT_EQ(info.targetHeight, 20);
    EXPECT_TRUE(info.sizesDiffer());
}

TEST(NormalizerTest, NameConversions)
{
    bool ok = false;
    EXPECT_EQ(CanvasNormalizer::typeFromString("Smallest", &ok), NormalizationType::Smallest);
    EXPECT_TRUE(ok);
    EXPECT_EQ(CanvasNormalizer::alignmentFromString("top-center", &ok), Alignment::TopCenter);
    EXPECT_TRUE(ok);

    EXPECT_EQ(CanvasNormalizer::typeFromString("huge", &ok), NormalizationType::Largest);
    EXPECT_FALSE(ok);
    EXPECT_EQ(CanvasNormalizer::alignmentFromString("bottom", &ok), Alignment::TopLeft);
    EXPECT_FALSE(ok);

    EXPECT_EQ(CanvasNormalizer::typeToString(NormalizationType::Second), "second");
    EXPECT_EQ(CanvasNormalizer::alignmentToString(Alignment::Center), "center");
}
