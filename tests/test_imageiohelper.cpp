#include <gtest/gtest.h>
#include <QTemporaryDir>
#include "imageiohelper.h"
#include "testutils.h"

TEST(ImageIOHelperTest, PngRoundTripKeepsRgba)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("page.png");

    Canvas canvas = makeSolidCanvas(3, 2, 200, 100, 50);
    canvas.pixels().at<cv::Vec4b>(1, 2) = cv::Vec4b(1, 2, 3, 128);
    ASSERT_TRUE(ImageIOHelper::saveCanvas(path, canvas));

    Canvas loaded;
    ASSERT_TRUE(ImageIOHelper::loadCanvas(path, loaded));
    EXPECT_EQ(loaded.width(), 3);
    EXPECT_EQ(loaded.height(), 2);
    EXPECT_EQ(pixelAt(loaded, 0, 0), cv::Vec4b(200, 100, 50, 255));
    EXPECT_EQ(pixelAt(loaded, 2, 1), cv::Vec4b(1, 2, 3, 128));
}

TEST(ImageIOHelperTest, OpaqueFilesLoadWithFullAlpha)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("rgb.png");

    // OpenCV writes BGR order
    cv::Mat bgr(2, 2, CV_8UC3, cv::Scalar(30, 20, 10));
    ASSERT_TRUE(ImageIOHelper::imwriteUnicode(path, bgr));

    Canvas loaded;
    ASSERT_TRUE(ImageIOHelper::loadCanvas(path, loaded));
    EXPECT_EQ(pixelAt(loaded, 1, 1), cv::Vec4b(10, 20, 30, 255));
}

TEST(ImageIOHelperTest, MissingFileFailsToLoad)
{
    Canvas canvas;
    EXPECT_FALSE(ImageIOHelper::loadCanvas("/nonexistent/pagediff/missing.png", canvas));
    EXPECT_TRUE(canvas.isEmpty());
}

TEST(ImageIOHelperTest, EmptyCanvasIsNotSaved)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    EXPECT_FALSE(ImageIOHelper::saveCanvas(dir.filePath("empty.png"), Canvas()));
}

TEST(ImageIOHelperTest, CachedLoadDecodesOnce)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("page.png");
    ASSERT_TRUE(ImageIOHelper::saveCanvas(path, makeSolidCanvas(4, 3, 10, 20, 30)));

    RenderCache cache(2);
    std::shared_ptr<const Canvas> first = ImageIOHelper::loadCanvasCached(path, cache);
    std::shared_ptr<const Canvas> second = ImageIOHelper::loadCanvasCached(path, cache);

    ASSERT_TRUE(first);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->width(), 4);
    EXPECT_EQ(pixelAt(*first, 3, 2), cv::Vec4b(10, 20, 30, 255));

    RenderCacheStats stats = cache.getStats();
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST(ImageIOHelperTest, CachedLoadOfMissingFileIsNotCached)
{
    RenderCache cache(2);

    EXPECT_FALSE(ImageIOHelper::loadCanvasCached("/nonexistent/pagediff/missing.png", cache));
    EXPECT_EQ(cache.size(), 0u);
}
