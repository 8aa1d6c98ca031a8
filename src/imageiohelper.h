#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <QFile>
#include <QFileInfo>
#include <QDateTime>
#include <opencv2/opencv.hpp>
#include <memory>
#include <vector>
#include "canvas.h"
#include "rendercache.h"

/**
 * Unicode-safe image file I/O for Canvas surfaces
 *
 * cv::imread() and cv::imwrite() do not accept Unicode paths on Windows, so
 * files go through Qt's file APIs and cv::imdecode()/cv::imencode().
 * Channel order is converted between OpenCV's BGR(A) and the RGBA of Canvas.
 */
class ImageIOHelper
{
public:
    /**
     * Load an image file into an RGBA surface
     * @param filePath Path of a PNG, JPEG, BMP, ... file
     * @param canvas Receives the pixels
     * @return false if the file cannot be read or decoded
     */
    static bool loadCanvas(const QString& filePath, Canvas& canvas)
    {
        cv::Mat image = imreadUnicode(filePath, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            return false;
        }

        if (image.depth() != CV_8U) {
            cv::Mat converted;
            double scale = image.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
            image.convertTo(converted, CV_8U, scale);
            image = converted;
        }

        cv::Mat rgba;
        switch (image.channels()) {
            case 1:
                cv::cvtColor(image, rgba, cv::COLOR_GRAY2RGBA);
                break;
            case 3:
                cv::cvtColor(image, rgba, cv::COLOR_BGR2RGBA);
                break;
            case 4:
                cv::cvtColor(image, rgba, cv::COLOR_BGRA2RGBA);
                break;
            default:
                return false;
        }

        canvas = Canvas::fromMat(rgba);
        return true;
    }

    /**
     * Load an image through a raster cache at 100% zoom
     *
     * The cache key is the absolute path plus the modification time, so an
     * edited file is decoded again.
     * @return Shared raster, nullptr if the file cannot be read or decoded
     */
    static std::shared_ptr<const Canvas> loadCanvasCached(const QString& filePath, RenderCache& cache)
    {
        QFileInfo info(filePath);
        const std::string sourceId = (info.absoluteFilePath() + "@" +
                                      QString::number(info.lastModified().toMSecsSinceEpoch())).toStdString();

        std::shared_ptr<const Canvas> raster = cache.get(sourceId, 1.0);
        if (raster) {
            return raster;
        }

        auto canvas = std::make_shared<Canvas>();
        if (!loadCanvas(filePath, *canvas)) {
            return nullptr;
        }
        cache.put(sourceId, 1.0, canvas);
        return canvas;
    }

    /**
     * Write a surface to disk, the format follows the file extension
     * @return false if the surface is empty or the file cannot be written
     */
    static bool saveCanvas(const QString& filePath, const Canvas& canvas)
    {
        if (canvas.isEmpty()) {
            return false;
        }

        cv::Mat bgra;
        cv::cvtColor(canvas.pixels(), bgra, cv::COLOR_RGBA2BGRA);

        // JPEG has no alpha channel
        QString lower = filePath.toLower();
        if (lower.endsWith(".jpg") || lower.endsWith(".jpeg")) {
            cv::Mat bgr;
            cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
            return imwriteUnicode(filePath, bgr);
        }
        return imwriteUnicode(filePath, bgra);
    }

    /**
     * Write an image to disk with Unicode path support
     * @param filePath Path to save the image
     * @param image OpenCV Mat to save
     * @param params Compression parameters
     * @return true if successful, false otherwise
     */
    static bool imwriteUnicode(const QString& filePath, const cv::Mat& image,
                               const std::vector<int>& params = std::vector<int>())
    {
        if (image.empty()) {
            return false;
        }

        int dot = filePath.lastIndexOf('.');
        QString ext = dot >= 0 ? filePath.mid(dot).toLower() : QString(".png");

        std::vector<uchar> buffer;
        if (!cv::imencode(ext.toStdString(), image, buffer, params)) {
            return false;
        }

        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }

        qint64 written = file.write(reinterpret_cast<const char*>(buffer.data()), buffer.size());
        file.close();

        return written == static_cast<qint64>(buffer.size());
    }

    /**
     * Read an image from disk with Unicode path support
     * @return OpenCV Mat (empty if failed)
     */
    static cv::Mat imreadUnicode(const QString& filePath, int flags = cv::IMREAD_COLOR)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            return cv::Mat();
        }

        QByteArray fileData = file.readAll();
        file.close();

        if (fileData.isEmpty()) {
            return cv::Mat();
        }

        std::vector<uchar> buffer(fileData.begin(), fileData.end());
        return cv::imdecode(buffer, flags);
    }
};

#endif // IMAGEIOHELPER_H
