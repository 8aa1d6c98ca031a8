#ifndef CANVAS_H
#define CANVAS_H

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <vector>

/**
 * Flat RGBA byte buffer, row-major, four bytes per pixel
 */
using PixelBuffer = std::vector<uint8_t>;

/**
 * RGBA8888 pixel surface
 *
 * Backed by a continuous CV_8UC4 cv::Mat in R,G,B,A channel order.
 * Copies are deep; moves transfer the pixel storage.
 */
class Canvas {
public:
    Canvas() = default;
    Canvas(int width, int height);

    Canvas(const Canvas& other);
    Canvas& operator=(const Canvas& other);
    Canvas(Canvas&& other) = default;
    Canvas& operator=(Canvas&& other) = default;

    /**
     * Wrap a copy of an existing RGBA matrix
     * @param rgba CV_8UC4 matrix in RGBA order
     * @return Canvas holding a deep copy
     */
    static Canvas fromMat(const cv::Mat& rgba);

    int width() const { return m_pixels.cols; }
    int height() const { return m_pixels.rows; }
    bool isEmpty() const { return m_pixels.empty(); }

    /**
     * Change the surface size. Contents are cleared to transparent black;
     * storage is kept when the size does not change.
     */
    void resize(int width, int height);

    /**
     * Reset every byte to zero
     */
    void clear();

    void fill(const cv::Scalar& rgba);

    /**
     * Copy the pixels out as a flat RGBA buffer
     * @return Buffer of width*height*4 bytes
     * @throws DiffException (CanvasError) when the surface holds no pixels
     */
    PixelBuffer getImageData() const;

    /**
     * Overwrite the pixels from a flat RGBA buffer of the current size
     * @throws DiffException (CanvasError) on a length mismatch
     */
    void putImageData(const PixelBuffer& data);
    void putImageData(const cv::Mat& rgba);

    /**
     * Scale src to w x h and composite it (source-over) with its top-left corner
     * at (x, y). Coordinates are rounded to whole pixels and the result is
     * clipped to this surface.
     */
    void drawImage(const Canvas& src, double x, double y, double w, double h);

    const cv::Mat& pixels() const { return m_pixels; }
    cv::Mat& pixels() { return m_pixels; }

private:
    cv::Mat m_pixels;
};

#endif // CANVAS_H
