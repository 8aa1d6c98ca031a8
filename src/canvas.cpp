#include "canvas.h"
#include "errorhandler.h"
#include <cmath>
#include <cstring>

Canvas::Canvas(int width, int height) {
    resize(width, height);
}

Canvas::Canvas(const Canvas& other)
    : m_pixels(other.m_pixels.clone()) {
}

Canvas& Canvas::operator=(const Canvas& other) {
    if (this != &other) {
        other.m_pixels.copyTo(m_pixels);
    }
    return *this;
}

Canvas Canvas::fromMat(const cv::Mat& rgba) {
    CV_Assert(rgba.type() == CV_8UC4);
    Canvas canvas;
    canvas.m_pixels = rgba.clone();
    return canvas;
}

void Canvas::resize(int width, int height) {
    if (width <= 0 || height <= 0) {
        m_pixels.release();
        return;
    }
    m_pixels.create(height, width, CV_8UC4);
    m_pixels.setTo(cv::Scalar::all(0));
}

void Canvas::clear() {
    if (!m_pixels.empty()) {
        m_pixels.setTo(cv::Scalar::all(0));
    }
}

void Canvas::fill(const cv::Scalar& rgba) {
    if (!m_pixels.empty()) {
        m_pixels.setTo(rgba);
    }
}

PixelBuffer Canvas::getImageData() const {
    if (m_pixels.empty()) {
        throw DiffException(ErrorType::CanvasError, "Canvas has no pixel data to read");
    }

    PixelBuffer data(m_pixels.total() * 4);
    if (m_pixels.isContinuous()) {
        std::memcpy(data.data(), m_pixels.data, data.size());
    } else {
        size_t rowBytes = static_cast<size_t>(m_pixels.cols) * 4;
        for (int y = 0; y < m_pixels.rows; ++y) {
            std::memcpy(data.data() + y * rowBytes, m_pixels.ptr(y), rowBytes);
        }
    }
    return data;
}

void Canvas::putImageData(const PixelBuffer& data) {
    if (data.size() != m_pixels.total() * 4) {
        throw DiffException(ErrorType::CanvasError,
                            "Image data length " + std::to_string(data.size()) +
                            " does not match canvas size " + std::to_string(width()) +
                            "x" + std::to_string(height()));
    }
    if (data.empty()) {
        return;
    }

    cv::Mat view(m_pixels.rows, m_pixels.cols, CV_8UC4, const_cast<uint8_t*>(data.data()));
    view.copyTo(m_pixels);
}

void Canvas::putImageData(const cv::Mat& rgba) {
    if (rgba.type() != CV_8UC4 || rgba.rows != m_pixels.rows || rgba.cols != m_pixels.cols) {
        throw DiffException(ErrorType::CanvasError, "Image data does not match canvas size or format");
    }
    rgba.copyTo(m_pixels);
}

void Canvas::drawImage(const Canvas& src, double x, double y, double w, double h) {
    int drawWidth = static_cast<int>(std::lround(w));
    int drawHeight = static_cast<int>(std::lround(h));
    if (src.isEmpty() || isEmpty() || drawWidth <= 0 || drawHeight <= 0) {
        return;
    }

    cv::Mat scaled;
    if (drawWidth == src.width() && drawHeight == src.height()) {
        scaled = src.m_pixels;
    } else {
        int interpolation = (drawWidth < src.width()) ? cv::INTER_AREA : cv::INTER_LINEAR;
        cv::resize(src.m_pixels, scaled, cv::Size(drawWidth, drawHeight), 0, 0, interpolation);
    }

    int originX = static_cast<int>(std::lround(x));
    int originY = static_cast<int>(std::lround(y));
    cv::Rect target = cv::Rect(originX, originY, drawWidth, drawHeight) & cv::Rect(0, 0, width(), height());
    if (target.empty()) {
        return;
    }

    cv::Mat source = scaled(cv::Rect(target.x - originX, target.y - originY, target.width, target.height));
    cv::Mat dest = m_pixels(target);

    for (int row = 0; row < target.height; ++row) {
        const uchar* s = source.ptr<uchar>(row);
        uchar* d = dest.ptr<uchar>(row);
        for (int col = 0; col < target.width; ++col, s += 4, d += 4) {
            int alpha = s[3];
            if (alpha == 255) {
                d[0] = s[0];
                d[1] = s[1];
                d[2] = s[2];
                d[3] = 255;
            } else if (alpha > 0) {
                double a = alpha / 255.0;
                for (int c = 0; c < 3; ++c) {
                    d[c] = cv::saturate_cast<uchar>(s[c] * a + d[c] * (1.0 - a));
                }
                d[3] = cv::saturate_cast<uchar>(alpha + d[3] * (1.0 - a));
            }
        }
    }
}
