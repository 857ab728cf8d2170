#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QByteArray>
#include <QFile>
#include <QString>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <vector>

/**
 * Helper functions for in-memory image encoding and Unicode-safe file I/O
 *
 * Job results are handed to callers as encoded bytes, and OpenCV's
 * cv::imwrite()/cv::imread() do not support Unicode paths on Windows, so all
 * image I/O goes through cv::imencode()/cv::imdecode() and Qt's file APIs.
 */
class ImageIOHelper
{
public:
    /**
     * Encode an image as PNG (alpha channel preserved for BGRA input)
     * @param image OpenCV Mat to encode
     * @param compression PNG compression level (0-9)
     * @return Encoded bytes, empty if encoding failed
     */
    static QByteArray encodePng(const cv::Mat& image, int compression = 3)
    {
        if (image.empty()) {
            return QByteArray();
        }

        std::vector<uchar> buffer;
        std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, compression};
        if (!cv::imencode(".png", image, buffer, params)) {
            return QByteArray();
        }

        return QByteArray(reinterpret_cast<const char*>(buffer.data()), static_cast<int>(buffer.size()));
    }

    /**
     * Decode encoded image bytes
     * @param data Encoded image (PNG, JPEG, ...)
     * @param flags OpenCV imread flags (e.g., cv::IMREAD_UNCHANGED)
     * @return OpenCV Mat (empty if failed)
     */
    static cv::Mat decode(const QByteArray& data, int flags = cv::IMREAD_UNCHANGED)
    {
        if (data.isEmpty()) {
            return cv::Mat();
        }

        std::vector<uchar> buffer(data.begin(), data.end());
        return cv::imdecode(buffer, flags);
    }

    /**
     * Write raw bytes to disk with Unicode path support
     * @param filePath Destination path
     * @param data Bytes to write
     * @return true if every byte was written
     */
    static bool writeBytes(const QString& filePath, const QByteArray& data)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }

        qint64 written = file.write(data);
        file.close();

        return written == data.size();
    }

    /**
     * Load a source photo, keeping any alpha channel for the pipeline to flatten
     * @param filePath Image path (Unicode safe)
     * @param flags OpenCV imread flags
     * @return Decoded image, empty if the file is missing or not an image
     */
    static cv::Mat readImage(const QString& filePath, int flags = cv::IMREAD_UNCHANGED)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            return cv::Mat();
        }
        return decode(file.readAll(), flags);
    }
};

#endif // IMAGEIOHELPER_H
