#include "core/image_validator.h"
#include "core/pipeline_errors.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <vector>

ImageValidator::ImageValidator(int maxUploadMb, int canvasSize)
    : m_maxBytes(static_cast<qint64>(std::max(0, maxUploadMb)) * 1024 * 1024)
    , m_canvasSize(canvasSize)
{
}

ImageValidator::ImageFormat ImageValidator::detectFormat(const QByteArray &bytes)
{
    if (bytes.size() >= 3 && static_cast<uchar>(bytes[0]) == 0xFF && static_cast<uchar>(bytes[1]) == 0xD8
        && static_cast<uchar>(bytes[2]) == 0xFF) {
        return ImageFormat::Jpeg;
    }
    if (bytes.startsWith(QByteArray("\x89PNG\r\n\x1a\n", 8))) {
        return ImageFormat::Png;
    }
    if (bytes.size() >= 12 && bytes.startsWith("RIFF") && bytes.mid(8, 4) == "WEBP") {
        return ImageFormat::WebP;
    }
    return ImageFormat::Unknown;
}

cv::Mat ImageValidator::decode(const QByteArray &bytes, const QString &label) const
{
    if (bytes.isEmpty()) {
        throw InputValidationError(QStringLiteral("%1 image is empty").arg(label).toStdString());
    }
    if (bytes.size() > m_maxBytes) {
        throw InputValidationError(QStringLiteral("%1 image exceeds %2MB limit")
                                       .arg(label)
                                       .arg(m_maxBytes / (1024 * 1024))
                                       .toStdString());
    }
    if (detectFormat(bytes) == ImageFormat::Unknown) {
        throw InputValidationError(
            QStringLiteral("%1 image has an unsupported type (expected JPEG, PNG or WebP)").arg(label).toStdString());
    }

    std::vector<uchar> buffer(bytes.constBegin(), bytes.constEnd());
    cv::Mat image;
    try {
        // IMREAD_COLOR honours the EXIF orientation tag
        image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    } catch (const cv::Exception &e) {
        qWarning() << "ImageValidator: Decoder error for" << label << ":" << e.what();
    }
    if (image.empty()) {
        throw InputValidationError(QStringLiteral("%1 image could not be decoded").arg(label).toStdString());
    }
    return image;
}

cv::Rect ImageValidator::placement(const cv::Size &source, int canvasSize)
{
    if (source.width <= 0 || source.height <= 0 || canvasSize <= 0) {
        return cv::Rect();
    }

    const double scale = std::min({1.0, static_cast<double>(canvasSize) / source.width,
                                   static_cast<double>(canvasSize) / source.height});
    cv::Size scaledSize = source;
    if (scale < 1.0) {
        scaledSize = cv::Size(std::max(1, static_cast<int>(std::lround(source.width * scale))),
                              std::max(1, static_cast<int>(std::lround(source.height * scale))));
    }

    return cv::Rect((canvasSize - scaledSize.width) / 2, (canvasSize - scaledSize.height) / 2,
                    scaledSize.width, scaledSize.height);
}

cv::Mat ImageValidator::letterbox(const cv::Mat &image) const
{
    cv::Mat canvas(m_canvasSize, m_canvasSize, CV_8UC3, cv::Scalar(255, 255, 255));

    const cv::Rect region = placement(image.size(), m_canvasSize);
    cv::Mat scaled = image;
    if (region.size() != image.size()) {
        cv::resize(image, scaled, region.size(), 0, 0, cv::INTER_LANCZOS4);
    }
    scaled.copyTo(canvas(region));
    return canvas;
}

cv::Mat ImageValidator::letterboxLabels(const cv::Mat &labels, const cv::Size &photoSize, int canvasSize)
{
    CV_Assert(labels.type() == CV_8UC1);

    cv::Mat canvas = cv::Mat::zeros(canvasSize, canvasSize, CV_8UC1);
    const cv::Rect region = placement(photoSize, canvasSize);
    if (region.area() <= 0) {
        return canvas;
    }

    // Class ids must survive, so nearest-neighbour only
    cv::Mat scaled = labels;
    if (labels.size() != region.size()) {
        cv::resize(labels, scaled, region.size(), 0, 0, cv::INTER_NEAREST);
    }
    scaled.copyTo(canvas(region));
    return canvas;
}

cv::Mat ImageValidator::prepare(const QByteArray &bytes, const QString &label) const
{
    return letterbox(decode(bytes, label));
}

cv::Mat ImageValidator::prepare(const cv::Mat &image, const QString &label) const
{
    if (image.empty()) {
        throw InputValidationError(QStringLiteral("%1 image is empty").arg(label).toStdString());
    }
    if (image.depth() != CV_8U) {
        throw InputValidationError(QStringLiteral("%1 image must have 8-bit channels").arg(label).toStdString());
    }

    cv::Mat bgr;
    switch (image.channels()) {
    case 1:
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 3:
        bgr = image;
        break;
    case 4:
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        throw InputValidationError(
            QStringLiteral("%1 image has %2 channels").arg(label).arg(image.channels()).toStdString());
    }
    return letterbox(bgr);
}
