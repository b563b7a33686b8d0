#ifndef IMAGE_VALIDATOR_H
#define IMAGE_VALIDATOR_H

#include <QByteArray>
#include <QString>
#include <QtGlobal>
#include <opencv2/opencv.hpp>

/**
 * @brief Admission checks and canvas normalisation for uploaded images
 *
 * Everything rejected here throws InputValidationError and never reaches the
 * pipeline. Accepted images come out as CV_8UC3 on a white square canvas.
 */
class ImageValidator
{
public:
    enum class ImageFormat { Unknown, Jpeg, Png, WebP };

    ImageValidator(int maxUploadMb, int canvasSize);

    // Size and container checks, then decode and letterbox
    cv::Mat prepare(const QByteArray &bytes, const QString &label) const;

    // Channel normalisation and letterbox for an already decoded image
    cv::Mat prepare(const cv::Mat &image, const QString &label) const;

    cv::Mat decode(const QByteArray &bytes, const QString &label) const;

    // Downscale only, aspect preserved, centred on white
    cv::Mat letterbox(const cv::Mat &image) const;

    // Canvas region a photo of the given size occupies after letterbox()
    static cv::Rect placement(const cv::Size &source, int canvasSize);

    /**
     * @brief Same letterbox transform for a per-pixel label map of the photo
     * @param labels CV_8UC1 class ids, at the photo's resolution or any other
     * @param photoSize Size of the photo the labels belong to
     * @return canvasSize x canvasSize map, label 0 outside the photo
     */
    static cv::Mat letterboxLabels(const cv::Mat &labels, const cv::Size &photoSize, int canvasSize);

    static ImageFormat detectFormat(const QByteArray &bytes);

    qint64 maxBytes() const { return m_maxBytes; }
    int canvasSize() const { return m_canvasSize; }

private:
    qint64 m_maxBytes;
    int m_canvasSize;
};

#endif // IMAGE_VALIDATOR_H
