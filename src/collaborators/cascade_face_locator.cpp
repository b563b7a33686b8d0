#include "collaborators/cascade_face_locator.h"
#include "core/pipeline_errors.h"
#include <QDebug>
#include <QStringList>
#include <vector>

CascadeFaceLocator::CascadeFaceLocator(const QString &cascadePath)
    : m_loaded(false)
{
    QStringList candidates;
    if (!cascadePath.isEmpty()) {
        candidates << cascadePath;
    } else {
        candidates << QStringLiteral("/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml")
                   << QStringLiteral("/usr/share/opencv/haarcascades/haarcascade_frontalface_default.xml")
                   << QStringLiteral("/usr/local/share/opencv4/haarcascades/haarcascade_frontalface_default.xml")
                   << QStringLiteral("haarcascade_frontalface_default.xml");
    }

    for (const QString &path : candidates) {
        if (m_classifier.load(path.toStdString())) {
            m_loaded = true;
            qDebug() << "CascadeFaceLocator: Loaded" << path;
            break;
        }
    }
    if (!m_loaded) {
        qWarning() << "CascadeFaceLocator: Face cascade not found, tried" << candidates;
    }
}

OptionalBox CascadeFaceLocator::locate(const cv::Mat &image)
{
    if (!m_loaded) {
        throw CollaboratorUnavailableError("CascadeFaceLocator: No face cascade loaded");
    }

    cv::Mat gray;
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    cv::equalizeHist(gray, gray);

    std::vector<cv::Rect> faces;
    m_classifier.detectMultiScale(gray, faces, 1.1, 3, 0, cv::Size(60, 60));
    if (faces.empty()) {
        return std::nullopt;
    }

    size_t largest = 0;
    for (size_t i = 1; i < faces.size(); ++i) {
        if (faces[i].area() > faces[largest].area()) {
            largest = i;
        }
    }

    const cv::Rect face = faces[largest] & cv::Rect(0, 0, image.cols, image.rows);
    // Boxes use inclusive corners
    return BoundingBox(face.x, face.y, face.x + face.width - 1, face.y + face.height - 1);
}
