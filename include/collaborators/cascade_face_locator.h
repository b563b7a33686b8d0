#ifndef CASCADE_FACE_LOCATOR_H
#define CASCADE_FACE_LOCATOR_H

#include <QString>
#include <opencv2/objdetect.hpp>
#include <opencv2/opencv.hpp>
#include "core/collaborators.h"

// Haar cascade face detector; the largest detection wins
class CascadeFaceLocator : public FaceLocator
{
public:
    // An empty path tries the cascade locations of common OpenCV installs
    explicit CascadeFaceLocator(const QString &cascadePath = QString());

    bool isLoaded() const { return m_loaded; }

    // @throws CollaboratorUnavailableError when no cascade could be loaded
    OptionalBox locate(const cv::Mat &image) override;

private:
    cv::CascadeClassifier m_classifier;
    bool m_loaded;
};

#endif // CASCADE_FACE_LOCATOR_H
