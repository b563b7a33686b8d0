#include "collaborators/openpose_dnn_provider.h"
#include "core/pipeline_errors.h"
#include <QDebug>
#include <QElapsedTimer>

namespace {

// BODY_25 limb pairs
const int kPosePairs[][2] = {
    {1, 8},   {1, 2},   {1, 5},   {2, 3},   {3, 4},   {5, 6},   {6, 7},   {8, 9},
    {9, 10},  {10, 11}, {8, 12},  {12, 13}, {13, 14}, {1, 0},   {0, 15},  {15, 17},
    {0, 16},  {16, 18}, {14, 19}, {19, 20}, {14, 21}, {11, 22}, {22, 23}, {11, 24},
};

} // namespace

OpenPoseDnnProvider::OpenPoseDnnProvider(const QString &modelPath, const QString &protoPath)
    : m_inputSize(368, 368)
{
    try {
        m_net = cv::dnn::readNet(modelPath.toStdString(), protoPath.toStdString());
    } catch (const cv::Exception &e) {
        throw FatalPipelineError(std::string("OpenPoseDnnProvider: Failed to load network: ") + e.what());
    }
    if (m_net.empty()) {
        throw FatalPipelineError("OpenPoseDnnProvider: Network is empty after loading " + modelPath.toStdString());
    }
    qDebug() << "OpenPoseDnnProvider: Loaded" << modelPath;
}

std::vector<cv::Point> OpenPoseDnnProvider::detectKeypoints(const cv::Mat &image)
{
    std::vector<cv::Point> keypoints;

    cv::Mat blob;
    cv::dnn::blobFromImage(image, blob, 1.0 / 255.0, m_inputSize, cv::Scalar(0, 0, 0), false, false);
    m_net.setInput(blob);
    cv::Mat output = m_net.forward();

    const int heatH = output.size[2];
    const int heatW = output.size[3];

    for (int i = 0; i < KeypointCount; ++i) {
        cv::Mat heatMap(heatH, heatW, CV_32F, output.ptr(0, i));
        cv::Point maxLoc;
        double maxVal = 0.0;
        cv::minMaxLoc(heatMap, nullptr, &maxVal, nullptr, &maxLoc);

        if (maxVal > ConfidenceThreshold) {
            keypoints.emplace_back(maxLoc.x * image.cols / heatW, maxLoc.y * image.rows / heatH);
        } else {
            keypoints.emplace_back(-1, -1);
        }
    }
    return keypoints;
}

cv::Mat OpenPoseDnnProvider::drawSkeleton(const std::vector<cv::Point> &keypoints, const cv::Size &size)
{
    cv::Mat canvas = cv::Mat::zeros(size, CV_8UC3);
    const int thickness = std::max(2, size.width / 128);

    int pairIndex = 0;
    for (const auto &pair : kPosePairs) {
        if (pair[0] >= static_cast<int>(keypoints.size()) || pair[1] >= static_cast<int>(keypoints.size())) {
            continue;
        }
        const cv::Point &a = keypoints[pair[0]];
        const cv::Point &b = keypoints[pair[1]];
        if (a.x < 0 || b.x < 0) {
            continue;
        }
        // Distinct hue per limb, as the conditioning network was trained on
        cv::Mat hsv(1, 1, CV_8UC3, cv::Scalar(pairIndex * 180 / 24, 255, 255));
        cv::Mat bgr;
        cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
        const cv::Vec3b colour = bgr.at<cv::Vec3b>(0, 0);
        cv::line(canvas, a, b, cv::Scalar(colour[0], colour[1], colour[2]), thickness, cv::LINE_AA);
        ++pairIndex;
    }

    for (const cv::Point &point : keypoints) {
        if (point.x >= 0) {
            cv::circle(canvas, point, thickness + 1, cv::Scalar(255, 255, 255), cv::FILLED, cv::LINE_AA);
        }
    }
    return canvas;
}

PoseResult OpenPoseDnnProvider::extractPose(const cv::Mat &image)
{
    QElapsedTimer timer;
    timer.start();

    PoseResult result;
    try {
        const std::vector<cv::Point> keypoints = detectKeypoints(image);
        result.poseImage = drawSkeleton(keypoints, image.size());
    } catch (const cv::Exception &e) {
        throw FatalPipelineError(std::string("OpenPoseDnnProvider: Inference failed: ") + e.what());
    }

    qDebug() << "OpenPoseDnnProvider: Pose extracted in" << timer.elapsed() << "ms";
    return result;
}
