#ifndef OPENPOSE_DNN_PROVIDER_H
#define OPENPOSE_DNN_PROVIDER_H

#include <QString>
#include <opencv2/dnn.hpp>
#include <opencv2/opencv.hpp>
#include <vector>
#include "core/collaborators.h"

/**
 * @brief OpenPose BODY_25 keypoints through cv::dnn, drawn as a skeleton image
 *
 * The network is loaded once. Each call picks the heat-map maximum of every
 * keypoint and connects confident pairs on a black canvas of the input size,
 * which is the conditioning image the synthesizer expects.
 */
class OpenPoseDnnProvider : public PoseProvider
{
public:
    // @throws FatalPipelineError when the network cannot be loaded
    OpenPoseDnnProvider(const QString &modelPath, const QString &protoPath);

    PoseResult extractPose(const cv::Mat &image) override;

    std::vector<cv::Point> detectKeypoints(const cv::Mat &image);
    static cv::Mat drawSkeleton(const std::vector<cv::Point> &keypoints, const cv::Size &size);

    static constexpr int KeypointCount = 25;
    static constexpr float ConfidenceThreshold = 0.1f;

private:
    cv::dnn::Net m_net;
    cv::Size m_inputSize;
};

#endif // OPENPOSE_DNN_PROVIDER_H
