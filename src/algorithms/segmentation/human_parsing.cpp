#include "algorithms/segmentation/human_parsing.h"
#include "core/bounding_box_geometry.h"
#include <QDebug>

namespace HumanParsing {

const std::vector<int> &clothingLabels()
{
    static const std::vector<int> labels = {4, 5, 6, 7, 8, 16, 17};
    return labels;
}

const std::vector<int> &bodyLabels()
{
    static const std::vector<int> labels = {11, 12, 13, 14, 15};
    return labels;
}

std::vector<int> labelsForCategory(GarmentCategory category)
{
    switch (category) {
    case GarmentCategory::Upper:
        return {4, 7, 17};
    case GarmentCategory::Lower:
        return {5, 6, 8};
    case GarmentCategory::Full:
        break;
    }
    return clothingLabels();
}

cv::Mat maskForLabels(const cv::Mat &labelMap, const std::vector<int> &labels)
{
    CV_Assert(labelMap.type() == CV_8UC1);

    cv::Mat mask = cv::Mat::zeros(labelMap.size(), CV_8UC1);
    for (int label : labels) {
        cv::Mat hit;
        cv::compare(labelMap, cv::Scalar(label), hit, cv::CMP_EQ);
        cv::bitwise_or(mask, hit, mask);
    }
    return mask;
}

SegmentationResult masksFromLabelMap(const cv::Mat &labelMap)
{
    std::vector<int> body = clothingLabels();
    body.insert(body.end(), bodyLabels().begin(), bodyLabels().end());

    SegmentationResult result;
    result.clothingMask = maskForLabels(labelMap, clothingLabels());
    result.bodyMask = maskForLabels(labelMap, body);
    result.faceMask = maskForLabels(labelMap, {FaceLabel});
    result.faceBox = BoxGeometry::bboxFromMask(result.faceMask);
    result.labelMap = labelMap.clone();

    if (result.faceBox) {
        qDebug() << "HumanParsing: Face bbox from labels" << result.faceBox->x1 << result.faceBox->y1
                 << result.faceBox->x2 << result.faceBox->y2;
    } else {
        qDebug() << "HumanParsing: No face label present";
    }
    return result;
}

cv::Mat clothingMaskForCategory(const cv::Mat &labelMap, GarmentCategory category)
{
    return maskForLabels(labelMap, labelsForCategory(category));
}

cv::Mat dilateMask(const cv::Mat &mask, int kernelSize)
{
    if (kernelSize <= 1) {
        return mask.clone();
    }
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(kernelSize, kernelSize));
    cv::Mat dilated;
    cv::dilate(mask, dilated, kernel, cv::Point(-1, -1), 1);
    return dilated;
}

} // namespace HumanParsing
