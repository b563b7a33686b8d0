#ifndef HUMAN_PARSING_H
#define HUMAN_PARSING_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "core/common_types.h"

/**
 * @brief Mask derivation from an 18-class human-parsing label map
 *
 * Label ids: 0 background, 1 hat, 2 hair, 3 sunglasses, 4 upper-clothes, 5 skirt,
 * 6 pants, 7 dress, 8 belt, 9 left shoe, 10 right shoe, 11 face, 12 left leg,
 * 13 right leg, 14 left arm, 15 right arm, 16 bag, 17 scarf.
 */
namespace HumanParsing {

constexpr int FaceLabel = 11;

const std::vector<int> &clothingLabels();
const std::vector<int> &bodyLabels();
std::vector<int> labelsForCategory(GarmentCategory category);

// 255 where the label map holds any of the given labels
cv::Mat maskForLabels(const cv::Mat &labelMap, const std::vector<int> &labels);

// Clothing, body and face masks plus the face bbox taken from label 11
SegmentationResult masksFromLabelMap(const cv::Mat &labelMap);

cv::Mat clothingMaskForCategory(const cv::Mat &labelMap, GarmentCategory category);

// Single elliptical dilation that grows the replace region past the garment edge
cv::Mat dilateMask(const cv::Mat &mask, int kernelSize);

} // namespace HumanParsing

#endif // HUMAN_PARSING_H
