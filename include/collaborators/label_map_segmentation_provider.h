#ifndef LABEL_MAP_SEGMENTATION_PROVIDER_H
#define LABEL_MAP_SEGMENTATION_PROVIDER_H

#include <QString>
#include <opencv2/opencv.hpp>
#include "core/collaborators.h"

/**
 * @brief Segmentation from a precomputed human-parsing label map
 *
 * The label map (one class id per pixel, see HumanParsing) comes from an
 * external parsing model run on the original photo. When the photo size is
 * known the map goes through the same letterbox as the photo (ImageValidator),
 * so labels land on the right canvas pixels; otherwise it is assumed to cover
 * the canvas already and is only resized. Sampling is nearest-neighbour so
 * class ids survive.
 */
class LabelMapSegmentationProvider : public SegmentationProvider
{
public:
    explicit LabelMapSegmentationProvider(const cv::Mat &labelMap, const cv::Size &photoSize = cv::Size());

    // @throws FatalPipelineError when the file cannot be read as a single-channel map
    static LabelMapSegmentationProvider fromFile(const QString &path, const cv::Size &photoSize = cv::Size());

    SegmentationResult segment(const cv::Mat &image) override;

private:
    cv::Mat m_labelMap;
    cv::Size m_photoSize;
};

#endif // LABEL_MAP_SEGMENTATION_PROVIDER_H
