#include "collaborators/label_map_segmentation_provider.h"
#include "algorithms/segmentation/human_parsing.h"
#include "core/image_validator.h"
#include "core/pipeline_errors.h"
#include <QDebug>

LabelMapSegmentationProvider::LabelMapSegmentationProvider(const cv::Mat &labelMap, const cv::Size &photoSize)
    : m_labelMap(labelMap)
    , m_photoSize(photoSize)
{
}

LabelMapSegmentationProvider LabelMapSegmentationProvider::fromFile(const QString &path, const cv::Size &photoSize)
{
    cv::Mat labelMap = cv::imread(path.toStdString(), cv::IMREAD_UNCHANGED);
    if (labelMap.empty()) {
        throw FatalPipelineError("LabelMapSegmentationProvider: Cannot read label map " + path.toStdString());
    }
    if (labelMap.channels() != 1 || labelMap.depth() != CV_8U) {
        throw FatalPipelineError("LabelMapSegmentationProvider: Label map must be a single-channel 8-bit image");
    }
    qDebug() << "LabelMapSegmentationProvider: Loaded" << path << labelMap.cols << "x" << labelMap.rows;
    return LabelMapSegmentationProvider(labelMap, photoSize);
}

SegmentationResult LabelMapSegmentationProvider::segment(const cv::Mat &image)
{
    if (m_labelMap.empty()) {
        throw FatalPipelineError("LabelMapSegmentationProvider: No label map loaded");
    }

    if (m_labelMap.type() != CV_8UC1) {
        throw FatalPipelineError("LabelMapSegmentationProvider: Label map must be a single-channel 8-bit image");
    }

    cv::Mat labels = m_labelMap;
    if (!m_photoSize.empty() && image.rows == image.cols) {
        labels = ImageValidator::letterboxLabels(m_labelMap, m_photoSize, image.cols);
    } else if (labels.size() != image.size()) {
        if (!m_photoSize.empty()) {
            qWarning() << "LabelMapSegmentationProvider: Canvas" << image.cols << "x" << image.rows
                       << "is not square, stretching the label map";
        }
        cv::resize(m_labelMap, labels, image.size(), 0, 0, cv::INTER_NEAREST);
    }
    return HumanParsing::masksFromLabelMap(labels);
}
