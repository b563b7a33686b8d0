#include "core/bounding_box_geometry.h"
#include <algorithm>

namespace BoxGeometry {

OptionalBox bboxFromMask(const cv::Mat &mask, int threshold)
{
    if (mask.empty()) {
        return std::nullopt;
    }

    CV_Assert(mask.type() == CV_8UC1);

    cv::Mat binary;
    cv::threshold(mask, binary, threshold, 255, cv::THRESH_BINARY);

    std::vector<cv::Point> points;
    cv::findNonZero(binary, points);
    if (points.empty()) {
        return std::nullopt;
    }

    // boundingRect is half-open, the box keeps inclusive extremes
    const cv::Rect rect = cv::boundingRect(points);
    return BoundingBox(rect.x, rect.y, rect.x + rect.width - 1, rect.y + rect.height - 1);
}

cv::Rect padAndClip(const BoundingBox &box, int padding, const cv::Size &size)
{
    const int x1 = std::max(0, box.x1 - padding);
    const int y1 = std::max(0, box.y1 - padding);
    const int x2 = std::min(size.width, box.x2 + padding);
    const int y2 = std::min(size.height, box.y2 + padding);

    if (x2 <= x1 || y2 <= y1) {
        return cv::Rect();
    }
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

cv::Mat zeroRect(const cv::Mat &mask, const cv::Rect &rect)
{
    cv::Mat result = mask.clone();
    const cv::Rect clipped = rect & cv::Rect(0, 0, mask.cols, mask.rows);
    if (clipped.area() > 0) {
        result(clipped).setTo(cv::Scalar::all(0));
    }
    return result;
}

std::vector<cv::Point2f> controlPoints(const BoundingBox &box)
{
    const float midX = static_cast<float>((box.x1 + box.x2) / 2);
    const float midY = static_cast<float>((box.y1 + box.y2) / 2);
    const float x1 = static_cast<float>(box.x1);
    const float y1 = static_cast<float>(box.y1);
    const float x2 = static_cast<float>(box.x2);
    const float y2 = static_cast<float>(box.y2);

    // cv::Point2f(row, col)
    return {
        cv::Point2f(y1, x1), cv::Point2f(y1, midX), cv::Point2f(y1, x2),
        cv::Point2f(midY, x2), cv::Point2f(y2, x2),
        cv::Point2f(y2, midX), cv::Point2f(y2, x1),
        cv::Point2f(midY, x1),
    };
}

std::vector<cv::Point2f> cornerPoints(const BoundingBox &box)
{
    return {
        cv::Point2f(static_cast<float>(box.x1), static_cast<float>(box.y1)),
        cv::Point2f(static_cast<float>(box.x2), static_cast<float>(box.y1)),
        cv::Point2f(static_cast<float>(box.x2), static_cast<float>(box.y2)),
        cv::Point2f(static_cast<float>(box.x1), static_cast<float>(box.y2)),
    };
}

} // namespace BoxGeometry
