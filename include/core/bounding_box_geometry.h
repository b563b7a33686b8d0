#ifndef BOUNDING_BOX_GEOMETRY_H
#define BOUNDING_BOX_GEOMETRY_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "core/common_types.h"

/**
 * @brief Pure bounding-box helpers shared by the mask, warp and blend stages
 */
namespace BoxGeometry {

/**
 * @brief Bounding box of all mask pixels strictly above the threshold
 * @param mask CV_8UC1 mask
 * @param threshold Pixel values <= threshold count as background
 * @return Inclusive extremes, or std::nullopt when no pixel qualifies
 */
OptionalBox bboxFromMask(const cv::Mat &mask, int threshold = 127);

/**
 * @brief Expand a box by padding on every side and clip it to the raster
 *
 * The result is half-open: [x1 - p, x2 + p) x [y1 - p, y2 + p) intersected
 * with [0, width) x [0, height). It may be empty when the box lies outside.
 */
cv::Rect padAndClip(const BoundingBox &box, int padding, const cv::Size &size);

// Copy of the mask with every pixel inside rect set to zero
cv::Mat zeroRect(const cv::Mat &mask, const cv::Rect &rect);

// Corners and edge midpoints, clockwise from the top-left corner, as (row, col)
std::vector<cv::Point2f> controlPoints(const BoundingBox &box);

// Corners only, as (x, y), in the same clockwise order
std::vector<cv::Point2f> cornerPoints(const BoundingBox &box);

} // namespace BoxGeometry

#endif // BOUNDING_BOX_GEOMETRY_H
