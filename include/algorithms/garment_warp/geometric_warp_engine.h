#ifndef GEOMETRIC_WARP_ENGINE_H
#define GEOMETRIC_WARP_ENGINE_H

#include <opencv2/opencv.hpp>
#include "core/common_types.h"

struct WarpResult {
    enum class Path { ResizedFallback, HomographyOnly, ThinPlateSpline };

    cv::Mat warpedGarment; // CV_8UC3 at the target size
    cv::Mat placementMask; // pass-through of the target mask at the target size
    Path path = Path::ResizedFallback;

    bool fallbackUsed() const { return path != Path::ThinPlateSpline; }
};

const char *warpPathName(WarpResult::Path path);

/**
 * @brief Aligns garment pixels to the person's garment region
 *
 * Two phases:
 * - Coarse: RANSAC homography from the garment content box to the placement box
 * - Fine: thin-plate spline through eight boundary control points
 *
 * Degenerate geometry never raises. An empty box on either side yields the
 * garment resized to the target; a singular spline keeps the homography result.
 */
class GeometricWarpEngine
{
public:
    struct Settings {
        double ransacReprojThreshold = 5.0;
        int backgroundTolerance = 12; // max colour distance still counted as backdrop
    };

    GeometricWarpEngine();
    explicit GeometricWarpEngine(const Settings &settings);

    WarpResult warp(const cv::Mat &garment, const cv::Mat &placementMask, const cv::Size &targetSize) const;

    // Box of pixels that differ from the median border colour
    static OptionalBox garmentContentBox(const cv::Mat &garment, int tolerance);

private:
    bool refine(const cv::Mat &coarse, const BoundingBox &sourceBox, const BoundingBox &destinationBox,
                const cv::Mat &homography, cv::Mat &refined) const;

    Settings m_settings;
};

#endif // GEOMETRIC_WARP_ENGINE_H
