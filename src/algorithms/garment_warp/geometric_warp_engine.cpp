#include "algorithms/garment_warp/geometric_warp_engine.h"
#include "algorithms/garment_warp/thin_plate_spline.h"
#include "core/bounding_box_geometry.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <vector>

const char *warpPathName(WarpResult::Path path)
{
    switch (path) {
    case WarpResult::Path::ResizedFallback:
        return "resized-fallback";
    case WarpResult::Path::HomographyOnly:
        return "homography-only";
    case WarpResult::Path::ThinPlateSpline:
        return "thin-plate-spline";
    }
    return "unknown";
}

GeometricWarpEngine::GeometricWarpEngine()
    : m_settings()
{
}

GeometricWarpEngine::GeometricWarpEngine(const Settings &settings)
    : m_settings(settings)
{
}

OptionalBox GeometricWarpEngine::garmentContentBox(const cv::Mat &garment, int tolerance)
{
    if (garment.empty() || garment.type() != CV_8UC3) {
        return std::nullopt;
    }

    // Estimate the backdrop from the one-pixel frame
    std::vector<uchar> border[3];
    auto collect = [&](const cv::Vec3b &px) {
        for (int c = 0; c < 3; ++c) {
            border[c].push_back(px[c]);
        }
    };
    for (int x = 0; x < garment.cols; ++x) {
        collect(garment.at<cv::Vec3b>(0, x));
        collect(garment.at<cv::Vec3b>(garment.rows - 1, x));
    }
    for (int y = 0; y < garment.rows; ++y) {
        collect(garment.at<cv::Vec3b>(y, 0));
        collect(garment.at<cv::Vec3b>(y, garment.cols - 1));
    }

    cv::Scalar background;
    for (int c = 0; c < 3; ++c) {
        auto mid = border[c].begin() + border[c].size() / 2;
        std::nth_element(border[c].begin(), mid, border[c].end());
        background[c] = *mid;
    }

    cv::Mat difference;
    cv::absdiff(garment, background, difference);
    std::vector<cv::Mat> channels;
    cv::split(difference, channels);
    cv::Mat distance;
    cv::max(channels[0], channels[1], distance);
    cv::max(distance, channels[2], distance);

    return BoxGeometry::bboxFromMask(distance, tolerance);
}

WarpResult GeometricWarpEngine::warp(const cv::Mat &garment, const cv::Mat &placementMask,
                                     const cv::Size &targetSize) const
{
    CV_Assert(!garment.empty());
    CV_Assert(targetSize.width > 0 && targetSize.height > 0);

    QElapsedTimer warpTimer;
    warpTimer.start();

    WarpResult result;

    cv::Mat resizedGarment;
    cv::resize(garment, resizedGarment, targetSize, 0, 0, cv::INTER_LINEAR);

    if (placementMask.empty()) {
        result.placementMask = cv::Mat::zeros(targetSize, CV_8UC1);
    } else if (placementMask.size() != targetSize) {
        cv::resize(placementMask, result.placementMask, targetSize, 0, 0, cv::INTER_NEAREST);
    } else {
        result.placementMask = placementMask.clone();
    }

    const OptionalBox sourceBox = garmentContentBox(resizedGarment, m_settings.backgroundTolerance);
    const OptionalBox destinationBox = BoxGeometry::bboxFromMask(result.placementMask);

    if (!sourceBox || !destinationBox) {
        qWarning() << "GeometricWarpEngine: No valid bounding box"
                   << (sourceBox ? "" : "(garment)") << (destinationBox ? "" : "(placement)")
                   << "- returning resized garment";
        result.warpedGarment = resizedGarment;
        result.path = WarpResult::Path::ResizedFallback;
        return result;
    }

    // Coarse alignment
    cv::Mat homography;
    try {
        homography = cv::findHomography(BoxGeometry::cornerPoints(*sourceBox),
                                        BoxGeometry::cornerPoints(*destinationBox),
                                        cv::RANSAC, m_settings.ransacReprojThreshold);
    } catch (const cv::Exception &e) {
        qWarning() << "GeometricWarpEngine: Homography estimation failed:" << e.what();
        homography.release();
    }

    if (homography.empty() || !cv::checkRange(homography)) {
        qWarning() << "GeometricWarpEngine: Degenerate homography - returning resized garment";
        result.warpedGarment = resizedGarment;
        result.path = WarpResult::Path::ResizedFallback;
        return result;
    }

    cv::Mat coarse;
    cv::warpPerspective(resizedGarment, coarse, homography, targetSize,
                        cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0));

    // Non-rigid refinement
    cv::Mat refined;
    if (refine(coarse, *sourceBox, *destinationBox, homography, refined)) {
        result.warpedGarment = refined;
        result.path = WarpResult::Path::ThinPlateSpline;
    } else {
        qDebug() << "GeometricWarpEngine: Spline refinement degenerate - using homography only";
        result.warpedGarment = coarse;
        result.path = WarpResult::Path::HomographyOnly;
    }

    qint64 warpTime = warpTimer.elapsed();
    qDebug() << "GeometricWarpEngine: Warp" << warpPathName(result.path) << "in" << warpTime << "ms for"
             << targetSize.width << "x" << targetSize.height;

    return result;
}

bool GeometricWarpEngine::refine(const cv::Mat &coarse, const BoundingBox &sourceBox,
                                 const BoundingBox &destinationBox, const cv::Mat &homography,
                                 cv::Mat &refined) const
{
    const std::vector<cv::Point2f> sourceControl = BoxGeometry::controlPoints(sourceBox);
    const std::vector<cv::Point2f> destinationControl = BoxGeometry::controlPoints(destinationBox);

    // Where the source control points sit after the homography, (x, y) for OpenCV
    std::vector<cv::Point2f> sourceXY;
    sourceXY.reserve(sourceControl.size());
    for (const cv::Point2f &rc : sourceControl) {
        sourceXY.emplace_back(rc.y, rc.x);
    }

    std::vector<cv::Point2f> projectedXY;
    try {
        cv::perspectiveTransform(sourceXY, projectedXY, homography);
    } catch (const cv::Exception &e) {
        qDebug() << "GeometricWarpEngine: Control point projection failed:" << e.what();
        return false;
    }

    std::vector<cv::Point2f> projectedRC;
    projectedRC.reserve(projectedXY.size());
    for (const cv::Point2f &xy : projectedXY) {
        projectedRC.emplace_back(xy.y, xy.x);
    }

    // Backward field: destination pixel -> position in the homography raster
    ThinPlateSpline spline;
    if (!spline.fit(destinationControl, projectedRC)) {
        return false;
    }

    cv::Mat mapX, mapY;
    if (!spline.buildRemapMaps(coarse.size(), mapX, mapY)) {
        return false;
    }

    try {
        cv::remap(coarse, refined, mapX, mapY, cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0));
    } catch (const cv::Exception &e) {
        qDebug() << "GeometricWarpEngine: Remap failed:" << e.what();
        return false;
    }
    return true;
}
