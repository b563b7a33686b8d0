#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <opencv2/opencv.hpp>
#include <QString>
#include <optional>

/**
 * @brief Common data structures shared across the pipeline stages
 *
 * Images travel between stages as cv::Mat:
 * - RasterImage: CV_8UC3, never modified in place by a stage
 * - Mask: CV_8UC1, 0 = keep original, 255 = replace, same size as its image
 */

struct BoundingBox {
    int x1, y1, x2, y2;
    double confidence;

    BoundingBox() : x1(0), y1(0), x2(0), y2(0), confidence(0.0) {}
    BoundingBox(int x1_, int y1_, int x2_, int y2_, double conf = 1.0)
        : x1(x1_), y1(y1_), x2(x2_), y2(y2_), confidence(conf) {}

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    bool isValid() const { return x1 <= x2 && y1 <= y2; }

    bool operator==(const BoundingBox &other) const
    {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
};

using OptionalBox = std::optional<BoundingBox>;

// Canonical garment taxonomy accepted at the job boundary
enum class GarmentCategory { Upper, Lower, Full };

QString garmentCategoryName(GarmentCategory category);

// Accepts "upper", "lower", "full" and the legacy "overall" spelling of full
std::optional<GarmentCategory> parseGarmentCategory(const QString &name);

struct SegmentationResult {
    cv::Mat clothingMask;
    cv::Mat bodyMask;
    cv::Mat faceMask;
    OptionalBox faceBox;
    cv::Mat labelMap; // CV_8UC1 per-pixel class ids, may be empty
};

struct PoseResult {
    cv::Mat poseImage; // skeleton visualisation, same size as the person image
};

#endif // COMMON_TYPES_H
