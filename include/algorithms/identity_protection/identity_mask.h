#ifndef IDENTITY_MASK_H
#define IDENTITY_MASK_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "core/common_types.h"

/**
 * @brief Derives the final replace-mask with the face region hard-excluded
 *
 * The generative step only touches pixels where the mask is non-zero, so zeroing
 * the padded face rectangle keeps identity-bearing pixels out of its reach no
 * matter what the synthesizer does inside the mask.
 */
class IdentityMask
{
public:
    struct Result {
        cv::Mat mask;            // protected replace-mask, same size as the input mask
        cv::Rect protectedRect;  // empty when unprotected
        int candidateIndex = -1; // which candidate box was used, -1 when none
        bool isProtected = false;
    };

    /**
     * @brief Zero the padded rectangle of the first non-empty face candidate
     * @param baseMask CV_8UC1 replace-mask
     * @param candidates Face boxes in priority order (precise detector first)
     * @param padding Pixels added on every side before clipping
     * @return Protected mask; the input mask unchanged and isProtected == false
     *         when no candidate is present
     */
    static Result apply(const cv::Mat &baseMask,
                        const std::vector<OptionalBox> &candidates,
                        int padding);

    // Single-candidate convenience overload
    static Result apply(const cv::Mat &baseMask, const OptionalBox &faceBox, int padding);
};

#endif // IDENTITY_MASK_H
