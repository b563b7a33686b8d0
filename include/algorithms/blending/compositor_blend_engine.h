#ifndef COMPOSITOR_BLEND_ENGINE_H
#define COMPOSITOR_BLEND_ENGINE_H

#include <opencv2/opencv.hpp>
#include "core/common_types.h"

struct BlendResult {
    cv::Mat image;
    bool seamlessCloneUsed = false;
    bool alphaFallbackUsed = false; // seamless clone failed or had nothing to clone
    bool identityRestored = false;
    cv::Rect restoredRect;
};

/**
 * @brief Merges synthesized content back into the original photo
 *
 * 1. Erode the clothing mask so the seam sits inside the garment edge
 * 2. Poisson-clone the generated region into the original (alpha blend on failure)
 * 3. Paste the original face back through a feathered alpha
 * 4. Match channel histograms to the original to undo lighting drift
 */
class CompositorBlendEngine
{
public:
    struct Settings {
        int erosionKernel = 15;
        int erosionIterations = 2;
        int maxFeatherKernel = 51;
    };

    CompositorBlendEngine();
    explicit CompositorBlendEngine(const Settings &settings);

    /**
     * @brief Blend the generated canvas over the original person photo
     * @param original Person image, CV_8UC3
     * @param generated Synthesized image; resized to the original when sizes differ
     * @param clothingMask Replace-mask of the garment region, CV_8UC1
     * @param faceBox Optional face box to restore from the original
     * @param facePadding Padding applied to faceBox before restoring
     */
    BlendResult blend(const cv::Mat &original, const cv::Mat &generated, const cv::Mat &clothingMask,
                      const OptionalBox &faceBox, int facePadding) const;

    // result = a * foreground + (1 - a) * background with a = mask / 255
    static cv::Mat alphaComposite(const cv::Mat &foreground, const cv::Mat &background, const cv::Mat &mask);

    // Smoothed uniform field of the given size, peak normalised to 1, CV_32FC1
    cv::Mat featherField(const cv::Size &size) const;

    // Paste the original pixels inside rect back over composite through the feather
    cv::Mat restoreRegion(const cv::Mat &composite, const cv::Mat &original, const cv::Rect &rect) const;

private:
    Settings m_settings;
};

#endif // COMPOSITOR_BLEND_ENGINE_H
