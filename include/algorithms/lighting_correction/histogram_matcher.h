#ifndef HISTOGRAM_MATCHER_H
#define HISTOGRAM_MATCHER_H

#include <opencv2/opencv.hpp>
#include <vector>

/**
 * @brief Per-channel histogram matching
 *
 * This class normalizes lighting introduced by synthesis:
 * - Computes 256-bin histograms for every channel of both images
 * - Builds a lookup table by interpolating the source CDF into the reference CDF
 * - Leaves an image matched against itself unchanged
 */
class HistogramMatcher
{
public:
    /**
     * @brief Match every channel of input to the corresponding channel of reference
     * @param input 8-bit image (1 to 4 channels)
     * @param reference 8-bit image with the same channel count, any size
     * @return Matched image, or a copy of input when matching is not possible
     */
    static cv::Mat match(const cv::Mat &input, const cv::Mat &reference);

    // Lookup table mapping source intensities onto reference intensities
    static std::vector<uchar> createHistogramMapping(const std::vector<double> &sourceCDF,
                                                     const std::vector<double> &referenceCDF);

    // Normalized cumulative distribution (last entry 1.0) of one 8-bit channel
    static std::vector<double> computeCDF(const cv::Mat &channel);

private:
    static cv::Mat matchChannel(const cv::Mat &input, const cv::Mat &reference);
};

#endif // HISTOGRAM_MATCHER_H
