#include "algorithms/lighting_correction/histogram_matcher.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

/**
 * @brief Match every channel of input to the corresponding channel of reference
 *
 * Channels are matched independently, so the result follows the reference in
 * brightness and colour balance while keeping the input's spatial content.
 *
 * @param input Input image
 * @param reference Reference image
 * @return Histogram-matched image
 */
cv::Mat HistogramMatcher::match(const cv::Mat &input, const cv::Mat &reference)
{
    if (input.empty()) {
        qWarning() << "HistogramMatcher: Empty input image";
        return cv::Mat();
    }

    if (reference.empty() || input.depth() != CV_8U || reference.depth() != CV_8U
        || input.channels() != reference.channels()) {
        qWarning() << "HistogramMatcher: Incompatible reference, returning original image";
        return input.clone();
    }

    try {
        std::vector<cv::Mat> inputChannels, referenceChannels;
        cv::split(input, inputChannels);
        cv::split(reference, referenceChannels);

        for (size_t c = 0; c < inputChannels.size(); ++c) {
            inputChannels[c] = matchChannel(inputChannels[c], referenceChannels[c]);
        }

        cv::Mat result;
        cv::merge(inputChannels, result);
        return result;

    } catch (const cv::Exception &e) {
        qWarning() << "HistogramMatcher: Histogram matching failed:" << e.what();
        return input.clone();
    }
}

cv::Mat HistogramMatcher::matchChannel(const cv::Mat &input, const cv::Mat &reference)
{
    std::vector<double> inputCDF = computeCDF(input);
    std::vector<double> referenceCDF = computeCDF(reference);

    std::vector<uchar> mapping = createHistogramMapping(inputCDF, referenceCDF);

    cv::Mat matched;
    cv::LUT(input, cv::Mat(1, 256, CV_8UC1, mapping.data()), matched);
    return matched;
}

/**
 * @brief Compute the normalized cumulative distribution of one channel
 *
 * @param channel Single 8-bit channel
 * @return CDF as 256 doubles, the last one equal to 1
 */
std::vector<double> HistogramMatcher::computeCDF(const cv::Mat &channel)
{
    int histSize = 256;
    float range[] = {0, 256};
    const float *histRange = {range};

    cv::Mat hist;
    cv::calcHist(&channel, 1, 0, cv::Mat(), hist, 1, &histSize, &histRange, true, false);

    std::vector<double> cdf(256, 0.0);
    double sum = 0.0;
    for (int i = 0; i < 256; ++i) {
        sum += hist.at<float>(i);
        cdf[i] = sum;
    }

    if (sum > 0.0) {
        for (double &value : cdf) {
            value /= sum;
        }
    }
    return cdf;
}

/**
 * @brief Create lookup table for histogram matching
 *
 * Each source level is sent to the first reference level whose CDF reaches the
 * source CDF, interpolating linearly with the level below it. Levels present in
 * the source always land on an exact reference level when both CDFs agree.
 *
 * @param sourceCDF CDF of source image
 * @param referenceCDF CDF of reference image
 * @return Lookup table mapping source values to reference values
 */
std::vector<uchar> HistogramMatcher::createHistogramMapping(const std::vector<double> &sourceCDF,
                                                            const std::vector<double> &referenceCDF)
{
    std::vector<uchar> mapping(256);

    for (int i = 0; i < 256; ++i) {
        const double value = sourceCDF[i];

        auto it = std::lower_bound(referenceCDF.begin(), referenceCDF.end(), value);
        if (it == referenceCDF.end()) {
            mapping[i] = 255;
            continue;
        }

        const int j = static_cast<int>(it - referenceCDF.begin());
        double level = static_cast<double>(j);
        if (j > 0 && *it > value) {
            const double lower = referenceCDF[j - 1];
            const double span = *it - lower;
            if (span > 0.0) {
                level = (j - 1) + (value - lower) / span;
            }
        }

        mapping[i] = static_cast<uchar>(std::clamp(std::lround(level), 0L, 255L));
    }

    return mapping;
}
