#ifndef THIN_PLATE_SPLINE_H
#define THIN_PLATE_SPLINE_H

#include <opencv2/opencv.hpp>
#include <vector>

/**
 * @brief Interpolating 2D thin-plate spline, U(r) = r^2 log r^2
 *
 * Points are (row, col) stored in cv::Point2f(x = row, y = col). The fitted
 * function maps every control point exactly onto its target and bends as
 * little as possible in between.
 */
class ThinPlateSpline
{
public:
    ThinPlateSpline();

    /**
     * @brief Solve for the spline coefficients
     * @return false when the system is singular (repeated or collinear control
     *         points) or the solution is not finite
     */
    bool fit(const std::vector<cv::Point2f> &from, const std::vector<cv::Point2f> &to);

    bool isValid() const { return m_valid; }

    cv::Point2f map(const cv::Point2f &point) const;

    /**
     * @brief Backward maps for cv::remap over a raster of the given size
     * @param mapX CV_32FC1 source column for every destination pixel
     * @param mapY CV_32FC1 source row for every destination pixel
     * @return false when the spline is not valid or produced non-finite values
     */
    bool buildRemapMaps(const cv::Size &size, cv::Mat &mapX, cv::Mat &mapY) const;

private:
    static double kernel(double squaredDistance);

    std::vector<cv::Point2d> m_controlPoints;
    cv::Mat m_coefficients; // (n + 3) x 2, CV_64F
    bool m_valid;
};

#endif // THIN_PLATE_SPLINE_H
