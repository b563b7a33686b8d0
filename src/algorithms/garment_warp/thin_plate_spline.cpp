#include "algorithms/garment_warp/thin_plate_spline.h"
#include <QDebug>
#include <cmath>

ThinPlateSpline::ThinPlateSpline()
    : m_valid(false)
{
}

double ThinPlateSpline::kernel(double squaredDistance)
{
    if (squaredDistance <= 0.0) {
        return 0.0;
    }
    return squaredDistance * std::log(squaredDistance);
}

bool ThinPlateSpline::fit(const std::vector<cv::Point2f> &from, const std::vector<cv::Point2f> &to)
{
    m_valid = false;
    m_controlPoints.clear();
    m_coefficients.release();

    if (from.size() != to.size() || from.size() < 3) {
        qWarning() << "ThinPlateSpline: Need at least 3 matching control points, got"
                   << from.size() << "and" << to.size();
        return false;
    }

    const int n = static_cast<int>(from.size());
    for (const cv::Point2f &p : from) {
        m_controlPoints.emplace_back(p.x, p.y);
    }

    // Coincident controls make the system singular; LU would not always notice
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            const cv::Point2d d = m_controlPoints[i] - m_controlPoints[j];
            if (d.dot(d) < 1e-12) {
                qDebug() << "ThinPlateSpline: Control points" << i << "and" << j << "coincide";
                m_controlPoints.clear();
                return false;
            }
        }
    }

    // | K   P | |w|   |v|
    // | P^T 0 | |a| = |0|
    cv::Mat L = cv::Mat::zeros(n + 3, n + 3, CV_64F);
    cv::Mat rhs = cv::Mat::zeros(n + 3, 2, CV_64F);

    for (int i = 0; i < n; ++i) {
        const cv::Point2d &pi = m_controlPoints[i];
        for (int j = 0; j < n; ++j) {
            const cv::Point2d d = pi - m_controlPoints[j];
            L.at<double>(i, j) = kernel(d.dot(d));
        }
        L.at<double>(i, n) = 1.0;
        L.at<double>(i, n + 1) = pi.x;
        L.at<double>(i, n + 2) = pi.y;
        L.at<double>(n, i) = 1.0;
        L.at<double>(n + 1, i) = pi.x;
        L.at<double>(n + 2, i) = pi.y;

        rhs.at<double>(i, 0) = to[i].x;
        rhs.at<double>(i, 1) = to[i].y;
    }

    cv::Mat coefficients;
    if (!cv::solve(L, rhs, coefficients, cv::DECOMP_LU)) {
        qDebug() << "ThinPlateSpline: Singular system for" << n << "control points";
        return false;
    }

    if (!cv::checkRange(coefficients)) {
        qDebug() << "ThinPlateSpline: Non-finite coefficients";
        return false;
    }

    m_coefficients = coefficients;
    m_valid = true;
    return true;
}

cv::Point2f ThinPlateSpline::map(const cv::Point2f &point) const
{
    if (!m_valid) {
        return point;
    }

    const int n = static_cast<int>(m_controlPoints.size());
    const double *a0 = m_coefficients.ptr<double>(n);
    const double *a1 = m_coefficients.ptr<double>(n + 1);
    const double *a2 = m_coefficients.ptr<double>(n + 2);

    double row = a0[0] + a1[0] * point.x + a2[0] * point.y;
    double col = a0[1] + a1[1] * point.x + a2[1] * point.y;

    for (int i = 0; i < n; ++i) {
        const double dr = point.x - m_controlPoints[i].x;
        const double dc = point.y - m_controlPoints[i].y;
        const double u = kernel(dr * dr + dc * dc);
        const double *w = m_coefficients.ptr<double>(i);
        row += w[0] * u;
        col += w[1] * u;
    }

    return cv::Point2f(static_cast<float>(row), static_cast<float>(col));
}

bool ThinPlateSpline::buildRemapMaps(const cv::Size &size, cv::Mat &mapX, cv::Mat &mapY) const
{
    if (!m_valid) {
        return false;
    }

    mapX.create(size, CV_32FC1);
    mapY.create(size, CV_32FC1);

    for (int r = 0; r < size.height; ++r) {
        float *xs = mapX.ptr<float>(r);
        float *ys = mapY.ptr<float>(r);
        for (int c = 0; c < size.width; ++c) {
            const cv::Point2f source = map(cv::Point2f(static_cast<float>(r), static_cast<float>(c)));
            ys[c] = source.x;
            xs[c] = source.y;
        }
    }

    return cv::checkRange(mapX) && cv::checkRange(mapY);
}
