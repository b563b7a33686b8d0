#include "algorithms/blending/compositor_blend_engine.h"
#include "algorithms/lighting_correction/histogram_matcher.h"
#include "core/bounding_box_geometry.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>

CompositorBlendEngine::CompositorBlendEngine()
    : m_settings()
{
}

CompositorBlendEngine::CompositorBlendEngine(const Settings &settings)
    : m_settings(settings)
{
}

cv::Mat CompositorBlendEngine::alphaComposite(const cv::Mat &foreground, const cv::Mat &background,
                                              const cv::Mat &mask)
{
    CV_Assert(foreground.size() == background.size() && foreground.type() == background.type());
    CV_Assert(mask.size() == background.size() && mask.type() == CV_8UC1);

    cv::Mat alpha;
    mask.convertTo(alpha, CV_32F, 1.0 / 255.0);
    std::vector<cv::Mat> alphaChannels(background.channels(), alpha);
    cv::Mat alpha3;
    cv::merge(alphaChannels, alpha3);

    cv::Mat fg, bg;
    foreground.convertTo(fg, CV_32F);
    background.convertTo(bg, CV_32F);

    cv::Mat inverse = cv::Scalar::all(1.0) - alpha3;
    cv::Mat blended = fg.mul(alpha3) + bg.mul(inverse);

    cv::Mat result;
    blended.convertTo(result, background.type());
    return result;
}

cv::Mat CompositorBlendEngine::featherField(const cv::Size &size) const
{
    const int kw = std::min(size.width / 4 * 2 + 1, m_settings.maxFeatherKernel);
    const int kh = std::min(size.height / 4 * 2 + 1, m_settings.maxFeatherKernel);

    cv::Mat field = cv::Mat::ones(size, CV_32F);
    cv::Mat feather;
    // Zero border makes the field fall off towards the rectangle edge
    cv::GaussianBlur(field, feather, cv::Size(kw | 1, kh | 1), 0, 0, cv::BORDER_CONSTANT);

    double peak = 0.0;
    cv::minMaxLoc(feather, nullptr, &peak);
    if (peak > 0.0) {
        feather /= peak;
    }
    return feather;
}

cv::Mat CompositorBlendEngine::restoreRegion(const cv::Mat &composite, const cv::Mat &original,
                                             const cv::Rect &rect) const
{
    cv::Mat result = composite.clone();
    const cv::Rect clipped = rect & cv::Rect(0, 0, composite.cols, composite.rows);
    if (clipped.area() <= 0) {
        return result;
    }

    cv::Mat feather = featherField(clipped.size());
    cv::Mat feather8;
    feather.convertTo(feather8, CV_8U, 255.0);

    cv::Mat restored = alphaComposite(original(clipped), composite(clipped), feather8);
    restored.copyTo(result(clipped));
    return result;
}

BlendResult CompositorBlendEngine::blend(const cv::Mat &original, const cv::Mat &generated,
                                         const cv::Mat &clothingMask, const OptionalBox &faceBox,
                                         int facePadding) const
{
    CV_Assert(!original.empty() && original.type() == CV_8UC3);
    CV_Assert(!generated.empty());

    QElapsedTimer blendTimer;
    blendTimer.start();

    BlendResult result;

    cv::Mat gen = generated;
    if (gen.size() != original.size()) {
        cv::resize(generated, gen, original.size(), 0, 0, cv::INTER_LINEAR);
    }

    cv::Mat mask;
    if (clothingMask.empty()) {
        mask = cv::Mat::zeros(original.size(), CV_8UC1);
    } else if (clothingMask.size() != original.size()) {
        cv::resize(clothingMask, mask, original.size(), 0, 0, cv::INTER_NEAREST);
    } else {
        mask = clothingMask;
    }

    // 1. Pull the seam inside the garment edge
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE,
                                               cv::Size(m_settings.erosionKernel, m_settings.erosionKernel));
    cv::Mat eroded;
    cv::erode(mask, eroded, kernel, cv::Point(-1, -1), m_settings.erosionIterations);
    cv::threshold(eroded, eroded, 127, 255, cv::THRESH_BINARY);

    // seamlessClone ignores the outermost pixel ring of the mask
    if (eroded.rows > 2 && eroded.cols > 2) {
        cv::rectangle(eroded, cv::Rect(0, 0, eroded.cols, eroded.rows), cv::Scalar(0), 1);
    } else {
        eroded.setTo(cv::Scalar(0));
    }

    // 2./3. Gradient-domain clone, alpha composite otherwise
    cv::Mat composite;
    const OptionalBox cloneBox = BoxGeometry::bboxFromMask(eroded);
    if (cloneBox) {
        const cv::Rect roi(cloneBox->x1, cloneBox->y1, cloneBox->width() + 1, cloneBox->height() + 1);
        const cv::Point center(roi.x + roi.width / 2, roi.y + roi.height / 2);
        try {
            cv::seamlessClone(gen, original, eroded, center, composite, cv::NORMAL_CLONE);
            result.seamlessCloneUsed = true;
        } catch (const cv::Exception &e) {
            qWarning() << "CompositorBlendEngine: Seamless clone failed:" << e.what()
                       << "- falling back to alpha composite";
            composite = alphaComposite(gen, original, mask);
            result.alphaFallbackUsed = true;
        }
    } else {
        composite = alphaComposite(gen, original, mask);
        result.alphaFallbackUsed = true;
    }

    // 4. Identity safety net
    if (faceBox && faceBox->isValid()) {
        const cv::Rect rect = BoxGeometry::padAndClip(*faceBox, std::max(0, facePadding), original.size());
        if (rect.area() > 0) {
            composite = restoreRegion(composite, original, rect);
            result.identityRestored = true;
            result.restoredRect = rect;
        }
    }

    // 5. Lighting normalisation
    result.image = HistogramMatcher::match(composite, original);

    qint64 blendTime = blendTimer.elapsed();
    qDebug() << "CompositorBlendEngine: Blend finished in" << blendTime << "ms"
             << "| seamless:" << result.seamlessCloneUsed
             << "| identity restored:" << result.identityRestored;

    return result;
}
