#include "algorithms/identity_protection/identity_mask.h"
#include "core/bounding_box_geometry.h"
#include <QDebug>
#include <algorithm>

IdentityMask::Result IdentityMask::apply(const cv::Mat &baseMask,
                                         const std::vector<OptionalBox> &candidates,
                                         int padding)
{
    Result result;
    result.mask = baseMask;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const OptionalBox &candidate = candidates[i];
        if (!candidate || !candidate->isValid()) {
            continue;
        }

        const cv::Rect rect = BoxGeometry::padAndClip(*candidate, std::max(0, padding), baseMask.size());
        result.mask = BoxGeometry::zeroRect(baseMask, rect);
        result.protectedRect = rect;
        result.candidateIndex = static_cast<int>(i);
        result.isProtected = true;

        qDebug() << "IdentityMask: Protected face rectangle" << rect.x << rect.y
                 << rect.x + rect.width << rect.y + rect.height
                 << "from candidate" << i;
        return result;
    }

    return result;
}

IdentityMask::Result IdentityMask::apply(const cv::Mat &baseMask, const OptionalBox &faceBox, int padding)
{
    return apply(baseMask, std::vector<OptionalBox>{faceBox}, padding);
}
