#include "core/resource_tier_selector.h"
#include <QDebug>

QString resourceTierName(ResourceTier tier)
{
    return tier == ResourceTier::Constrained ? QStringLiteral("CONSTRAINED") : QStringLiteral("FULL");
}

ResourceTier ResourceTierSelector::classify(size_t capacityBytes, size_t thresholdBytes)
{
    if (capacityBytes > 0 && capacityBytes < thresholdBytes) {
        return ResourceTier::Constrained;
    }
    return ResourceTier::Full;
}

ExecutionPolicy ResourceTierSelector::policyFor(ResourceTier tier, const CapabilityFlags &capabilities)
{
    ExecutionPolicy policy;
    policy.tier = tier;
    policy.memorySavingExecution = (tier == ResourceTier::Constrained);
    policy.attemptRefinement = (tier == ResourceTier::Full) && capabilities.hasRefinement;
    return policy;
}

ExecutionPolicy ResourceTierSelector::select(size_t capacityBytes, size_t thresholdBytes,
                                             const CapabilityFlags &capabilities)
{
    const ExecutionPolicy policy = policyFor(classify(capacityBytes, thresholdBytes), capabilities);

    qInfo() << "ResourceTierSelector: Accelerator memory"
            << static_cast<qulonglong>(capacityBytes / (1024 * 1024)) << "MB, threshold"
            << static_cast<qulonglong>(thresholdBytes / (1024 * 1024)) << "MB ->"
            << resourceTierName(policy.tier)
            << "| memory saving:" << policy.memorySavingExecution
            << "| refinement:" << policy.attemptRefinement;
    return policy;
}
