#ifndef RESOURCE_TIER_SELECTOR_H
#define RESOURCE_TIER_SELECTOR_H

#include <QString>
#include <cstddef>

enum class ResourceTier { Constrained, Full };

QString resourceTierName(ResourceTier tier);

// Which optional collaborators were wired in, computed once at startup
struct CapabilityFlags {
    bool hasFaceLocator = false;
    bool hasFaceEmbedder = false;
    bool hasRefinement = false;
    bool hasPersistentStore = false;
};

// Execution strategy handed to the model host for the process lifetime
struct ExecutionPolicy {
    ResourceTier tier = ResourceTier::Full;
    bool memorySavingExecution = false; // offload / sliced execution on small devices
    bool attemptRefinement = false;
};

/**
 * @brief Classifies accelerator capacity into an execution tier
 *
 * A device with 0 < capacity < threshold is Constrained. No device (capacity 0)
 * or a large device is Full: CPU hosts are not memory-bound the same way.
 */
class ResourceTierSelector
{
public:
    static ResourceTier classify(size_t capacityBytes, size_t thresholdBytes);
    static ExecutionPolicy policyFor(ResourceTier tier, const CapabilityFlags &capabilities);
    static ExecutionPolicy select(size_t capacityBytes, size_t thresholdBytes, const CapabilityFlags &capabilities);
};

#endif // RESOURCE_TIER_SELECTOR_H
