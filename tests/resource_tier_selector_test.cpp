#include <gtest/gtest.h>

#include "core/pipeline_context.h"
#include "core/pipeline_errors.h"
#include "core/resource_tier_selector.h"
#include "Fakes.h"

namespace {

constexpr size_t GiB = 1024ull * 1024 * 1024;

} // namespace

TEST(ResourceTierSelectorTest, ClassifiesByCapacity)
{
    EXPECT_EQ(ResourceTierSelector::classify(8 * GiB, 12 * GiB), ResourceTier::Constrained);
    EXPECT_EQ(ResourceTierSelector::classify(12 * GiB - 1, 12 * GiB), ResourceTier::Constrained);
    EXPECT_EQ(ResourceTierSelector::classify(12 * GiB, 12 * GiB), ResourceTier::Full);
    EXPECT_EQ(ResourceTierSelector::classify(24 * GiB, 12 * GiB), ResourceTier::Full);
}

TEST(ResourceTierSelectorTest, NoAcceleratorIsFull)
{
    EXPECT_EQ(ResourceTierSelector::classify(0, 12 * GiB), ResourceTier::Full);
}

TEST(ResourceTierSelectorTest, ConstrainedTierSavesMemoryAndSkipsRefinement)
{
    CapabilityFlags capabilities;
    capabilities.hasRefinement = true;

    const ExecutionPolicy constrained = ResourceTierSelector::policyFor(ResourceTier::Constrained, capabilities);
    EXPECT_TRUE(constrained.memorySavingExecution);
    EXPECT_FALSE(constrained.attemptRefinement);

    const ExecutionPolicy full = ResourceTierSelector::policyFor(ResourceTier::Full, capabilities);
    EXPECT_FALSE(full.memorySavingExecution);
    EXPECT_TRUE(full.attemptRefinement);

    capabilities.hasRefinement = false;
    EXPECT_FALSE(ResourceTierSelector::policyFor(ResourceTier::Full, capabilities).attemptRefinement);
}

TEST(PipelineContextTest, FinalizeConfiguresHostOnce)
{
    Fakes::Harness harness(8 * GiB);
    harness.context->finalize(12 * GiB);
    harness.context->finalize(12 * GiB);

    EXPECT_TRUE(harness.context->isFinalized());
    EXPECT_EQ(harness.modelHost->configureCalls, 1);
    EXPECT_EQ(harness.modelHost->configuredPolicy.tier, ResourceTier::Constrained);
    EXPECT_TRUE(harness.context->executionPolicy().memorySavingExecution);
    EXPECT_TRUE(harness.context->capabilities().hasPersistentStore);
    EXPECT_FALSE(harness.context->capabilities().hasFaceLocator);
}

TEST(PipelineContextTest, OptionalCollaboratorsSetCapabilities)
{
    Fakes::Harness harness;
    harness.context->faceLocator = std::make_shared<Fakes::FixedFaceLocator>(std::nullopt);
    harness.context->faceEmbedder = std::make_shared<Fakes::FixedFaceEmbedder>();
    harness.context->refinement = std::make_shared<Fakes::CountingRefinement>();
    harness.context->finalize(12 * GiB);

    const CapabilityFlags &capabilities = harness.context->capabilities();
    EXPECT_TRUE(capabilities.hasFaceLocator);
    EXPECT_TRUE(capabilities.hasFaceEmbedder);
    EXPECT_TRUE(capabilities.hasRefinement);
    EXPECT_TRUE(harness.context->executionPolicy().attemptRefinement);
}

TEST(PipelineContextTest, MissingMandatoryCollaboratorIsFatal)
{
    Fakes::Harness harness;
    harness.context->pose.reset();
    EXPECT_THROW(harness.context->finalize(12 * GiB), FatalPipelineError);
    EXPECT_FALSE(harness.context->isFinalized());
}
