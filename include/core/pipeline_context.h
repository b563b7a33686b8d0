#ifndef PIPELINE_CONTEXT_H
#define PIPELINE_CONTEXT_H

#include <memory>
#include "core/accelerator_probe.h"
#include "core/collaborators.h"
#include "core/resource_tier_selector.h"

/**
 * @brief Owns every loaded collaborator for the lifetime of the hosting process
 *
 * Built once at startup and handed to the orchestrator. Capability flags and
 * the execution policy are computed in finalize() and never change afterwards.
 */
class PipelineContext
{
public:
    std::shared_ptr<SegmentationProvider> segmentation;
    std::shared_ptr<PoseProvider> pose;
    std::shared_ptr<GenerativeSynthesizer> synthesizer;
    std::shared_ptr<ResultSink> sink;
    std::shared_ptr<ModelHost> modelHost;

    // Optional
    std::shared_ptr<FaceLocator> faceLocator;
    std::shared_ptr<FaceEmbedder> faceEmbedder;
    std::shared_ptr<RefinementStage> refinement;

    // Startup probe result, reported by the health check
    AcceleratorProbe::AcceleratorInfo accelerator;

    /**
     * @brief Compute capabilities, pick the resource tier and configure the host
     * @param tierThresholdBytes Accelerator memory below which execution is constrained
     * @throws FatalPipelineError when a mandatory collaborator is missing
     */
    void finalize(size_t tierThresholdBytes);

    bool isFinalized() const { return m_finalized; }
    const CapabilityFlags &capabilities() const { return m_capabilities; }
    const ExecutionPolicy &executionPolicy() const { return m_policy; }

private:
    CapabilityFlags m_capabilities;
    ExecutionPolicy m_policy;
    bool m_finalized = false;
};

#endif // PIPELINE_CONTEXT_H
