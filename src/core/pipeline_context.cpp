#include "core/pipeline_context.h"
#include "core/pipeline_errors.h"
#include <QDebug>

void PipelineContext::finalize(size_t tierThresholdBytes)
{
    if (m_finalized) {
        return;
    }

    if (!segmentation || !pose || !synthesizer || !sink || !modelHost) {
        throw FatalPipelineError("PipelineContext: segmentation, pose, synthesizer, sink and model host are required");
    }

    m_capabilities.hasFaceLocator = static_cast<bool>(faceLocator);
    m_capabilities.hasFaceEmbedder = static_cast<bool>(faceEmbedder);
    m_capabilities.hasRefinement = static_cast<bool>(refinement);
    m_capabilities.hasPersistentStore = sink->isPersistent();

    m_policy = ResourceTierSelector::select(modelHost->acceleratorMemoryBytes(), tierThresholdBytes, m_capabilities);
    modelHost->configureExecution(m_policy);

    qInfo() << "PipelineContext: Capabilities"
            << "| face locator:" << m_capabilities.hasFaceLocator
            << "| face embedder:" << m_capabilities.hasFaceEmbedder
            << "| refinement:" << m_capabilities.hasRefinement
            << "| persistent store:" << m_capabilities.hasPersistentStore;

    m_finalized = true;
}
