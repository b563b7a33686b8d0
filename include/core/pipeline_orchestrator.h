#ifndef PIPELINE_ORCHESTRATOR_H
#define PIPELINE_ORCHESTRATOR_H

#include <QMutex>
#include <QObject>
#include <QString>
#include "algorithms/blending/compositor_blend_engine.h"
#include "algorithms/garment_warp/geometric_warp_engine.h"
#include "core/job_store.h"
#include "core/pipeline_config.h"
#include "core/pipeline_context.h"
#include "core/tryon_job.h"

/**
 * @brief Drives one try-on job through the fixed stage sequence
 *
 * QUEUED -> SEGMENTING -> POSING -> WARPING -> SYNTHESIZING -> BLENDING -> DONE,
 * with FAILED reachable from every non-terminal stage. A failed attempt is retried
 * once from QUEUED (never for input validation errors). Transient accelerator
 * memory is released once per attempt, on success before the result is delivered
 * and on failure before the job is re-queued or failed.
 *
 * run() is serialized: two pipeline runs never overlap on one orchestrator.
 */
class PipelineOrchestrator : public QObject
{
    Q_OBJECT

public:
    PipelineOrchestrator(PipelineContext &context, JobStore &store, const PipelineConfig &config,
                         QObject *parent = nullptr);
    ~PipelineOrchestrator();

    // Blocks until the job is terminal; returns true on success
    bool run(const QString &jobId, const TryOnRequest &request);

    SynthesisParams synthesisParams() const;

signals:
    void stageChanged(const QString &jobId, const QString &stage, int progress);
    void jobSucceeded(const QString &jobId, const QString &result);
    void jobFailed(const QString &jobId, const QString &kind, const QString &message);
    void transientMemoryReleased(const QString &jobId);

private:
    ResultReference runAttempt(const QString &jobId, const TryOnRequest &request, bool &released);
    void enterStage(const QString &jobId, PipelineStage stage);
    void releaseTransientMemory(const QString &jobId, bool &released);

    cv::Mat categoryMask(const SegmentationResult &segmentation, GarmentCategory category,
                         const cv::Size &canvasSize) const;
    std::vector<OptionalBox> faceCandidates(const QString &jobId, const cv::Mat &person,
                                            const SegmentationResult &segmentation) const;

    PipelineContext &m_context;
    JobStore &m_store;
    PipelineConfig m_config;

    GeometricWarpEngine m_warpEngine;
    CompositorBlendEngine m_blendEngine;

    QMutex m_runMutex;
};

#endif // PIPELINE_ORCHESTRATOR_H
