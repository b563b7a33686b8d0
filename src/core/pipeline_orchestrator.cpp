#include "core/pipeline_orchestrator.h"
#include "algorithms/identity_protection/identity_mask.h"
#include "algorithms/segmentation/human_parsing.h"
#include "core/pipeline_errors.h"
#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>

namespace {

GeometricWarpEngine::Settings warpSettings(const PipelineConfig &config)
{
    GeometricWarpEngine::Settings settings;
    settings.ransacReprojThreshold = config.ransacReprojThreshold;
    settings.backgroundTolerance = config.garmentBackgroundTolerance;
    return settings;
}

CompositorBlendEngine::Settings blendSettings(const PipelineConfig &config)
{
    CompositorBlendEngine::Settings settings;
    settings.erosionKernel = config.erosionKernel;
    settings.erosionIterations = config.erosionIterations;
    return settings;
}

cv::Mat toCanvas(const cv::Mat &mask, const cv::Size &canvasSize)
{
    if (mask.empty() || mask.size() == canvasSize) {
        return mask;
    }
    cv::Mat resized;
    cv::resize(mask, resized, canvasSize, 0, 0, cv::INTER_NEAREST);
    return resized;
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(PipelineContext &context, JobStore &store,
                                           const PipelineConfig &config, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_store(store)
    , m_config(config)
    , m_warpEngine(warpSettings(config))
    , m_blendEngine(blendSettings(config))
{
    if (!m_context.isFinalized()) {
        m_context.finalize(m_config.tierThresholdBytes());
    }
}

PipelineOrchestrator::~PipelineOrchestrator()
{
}

SynthesisParams PipelineOrchestrator::synthesisParams() const
{
    SynthesisParams params;
    params.prompt = m_config.prompt;
    params.negativePrompt = m_config.negativePrompt;
    params.numInferenceSteps = m_config.numInferenceSteps;
    params.guidanceScale = m_config.guidanceScale;
    params.strength = m_config.strength;
    params.conditioningScale = m_config.conditioningScale;
    params.seed = m_config.seed;
    params.memorySavingExecution = m_context.executionPolicy().memorySavingExecution;
    return params;
}

bool PipelineOrchestrator::run(const QString &jobId, const TryOnRequest &request)
{
    QMutexLocker locker(&m_runMutex);

    // Workers and sync callers run on different threads; each needs the policy applied
    try {
        m_context.modelHost->applyExecutionPolicy();
    } catch (const std::exception &e) {
        qWarning() << "PipelineOrchestrator: [" << jobId << "] Execution policy not applied:" << e.what();
    }

    const int maxAttempts = 1 + qBound(0, m_config.maxRetries, 1);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        m_store.markRunning(jobId);
        bool released = false;
        bool retryable = true;
        JobError error;
        error.jobId = jobId;
        error.attempt = attempt;

        QElapsedTimer attemptTimer;
        attemptTimer.start();

        try {
            const ResultReference result = runAttempt(jobId, request, released);
            m_store.markSucceeded(jobId, result);
            qInfo() << "PipelineOrchestrator: [" << jobId << "] Done in" << attemptTimer.elapsed()
                    << "ms (attempt" << attempt << ")";
            emit stageChanged(jobId, pipelineStageName(PipelineStage::Done),
                              pipelineStageProgress(PipelineStage::Done));
            emit jobSucceeded(jobId, result.value);
            return true;
        } catch (const InputValidationError &e) {
            error.kind = QString::fromLatin1(e.kind());
            error.message = QString::fromStdString(e.what());
            retryable = false;
        } catch (const PipelineError &e) {
            error.kind = QString::fromLatin1(e.kind());
            error.message = QString::fromStdString(e.what());
        } catch (const cv::Exception &e) {
            error.kind = QStringLiteral("FatalPipelineError");
            error.message = QString::fromStdString(e.what());
        } catch (const std::exception &e) {
            error.kind = QStringLiteral("FatalPipelineError");
            error.message = QString::fromStdString(e.what());
        } catch (...) {
            // Collaborators may wrap libraries that throw non-standard types
            error.kind = QStringLiteral("FatalPipelineError");
            error.message = QStringLiteral("unknown exception");
        }

        qCritical() << "PipelineOrchestrator: [" << jobId << "] Attempt" << attempt << "failed after"
                    << attemptTimer.elapsed() << "ms:" << error.kind << "-" << error.message;

        releaseTransientMemory(jobId, released);

        const auto snapshot = m_store.get(jobId);
        emit stageChanged(jobId, pipelineStageName(PipelineStage::Failed), snapshot ? snapshot->progress : 0);

        if (retryable && attempt < maxAttempts) {
            qWarning() << "PipelineOrchestrator: [" << jobId << "] Re-queueing for a whole-pipeline retry";
            m_store.markRequeued(jobId, error);
            continue;
        }

        m_store.markFailed(jobId, error);
        emit jobFailed(jobId, error.kind, error.message);
        return false;
    }
    return false;
}

ResultReference PipelineOrchestrator::runAttempt(const QString &jobId, const TryOnRequest &request,
                                                 bool &released)
{
    const cv::Mat &person = request.person;
    if (person.empty() || person.type() != CV_8UC3) {
        throw InputValidationError("Person image must be a non-empty 8-bit BGR image");
    }
    if (request.garment.empty() || request.garment.type() != CV_8UC3) {
        throw InputValidationError("Garment image must be a non-empty 8-bit BGR image");
    }

    const cv::Size canvasSize = person.size();
    QElapsedTimer stageTimer;

    // 1. Segmentation and identity protection
    enterStage(jobId, PipelineStage::Segmenting);
    stageTimer.start();
    const SegmentationResult segmentation = m_context.segmentation->segment(person);
    const cv::Mat garmentMask = categoryMask(segmentation, request.category, canvasSize);
    const cv::Mat dilatedMask = HumanParsing::dilateMask(garmentMask, m_config.maskDilationKernel);

    const std::vector<OptionalBox> candidates = faceCandidates(jobId, person, segmentation);
    const IdentityMask::Result protection = IdentityMask::apply(dilatedMask, candidates, m_config.facePadding);
    OptionalBox faceBox;
    if (protection.isProtected) {
        faceBox = candidates[protection.candidateIndex];
    } else {
        qWarning() << "PipelineOrchestrator: [" << jobId << "] No face found, identity is unprotected";
    }
    qDebug() << "PipelineOrchestrator: [" << jobId << "] Segmentation" << stageTimer.elapsed() << "ms";

    // 2. Pose
    enterStage(jobId, PipelineStage::Posing);
    stageTimer.restart();
    PoseResult pose = m_context.pose->extractPose(person);
    if (pose.poseImage.empty()) {
        throw FatalPipelineError("Pose provider returned an empty image");
    }
    if (pose.poseImage.size() != canvasSize) {
        cv::resize(pose.poseImage, pose.poseImage, canvasSize);
    }
    qDebug() << "PipelineOrchestrator: [" << jobId << "] Pose" << stageTimer.elapsed() << "ms";

    // 3. Garment warp
    enterStage(jobId, PipelineStage::Warping);
    const WarpResult warp = m_warpEngine.warp(request.garment, protection.mask, canvasSize);
    if (warp.fallbackUsed()) {
        qInfo() << "PipelineOrchestrator: [" << jobId << "] Warp used" << warpPathName(warp.path);
    }

    // 4. Synthesis
    enterStage(jobId, PipelineStage::Synthesizing);
    stageTimer.restart();
    const cv::Mat composite = CompositorBlendEngine::alphaComposite(warp.warpedGarment, person, protection.mask);

    SynthesisConditioning conditioning;
    conditioning.poseImage = pose.poseImage;
    conditioning.warpedGarment = warp.warpedGarment;
    if (m_context.faceEmbedder) {
        try {
            conditioning.identityEmbedding = m_context.faceEmbedder->embed(person);
        } catch (const CollaboratorUnavailableError &e) {
            qWarning() << "PipelineOrchestrator: [" << jobId << "] Identity conditioning skipped:" << e.what();
        }
    }

    const SynthesisParams params = synthesisParams();
    cv::Mat generated = m_context.synthesizer->generate(composite, protection.mask, conditioning, params);
    if (generated.empty()) {
        throw FatalPipelineError("Synthesizer returned an empty image");
    }
    if (generated.size() != canvasSize) {
        cv::resize(generated, generated, canvasSize, 0, 0, cv::INTER_LANCZOS4);
    }

    if (m_context.executionPolicy().attemptRefinement && m_context.refinement) {
        try {
            cv::Mat refined = m_context.refinement->refine(generated, params);
            if (!refined.empty()) {
                if (refined.size() != canvasSize) {
                    cv::resize(refined, refined, canvasSize, 0, 0, cv::INTER_LANCZOS4);
                }
                generated = refined;
            }
        } catch (const CollaboratorUnavailableError &e) {
            qWarning() << "PipelineOrchestrator: [" << jobId << "] Refinement skipped:" << e.what();
        }
    }
    qDebug() << "PipelineOrchestrator: [" << jobId << "] Synthesis" << stageTimer.elapsed() << "ms";

    // 5. Blend back into the original photo
    enterStage(jobId, PipelineStage::Blending);
    const BlendResult blended = m_blendEngine.blend(person, generated, garmentMask, faceBox, m_config.facePadding);

    // 6. Memory is released between jobs, before the sink sees the result
    releaseTransientMemory(jobId, released);
    return m_context.sink->deliver(blended.image, jobId);
}

void PipelineOrchestrator::enterStage(const QString &jobId, PipelineStage stage)
{
    m_store.advance(jobId, stage);
    const auto snapshot = m_store.get(jobId);
    const int progress = snapshot ? snapshot->progress : pipelineStageProgress(stage);
    qDebug() << "PipelineOrchestrator: [" << jobId << "]" << pipelineStageName(stage) << progress << "%";
    emit stageChanged(jobId, pipelineStageName(stage), progress);
}

void PipelineOrchestrator::releaseTransientMemory(const QString &jobId, bool &released)
{
    if (released) {
        return;
    }
    released = true;

    try {
        m_context.modelHost->releaseTransientMemory();
    } catch (const std::exception &e) {
        qWarning() << "PipelineOrchestrator: [" << jobId << "] Memory release reported an error:" << e.what();
    }
    emit transientMemoryReleased(jobId);
}

cv::Mat PipelineOrchestrator::categoryMask(const SegmentationResult &segmentation, GarmentCategory category,
                                           const cv::Size &canvasSize) const
{
    cv::Mat mask;
    if (!segmentation.labelMap.empty()) {
        mask = HumanParsing::clothingMaskForCategory(toCanvas(segmentation.labelMap, canvasSize), category);
    } else {
        mask = toCanvas(segmentation.clothingMask, canvasSize);
    }

    if (mask.empty() || mask.type() != CV_8UC1) {
        throw FatalPipelineError("Segmentation returned no usable clothing mask");
    }

    cv::Mat binary;
    cv::threshold(mask, binary, 127, 255, cv::THRESH_BINARY);
    return binary;
}

std::vector<OptionalBox> PipelineOrchestrator::faceCandidates(const QString &jobId, const cv::Mat &person,
                                                             const SegmentationResult &segmentation) const
{
    std::vector<OptionalBox> candidates;

    // The dedicated detector is more precise than the parsing face label
    if (m_context.faceLocator) {
        try {
            candidates.push_back(m_context.faceLocator->locate(person));
        } catch (const CollaboratorUnavailableError &e) {
            qWarning() << "PipelineOrchestrator: [" << jobId << "] Face locator unavailable:" << e.what();
        }
    }
    candidates.push_back(segmentation.faceBox);
    return candidates;
}
