#include <gtest/gtest.h>

#include "core/job_store.h"
#include "core/pipeline_orchestrator.h"
#include "Fakes.h"

#include <QStringList>
#include <QThread>
#include <vector>

namespace {

struct Observed {
    std::vector<int> progress;
    QStringList stages;
    int released = 0;
    int succeeded = 0;
    int failed = 0;
    QString failureKind;
};

class PipelineOrchestratorTest : public ::testing::Test
{
protected:
    void wire(PipelineOrchestrator &orchestrator)
    {
        QObject::connect(&orchestrator, &PipelineOrchestrator::stageChanged,
                         [this](const QString &, const QString &stage, int progress) {
                             observed.stages << stage;
                             observed.progress.push_back(progress);
                         });
        QObject::connect(&orchestrator, &PipelineOrchestrator::transientMemoryReleased,
                         [this](const QString &) { ++observed.released; });
        QObject::connect(&orchestrator, &PipelineOrchestrator::jobSucceeded,
                         [this](const QString &, const QString &) { ++observed.succeeded; });
        QObject::connect(&orchestrator, &PipelineOrchestrator::jobFailed,
                         [this](const QString &, const QString &kind, const QString &) {
                             ++observed.failed;
                             observed.failureKind = kind;
                         });
    }

    TryOnRequest request(int size = 256) const
    {
        TryOnRequest r;
        r.person = Fakes::personImage(size);
        r.garment = Fakes::garmentImage(size);
        r.category = GarmentCategory::Upper;
        return r;
    }

    static bool nonDecreasing(const std::vector<int> &values)
    {
        for (size_t i = 1; i < values.size(); ++i) {
            if (values[i] < values[i - 1]) {
                return false;
            }
        }
        return true;
    }

    Fakes::Harness harness;
    PipelineConfig config;
    JobStore store;
    Observed observed;
};

} // namespace

TEST_F(PipelineOrchestratorTest, SuccessfulJobWalksStagesWithRisingProgress)
{
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    wire(orchestrator);

    const QString id = store.create(GarmentCategory::Upper);
    ASSERT_TRUE(orchestrator.run(id, request()));

    EXPECT_EQ(observed.progress, (std::vector<int>{10, 25, 40, 55, 85, 100}));
    EXPECT_EQ(observed.stages, (QStringList{QStringLiteral("segmentation"), QStringLiteral("pose"),
                                            QStringLiteral("warp"), QStringLiteral("synthesis"),
                                            QStringLiteral("blend"), QStringLiteral("done")}));
    EXPECT_EQ(observed.succeeded, 1);
    EXPECT_EQ(observed.failed, 0);

    const TryOnJob job = *store.get(id);
    EXPECT_EQ(job.status, JobStatus::Succeeded);
    EXPECT_EQ(job.progress, 100);
    EXPECT_EQ(job.attempts, 1);
    ASSERT_TRUE(job.result.has_value());
    EXPECT_EQ(job.result->value, QStringLiteral("memory://%1").arg(id));

    EXPECT_EQ(harness.modelHost->releases.load(), 1);
    EXPECT_EQ(observed.released, 1);
    EXPECT_EQ(harness.sink->deliveries, 1);
    EXPECT_EQ(harness.sink->lastImage.size(), cv::Size(256, 256));
}

TEST_F(PipelineOrchestratorTest, SynthesisParametersFollowConfiguration)
{
    config.numInferenceSteps = 12;
    config.seed = 7;
    PipelineOrchestrator orchestrator(*harness.context, store, config);

    ASSERT_TRUE(orchestrator.run(store.create(GarmentCategory::Upper), request()));
    EXPECT_EQ(harness.synthesizer->lastParams.numInferenceSteps, 12);
    EXPECT_EQ(harness.synthesizer->lastParams.seed, 7u);
    EXPECT_DOUBLE_EQ(harness.synthesizer->lastParams.guidanceScale, 7.5);
    EXPECT_FALSE(harness.synthesizer->lastParams.memorySavingExecution);
    // Pose conditioning is resized to the canvas
    EXPECT_EQ(harness.synthesizer->lastPoseSize, cv::Size(256, 256));
}

TEST_F(PipelineOrchestratorTest, FailedIsReachableFromEveryStage)
{
    const std::vector<Fakes::Stage> stages = {Fakes::Stage::Segmentation, Fakes::Stage::Pose,
                                              Fakes::Stage::Synthesis, Fakes::Stage::Sink};

    for (Fakes::Stage stage : stages) {
        Fakes::Harness local;
        local.script->stage = stage;
        local.script->failuresLeft = 2;
        config.maxRetries = 0;

        JobStore localStore;
        PipelineOrchestrator orchestrator(*local.context, localStore, config);
        Observed seen;
        QObject::connect(&orchestrator, &PipelineOrchestrator::jobFailed,
                         [&seen](const QString &, const QString &kind, const QString &) {
                             ++seen.failed;
                             seen.failureKind = kind;
                         });

        const QString id = localStore.create(GarmentCategory::Upper);
        EXPECT_FALSE(orchestrator.run(id, request()));

        const TryOnJob job = *localStore.get(id);
        EXPECT_EQ(job.status, JobStatus::Failed);
        EXPECT_EQ(job.stage, PipelineStage::Failed);
        ASSERT_TRUE(job.error.has_value());
        EXPECT_EQ(job.error->kind, QStringLiteral("FatalPipelineError"));
        EXPECT_EQ(job.error->jobId, id);
        EXPECT_EQ(seen.failed, 1);
        // Exactly one release, also when the failure came after the pre-delivery release
        EXPECT_EQ(local.modelHost->releases.load(), 1) << "stage " << static_cast<int>(stage);
    }
}

TEST_F(PipelineOrchestratorTest, InvalidInputFailsFromQueuedWithoutRetry)
{
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    wire(orchestrator);

    TryOnRequest bad = request();
    bad.person = cv::Mat();
    const QString id = store.create(GarmentCategory::Upper);
    EXPECT_FALSE(orchestrator.run(id, bad));

    const TryOnJob job = *store.get(id);
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.attempts, 1);
    EXPECT_EQ(job.progress, 0);
    EXPECT_EQ(observed.failureKind, QStringLiteral("InputValidationError"));
    EXPECT_EQ(harness.segmentation->calls.load(), 0);
    EXPECT_EQ(harness.modelHost->releases.load(), 1);
}

TEST_F(PipelineOrchestratorTest, ValidationErrorFromCollaboratorIsNotRetried)
{
    harness.script->stage = Fakes::Stage::Segmentation;
    harness.script->failuresLeft = 2;
    harness.script->inputError = true;
    PipelineOrchestrator orchestrator(*harness.context, store, config);

    const QString id = store.create(GarmentCategory::Upper);
    EXPECT_FALSE(orchestrator.run(id, request()));
    EXPECT_EQ(store.get(id)->attempts, 1);
    EXPECT_EQ(harness.segmentation->calls.load(), 1);
}

TEST_F(PipelineOrchestratorTest, RetriesOnceAfterFailure)
{
    harness.script->stage = Fakes::Stage::Synthesis;
    harness.script->failuresLeft = 1;
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    wire(orchestrator);

    const QString id = store.create(GarmentCategory::Upper);
    ASSERT_TRUE(orchestrator.run(id, request()));

    const TryOnJob job = *store.get(id);
    EXPECT_EQ(job.status, JobStatus::Succeeded);
    EXPECT_EQ(job.attempts, 2);
    ASSERT_TRUE(job.lastError.has_value());
    EXPECT_EQ(job.lastError->attempt, 1);
    EXPECT_FALSE(job.error.has_value());

    EXPECT_TRUE(nonDecreasing(observed.progress));
    EXPECT_EQ(observed.progress.back(), 100);
    EXPECT_TRUE(observed.stages.contains(QStringLiteral("failed")));
    EXPECT_EQ(harness.segmentation->calls.load(), 2);
    // One release per attempt
    EXPECT_EQ(harness.modelHost->releases.load(), 2);
    EXPECT_EQ(observed.succeeded, 1);
    EXPECT_EQ(observed.failed, 0);
}

TEST_F(PipelineOrchestratorTest, SecondFailureIsTerminal)
{
    harness.script->stage = Fakes::Stage::Pose;
    harness.script->failuresLeft = 5;
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    wire(orchestrator);

    const QString id = store.create(GarmentCategory::Upper);
    EXPECT_FALSE(orchestrator.run(id, request()));

    const TryOnJob job = *store.get(id);
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.attempts, 2);
    EXPECT_EQ(job.error->attempt, 2);
    EXPECT_EQ(harness.modelHost->releases.load(), 2);
    EXPECT_EQ(observed.failed, 1);
    EXPECT_TRUE(nonDecreasing(observed.progress));
}

TEST_F(PipelineOrchestratorTest, UnavailableOptionalCollaboratorsDegrade)
{
    harness.context->faceLocator = std::make_shared<Fakes::UnavailableFaceLocator>();
    harness.context->faceEmbedder = std::make_shared<Fakes::UnavailableFaceEmbedder>();
    PipelineOrchestrator orchestrator(*harness.context, store, config);

    const QString id = store.create(GarmentCategory::Upper);
    ASSERT_TRUE(orchestrator.run(id, request()));
    EXPECT_FALSE(harness.synthesizer->lastHadEmbedding);

    // The segmentation face box still protects the face: label 11 at (100,20)-(155,79), padding 30
    // gives [70,185) x [0,109)
    const cv::Mat &mask = harness.synthesizer->lastMask;
    ASSERT_EQ(mask.size(), cv::Size(256, 256));
    EXPECT_EQ(cv::countNonZero(mask(cv::Rect(70, 0, 115, 109))), 0);
    EXPECT_GT(cv::countNonZero(mask), 0);
}

TEST_F(PipelineOrchestratorTest, IdentityEmbeddingReachesSynthesizer)
{
    harness.context->faceEmbedder = std::make_shared<Fakes::FixedFaceEmbedder>();
    PipelineOrchestrator orchestrator(*harness.context, store, config);

    ASSERT_TRUE(orchestrator.run(store.create(GarmentCategory::Upper), request()));
    EXPECT_TRUE(harness.synthesizer->lastHadEmbedding);
}

TEST_F(PipelineOrchestratorTest, RefinementRunsOnlyOnFullTier)
{
    auto refinement = std::make_shared<Fakes::CountingRefinement>();
    harness.context->refinement = refinement;
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    ASSERT_TRUE(orchestrator.run(store.create(GarmentCategory::Upper), request()));
    EXPECT_EQ(refinement->calls, 1);

    Fakes::Harness constrained(8ull * 1024 * 1024 * 1024);
    auto skipped = std::make_shared<Fakes::CountingRefinement>();
    constrained.context->refinement = skipped;
    JobStore constrainedStore;
    PipelineOrchestrator constrainedOrchestrator(*constrained.context, constrainedStore, config);
    ASSERT_TRUE(constrainedOrchestrator.run(constrainedStore.create(GarmentCategory::Upper), request()));
    EXPECT_EQ(skipped->calls, 0);
    EXPECT_TRUE(constrained.synthesizer->lastParams.memorySavingExecution);
}

TEST_F(PipelineOrchestratorTest, DetectedFaceIsProtectedOnFullCanvas)
{
    harness.context->faceLocator = std::make_shared<Fakes::FixedFaceLocator>(BoundingBox(100, 100, 300, 300));
    PipelineOrchestrator orchestrator(*harness.context, store, config);

    const TryOnRequest r = request(1024);
    ASSERT_TRUE(orchestrator.run(store.create(GarmentCategory::Upper), r));

    // The synthesizer never gets to touch the padded face rectangle
    const cv::Rect protectedRect(70, 70, 260, 260);
    EXPECT_EQ(cv::countNonZero(harness.synthesizer->lastMask(protectedRect)), 0);

    // The synthesizer painted the whole canvas; the face rectangle still shows the original
    const cv::Mat &output = harness.sink->lastImage;
    ASSERT_EQ(output.size(), r.person.size());
    EXPECT_LE(cv::norm(output(protectedRect), r.person(protectedRect), cv::NORM_INF), 2.0);
}

TEST_F(PipelineOrchestratorTest, CategoryWithoutGarmentPixelsStillCompletes)
{
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    TryOnRequest r = request();
    r.category = GarmentCategory::Lower; // label map has no lower-body garment

    const QString id = store.create(GarmentCategory::Lower);
    ASSERT_TRUE(orchestrator.run(id, r));
    EXPECT_EQ(cv::countNonZero(harness.synthesizer->lastMask), 0);
    EXPECT_EQ(cv::norm(harness.sink->lastImage, r.person, cv::NORM_INF), 0.0);
}

TEST_F(PipelineOrchestratorTest, NonStandardExceptionFailsTheAttempt)
{
    harness.script->stage = Fakes::Stage::Pose;
    harness.script->failuresLeft = 2;
    harness.script->foreignError = true;
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    wire(orchestrator);

    const QString id = store.create(GarmentCategory::Upper);
    bool succeeded = true;
    ASSERT_NO_THROW(succeeded = orchestrator.run(id, request()));
    EXPECT_FALSE(succeeded);

    const TryOnJob job = *store.get(id);
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.attempts, 2);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_EQ(job.error->kind, QStringLiteral("FatalPipelineError"));
    EXPECT_EQ(job.error->message, QStringLiteral("unknown exception"));
    EXPECT_EQ(harness.modelHost->releases.load(), 2);
    EXPECT_EQ(observed.failed, 1);
}

TEST_F(PipelineOrchestratorTest, CollaboratorComputationErrorKeepsItsKind)
{
    harness.script->stage = Fakes::Stage::Synthesis;
    harness.script->failuresLeft = 2;
    harness.script->computationError = true;
    PipelineOrchestrator orchestrator(*harness.context, store, config);

    const QString id = store.create(GarmentCategory::Upper);
    EXPECT_FALSE(orchestrator.run(id, request()));

    const TryOnJob job = *store.get(id);
    EXPECT_EQ(job.attempts, 2);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_EQ(job.error->kind, QStringLiteral("StageComputationError"));
    EXPECT_EQ(job.error->message, QStringLiteral("scripted computation failure"));
}

TEST_F(PipelineOrchestratorTest, ExecutionPolicyIsAppliedOnTheRunningThread)
{
    PipelineOrchestrator orchestrator(*harness.context, store, config);
    ASSERT_TRUE(orchestrator.run(store.create(GarmentCategory::Upper), request()));
    ASSERT_TRUE(orchestrator.run(store.create(GarmentCategory::Upper), request()));

    const std::vector<QThread *> applied = harness.modelHost->applied();
    ASSERT_EQ(applied.size(), 2u);
    EXPECT_EQ(applied[0], QThread::currentThread());
    EXPECT_EQ(applied[1], QThread::currentThread());
    EXPECT_EQ(harness.modelHost->configureCalls, 1);
}
