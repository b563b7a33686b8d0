#ifndef TRYON_TESTS_FAKES_H
#define TRYON_TESTS_FAKES_H

#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QThread>
#include <atomic>
#include <memory>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "core/collaborators.h"
#include "core/pipeline_context.h"
#include "core/pipeline_errors.h"

// Scripted collaborators for orchestrator and service tests

namespace Fakes {

// Person photo 256x256: grey backdrop, skin-tone face block, blue shirt block
inline cv::Mat personImage(int size = 256)
{
    cv::Mat image(size, size, CV_8UC3, cv::Scalar(180, 180, 180));
    const int s = size / 256;
    image(cv::Rect(100 * s, 20 * s, 56 * s, 60 * s)).setTo(cv::Scalar(140, 170, 220));
    image(cv::Rect(70 * s, 90 * s, 116 * s, 120 * s)).setTo(cv::Scalar(200, 60, 40));
    return image;
}

// Garment photo: red shirt on a white backdrop
inline cv::Mat garmentImage(int size = 256)
{
    cv::Mat image(size, size, CV_8UC3, cv::Scalar(255, 255, 255));
    image(cv::Rect(size / 4, size / 4, size / 2, size / 2)).setTo(cv::Scalar(30, 30, 210));
    return image;
}

// Label map matching personImage(): face label 11, upper-clothes label 4
inline cv::Mat labelMap(int size = 256)
{
    cv::Mat labels = cv::Mat::zeros(size, size, CV_8UC1);
    const int s = size / 256;
    labels(cv::Rect(100 * s, 20 * s, 56 * s, 60 * s)).setTo(cv::Scalar(11));
    labels(cv::Rect(70 * s, 90 * s, 116 * s, 120 * s)).setTo(cv::Scalar(4));
    return labels;
}

enum class Stage { None, Segmentation, Pose, Synthesis, Sink };

// Throws FatalPipelineError from the scripted stage for the first failuresLeft calls
struct FailureScript {
    Stage stage = Stage::None;
    int failuresLeft = 0;
    bool inputError = false;
    bool foreignError = false; // not derived from std::exception
    bool computationError = false;

    void maybeThrow(Stage current)
    {
        if (stage != current || failuresLeft <= 0) {
            return;
        }
        --failuresLeft;
        if (foreignError) {
            throw 42;
        }
        if (inputError) {
            throw InputValidationError("scripted input failure");
        }
        if (computationError) {
            throw StageComputationError("scripted computation failure");
        }
        throw FatalPipelineError("scripted failure");
    }
};

class FakeSegmentation : public SegmentationProvider
{
public:
    explicit FakeSegmentation(std::shared_ptr<FailureScript> script)
        : m_script(std::move(script)) {}

    SegmentationResult segment(const cv::Mat &image) override
    {
        ++calls;
        m_script->maybeThrow(Stage::Segmentation);
        cv::Mat labels = labelMap(256);
        if (labels.size() != image.size()) {
            cv::resize(labels, labels, image.size(), 0, 0, cv::INTER_NEAREST);
        }
        SegmentationResult result;
        result.labelMap = labels;
        result.clothingMask = (labels == 4);
        result.faceMask = (labels == 11);
        cv::Mat facePoints;
        cv::findNonZero(result.faceMask, facePoints);
        const cv::Rect face = cv::boundingRect(facePoints);
        result.faceBox = BoundingBox(face.x, face.y, face.x + face.width - 1, face.y + face.height - 1);
        return result;
    }

    std::atomic<int> calls{0};

private:
    std::shared_ptr<FailureScript> m_script;
};

class FakePose : public PoseProvider
{
public:
    explicit FakePose(std::shared_ptr<FailureScript> script)
        : m_script(std::move(script)) {}

    PoseResult extractPose(const cv::Mat &image) override
    {
        m_script->maybeThrow(Stage::Pose);
        PoseResult result;
        // Half-size on purpose: the orchestrator resizes to the canvas
        result.poseImage = cv::Mat::zeros(image.rows / 2, image.cols / 2, CV_8UC3);
        cv::line(result.poseImage, cv::Point(10, 10), cv::Point(50, 50), cv::Scalar(0, 255, 0), 2);
        return result;
    }

private:
    std::shared_ptr<FailureScript> m_script;
};

// Paints the whole canvas a flat colour, ignoring the mask boundary
class FakeSynthesizer : public GenerativeSynthesizer
{
public:
    explicit FakeSynthesizer(std::shared_ptr<FailureScript> script)
        : m_script(std::move(script)) {}

    cv::Mat generate(const cv::Mat &composite, const cv::Mat &mask,
                     const SynthesisConditioning &conditioning,
                     const SynthesisParams &params) override
    {
        m_script->maybeThrow(Stage::Synthesis);
        {
            QMutexLocker locker(&m_mutex);
            lastMask = mask.clone();
            lastParams = params;
            lastHadEmbedding = conditioning.identityEmbedding.has_value();
            lastPoseSize = conditioning.poseImage.size();
        }
        if (stallMs > 0) {
            QThread::msleep(static_cast<unsigned long>(stallMs));
        }
        return cv::Mat(composite.size(), CV_8UC3, cv::Scalar(20, 200, 20));
    }

    cv::Mat lastMask;
    SynthesisParams lastParams;
    bool lastHadEmbedding = false;
    cv::Size lastPoseSize;
    int stallMs = 0;

private:
    std::shared_ptr<FailureScript> m_script;
    QMutex m_mutex;
};

class FakeSink : public ResultSink
{
public:
    explicit FakeSink(std::shared_ptr<FailureScript> script)
        : m_script(std::move(script)) {}

    ResultReference deliver(const cv::Mat &image, const QString &jobId) override
    {
        m_script->maybeThrow(Stage::Sink);
        QMutexLocker locker(&m_mutex);
        lastImage = image.clone();
        ++deliveries;
        ResultReference reference;
        reference.kind = ResultReference::Kind::Locator;
        reference.value = QStringLiteral("memory://%1").arg(jobId);
        return reference;
    }

    bool isPersistent() const override { return true; }

    cv::Mat lastImage;
    int deliveries = 0;

private:
    std::shared_ptr<FailureScript> m_script;
    QMutex m_mutex;
};

class FakeModelHost : public ModelHost
{
public:
    explicit FakeModelHost(size_t capacity = 24ull * 1024 * 1024 * 1024)
        : m_capacity(capacity) {}

    size_t acceleratorMemoryBytes() const override { return m_capacity; }
    void configureExecution(const ExecutionPolicy &policy) override
    {
        configuredPolicy = policy;
        ++configureCalls;
    }
    void applyExecutionPolicy() override
    {
        QMutexLocker locker(&m_mutex);
        m_appliedThreads.push_back(QThread::currentThread());
    }
    void releaseTransientMemory() override { ++releases; }

    std::vector<QThread *> applied() const
    {
        QMutexLocker locker(&m_mutex);
        return m_appliedThreads;
    }

    ExecutionPolicy configuredPolicy;
    int configureCalls = 0;
    std::atomic<int> releases{0};

private:
    size_t m_capacity;
    std::vector<QThread *> m_appliedThreads;
    mutable QMutex m_mutex;
};

class UnavailableFaceLocator : public FaceLocator
{
public:
    OptionalBox locate(const cv::Mat &) override
    {
        throw CollaboratorUnavailableError("face model not installed");
    }
};

class FixedFaceLocator : public FaceLocator
{
public:
    explicit FixedFaceLocator(const OptionalBox &box)
        : m_box(box) {}

    OptionalBox locate(const cv::Mat &) override { return m_box; }

private:
    OptionalBox m_box;
};

class UnavailableFaceEmbedder : public FaceEmbedder
{
public:
    std::optional<std::vector<float>> embed(const cv::Mat &) override
    {
        throw CollaboratorUnavailableError("embedding model not installed");
    }
};

class FixedFaceEmbedder : public FaceEmbedder
{
public:
    std::optional<std::vector<float>> embed(const cv::Mat &) override
    {
        return std::vector<float>(512, 0.5f);
    }
};

class CountingRefinement : public RefinementStage
{
public:
    cv::Mat refine(const cv::Mat &image, const SynthesisParams &) override
    {
        ++calls;
        return image.clone();
    }

    int calls = 0;
};

// Context wired with fakes; the fakes stay reachable for assertions
struct Harness {
    std::shared_ptr<FailureScript> script = std::make_shared<FailureScript>();
    std::shared_ptr<FakeSegmentation> segmentation = std::make_shared<FakeSegmentation>(script);
    std::shared_ptr<FakePose> pose = std::make_shared<FakePose>(script);
    std::shared_ptr<FakeSynthesizer> synthesizer = std::make_shared<FakeSynthesizer>(script);
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>(script);
    std::shared_ptr<FakeModelHost> modelHost;
    std::shared_ptr<PipelineContext> context = std::make_shared<PipelineContext>();

    explicit Harness(size_t capacity = 24ull * 1024 * 1024 * 1024)
        : modelHost(std::make_shared<FakeModelHost>(capacity))
    {
        context->segmentation = segmentation;
        context->pose = pose;
        context->synthesizer = synthesizer;
        context->sink = sink;
        context->modelHost = modelHost;
    }
};

} // namespace Fakes

#endif // TRYON_TESTS_FAKES_H
