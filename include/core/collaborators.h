#ifndef COLLABORATORS_H
#define COLLABORATORS_H

#include <QString>
#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>
#include "core/common_types.h"
#include "core/resource_tier_selector.h"

/**
 * @brief Interfaces of the external collaborators driven by the pipeline
 *
 * Model inference, storage and accelerator hosting live behind these classes.
 * Every call is synchronous. Optional collaborators signal a missing model by
 * throwing CollaboratorUnavailableError; the pipeline then skips the feature.
 */

class SegmentationProvider
{
public:
    virtual ~SegmentationProvider() = default;
    virtual SegmentationResult segment(const cv::Mat &image) = 0;
};

class PoseProvider
{
public:
    virtual ~PoseProvider() = default;
    virtual PoseResult extractPose(const cv::Mat &image) = 0;
};

class FaceLocator
{
public:
    virtual ~FaceLocator() = default;
    // std::nullopt when no face is found
    virtual OptionalBox locate(const cv::Mat &image) = 0;
};

class FaceEmbedder
{
public:
    virtual ~FaceEmbedder() = default;
    virtual std::optional<std::vector<float>> embed(const cv::Mat &image) = 0;
};

struct SynthesisParams {
    QString prompt;
    QString negativePrompt;
    int numInferenceSteps = 30;
    double guidanceScale = 7.5;
    double strength = 0.85;
    double conditioningScale = 0.8;
    quint64 seed = 42;
    bool memorySavingExecution = false;
};

struct SynthesisConditioning {
    cv::Mat poseImage;
    cv::Mat warpedGarment;
    std::optional<std::vector<float>> identityEmbedding;
};

class GenerativeSynthesizer
{
public:
    virtual ~GenerativeSynthesizer() = default;

    /**
     * @brief Synthesize the garment region of the composite
     *
     * The returned canvas is not assumed to respect the mask boundary.
     */
    virtual cv::Mat generate(const cv::Mat &composite, const cv::Mat &mask,
                             const SynthesisConditioning &conditioning,
                             const SynthesisParams &params) = 0;
};

class RefinementStage
{
public:
    virtual ~RefinementStage() = default;
    virtual cv::Mat refine(const cv::Mat &image, const SynthesisParams &params) = 0;
};

struct ResultReference {
    enum class Kind { Locator, InlineToken };

    Kind kind = Kind::Locator;
    QString value;
};

class ResultSink
{
public:
    virtual ~ResultSink() = default;
    virtual ResultReference deliver(const cv::Mat &image, const QString &jobId) = 0;
    // true for sinks that persist results and hand back a locator
    virtual bool isPersistent() const = 0;
};

class ModelHost
{
public:
    virtual ~ModelHost() = default;
    virtual size_t acceleratorMemoryBytes() const = 0;
    virtual void configureExecution(const ExecutionPolicy &policy) = 0;
    // Runs on the thread that executes the pipeline; thread-local runtime switches belong here
    virtual void applyExecutionPolicy() = 0;
    // Called only between jobs, never while a stage is running
    virtual void releaseTransientMemory() = 0;
};

#endif // COLLABORATORS_H
