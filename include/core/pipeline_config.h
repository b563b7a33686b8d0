#ifndef PIPELINE_CONFIG_H
#define PIPELINE_CONFIG_H

#include <QString>
#include <cstddef>

class QSettings;

/**
 * @brief Runtime settings of the try-on pipeline
 *
 * Defaults are compiled in. load() reads an optional INI file and then applies
 * TRYON_* environment variables on top, so deployments can override single values.
 */
struct PipelineConfig {
    enum class StorageMode { Inline, Filesystem };

    // Canvas
    int outputSize = 1024;

    // Masks
    int maskDilationKernel = 20;
    int facePadding = 30;

    // Warp
    double ransacReprojThreshold = 5.0;
    int garmentBackgroundTolerance = 12;

    // Blend
    int erosionKernel = 15;
    int erosionIterations = 2;

    // Synthesis
    int numInferenceSteps = 30;
    double guidanceScale = 7.5;
    double strength = 0.85;
    double conditioningScale = 0.8;
    quint64 seed = 42;
    QString prompt = QStringLiteral(
        "a person wearing the clothing, photorealistic, high resolution, "
        "studio lighting, fashion photography, 8k");
    QString negativePrompt = QStringLiteral(
        "deformed, blurry, bad anatomy, ugly, duplicate, artifacts, "
        "low quality, watermark, text");

    // Resources
    double constrainedTierThresholdGB = 12.0;
    int maxRetries = 1;

    // Input / output
    int maxUploadMb = 20;
    StorageMode storageMode = StorageMode::Inline;
    QString storageDirectory = QStringLiteral("/tmp/tryon/results");
    int resultTtlSeconds = 3600;

    size_t tierThresholdBytes() const;

    static PipelineConfig load(const QString &iniPath = QString());
    void readSettings(QSettings &settings);
    void applyEnvironment();
};

QString storageModeName(PipelineConfig::StorageMode mode);

#endif // PIPELINE_CONFIG_H
