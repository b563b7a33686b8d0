#include "core/pipeline_config.h"
#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QtGlobal>

namespace {

int envInt(const char *name, int fallback)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return fallback;
    }
    bool ok = false;
    const int value = qEnvironmentVariable(name).toInt(&ok);
    if (!ok) {
        qWarning() << "PipelineConfig: Ignoring non-integer" << name << "=" << qEnvironmentVariable(name);
        return fallback;
    }
    return value;
}

double envDouble(const char *name, double fallback)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return fallback;
    }
    bool ok = false;
    const double value = qEnvironmentVariable(name).toDouble(&ok);
    if (!ok) {
        qWarning() << "PipelineConfig: Ignoring non-numeric" << name << "=" << qEnvironmentVariable(name);
        return fallback;
    }
    return value;
}

QString envString(const char *name, const QString &fallback)
{
    return qEnvironmentVariableIsSet(name) ? qEnvironmentVariable(name) : fallback;
}

PipelineConfig::StorageMode parseStorageMode(const QString &text, PipelineConfig::StorageMode fallback)
{
    const QString key = text.trimmed().toLower();
    if (key == QLatin1String("inline")) {
        return PipelineConfig::StorageMode::Inline;
    }
    if (key == QLatin1String("filesystem") || key == QLatin1String("file")) {
        return PipelineConfig::StorageMode::Filesystem;
    }
    if (!key.isEmpty()) {
        qWarning() << "PipelineConfig: Unknown storage mode" << text << "- keeping" << storageModeName(fallback);
    }
    return fallback;
}

} // namespace

QString storageModeName(PipelineConfig::StorageMode mode)
{
    return mode == PipelineConfig::StorageMode::Filesystem ? QStringLiteral("filesystem")
                                                           : QStringLiteral("inline");
}

size_t PipelineConfig::tierThresholdBytes() const
{
    return static_cast<size_t>(constrainedTierThresholdGB * 1024.0 * 1024.0 * 1024.0);
}

PipelineConfig PipelineConfig::load(const QString &iniPath)
{
    PipelineConfig config;

    if (!iniPath.isEmpty()) {
        if (QFileInfo::exists(iniPath)) {
            QSettings settings(iniPath, QSettings::IniFormat);
            config.readSettings(settings);
            qDebug() << "PipelineConfig: Loaded settings from" << iniPath;
        } else {
            qWarning() << "PipelineConfig: Settings file does not exist:" << iniPath << "- using defaults";
        }
    }

    config.applyEnvironment();

    qDebug() << "PipelineConfig: output" << config.outputSize << "| face padding" << config.facePadding
             << "| steps" << config.numInferenceSteps << "| storage" << storageModeName(config.storageMode)
             << "| retries" << config.maxRetries;
    return config;
}

void PipelineConfig::readSettings(QSettings &settings)
{
    settings.beginGroup(QStringLiteral("canvas"));
    outputSize = settings.value(QStringLiteral("outputSize"), outputSize).toInt();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("mask"));
    maskDilationKernel = settings.value(QStringLiteral("dilationKernel"), maskDilationKernel).toInt();
    facePadding = settings.value(QStringLiteral("facePadding"), facePadding).toInt();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("warp"));
    ransacReprojThreshold = settings.value(QStringLiteral("ransacReprojThreshold"), ransacReprojThreshold).toDouble();
    garmentBackgroundTolerance = settings.value(QStringLiteral("backgroundTolerance"), garmentBackgroundTolerance).toInt();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("blend"));
    erosionKernel = settings.value(QStringLiteral("erosionKernel"), erosionKernel).toInt();
    erosionIterations = settings.value(QStringLiteral("erosionIterations"), erosionIterations).toInt();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("synthesis"));
    numInferenceSteps = settings.value(QStringLiteral("steps"), numInferenceSteps).toInt();
    guidanceScale = settings.value(QStringLiteral("guidanceScale"), guidanceScale).toDouble();
    strength = settings.value(QStringLiteral("strength"), strength).toDouble();
    conditioningScale = settings.value(QStringLiteral("conditioningScale"), conditioningScale).toDouble();
    seed = settings.value(QStringLiteral("seed"), seed).toULongLong();
    prompt = settings.value(QStringLiteral("prompt"), prompt).toString();
    negativePrompt = settings.value(QStringLiteral("negativePrompt"), negativePrompt).toString();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("resources"));
    constrainedTierThresholdGB = settings.value(QStringLiteral("constrainedTierThresholdGB"),
                                                constrainedTierThresholdGB).toDouble();
    maxRetries = settings.value(QStringLiteral("maxRetries"), maxRetries).toInt();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("io"));
    maxUploadMb = settings.value(QStringLiteral("maxUploadMb"), maxUploadMb).toInt();
    storageMode = parseStorageMode(settings.value(QStringLiteral("storageMode")).toString(), storageMode);
    storageDirectory = settings.value(QStringLiteral("storageDirectory"), storageDirectory).toString();
    resultTtlSeconds = settings.value(QStringLiteral("resultTtlSeconds"), resultTtlSeconds).toInt();
    settings.endGroup();
}

void PipelineConfig::applyEnvironment()
{
    outputSize = qBound(64, envInt("TRYON_OUTPUT_SIZE", outputSize), 4096);
    maskDilationKernel = qMax(0, envInt("TRYON_MASK_DILATION", maskDilationKernel));
    facePadding = qMax(0, envInt("TRYON_FACE_PADDING", facePadding));
    numInferenceSteps = qMax(1, envInt("TRYON_NUM_INFERENCE_STEPS", numInferenceSteps));
    guidanceScale = envDouble("TRYON_GUIDANCE_SCALE", guidanceScale);
    strength = qBound(0.0, envDouble("TRYON_STRENGTH", strength), 1.0);
    conditioningScale = envDouble("TRYON_CONDITIONING_SCALE", conditioningScale);
    constrainedTierThresholdGB = qMax(0.0, envDouble("TRYON_TIER_THRESHOLD_GB", constrainedTierThresholdGB));
    // One automatic retry is the ceiling
    maxRetries = qBound(0, envInt("TRYON_MAX_RETRIES", maxRetries), 1);
    maxUploadMb = qMax(1, envInt("TRYON_MAX_UPLOAD_MB", maxUploadMb));
    storageMode = parseStorageMode(envString("TRYON_STORAGE_MODE", QString()), storageMode);
    storageDirectory = envString("TRYON_STORAGE_DIR", storageDirectory);
    resultTtlSeconds = qMax(1, envInt("TRYON_RESULT_TTL_SECONDS", resultTtlSeconds));
}
