#include "core/tryon_job.h"

QString jobStatusName(JobStatus status)
{
    switch (status) {
    case JobStatus::Queued:
        return QStringLiteral("queued");
    case JobStatus::Running:
        return QStringLiteral("running");
    case JobStatus::Succeeded:
        return QStringLiteral("succeeded");
    case JobStatus::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

QString pipelineStageName(PipelineStage stage)
{
    switch (stage) {
    case PipelineStage::Queued:
        return QStringLiteral("queued");
    case PipelineStage::Segmenting:
        return QStringLiteral("segmentation");
    case PipelineStage::Posing:
        return QStringLiteral("pose");
    case PipelineStage::Warping:
        return QStringLiteral("warp");
    case PipelineStage::Synthesizing:
        return QStringLiteral("synthesis");
    case PipelineStage::Blending:
        return QStringLiteral("blend");
    case PipelineStage::Done:
        return QStringLiteral("done");
    case PipelineStage::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

int pipelineStageProgress(PipelineStage stage)
{
    switch (stage) {
    case PipelineStage::Queued:
        return 0;
    case PipelineStage::Segmenting:
        return 10;
    case PipelineStage::Posing:
        return 25;
    case PipelineStage::Warping:
        return 40;
    case PipelineStage::Synthesizing:
        return 55;
    case PipelineStage::Blending:
        return 85;
    case PipelineStage::Done:
        return 100;
    case PipelineStage::Failed:
        break;
    }
    return 0;
}

QJsonObject JobError::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("exc_type"), kind);
    object.insert(QStringLiteral("exc_message"), message);
    object.insert(QStringLiteral("job_id"), jobId);
    object.insert(QStringLiteral("attempt"), attempt);
    return object;
}

QJsonObject TryOnJob::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("job_id"), id);
    object.insert(QStringLiteral("status"), jobStatusName(status));
    object.insert(QStringLiteral("stage"), pipelineStageName(stage));
    object.insert(QStringLiteral("progress"), progress);
    object.insert(QStringLiteral("garment_category"), garmentCategoryName(category));

    if (result) {
        if (result->kind == ResultReference::Kind::Locator) {
            object.insert(QStringLiteral("result_url"), result->value);
        } else {
            object.insert(QStringLiteral("result_b64"), result->value);
        }
    }
    if (error) {
        object.insert(QStringLiteral("error"), error->toJson());
    }
    return object;
}
