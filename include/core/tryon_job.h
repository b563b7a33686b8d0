#ifndef TRYON_JOB_H
#define TRYON_JOB_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <opencv2/opencv.hpp>
#include <optional>
#include "core/collaborators.h"
#include "core/common_types.h"

enum class JobStatus { Queued, Running, Succeeded, Failed };

// Linear stage sequence; Failed is reachable from every non-terminal stage
enum class PipelineStage { Queued, Segmenting, Posing, Warping, Synthesizing, Blending, Done, Failed };

QString jobStatusName(JobStatus status);
QString pipelineStageName(PipelineStage stage);
int pipelineStageProgress(PipelineStage stage);

struct JobError {
    QString kind;
    QString message;
    QString jobId;
    int attempt = 0;

    QJsonObject toJson() const;
};

// Decoded, canvas-sized inputs of one try-on job
struct TryOnRequest {
    cv::Mat person;  // CV_8UC3
    cv::Mat garment; // CV_8UC3
    GarmentCategory category = GarmentCategory::Upper;
};

struct TryOnJob {
    QString id;
    GarmentCategory category = GarmentCategory::Upper;
    JobStatus status = JobStatus::Queued;
    PipelineStage stage = PipelineStage::Queued;
    int progress = 0;
    int attempts = 0;
    std::optional<ResultReference> result;
    std::optional<JobError> error;     // terminal failure
    std::optional<JobError> lastError; // most recent failed attempt, kept across a retry
    QDateTime createdAt;
    QDateTime startedAt;
    QDateTime finishedAt;

    bool isTerminal() const { return status == JobStatus::Succeeded || status == JobStatus::Failed; }

    // {job_id, status, stage, progress, result | error}
    QJsonObject toJson() const;
};

#endif // TRYON_JOB_H
