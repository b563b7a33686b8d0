#ifndef TRYON_SERVICE_H
#define TRYON_SERVICE_H

#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include "core/image_validator.h"
#include "core/job_store.h"
#include "core/pipeline_config.h"
#include "core/pipeline_context.h"
#include "core/tryon_job.h"

class QThread;
class JobQueueWorker;
class PipelineOrchestrator;

/**
 * @brief Job boundary of the try-on pipeline
 *
 * Async: submit() validates the inputs, registers the job and returns its id at
 * once; a single worker thread runs queued jobs in submission order and poll()
 * reports {status, stage, progress, result|error}.
 * Sync: runSync() validates and runs the job in the calling thread.
 *
 * Both paths share one orchestrator, so they never run concurrently.
 */
class TryOnService : public QObject
{
    Q_OBJECT

public:
    TryOnService(std::shared_ptr<PipelineContext> context, const PipelineConfig &config,
                 QObject *parent = nullptr);
    ~TryOnService();

    // @throws InputValidationError before any job is created
    QString submit(const QByteArray &personBytes, const QByteArray &garmentBytes, const QString &category);
    QString submit(const cv::Mat &person, const cv::Mat &garment, GarmentCategory category);

    TryOnJob runSync(const QByteArray &personBytes, const QByteArray &garmentBytes, const QString &category);
    TryOnJob runSync(const cv::Mat &person, const cv::Mat &garment, GarmentCategory category);

    std::optional<TryOnJob> job(const QString &jobId) const;
    QJsonObject poll(const QString &jobId) const;
    bool waitForJob(const QString &jobId, int timeoutMs) const;

    // Drops finished jobs older than the configured result TTL
    int expireResults();

    QJsonObject healthJson() const;

    PipelineOrchestrator *orchestrator() const { return m_orchestrator; }
    const PipelineConfig &config() const { return m_config; }

signals:
    void jobFinished(const QString &jobId, bool succeeded);

private:
    TryOnRequest makeRequest(const QByteArray &personBytes, const QByteArray &garmentBytes,
                             const QString &category) const;
    TryOnRequest makeRequest(const cv::Mat &person, const cv::Mat &garment, GarmentCategory category) const;
    QString enqueue(const TryOnRequest &request);
    TryOnJob execute(const TryOnRequest &request);

    std::shared_ptr<PipelineContext> m_context;
    PipelineConfig m_config;
    ImageValidator m_validator;
    JobStore m_store;

    PipelineOrchestrator *m_orchestrator;
    QThread *m_workerThread;
    JobQueueWorker *m_worker;
};

#endif // TRYON_SERVICE_H
