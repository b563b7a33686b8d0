#ifndef JOB_QUEUE_WORKER_H
#define JOB_QUEUE_WORKER_H

#include <QAtomicInt>
#include <QObject>
#include <QString>
#include "core/tryon_job.h"

class PipelineOrchestrator;

/**
 * @brief Runs queued jobs one after another on the thread it lives on
 *
 * Moved to a dedicated QThread by TryOnService. Jobs are posted as queued
 * invocations, so the thread's event loop is the job queue and the accelerator
 * never sees two pipeline runs at once.
 */
class JobQueueWorker : public QObject
{
    Q_OBJECT

public:
    explicit JobQueueWorker(PipelineOrchestrator *orchestrator, QObject *parent = nullptr);
    ~JobQueueWorker();

    // Thread-safe; returns immediately, false when the job could not be posted
    bool enqueue(const QString &jobId, const TryOnRequest &request);

    int pendingJobs() const;

signals:
    void jobProcessed(const QString &jobId, bool succeeded);

private:
    void process(const QString &jobId, const TryOnRequest &request);

    PipelineOrchestrator *m_orchestrator;
    QAtomicInt m_pending;
};

#endif // JOB_QUEUE_WORKER_H
