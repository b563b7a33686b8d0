#include "core/job_queue_worker.h"
#include "core/pipeline_orchestrator.h"
#include <QDebug>
#include <QMetaObject>

JobQueueWorker::JobQueueWorker(PipelineOrchestrator *orchestrator, QObject *parent)
    : QObject(parent)
    , m_orchestrator(orchestrator)
    , m_pending(0)
{
}

JobQueueWorker::~JobQueueWorker()
{
    if (m_pending.loadAcquire() > 0) {
        qWarning() << "JobQueueWorker: Destroyed with" << m_pending.loadAcquire() << "jobs still queued";
    }
}

bool JobQueueWorker::enqueue(const QString &jobId, const TryOnRequest &request)
{
    m_pending.ref();
    const bool posted = QMetaObject::invokeMethod(
        this, [this, jobId, request]() { process(jobId, request); }, Qt::QueuedConnection);
    if (!posted) {
        m_pending.deref();
        qCritical() << "JobQueueWorker: Failed to queue job" << jobId;
    }
    return posted;
}

int JobQueueWorker::pendingJobs() const
{
    return m_pending.loadAcquire();
}

void JobQueueWorker::process(const QString &jobId, const TryOnRequest &request)
{
    qDebug() << "JobQueueWorker: Processing job" << jobId << "| still queued:" << m_pending.loadAcquire() - 1;
    const bool succeeded = m_orchestrator->run(jobId, request);
    m_pending.deref();
    emit jobProcessed(jobId, succeeded);
}
