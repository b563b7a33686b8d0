#include "core/job_store.h"
#include <QDebug>
#include <QDeadlineTimer>
#include <QMutexLocker>
#include <QUuid>
#include <algorithm>

JobStore::JobStore()
{
}

QString JobStore::create(GarmentCategory category)
{
    TryOnJob job;
    job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job.category = category;
    job.createdAt = QDateTime::currentDateTimeUtc();

    QMutexLocker locker(&m_mutex);
    m_jobs.insert(job.id, job);
    return job.id;
}

std::optional<TryOnJob> JobStore::get(const QString &jobId) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(jobId);
    if (it == m_jobs.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool JobStore::contains(const QString &jobId) const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.contains(jobId);
}

int JobStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.size();
}

TryOnJob *JobStore::findLocked(const QString &jobId)
{
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        qWarning() << "JobStore: Unknown job" << jobId;
        return nullptr;
    }
    return &it.value();
}

void JobStore::markRunning(const QString &jobId)
{
    QMutexLocker locker(&m_mutex);
    TryOnJob *job = findLocked(jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->status = JobStatus::Running;
    job->attempts += 1;
    if (!job->startedAt.isValid()) {
        job->startedAt = QDateTime::currentDateTimeUtc();
    }
}

void JobStore::advance(const QString &jobId, PipelineStage stage)
{
    QMutexLocker locker(&m_mutex);
    TryOnJob *job = findLocked(jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->stage = stage;
    // A retried attempt walks the stages again; reported progress never goes back
    job->progress = std::max(job->progress, pipelineStageProgress(stage));
}

void JobStore::markRequeued(const QString &jobId, const JobError &error)
{
    QMutexLocker locker(&m_mutex);
    TryOnJob *job = findLocked(jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->status = JobStatus::Queued;
    job->stage = PipelineStage::Queued;
    job->lastError = error;
}

void JobStore::markSucceeded(const QString &jobId, const ResultReference &result)
{
    QMutexLocker locker(&m_mutex);
    TryOnJob *job = findLocked(jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->status = JobStatus::Succeeded;
    job->stage = PipelineStage::Done;
    job->progress = pipelineStageProgress(PipelineStage::Done);
    job->result = result;
    job->finishedAt = QDateTime::currentDateTimeUtc();
    m_terminalReached.wakeAll();
}

void JobStore::markFailed(const QString &jobId, const JobError &error)
{
    QMutexLocker locker(&m_mutex);
    TryOnJob *job = findLocked(jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->status = JobStatus::Failed;
    job->stage = PipelineStage::Failed;
    job->error = error;
    job->lastError = error;
    job->finishedAt = QDateTime::currentDateTimeUtc();
    m_terminalReached.wakeAll();
}

bool JobStore::waitForTerminal(const QString &jobId, int timeoutMs) const
{
    QDeadlineTimer deadline(timeoutMs);
    QMutexLocker locker(&m_mutex);

    while (true) {
        auto it = m_jobs.constFind(jobId);
        if (it == m_jobs.constEnd()) {
            return false;
        }
        if (it.value().isTerminal()) {
            return true;
        }
        if (!m_terminalReached.wait(&m_mutex, deadline)) {
            // Timed out; report whatever state the job reached
            it = m_jobs.constFind(jobId);
            return it != m_jobs.constEnd() && it.value().isTerminal();
        }
    }
}

int JobStore::expire(int ttlSeconds, const QDateTime &now)
{
    QMutexLocker locker(&m_mutex);
    int removed = 0;
    for (auto it = m_jobs.begin(); it != m_jobs.end();) {
        const TryOnJob &job = it.value();
        if (job.isTerminal() && job.finishedAt.isValid() && job.finishedAt.secsTo(now) > ttlSeconds) {
            it = m_jobs.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        qDebug() << "JobStore: Expired" << removed << "finished jobs";
    }
    return removed;
}

QJsonObject JobStore::snapshotJson(const QString &jobId) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(jobId);
    if (it == m_jobs.constEnd()) {
        QJsonObject object;
        object.insert(QStringLiteral("job_id"), jobId);
        object.insert(QStringLiteral("status"), QStringLiteral("unknown"));
        return object;
    }
    return it.value().toJson();
}
