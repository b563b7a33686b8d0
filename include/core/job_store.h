#ifndef JOB_STORE_H
#define JOB_STORE_H

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QMutex>
#include <QString>
#include <QWaitCondition>
#include <optional>
#include "core/tryon_job.h"

/**
 * @brief Thread-safe registry of try-on jobs for polling
 *
 * Only the orchestrator mutates a job after creation. Terminal states are
 * sticky: once a job succeeded or failed, later transitions are ignored.
 */
class JobStore
{
public:
    JobStore();

    QString create(GarmentCategory category);
    std::optional<TryOnJob> get(const QString &jobId) const;
    bool contains(const QString &jobId) const;
    int size() const;

    void markRunning(const QString &jobId);
    void advance(const QString &jobId, PipelineStage stage);
    void markRequeued(const QString &jobId, const JobError &error);
    void markSucceeded(const QString &jobId, const ResultReference &result);
    void markFailed(const QString &jobId, const JobError &error);

    // Blocks until the job reaches a terminal status or the timeout expires
    bool waitForTerminal(const QString &jobId, int timeoutMs) const;

    // Drops terminal jobs that finished more than ttlSeconds before now
    int expire(int ttlSeconds, const QDateTime &now = QDateTime::currentDateTimeUtc());

    QJsonObject snapshotJson(const QString &jobId) const;

private:
    TryOnJob *findLocked(const QString &jobId);

    mutable QMutex m_mutex;
    mutable QWaitCondition m_terminalReached;
    QHash<QString, TryOnJob> m_jobs;
};

#endif // JOB_STORE_H
