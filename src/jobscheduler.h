#ifndef JOBSCHEDULER_H
#define JOBSCHEDULER_H

#include <QElapsedTimer>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QThread>
#include <QWaitCondition>
#include <deque>
#include <functional>
#include <memory>
#include <vector>
#include "jobtypes.h"

struct SchedulerConfig {
    int workerCount;          // Concurrent jobs, clamped to [1, MAX_WORKERS]
    int maxQueueDepth;        // Queued (not running) jobs accepted before rejecting
    int resultTtlSeconds;     // Finished jobs are evicted after this, <= 0 keeps them
    int cleanupIntervalMs;    // How often expired jobs are purged

    // Each running job may hold several full-resolution rasters
    static constexpr int MAX_WORKERS = 4;

    SchedulerConfig() :
        workerCount(1),
        maxQueueDepth(10),
        resultTtlSeconds(3600),
        cleanupIntervalMs(60000)
    {}
};

/**
 * @brief Executes one job; throws on failure
 */
using JobRunner = std::function<JobResult(const JobRequest&)>;

/**
 * @brief Checks a request before it is queued; throws AnvilError to reject it
 */
using AdmissionCheck = std::function<void(const JobRequest&)>;

/**
 * @brief Bounded FIFO job queue with a small worker pool
 *
 * submit() validates and enqueues without blocking on execution; callers poll
 * status() with the returned id. Workers take jobs in admission order. A job
 * that throws ends in the error state without affecting other jobs.
 *
 * All public functions are thread-safe. Signals are emitted from worker
 * threads.
 */
class JobScheduler : public QObject
{
    Q_OBJECT

public:
    JobScheduler(const SchedulerConfig& config,
                 JobRunner runner,
                 AdmissionCheck admission = AdmissionCheck(),
                 QObject *parent = nullptr);
    ~JobScheduler() override;

    /**
     * Validate and enqueue a job
     * @param request Job input, copied into the scheduler
     * @return Ticket with the job id, or the rejection reason
     */
    SubmitResult submit(const JobRequest& request);

    /**
     * Non-blocking status snapshot
     * @param jobId Id returned by submit()
     * @return Report with found == false for unknown or evicted ids
     */
    JobStatusReport status(const QString& jobId) const;

    /**
     * Cancel a job
     *
     * A queued job is removed immediately. A running job keeps running but its
     * result is discarded and the job disappears when it finishes.
     *
     * @param jobId Job to cancel
     * @return true if the job was queued or running
     */
    bool cancel(const QString& jobId);

    /**
     * Evict a finished job once the caller has fetched its result
     * @param jobId Job to release
     * @return true if a finished job was removed
     */
    bool release(const QString& jobId);

    /**
     * Remove finished jobs older than the result TTL
     * @return Number of evicted jobs
     */
    int purgeExpired();

    SchedulerStats stats() const;

    /**
     * Stop accepting jobs, discard queued ones, wait for running ones and join the workers
     */
    void shutdown();

    bool isShutdown() const;

    int workerCount() const;

signals:
    void jobQueued(const QString& jobId, int queuePosition);
    void jobStarted(const QString& jobId);
    void jobFinished(const QString& jobId, bool success);

private:
    struct Job {
        QString id;
        JobKind kind;
        JobRequest request;        // Moved out when the job starts
        JobStatus status;
        std::shared_ptr<const JobResult> result;
        QString errorDetail;
        ErrorKind errorKind;
        bool discard;              // Cancelled while running
        QDateTime createdAt;
        QDateTime startedAt;
        QDateTime completedAt;
    };

    void workerLoop();

    /**
     * Take the next queued job; blocks until one is available or shutdown starts
     * @return Job or nullptr on shutdown
     */
    std::shared_ptr<Job> takeNext(JobRequest& request);

    void finishJob(const std::shared_ptr<Job>& job,
                   std::shared_ptr<const JobResult> result,
                   ErrorKind errorKind,
                   const QString& errorDetail);

    // Callers must hold m_mutex
    int purgeExpiredLocked();
    int queuePositionLocked(const QString& jobId) const;

    SchedulerConfig m_config;
    JobRunner m_runner;
    AdmissionCheck m_admission;

    mutable QMutex m_mutex;
    QWaitCondition m_workAvailable;
    std::deque<QString> m_queue;
    QHash<QString, std::shared_ptr<Job>> m_jobs;
    QElapsedTimer m_sinceLastPurge;
    bool m_shutdown;

    std::vector<std::unique_ptr<QThread>> m_workers;
};

#endif // JOBSCHEDULER_H
