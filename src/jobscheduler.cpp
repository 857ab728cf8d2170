#include "jobscheduler.h"
#include <QDebug>
#include <QMutexLocker>
#include <QUuid>
#include <algorithm>

JobScheduler::JobScheduler(const SchedulerConfig& config,
                           JobRunner runner,
                           AdmissionCheck admission,
                           QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_runner(std::move(runner))
    , m_admission(std::move(admission))
    , m_shutdown(false)
{
    if (m_config.workerCount < 1) {
        qWarning() << "JobScheduler: Worker count" << m_config.workerCount << "is invalid, using 1";
        m_config.workerCount = 1;
    } else if (m_config.workerCount > SchedulerConfig::MAX_WORKERS) {
        qWarning() << "JobScheduler: Worker count" << m_config.workerCount
                   << "exceeds the limit of" << SchedulerConfig::MAX_WORKERS << "- clamping";
        m_config.workerCount = SchedulerConfig::MAX_WORKERS;
    }
    if (m_config.maxQueueDepth < 0) {
        m_config.maxQueueDepth = 0;
    }
    if (m_config.cleanupIntervalMs <= 0) {
        m_config.cleanupIntervalMs = SchedulerConfig().cleanupIntervalMs;
    }

    m_sinceLastPurge.start();

    for (int i = 0; i < m_config.workerCount; ++i) {
        std::unique_ptr<QThread> worker(QThread::create([this]() { workerLoop(); }));
        worker->setObjectName(QString("AnvilizerWorker-%1").arg(i));
        worker->start();
        m_workers.push_back(std::move(worker));
    }

    qInfo() << "JobScheduler: Started" << m_config.workerCount << "worker(s), queue depth"
            << m_config.maxQueueDepth << ", result TTL" << m_config.resultTtlSeconds << "s";
}

JobScheduler::~JobScheduler()
{
    shutdown();
}

SubmitResult JobScheduler::submit(const JobRequest& request)
{
    QString specError;
    if (!request.spec.validate(&specError)) {
        qInfo() << "JobScheduler: Rejected job:" << specError;
        return SubmitResult::rejected(ErrorKind::Validation, specError);
    }
    if (request.image.empty()) {
        return SubmitResult::rejected(ErrorKind::Validation, "No image supplied");
    }

    if (m_admission) {
        try {
            m_admission(request);
        } catch (const AnvilError& e) {
            qInfo() << "JobScheduler: Rejected job:" << e.what();
            return SubmitResult::rejected(e.kind(), QString::fromUtf8(e.what()));
        } catch (const std::exception& e) {
            qInfo() << "JobScheduler: Rejected job:" << e.what();
            return SubmitResult::rejected(ErrorKind::Validation, QString::fromUtf8(e.what()));
        }
    }

    auto job = std::make_shared<Job>();
    job->id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job->kind = request.kind;
    job->request = request;
    job->status = JobStatus::Queued;
    job->errorKind = ErrorKind::None;
    job->discard = false;
    job->createdAt = QDateTime::currentDateTimeUtc();

    int position = 0;
    {
        QMutexLocker locker(&m_mutex);

        if (m_shutdown) {
            return SubmitResult::rejected(ErrorKind::QueueOverflow, "Scheduler is shutting down");
        }

        if (m_sinceLastPurge.elapsed() >= m_config.cleanupIntervalMs) {
            purgeExpiredLocked();
        }

        if (static_cast<int>(m_queue.size()) >= m_config.maxQueueDepth) {
            qWarning() << "JobScheduler: Queue full (" << m_queue.size() << "pending), rejecting"
                       << jobKindToString(request.kind) << "job";
            return SubmitResult::rejected(ErrorKind::QueueOverflow,
                                          QString("Queue is full (%1 jobs pending), try again later")
                                              .arg(m_queue.size()));
        }

        m_jobs.insert(job->id, job);
        m_queue.push_back(job->id);
        position = static_cast<int>(m_queue.size());
        m_workAvailable.wakeOne();
    }

    qInfo() << "JobScheduler: Queued" << jobKindToString(job->kind) << "job" << job->id << "at position" << position;
    emit jobQueued(job->id, position);

    return SubmitResult::accepted(job->id);
}

JobStatusReport JobScheduler::status(const QString& jobId) const
{
    JobStatusReport report;
    report.jobId = jobId;

    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(jobId);
    if (it == m_jobs.constEnd()) {
        return report;
    }

    const Job& job = **it;
    report.found = true;
    report.kind = job.kind;
    report.status = job.status;
    report.queuePosition = job.status == JobStatus::Queued ? queuePositionLocked(jobId) : 0;
    report.result = job.result;
    report.errorDetail = job.errorDetail;
    report.errorKind = job.errorKind;
    report.createdAt = job.createdAt;
    report.startedAt = job.startedAt;
    report.completedAt = job.completedAt;
    return report;
}

bool JobScheduler::cancel(const QString& jobId)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return false;
    }

    std::shared_ptr<Job> job = *it;
    if (job->status == JobStatus::Queued) {
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), jobId), m_queue.end());
        m_jobs.erase(it);
        qInfo() << "JobScheduler: Cancelled queued job" << jobId;
        return true;
    }
    if (job->status == JobStatus::Running) {
        job->discard = true;
        qInfo() << "JobScheduler: Job" << jobId << "is running, its result will be discarded";
        return true;
    }
    return false;
}

bool JobScheduler::release(const QString& jobId)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return false;
    }
    const JobStatus status = (*it)->status;
    if (status != JobStatus::Done && status != JobStatus::Error) {
        return false;
    }
    m_jobs.erase(it);
    return true;
}

int JobScheduler::purgeExpired()
{
    QMutexLocker locker(&m_mutex);
    return purgeExpiredLocked();
}

int JobScheduler::purgeExpiredLocked()
{
    m_sinceLastPurge.restart();
    if (m_config.resultTtlSeconds <= 0) {
        return 0;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    int removed = 0;
    for (auto it = m_jobs.begin(); it != m_jobs.end();) {
        const Job& job = **it;
        const bool finished = job.status == JobStatus::Done || job.status == JobStatus::Error;
        if (finished && job.completedAt.secsTo(now) >= m_config.resultTtlSeconds) {
            it = m_jobs.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        qInfo() << "JobScheduler: Purged" << removed << "expired job(s)";
    }
    return removed;
}

int JobScheduler::queuePositionLocked(const QString& jobId) const
{
    auto it = std::find(m_queue.begin(), m_queue.end(), jobId);
    if (it == m_queue.end()) {
        return 0;
    }
    return static_cast<int>(std::distance(m_queue.begin(), it)) + 1;
}

SchedulerStats JobScheduler::stats() const
{
    SchedulerStats stats;
    stats.workerCount = m_config.workerCount;
    stats.maxQueueDepth = m_config.maxQueueDepth;

    QMutexLocker locker(&m_mutex);
    for (const std::shared_ptr<Job>& job : m_jobs) {
        switch (job->status) {
            case JobStatus::Queued:  ++stats.queued; break;
            case JobStatus::Running: ++stats.running; break;
            case JobStatus::Done:    ++stats.done; break;
            case JobStatus::Error:   ++stats.error; break;
        }
    }
    for (const QString& id : m_queue) {
        auto it = m_jobs.constFind(id);
        if (it != m_jobs.constEnd()) {
            stats.pending.append(qMakePair(id, (*it)->kind));
        }
    }
    return stats;
}

void JobScheduler::shutdown()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;

        const QDateTime now = QDateTime::currentDateTimeUtc();
        for (const QString& id : m_queue) {
            auto it = m_jobs.find(id);
            if (it != m_jobs.end()) {
                Job& job = **it;
                job.status = JobStatus::Error;
                job.errorKind = ErrorKind::QueueOverflow;
                job.errorDetail = "Scheduler shut down before the job started";
                job.request = JobRequest();
                job.completedAt = now;
            }
        }
        if (!m_queue.empty()) {
            qInfo() << "JobScheduler: Discarded" << m_queue.size() << "queued job(s)";
        }
        m_queue.clear();
        m_workAvailable.wakeAll();
    }

    for (std::unique_ptr<QThread>& worker : m_workers) {
        worker->wait();
    }
    m_workers.clear();

    qInfo() << "JobScheduler: Shut down";
}

bool JobScheduler::isShutdown() const
{
    QMutexLocker locker(&m_mutex);
    return m_shutdown;
}

int JobScheduler::workerCount() const
{
    return m_config.workerCount;
}

std::shared_ptr<JobScheduler::Job> JobScheduler::takeNext(JobRequest& request)
{
    QMutexLocker locker(&m_mutex);
    while (!m_shutdown && m_queue.empty()) {
        // Idle workers double as the retention sweeper
        if (!m_workAvailable.wait(&m_mutex, static_cast<unsigned long>(m_config.cleanupIntervalMs))) {
            purgeExpiredLocked();
        }
    }
    if (m_shutdown) {
        return nullptr;
    }

    const QString id = m_queue.front();
    m_queue.pop_front();

    std::shared_ptr<Job> job = m_jobs.value(id);
    if (!job) {
        return nullptr;
    }
    job->status = JobStatus::Running;
    job->startedAt = QDateTime::currentDateTimeUtc();

    // The worker owns the input from here on
    request = std::move(job->request);
    job->request = JobRequest();
    return job;
}

void JobScheduler::workerLoop()
{
    for (;;) {
        JobRequest request;
        std::shared_ptr<Job> job = takeNext(request);
        if (!job) {
            if (isShutdown()) {
                return;
            }
            continue;
        }

        qInfo() << "JobScheduler: Starting" << jobKindToString(job->kind) << "job" << job->id;
        emit jobStarted(job->id);

        QElapsedTimer timer;
        timer.start();

        std::shared_ptr<const JobResult> result;
        ErrorKind errorKind = ErrorKind::None;
        QString errorDetail;
        try {
            if (!m_runner) {
                throw AnvilError(ErrorKind::CompositeFailure, QString("No job runner configured"));
            }
            result = std::make_shared<const JobResult>(m_runner(request));
        } catch (const AnvilError& e) {
            errorKind = e.kind();
            errorDetail = QString::fromUtf8(e.what());
        } catch (const std::exception& e) {
            errorKind = ErrorKind::CompositeFailure;
            errorDetail = QString::fromUtf8(e.what());
        }
        request = JobRequest();

        if (errorKind == ErrorKind::None) {
            qInfo() << "JobScheduler: Job" << job->id << "done in" << timer.elapsed() << "ms";
        } else {
            qWarning() << "JobScheduler: Job" << job->id << "failed after" << timer.elapsed() << "ms ("
                       << AnvilError::kindToString(errorKind) << "):" << errorDetail;
        }

        finishJob(job, result, errorKind, errorDetail);
        emit jobFinished(job->id, errorKind == ErrorKind::None);
    }
}

void JobScheduler::finishJob(const std::shared_ptr<Job>& job,
                             std::shared_ptr<const JobResult> result,
                             ErrorKind errorKind,
                             const QString& errorDetail)
{
    QMutexLocker locker(&m_mutex);
    job->completedAt = QDateTime::currentDateTimeUtc();

    if (job->discard) {
        m_jobs.remove(job->id);
        qInfo() << "JobScheduler: Discarded result of cancelled job" << job->id;
        return;
    }

    if (errorKind == ErrorKind::None) {
        job->status = JobStatus::Done;
        job->result = std::move(result);
    } else {
        job->status = JobStatus::Error;
        job->errorKind = errorKind;
        job->errorDetail = errorDetail;
    }
}
