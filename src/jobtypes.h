#ifndef JOBTYPES_H
#define JOBTYPES_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QPair>
#include <QString>
#include <memory>
#include <optional>
#include <opencv2/core.hpp>
#include "anvilerror.h"
#include "anvilspec.h"
#include "layerexporter.h"
#include "stylecompositor.h"
#include "subjectextractor.h"

enum class JobKind {
    Preview,    // All six styles at bounded resolution
    Advanced    // One style at native resolution, optionally layered
};

enum class JobStatus {
    Queued,
    Running,
    Done,
    Error
};

/**
 * @brief Everything a caller submits for one job
 */
struct JobRequest {
    JobKind kind;
    cv::Mat image;                  // Decoded BGR or BGRA upload
    AnvilSpec spec;
    Style style;                    // Advanced only
    bool layeredExport;             // Advanced only
    QString sourceName;             // Original file name, used for metadata and download names
    std::optional<cv::Rect> crop;   // Crop box chosen by the user, in image coordinates

    JobRequest() :
        kind(JobKind::Preview),
        style(Style::Flat),
        layeredExport(false)
    {}
};

/**
 * @brief One rendered style, PNG encoded
 */
struct StyleResult {
    Style style;
    QByteArray png;
    int width;
    int height;

    StyleResult() : style(Style::Flat), width(0), height(0) {}
};

/**
 * @brief Output of a finished job
 */
struct JobResult {
    JobKind kind;
    QList<StyleResult> images;            // Six for previews, one for advanced jobs
    std::optional<LayerPackage> layers;   // Advanced jobs with layered export
    bool autoDownscaled;                  // Native resolution exceeded the bound
    cv::Size outputSize;
    SubjectMask::ModelTag subjectModel;
    bool subjectExtracted;

    JobResult() :
        kind(JobKind::Preview),
        autoDownscaled(false),
        subjectModel(SubjectMask::ModelTag::Degraded),
        subjectExtracted(false)
    {}

    /**
     * @brief Find the image of a style
     * @return Pointer into images, or nullptr
     */
    const StyleResult* find(Style style) const;
};

/**
 * @brief Outcome of a submission
 */
struct SubmitResult {
    bool ok;
    QString jobId;
    ErrorKind error;
    QString message;

    SubmitResult() : ok(false), error(ErrorKind::None) {}

    static SubmitResult accepted(const QString& id);
    static SubmitResult rejected(ErrorKind kind, const QString& message);
};

/**
 * @brief Snapshot of a job as seen by a polling caller
 */
struct JobStatusReport {
    bool found;
    QString jobId;
    JobKind kind;
    JobStatus status;
    int queuePosition;                         // 1-based while queued, 0 otherwise
    std::shared_ptr<const JobResult> result;   // Set when done
    QString errorDetail;                       // Set when error
    ErrorKind errorKind;
    QDateTime createdAt;
    QDateTime startedAt;
    QDateTime completedAt;

    JobStatusReport() :
        found(false),
        kind(JobKind::Preview),
        status(JobStatus::Queued),
        queuePosition(0),
        errorKind(ErrorKind::None)
    {}
};

/**
 * @brief Scheduler counters
 */
struct SchedulerStats {
    int workerCount;
    int maxQueueDepth;
    int queued;
    int running;
    int done;
    int error;
    QList<QPair<QString, JobKind>> pending;   // Queued job ids in FIFO order

    SchedulerStats() :
        workerCount(0),
        maxQueueDepth(0),
        queued(0),
        running(0),
        done(0),
        error(0)
    {}
};

QString jobKindToString(JobKind kind);
bool jobKindFromString(const QString& name, JobKind& kind);

/**
 * @brief Get status as string
 * @param status Job status
 * @return "queued", "running", "done" or "error"
 */
QString jobStatusToString(JobStatus status);

#endif // JOBTYPES_H
