#include "jobtypes.h"

const StyleResult* JobResult::find(Style style) const
{
    for (const StyleResult& image : images) {
        if (image.style == style) {
            return &image;
        }
    }
    return nullptr;
}

SubmitResult SubmitResult::accepted(const QString& id)
{
    SubmitResult result;
    result.ok = true;
    result.jobId = id;
    return result;
}

SubmitResult SubmitResult::rejected(ErrorKind kind, const QString& message)
{
    SubmitResult result;
    result.ok = false;
    result.error = kind;
    result.message = message;
    return result;
}

QString jobKindToString(JobKind kind)
{
    switch (kind) {
        case JobKind::Preview:  return "preview";
        case JobKind::Advanced: return "advanced";
        default:                return "unknown";
    }
}

bool jobKindFromString(const QString& name, JobKind& kind)
{
    const QString key = name.trimmed().toLower();
    if (key == "preview") {
        kind = JobKind::Preview;
        return true;
    }
    if (key == "advanced") {
        kind = JobKind::Advanced;
        return true;
    }
    return false;
}

QString jobStatusToString(JobStatus status)
{
    switch (status) {
        case JobStatus::Queued:  return "queued";
        case JobStatus::Running: return "running";
        case JobStatus::Done:    return "done";
        case JobStatus::Error:   return "error";
        default:                 return "unknown";
    }
}
