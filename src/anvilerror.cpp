#include "anvilerror.h"

QString AnvilError::kindToString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::Validation:
            return "ValidationError";
        case ErrorKind::ExtractionFailure:
            return "ExtractionFailure";
        case ErrorKind::CompositeFailure:
            return "CompositeFailure";
        case ErrorKind::QueueOverflow:
            return "QueueOverflow";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::ResourceExhaustion:
            return "ResourceExhaustion";
        default:
            return "Unknown";
    }
}
