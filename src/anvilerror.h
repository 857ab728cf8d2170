#ifndef ANVILERROR_H
#define ANVILERROR_H

#include <QString>
#include <stdexcept>
#include <string>

/**
 * @brief Failure categories reported by the processing core
 */
enum class ErrorKind {
    None,
    Validation,          // Malformed spec or request, rejected before queueing
    ExtractionFailure,   // All segmentation models failed (absorbed, never fatal)
    CompositeFailure,    // Unexpected error while compositing a style
    QueueOverflow,       // Too many pending jobs
    Timeout,             // A step exceeded its soft limit
    ResourceExhaustion   // Input larger than the supported bounds
};

/**
 * @brief Exception type thrown inside the pipeline
 *
 * Carries an ErrorKind so the scheduler can report the category next to the
 * human-readable message.
 */
class AnvilError : public std::runtime_error
{
public:
    AnvilError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    AnvilError(ErrorKind kind, const QString& message)
        : std::runtime_error(message.toStdString()), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

    /**
     * @brief Get a short name for an error kind
     * @param kind Error kind
     * @return Name such as "Timeout" or "QueueOverflow"
     */
    static QString kindToString(ErrorKind kind);

private:
    ErrorKind m_kind;
};

#endif // ANVILERROR_H
