#include "segmentationmodel.h"
#include <QMutexLocker>
#include <utility>

void InferenceControl::requestStop()
{
    // The handler runs under the lock so clearStopHandler() cannot return while
    // it still touches backend state owned by the inference call.
    QMutexLocker locker(&m_mutex);
    m_stopRequested = true;
    if (m_stopHandler) {
        m_stopHandler();
    }
}

bool InferenceControl::stopRequested() const
{
    QMutexLocker locker(&m_mutex);
    return m_stopRequested;
}

void InferenceControl::setStopHandler(std::function<void()> handler)
{
    QMutexLocker locker(&m_mutex);
    m_stopHandler = std::move(handler);
    if (m_stopRequested && m_stopHandler) {
        m_stopHandler();
    }
}

void InferenceControl::clearStopHandler()
{
    QMutexLocker locker(&m_mutex);
    m_stopHandler = nullptr;
}
