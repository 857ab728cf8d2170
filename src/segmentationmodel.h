#ifndef SEGMENTATIONMODEL_H
#define SEGMENTATIONMODEL_H

#include <QMutex>
#include <QString>
#include <functional>
#include <opencv2/core.hpp>

/**
 * @brief Stop request shared between the caller and a running inference
 *
 * The caller may request a stop from another thread (for example after a soft
 * timeout). A model registers a handler that interrupts its backend; models that
 * cannot be interrupted poll stopRequested() instead.
 */
class InferenceControl
{
public:
    InferenceControl() = default;

    InferenceControl(const InferenceControl&) = delete;
    InferenceControl& operator=(const InferenceControl&) = delete;

    /**
     * @brief Request the running inference to stop and invoke the stop handler
     *
     * The handler runs with the control locked, so it must not call back into
     * this object; clearStopHandler() blocks until a running handler returns.
     */
    void requestStop();

    bool stopRequested() const;

    /**
     * @brief Install the backend interrupt; runs immediately if a stop was already requested
     */
    void setStopHandler(std::function<void()> handler);

    void clearStopHandler();

private:
    mutable QMutex m_mutex;
    bool m_stopRequested = false;
    std::function<void()> m_stopHandler;
};

/**
 * @brief Subject segmentation backend
 *
 * Implementations are loaded once per process and then only used for
 * inference, so predict() must be safe to call repeatedly.
 */
class SegmentationModel
{
public:
    virtual ~SegmentationModel() = default;

    /**
     * @brief Model name used in logs and metadata
     */
    virtual QString name() const = 0;

    /**
     * @brief Predict a subject alpha mask
     * @param bgrImage 8-bit BGR input image
     * @param control Stop request for this invocation
     * @return CV_8UC1 alpha mask; implementations may return a different size,
     *         callers resize it to the input
     * @throws std::exception on any backend failure
     */
    virtual cv::Mat predict(const cv::Mat& bgrImage, InferenceControl& control) = 0;

protected:
    SegmentationModel() = default;

    SegmentationModel(const SegmentationModel&) = delete;
    SegmentationModel& operator=(const SegmentationModel&) = delete;
};

#endif // SEGMENTATIONMODEL_H
