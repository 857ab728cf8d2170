#include "subjectextractor.h"
#include <QDebug>
#include <QElapsedTimer>
#include <chrono>
#include <future>
#include <opencv2/imgproc.hpp>
#include "anvilerror.h"

SubjectMask SubjectMask::degraded(const cv::Size& size)
{
    SubjectMask mask;
    mask.alpha = cv::Mat(size, CV_8UC1, cv::Scalar(255));
    mask.modelUsed = ModelTag::Degraded;
    return mask;
}

QString SubjectMask::tagToString(ModelTag tag)
{
    switch (tag) {
        case ModelTag::Primary:  return "primary";
        case ModelTag::Fallback: return "fallback";
        case ModelTag::Degraded: return "degraded";
        default:                 return "unknown";
    }
}

SubjectExtractor::SubjectExtractor(std::shared_ptr<SegmentationService> service, int inferenceTimeoutMs)
    : m_service(std::move(service))
    , m_inferenceTimeoutMs(inferenceTimeoutMs)
{
}

SubjectMask SubjectExtractor::extractSubject(const cv::Mat& bgrImage) const
{
    if (bgrImage.empty()) {
        return SubjectMask::degraded(cv::Size());
    }

    const int count = m_service ? m_service->modelCount() : 0;
    for (int i = 0; i < count; ++i) {
        QString loadError;
        SegmentationModel* model = m_service->model(i, &loadError);
        const QString modelName = m_service->descriptor(i).name;
        if (!model) {
            qWarning() << "SubjectExtractor: Model" << modelName << "unavailable:" << loadError;
            continue;
        }

        QElapsedTimer timer;
        timer.start();
        try {
            cv::Mat alpha = normalizeAlpha(runModel(model, bgrImage), bgrImage.size());

            SubjectMask mask;
            mask.alpha = alpha;
            mask.modelUsed = (i == 0) ? SubjectMask::ModelTag::Primary : SubjectMask::ModelTag::Fallback;
            mask.modelName = model->name();
            qInfo() << "SubjectExtractor: Subject extracted with" << mask.modelName
                    << "(" << SubjectMask::tagToString(mask.modelUsed) << ") in" << timer.elapsed() << "ms";
            return mask;
        } catch (const std::exception& e) {
            qWarning() << "SubjectExtractor: Model" << modelName << "failed after" << timer.elapsed()
                       << "ms:" << e.what();
        }
    }

    qWarning() << "SubjectExtractor: All segmentation models failed, using degraded full-opaque mask";
    return SubjectMask::degraded(bgrImage.size());
}

cv::Mat SubjectExtractor::runModel(SegmentationModel* model, const cv::Mat& bgrImage) const
{
    InferenceControl control;

    if (m_inferenceTimeoutMs <= 0) {
        return model->predict(bgrImage, control);
    }

    std::future<cv::Mat> pending = std::async(std::launch::async, [model, &bgrImage, &control]() {
        return model->predict(bgrImage, control);
    });

    if (pending.wait_for(std::chrono::milliseconds(m_inferenceTimeoutMs)) == std::future_status::timeout) {
        // The worker must not outlive this frame: interrupt it and wait for it to unwind
        control.requestStop();
        pending.wait();
        throw AnvilError(ErrorKind::Timeout,
                         QString("Inference exceeded %1 ms").arg(m_inferenceTimeoutMs));
    }

    return pending.get();
}

cv::Mat SubjectExtractor::normalizeAlpha(const cv::Mat& raw, const cv::Size& targetSize)
{
    if (raw.empty()) {
        throw AnvilError(ErrorKind::ExtractionFailure, QString("Model returned an empty mask"));
    }

    cv::Mat single;
    if (raw.channels() == 1) {
        single = raw;
    } else if (raw.channels() == 4) {
        cv::extractChannel(raw, single, 3);
    } else {
        cv::cvtColor(raw, single, cv::COLOR_BGR2GRAY);
    }

    cv::Mat alpha;
    if (single.depth() == CV_8U) {
        alpha = single;
    } else if (single.depth() == CV_32F || single.depth() == CV_64F) {
        // Float masks are probabilities in [0, 1]
        single.convertTo(alpha, CV_8U, 255.0);
    } else {
        single.convertTo(alpha, CV_8U);
    }

    if (alpha.size() != targetSize) {
        cv::Mat resized;
        cv::resize(alpha, resized, targetSize, 0, 0, cv::INTER_LINEAR);
        alpha = resized;
    }

    return alpha.clone();
}
