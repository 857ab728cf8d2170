#ifndef SUBJECTEXTRACTOR_H
#define SUBJECTEXTRACTOR_H

#include <QString>
#include <memory>
#include <opencv2/core.hpp>
#include "segmentationservice.h"

/**
 * @brief Subject alpha mask with the model that produced it
 */
struct SubjectMask {
    enum class ModelTag {
        Primary,
        Fallback,
        Degraded   // No model succeeded; the whole image is treated as subject
    };

    cv::Mat alpha;        // CV_8UC1, same size as the input image, 255 = subject
    ModelTag modelUsed;
    QString modelName;    // Empty when degraded

    SubjectMask() : modelUsed(ModelTag::Degraded) {}

    bool isDegraded() const { return modelUsed == ModelTag::Degraded; }

    /**
     * @brief Fully opaque mask covering the whole canvas
     */
    static SubjectMask degraded(const cv::Size& size);

    /**
     * @brief "primary", "fallback" or "degraded"
     */
    static QString tagToString(ModelTag tag);
};

/**
 * @brief Extracts the photographic subject using the segmentation model chain
 *
 * The first model in the service is the primary, every later one a fallback.
 * A model is skipped when it fails to load, throws, returns an unusable mask or
 * exceeds the inference timeout. When the chain is exhausted a degraded mask is
 * returned, so extractSubject() never throws.
 */
class SubjectExtractor
{
public:
    /**
     * @brief Constructor
     * @param service Shared model service
     * @param inferenceTimeoutMs Soft limit per model invocation, <= 0 disables it
     */
    explicit SubjectExtractor(std::shared_ptr<SegmentationService> service,
                              int inferenceTimeoutMs = DEFAULT_INFERENCE_TIMEOUT_MS);

    /**
     * @brief Produce a subject mask for an image
     * @param bgrImage 8-bit BGR or BGRA image
     * @return Mask with the same dimensions as the image
     */
    SubjectMask extractSubject(const cv::Mat& bgrImage) const;

    int inferenceTimeoutMs() const { return m_inferenceTimeoutMs; }

    static constexpr int DEFAULT_INFERENCE_TIMEOUT_MS = 120000;

private:
    /**
     * @brief Run one model with the soft timeout applied
     * @throws std::exception on failure or timeout
     */
    cv::Mat runModel(SegmentationModel* model, const cv::Mat& bgrImage) const;

    /**
     * @brief Convert a model output to CV_8UC1 at the target size
     */
    static cv::Mat normalizeAlpha(const cv::Mat& raw, const cv::Size& targetSize);

    std::shared_ptr<SegmentationService> m_service;
    int m_inferenceTimeoutMs;
};

#endif // SUBJECTEXTRACTOR_H
