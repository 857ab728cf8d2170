#ifndef RESOLUTIONPIPELINE_H
#define RESOLUTIONPIPELINE_H

#include <QString>
#include <memory>
#include <optional>
#include <opencv2/core.hpp>
#include "jobtypes.h"
#include "stylecompositor.h"
#include "subjectextractor.h"

/**
 * @brief Resolution bounds and soft limits of the pipeline
 */
struct PipelineConfig {
    int previewLongEdge;          // Preview canvases never exceed this long edge
    bool upscaleSmallPreviews;    // Upscale previews below 75% of the bound (at most 2x)
    int maxNativeLongEdge;        // Advanced jobs above this are downscaled and flagged
    int maxInputDimension;        // Admission limit on either side of the upload
    qint64 maxInputPixels;        // Admission limit on the pixel count of the upload
    int compositeTimeoutMs;       // Soft limit per style composite, <= 0 disables it

    PipelineConfig() :
        previewLongEdge(1920),
        upscaleSmallPreviews(true),
        maxNativeLongEdge(7680),
        maxInputDimension(16384),
        maxInputPixels(120000000),
        compositeTimeoutMs(60000)
    {}
};

/**
 * @brief Runs one job from crop to encoded results
 *
 * Preview jobs are bounded to previewLongEdge, the subject is extracted once and
 * the six styles are composited one after another. Each style's raster is
 * encoded and released before the next one is started so at most one full
 * composite is alive per job.
 *
 * Advanced jobs keep the native crop resolution (unless it exceeds
 * maxNativeLongEdge), extract the subject only when the style or the layered
 * export needs it, and composite the single requested style.
 *
 * The pipeline itself is stateless; run() may be called concurrently from
 * several workers.
 */
class ResolutionPipeline
{
public:
    ResolutionPipeline(const PipelineConfig& config,
                       std::shared_ptr<const SubjectExtractor> extractor,
                       const RenderProfile& profile = RenderProfile());

    /**
     * @brief Reject inputs the pipeline cannot handle
     * @param request Submitted request
     * @throws AnvilError Validation for unusable rasters, ResourceExhaustion for oversized ones
     */
    void checkAdmission(const JobRequest& request) const;

    /**
     * @brief Process a job
     * @param request Job input; the image is not modified
     * @return Complete result, never partial
     * @throws AnvilError or std::exception on failure
     */
    JobResult run(const JobRequest& request) const;

    /**
     * @brief Crop rectangle for an image
     *
     * An explicit crop is intersected with the image. Without one, the largest
     * centred rectangle of the requested aspect ratio is used.
     *
     * @param imageSize Upload size
     * @param ratio Requested aspect ratio
     * @param crop Optional user crop box
     * @return Non-empty rectangle inside the image
     * @throws AnvilError Validation if the crop box misses the image
     */
    static cv::Rect cropRect(const cv::Size& imageSize,
                             AspectRatio ratio,
                             const std::optional<cv::Rect>& crop = std::nullopt);

    /**
     * @brief Canvas size of a preview for a given crop size
     */
    cv::Size previewSize(const cv::Size& cropSize) const;

    /**
     * @brief Canvas size of an advanced job for a given crop size
     * @param cropSize Native crop size
     * @param downscaled Set to true when the crop exceeds maxNativeLongEdge
     */
    cv::Size nativeSize(const cv::Size& cropSize, bool& downscaled) const;

    const PipelineConfig& config() const { return m_config; }

private:
    JobResult runPreview(const JobRequest& request) const;
    JobResult runAdvanced(const JobRequest& request) const;

    /**
     * @brief Crop the upload and convert it to 8-bit BGR
     */
    static cv::Mat cropToBgr(const JobRequest& request);

    static cv::Mat resizeTo(const cv::Mat& image, const cv::Size& size);

    QDeadlineTimer compositeDeadline() const;

    StyleResult encode(Style style, const cv::Mat& image) const;

    PipelineConfig m_config;
    std::shared_ptr<const SubjectExtractor> m_extractor;
    StyleCompositor m_compositor;

    // Previews below this fraction of the bound are upscaled
    static constexpr double UPSCALE_THRESHOLD = 0.75;
    static constexpr double MAX_UPSCALE = 2.0;
    // Above this pixel count upscaling uses bilinear instead of bicubic interpolation
    static constexpr qint64 LARGE_UPSCALE_PIXELS = 1000000;
};

#endif // RESOLUTIONPIPELINE_H
