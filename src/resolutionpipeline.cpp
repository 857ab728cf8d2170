#include "resolutionpipeline.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include "anvilerror.h"
#include "imageiohelper.h"
#include "layerexporter.h"
#include "shapeengine.h"

ResolutionPipeline::ResolutionPipeline(const PipelineConfig& config,
                                       std::shared_ptr<const SubjectExtractor> extractor,
                                       const RenderProfile& profile)
    : m_config(config)
    , m_extractor(std::move(extractor))
    , m_compositor(profile)
{
}

void ResolutionPipeline::checkAdmission(const JobRequest& request) const
{
    const cv::Mat& image = request.image;
    if (image.empty()) {
        throw AnvilError(ErrorKind::Validation, QString("Input image is empty"));
    }
    if (image.depth() != CV_8U || (image.channels() != 1 && image.channels() != 3 && image.channels() != 4)) {
        throw AnvilError(ErrorKind::Validation, QString("Input image must be 8-bit grey, BGR or BGRA"));
    }

    const int longEdge = std::max(image.cols, image.rows);
    const qint64 pixels = static_cast<qint64>(image.cols) * image.rows;
    if (longEdge > m_config.maxInputDimension || pixels > m_config.maxInputPixels) {
        throw AnvilError(ErrorKind::ResourceExhaustion,
                         QString("Image %1x%2 exceeds the supported size (max %3 px per side, %4 pixels)")
                             .arg(image.cols).arg(image.rows)
                             .arg(m_config.maxInputDimension).arg(m_config.maxInputPixels));
    }

    if (request.crop) {
        // Throws Validation when the box misses the image
        cropRect(image.size(), request.spec.aspectRatio, request.crop);
    }
}

JobResult ResolutionPipeline::run(const JobRequest& request) const
{
    checkAdmission(request);
    return request.kind == JobKind::Preview ? runPreview(request) : runAdvanced(request);
}

JobResult ResolutionPipeline::runPreview(const JobRequest& request) const
{
    QElapsedTimer timer;
    timer.start();

    cv::Mat base = cropToBgr(request);
    const cv::Size canvas = previewSize(base.size());
    if (canvas != base.size()) {
        qDebug() << "ResolutionPipeline: Preview canvas" << base.cols << "x" << base.rows
                 << "->" << canvas.width << "x" << canvas.height;
        base = resizeTo(base, canvas);
    }

    JobResult result;
    result.kind = JobKind::Preview;
    result.outputSize = base.size();

    const SubjectMask subject = m_extractor ? m_extractor->extractSubject(base)
                                            : SubjectMask::degraded(base.size());
    result.subjectModel = subject.modelUsed;
    result.subjectExtracted = true;

    const cv::Mat shapeMask = ShapeEngine::computeShapeMask(base.size(), request.spec,
                                                            m_compositor.profile().path);

    // One style at a time: the composite is encoded and dropped before the next starts
    for (Style style : StyleCompositor::allStyles()) {
        cv::Mat image = m_compositor.composite(style, base, shapeMask, subject.alpha,
                                               request.spec, compositeDeadline());
        result.images.append(encode(style, image));
        image.release();
    }

    qInfo() << "ResolutionPipeline: Preview" << canvas.width << "x" << canvas.height
            << "rendered" << result.images.size() << "styles in" << timer.elapsed() << "ms";
    return result;
}

JobResult ResolutionPipeline::runAdvanced(const JobRequest& request) const
{
    QElapsedTimer timer;
    timer.start();

    JobResult result;
    result.kind = JobKind::Advanced;

    cv::Mat base = cropToBgr(request);
    const cv::Size canvas = nativeSize(base.size(), result.autoDownscaled);
    if (result.autoDownscaled) {
        qInfo() << "ResolutionPipeline: Auto-downscaling" << base.cols << "x" << base.rows
                << "to" << canvas.width << "x" << canvas.height;
        base = resizeTo(base, canvas);
    }
    result.outputSize = base.size();

    SubjectMask subject;
    if (StyleCompositor::requiresSubjectMask(request.style) || request.layeredExport) {
        subject = m_extractor ? m_extractor->extractSubject(base) : SubjectMask::degraded(base.size());
        result.subjectModel = subject.modelUsed;
        result.subjectExtracted = true;
    }

    const cv::Mat shapeMask = ShapeEngine::computeShapeMask(base.size(), request.spec,
                                                            m_compositor.profile().path);

    cv::Mat overlay;
    cv::Mat composite = m_compositor.composite(request.style, base, shapeMask, subject.alpha,
                                               request.spec, compositeDeadline(),
                                               request.layeredExport ? &overlay : nullptr);

    if (request.layeredExport) {
        result.layers = LayerExporter::buildPackage(base, subject, overlay, composite,
                                                    request.spec, request.style, request.sourceName);
    }
    result.images.append(encode(request.style, composite));

    qInfo() << "ResolutionPipeline: Advanced" << StyleCompositor::styleToString(request.style)
            << base.cols << "x" << base.rows << (request.layeredExport ? "with layers" : "")
            << "in" << timer.elapsed() << "ms";
    return result;
}

cv::Rect ResolutionPipeline::cropRect(const cv::Size& imageSize,
                                      AspectRatio ratio,
                                      const std::optional<cv::Rect>& crop)
{
    cv::Rect box(0, 0, imageSize.width, imageSize.height);

    if (crop) {
        box &= *crop;
        if (box.empty()) {
            throw AnvilError(ErrorKind::Validation, QString("Crop box lies outside the image"));
        }
    }

    // Largest rectangle of the requested ratio, centred in the box
    const double target = AnvilSpec::aspectRatioValue(ratio);
    int width = box.width;
    int height = box.height;
    if (static_cast<double>(width) / height > target) {
        width = std::max(1, static_cast<int>(std::lround(height * target)));
    } else {
        height = std::max(1, static_cast<int>(std::lround(width / target)));
    }
    width = std::min(width, box.width);
    height = std::min(height, box.height);

    return cv::Rect(box.x + (box.width - width) / 2, box.y + (box.height - height) / 2, width, height);
}

cv::Size ResolutionPipeline::previewSize(const cv::Size& cropSize) const
{
    const int bound = std::max(1, m_config.previewLongEdge);
    const int longEdge = std::max(cropSize.width, cropSize.height);
    if (longEdge <= 0) {
        return cropSize;
    }

    double factor = 1.0;
    if (longEdge > bound) {
        factor = static_cast<double>(bound) / longEdge;
    } else if (m_config.upscaleSmallPreviews && longEdge < bound * UPSCALE_THRESHOLD) {
        factor = std::min(static_cast<double>(bound) / longEdge, MAX_UPSCALE);
    }

    if (factor == 1.0) {
        return cropSize;
    }
    return cv::Size(std::max(1, static_cast<int>(std::lround(cropSize.width * factor))),
                    std::max(1, static_cast<int>(std::lround(cropSize.height * factor))));
}

cv::Size ResolutionPipeline::nativeSize(const cv::Size& cropSize, bool& downscaled) const
{
    downscaled = false;
    const int longEdge = std::max(cropSize.width, cropSize.height);
    if (m_config.maxNativeLongEdge <= 0 || longEdge <= m_config.maxNativeLongEdge) {
        return cropSize;
    }

    downscaled = true;
    const double factor = static_cast<double>(m_config.maxNativeLongEdge) / longEdge;
    return cv::Size(std::max(1, static_cast<int>(std::lround(cropSize.width * factor))),
                    std::max(1, static_cast<int>(std::lround(cropSize.height * factor))));
}

cv::Mat ResolutionPipeline::cropToBgr(const JobRequest& request)
{
    const cv::Rect rect = cropRect(request.image.size(), request.spec.aspectRatio, request.crop);
    const cv::Mat roi = request.image(rect);

    cv::Mat bgr;
    switch (roi.channels()) {
        case 4:
            cv::cvtColor(roi, bgr, cv::COLOR_BGRA2BGR);
            break;
        case 1:
            cv::cvtColor(roi, bgr, cv::COLOR_GRAY2BGR);
            break;
        default:
            bgr = roi.clone();
            break;
    }
    return bgr;
}

cv::Mat ResolutionPipeline::resizeTo(const cv::Mat& image, const cv::Size& size)
{
    if (image.size() == size) {
        return image;
    }

    int interpolation = cv::INTER_AREA;
    if (size.width > image.cols) {
        const qint64 pixels = static_cast<qint64>(image.cols) * image.rows;
        interpolation = pixels > LARGE_UPSCALE_PIXELS ? cv::INTER_LINEAR : cv::INTER_CUBIC;
    }

    cv::Mat resized;
    cv::resize(image, resized, size, 0, 0, interpolation);
    return resized;
}

QDeadlineTimer ResolutionPipeline::compositeDeadline() const
{
    if (m_config.compositeTimeoutMs <= 0) {
        return QDeadlineTimer(QDeadlineTimer::Forever);
    }
    return QDeadlineTimer(m_config.compositeTimeoutMs);
}

StyleResult ResolutionPipeline::encode(Style style, const cv::Mat& image) const
{
    StyleResult result;
    result.style = style;
    result.width = image.cols;
    result.height = image.rows;
    result.png = ImageIOHelper::encodePng(image);
    if (result.png.isEmpty()) {
        throw AnvilError(ErrorKind::CompositeFailure,
                         QString("Failed to encode %1").arg(StyleCompositor::styleToString(style)));
    }
    return result;
}
