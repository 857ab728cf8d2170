#include "stylecompositor.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include "anvilerror.h"

namespace {

cv::Mat toBgra(const cv::Mat& image)
{
    cv::Mat bgra;
    switch (image.channels()) {
        case 4:
            bgra = image.clone();
            break;
        case 3:
            cv::cvtColor(image, bgra, cv::COLOR_BGR2BGRA);
            break;
        case 1:
            cv::cvtColor(image, bgra, cv::COLOR_GRAY2BGRA);
            break;
        default:
            throw AnvilError(ErrorKind::CompositeFailure,
                             QString("Unsupported channel count %1").arg(image.channels()));
    }
    return bgra;
}

void checkDeadline(const QDeadlineTimer& deadline)
{
    if (deadline.hasExpired()) {
        throw AnvilError(ErrorKind::Timeout, QString("Compositing exceeded its time limit"));
    }
}

}

StyleCompositor::StyleCompositor(const RenderProfile& profile)
    : m_profile(profile)
{
    if (!m_profile.path.isValid()) {
        qWarning() << "StyleCompositor: Invalid anvil path, using default";
        m_profile.path = AnvilPath::defaultPath();
    }
    if (m_profile.gradientTints.empty()) {
        m_profile.gradientTints = RenderProfile().gradientTints;
    }
    if (!(m_profile.strokeWidthFraction > 0.0)) {
        m_profile.strokeWidthFraction = RenderProfile().strokeWidthFraction;
    }
}

cv::Mat StyleCompositor::composite(Style style,
                                   const cv::Mat& baseImage,
                                   const cv::Mat& shapeMask,
                                   const cv::Mat& subjectMask,
                                   const AnvilSpec& spec,
                                   QDeadlineTimer deadline,
                                   cv::Mat* overlayOut) const
{
    checkDeadline(deadline);

    cv::Mat overlay = renderOverlay(style, baseImage, shapeMask, subjectMask, spec);
    if (overlayOut) {
        *overlayOut = overlay;
    }
    if (style == Style::Window) {
        checkDeadline(deadline);
        return overlay.clone();
    }

    return alphaOver(overlay, baseImage, deadline);
}

cv::Mat StyleCompositor::renderOverlay(Style style,
                                       const cv::Mat& baseImage,
                                       const cv::Mat& shapeMask,
                                       const cv::Mat& subjectMask,
                                       const AnvilSpec& spec) const
{
    if (baseImage.empty() || baseImage.depth() != CV_8U) {
        throw AnvilError(ErrorKind::CompositeFailure, QString("Base image must be a non-empty 8-bit image"));
    }
    if (shapeMask.size() != baseImage.size() || shapeMask.type() != CV_8UC1) {
        throw AnvilError(ErrorKind::CompositeFailure, QString("Shape mask does not match the base image"));
    }

    const cv::Size size = baseImage.size();

    // An absent subject mask behaves like the degraded one
    cv::Mat subject;
    if (requiresSubjectMask(style)) {
        if (subjectMask.empty()) {
            subject = cv::Mat(size, CV_8UC1, cv::Scalar(255));
        } else if (subjectMask.size() != size || subjectMask.type() != CV_8UC1) {
            throw AnvilError(ErrorKind::CompositeFailure, QString("Subject mask does not match the base image"));
        } else {
            subject = subjectMask;
        }
    }

    cv::Mat overlay = cv::Mat::zeros(size, CV_8UC4);

    switch (style) {
        case Style::Flat: {
            const int alpha = static_cast<int>(std::lround(std::max(0.0, std::min(spec.opacity, 1.0)) * 255.0));
            const cv::Vec4b fill = spec.color.toBgra(alpha);
            overlay.setTo(cv::Scalar(fill[0], fill[1], fill[2], fill[3]), shapeMask);
            break;
        }
        case Style::Stroke: {
            std::vector<std::vector<cv::Point>> contours;
            cv::findContours(shapeMask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
            if (contours.empty()) {
                break;
            }
            const cv::Vec4b line = spec.color.toBgra(255);
            cv::drawContours(overlay, contours, -1, cv::Scalar(line[0], line[1], line[2], line[3]),
                             strokeThickness(cv::boundingRect(shapeMask)), cv::LINE_8);
            break;
        }
        case Style::Gradient: {
            const cv::Rect bounds = cv::boundingRect(shapeMask);
            if (bounds.empty()) {
                break;
            }
            cv::Mat gradient = renderGradient(size, bounds.x, bounds.x + bounds.width - 1, spec.color);
            cv::Mat gradientBgra;
            cv::cvtColor(gradient, gradientBgra, cv::COLOR_BGR2BGRA);
            gradientBgra.copyTo(overlay, shapeMask);
            break;
        }
        case Style::Window: {
            cv::Mat base = toBgra(baseImage);
            base.copyTo(overlay, shapeMask);
            break;
        }
        case Style::Silhouette:
        case Style::GradientSilhouette: {
            cv::Mat fill;
            if (style == Style::Silhouette) {
                const cv::Vec4b color = spec.color.toBgra(255);
                fill = cv::Mat(size, CV_8UC3, cv::Scalar(color[0], color[1], color[2]));
            } else {
                // Gradient follows the anvil's long axis but covers the whole canvas
                const cv::Rect bounds = cv::boundingRect(shapeMask);
                const int x0 = bounds.empty() ? 0 : bounds.x;
                const int x1 = bounds.empty() ? size.width - 1 : bounds.x + bounds.width - 1;
                fill = renderGradient(size, x0, x1, spec.color);
            }

            // The subject is knocked out of the fill so the photo shows through
            cv::Mat knockout;
            cv::subtract(cv::Scalar(255), subject, knockout);

            std::vector<cv::Mat> channels;
            cv::split(fill, channels);
            channels.push_back(knockout);
            cv::merge(channels, overlay);
            break;
        }
        default:
            throw AnvilError(ErrorKind::CompositeFailure, QString("Unknown style"));
    }

    return overlay;
}

cv::Mat StyleCompositor::alphaOver(const cv::Mat& overlay, const cv::Mat& canvas, QDeadlineTimer deadline)
{
    if (overlay.type() != CV_8UC4 || overlay.size() != canvas.size()) {
        throw AnvilError(ErrorKind::CompositeFailure, QString("Overlay does not match the canvas"));
    }

    cv::Mat result = toBgra(canvas);

    for (int y = 0; y < result.rows; ++y) {
        if (y % ROW_BAND == 0) {
            checkDeadline(deadline);
        }
        const cv::Vec4b* src = overlay.ptr<cv::Vec4b>(y);
        cv::Vec4b* dst = result.ptr<cv::Vec4b>(y);
        for (int x = 0; x < result.cols; ++x) {
            const int a = src[x][3];
            if (a == 255) {
                dst[x] = cv::Vec4b(src[x][0], src[x][1], src[x][2], 255);
            } else if (a > 0) {
                for (int c = 0; c < 3; ++c) {
                    dst[x][c] = static_cast<uchar>((src[x][c] * a + dst[x][c] * (255 - a) + 127) / 255);
                }
                dst[x][3] = 255;
            } else {
                dst[x][3] = 255;
            }
        }
    }

    return result;
}

QList<RgbColor> StyleCompositor::gradientStops(const RgbColor& color, const std::vector<double>& tints)
{
    QList<RgbColor> stops;
    for (double tint : tints) {
        stops.append(color.tinted(tint));
    }
    return stops;
}

cv::Mat StyleCompositor::renderGradient(const cv::Size& size, int x0, int x1, const RgbColor& color) const
{
    const QList<RgbColor> stops = gradientStops(color, m_profile.gradientTints);
    const double span = std::max(1, x1 - x0);
    const int segments = std::max(1, static_cast<int>(stops.size()) - 1);

    cv::Mat row(1, size.width, CV_8UC3);
    cv::Vec3b* pixels = row.ptr<cv::Vec3b>(0);
    for (int x = 0; x < size.width; ++x) {
        if (stops.size() == 1) {
            pixels[x] = cv::Vec3b(stops[0].b, stops[0].g, stops[0].r);
            continue;
        }

        const double t = std::max(0.0, std::min((x - x0) / span, 1.0));
        const double position = t * segments;
        const int index = std::min(static_cast<int>(position), segments - 1);
        const double local = position - index;
        const RgbColor& from = stops[index];
        const RgbColor& to = stops[index + 1];

        auto mix = [local](int a, int b) {
            return cv::saturate_cast<uchar>(a + (b - a) * local);
        };
        pixels[x] = cv::Vec3b(mix(from.b, to.b), mix(from.g, to.g), mix(from.r, to.r));
    }

    cv::Mat gradient;
    cv::repeat(row, size.height, 1, gradient);
    return gradient;
}

int StyleCompositor::strokeThickness(const cv::Rect& shapeBounds) const
{
    const double shorterSide = std::min(shapeBounds.width, shapeBounds.height);
    return std::max(1, static_cast<int>(std::lround(shorterSide * m_profile.strokeWidthFraction)));
}

bool StyleCompositor::requiresSubjectMask(Style style)
{
    return style == Style::Silhouette || style == Style::GradientSilhouette;
}

QString StyleCompositor::styleToString(Style style)
{
    switch (style) {
        case Style::Flat:               return "Flat";
        case Style::Stroke:             return "Stroke";
        case Style::Gradient:           return "Gradient";
        case Style::Window:             return "Window";
        case Style::Silhouette:         return "Silhouette";
        case Style::GradientSilhouette: return "Gradient Silhouette";
        default:                        return "Unknown";
    }
}

bool StyleCompositor::styleFromString(const QString& name, Style& style)
{
    QString key = name.trimmed().toLower();
    key.replace('_', ' ');
    key.replace('-', ' ');

    for (Style candidate : allStyles()) {
        if (styleToString(candidate).toLower() == key) {
            style = candidate;
            return true;
        }
    }
    return false;
}

QList<Style> StyleCompositor::allStyles()
{
    return {Style::Flat, Style::Stroke, Style::Gradient,
            Style::Window, Style::Silhouette, Style::GradientSilhouette};
}
