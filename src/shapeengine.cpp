#include "shapeengine.h"
#include <QStringList>
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

AnvilPath AnvilPath::defaultPath()
{
    AnvilPath path;
    path.vertices = {
        cv::Point2d(0.0, 0.0),
        cv::Point2d(1.0, 0.0),
        cv::Point2d(0.5, 1.0),
        cv::Point2d(0.0, 1.0)
    };
    return path;
}

bool AnvilPath::fromString(const QString& text, AnvilPath& path)
{
    AnvilPath parsed;
    const QStringList points = text.split(';', Qt::SkipEmptyParts);
    for (const QString& point : points) {
        const QStringList coords = point.split(',');
        if (coords.size() != 2) {
            return false;
        }
        bool okX = false;
        bool okY = false;
        double x = coords[0].trimmed().toDouble(&okX);
        double y = coords[1].trimmed().toDouble(&okY);
        if (!okX || !okY) {
            return false;
        }
        parsed.vertices.emplace_back(x, y);
    }

    if (!parsed.isValid()) {
        return false;
    }
    path = parsed;
    return true;
}

QString AnvilPath::toString() const
{
    QStringList points;
    for (const cv::Point2d& vertex : vertices) {
        points << QString("%1,%2").arg(vertex.x).arg(vertex.y);
    }
    return points.join(';');
}

bool AnvilPath::isValid() const
{
    if (vertices.size() < 3) {
        return false;
    }
    return std::all_of(vertices.begin(), vertices.end(), [](const cv::Point2d& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) &&
               v.x >= 0.0 && v.x <= 1.0 && v.y >= 0.0 && v.y <= 1.0;
    });
}

cv::Rect AnvilGeometry::boundingRect() const
{
    if (polygon.empty()) {
        return cv::Rect();
    }
    return cv::boundingRect(polygon);
}

AnvilGeometry ShapeEngine::computeGeometry(const cv::Size& canvasSize,
                                           const AnvilSpec& spec,
                                           const AnvilPath& path)
{
    AnvilGeometry geometry;
    geometry.canvasSize = canvasSize;
    if (canvasSize.width <= 0 || canvasSize.height <= 0) {
        return geometry;
    }

    const AnvilPath& outline = path.isValid() ? path : AnvilPath::defaultPath();

    const double width = canvasSize.width;
    const double height = canvasSize.height;
    const double scale = std::isfinite(spec.scale) ? std::max(0.0, std::min(spec.scale, 1.0)) : 1.0;
    const double offsetX = std::isfinite(spec.offsetX) ? std::max(-1.0, std::min(spec.offsetX, 1.0)) : 0.0;
    const double offsetY = std::isfinite(spec.offsetY) ? std::max(-1.0, std::min(spec.offsetY, 1.0)) : 0.0;

    // The box must fit both axes, so the limiting dimension is min(width, 2 * height)
    const double limiting = std::min(width, height * BOX_ASPECT);
    const double boxWidth = scale * limiting;
    const double boxHeight = boxWidth / BOX_ASPECT;

    const double slackX = (width - boxWidth) / 2.0;
    const double slackY = (height - boxHeight) / 2.0;

    double left = slackX + offsetX * slackX;
    double top = slackY + offsetY * slackY;
    left = std::max(0.0, std::min(left, width - boxWidth));
    top = std::max(0.0, std::min(top, height - boxHeight));

    geometry.box = cv::Rect2d(left, top, boxWidth, boxHeight);

    geometry.polygon.reserve(outline.vertices.size());
    for (const cv::Point2d& vertex : outline.vertices) {
        int x = static_cast<int>(std::floor(left + vertex.x * boxWidth));
        int y = static_cast<int>(std::floor(top + vertex.y * boxHeight));
        x = std::max(0, std::min(x, canvasSize.width - 1));
        y = std::max(0, std::min(y, canvasSize.height - 1));
        geometry.polygon.emplace_back(x, y);
    }

    return geometry;
}

cv::Mat ShapeEngine::computeShapeMask(const cv::Size& canvasSize,
                                      const AnvilSpec& spec,
                                      const AnvilPath& path)
{
    return rasterize(computeGeometry(canvasSize, spec, path));
}

cv::Mat ShapeEngine::rasterize(const AnvilGeometry& geometry)
{
    cv::Mat mask = cv::Mat::zeros(geometry.canvasSize, CV_8UC1);
    if (mask.empty() || geometry.polygon.size() < 3) {
        return mask;
    }

    std::vector<std::vector<cv::Point>> contours{geometry.polygon};
    cv::fillPoly(mask, contours, cv::Scalar(MASK_INSIDE), cv::LINE_8);
    return mask;
}
