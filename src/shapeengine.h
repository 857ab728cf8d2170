#ifndef SHAPEENGINE_H
#define SHAPEENGINE_H

#include <QString>
#include <algorithm>
#include <opencv2/core.hpp>
#include <vector>
#include "anvilspec.h"

/**
 * @brief Normalized anvil outline
 *
 * Vertices are expressed in a unit box that is later stretched to the anvil's
 * 2:1 bounding box, so (0,0) is the top-left and (1,1) the bottom-right corner.
 * The outline is brand data and comes from configuration.
 */
struct AnvilPath {
    std::vector<cv::Point2d> vertices;

    /**
     * @brief Default outline: flat top edge, vertical left edge, diagonal down to the bottom centre
     */
    static AnvilPath defaultPath();

    /**
     * @brief Parse "x,y;x,y;..." with at least three vertices inside [0, 1]
     * @param text Serialized path
     * @param path Parsed path on success
     * @return true if the text describes a valid path
     */
    static bool fromString(const QString& text, AnvilPath& path);

    QString toString() const;

    bool isValid() const;
};

/**
 * @brief Placement of the anvil on a concrete canvas
 */
struct AnvilGeometry {
    cv::Size canvasSize;
    cv::Rect2d box;                  // 2:1 bounding box in canvas coordinates
    std::vector<cv::Point> polygon;  // Pixel vertices, clamped to the canvas

    /**
     * @brief Integer bounding rectangle of the polygon
     */
    cv::Rect boundingRect() const;

    /**
     * @brief Shorter side of the anvil box in pixels
     */
    double shorterSide() const { return std::min(box.width, box.height); }
};

/**
 * @brief Positions the anvil on a canvas and rasterizes its mask
 *
 * All functions are deterministic and never fail: out-of-range parameters are
 * clamped so the shape stays on the canvas.
 */
class ShapeEngine
{
public:
    /**
     * @brief Compute the anvil placement for a canvas
     *
     * The box width is spec.scale times the limiting dimension (the canvas width,
     * or twice its height when the canvas is wider than 2:1). Offsets move the box
     * linearly from the centre toward the edges of the remaining slack.
     *
     * @param canvasSize Target canvas size
     * @param spec Anvil parameters
     * @param path Normalized outline
     * @return Placement with pixel polygon
     */
    static AnvilGeometry computeGeometry(const cv::Size& canvasSize,
                                         const AnvilSpec& spec,
                                         const AnvilPath& path = AnvilPath::defaultPath());

    /**
     * @brief Rasterize the anvil as a single-channel mask
     * @param canvasSize Target canvas size
     * @param spec Anvil parameters
     * @param path Normalized outline
     * @return CV_8UC1 mask, MASK_INSIDE inside the polygon and 0 outside
     */
    static cv::Mat computeShapeMask(const cv::Size& canvasSize,
                                    const AnvilSpec& spec,
                                    const AnvilPath& path = AnvilPath::defaultPath());

    /**
     * @brief Rasterize an already computed placement
     */
    static cv::Mat rasterize(const AnvilGeometry& geometry);

    static constexpr uchar MASK_INSIDE = 255;

    // Width:height of the anvil bounding box
    static constexpr double BOX_ASPECT = 2.0;
};

#endif // SHAPEENGINE_H
