#ifndef STYLECOMPOSITOR_H
#define STYLECOMPOSITOR_H

#include <QDeadlineTimer>
#include <QList>
#include <QString>
#include <opencv2/core.hpp>
#include <vector>
#include "anvilspec.h"
#include "shapeengine.h"

enum class Style {
    Flat,
    Stroke,
    Gradient,
    Window,
    Silhouette,
    GradientSilhouette
};

/**
 * @brief Brand rendering data shared by all jobs
 */
struct RenderProfile {
    AnvilPath path;
    std::vector<double> gradientTints;   // One stop per tint, see RgbColor::tinted()
    double strokeWidthFraction;          // Of the shape's shorter side

    RenderProfile() :
        path(AnvilPath::defaultPath()),
        gradientTints({0.5, 0.25, 0.0, -0.25}),
        strokeWidthFraction(0.02)
    {}
};

/**
 * @brief Renders the six anvil styles
 *
 * Every style except Window is rendered as a BGRA overlay of the canvas size and
 * then flattened over the base image with straight-alpha "over". The overlay is
 * kept separate so the layer exporter can ship it as its own layer. Window
 * instead cuts the base image out with the shape mask and leaves the rest
 * transparent.
 *
 * All outputs are CV_8UC4 with the base image dimensions.
 */
class StyleCompositor
{
public:
    explicit StyleCompositor(const RenderProfile& profile = RenderProfile());

    /**
     * @brief Composite one style
     * @param style Style to render
     * @param baseImage 8-bit BGR or BGRA image
     * @param shapeMask CV_8UC1 anvil mask (255 inside) of the base size
     * @param subjectMask CV_8UC1 subject alpha of the base size; required by the
     *        silhouette styles, ignored otherwise
     * @param spec Anvil parameters
     * @param deadline Soft limit; checked between row bands
     * @param overlayOut Receives the anvil layer when not null
     * @return CV_8UC4 image
     * @throws AnvilError CompositeFailure on mismatched inputs, Timeout when the deadline expires
     */
    cv::Mat composite(Style style,
                      const cv::Mat& baseImage,
                      const cv::Mat& shapeMask,
                      const cv::Mat& subjectMask,
                      const AnvilSpec& spec,
                      QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever),
                      cv::Mat* overlayOut = nullptr) const;

    /**
     * @brief Render the anvil layer of a style
     *
     * For Window the layer is the windowed photo itself.
     */
    cv::Mat renderOverlay(Style style,
                          const cv::Mat& baseImage,
                          const cv::Mat& shapeMask,
                          const cv::Mat& subjectMask,
                          const AnvilSpec& spec) const;

    /**
     * @brief Straight-alpha "over" of a BGRA layer onto an opaque canvas
     * @param overlay CV_8UC4 layer
     * @param canvas CV_8UC3 or CV_8UC4 canvas of the same size
     * @param deadline Soft limit; checked between row bands
     * @return Opaque CV_8UC4 result
     */
    static cv::Mat alphaOver(const cv::Mat& overlay,
                             const cv::Mat& canvas,
                             QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever));

    /**
     * @brief Tonal variants of a colour, one per tint
     */
    static QList<RgbColor> gradientStops(const RgbColor& color, const std::vector<double>& tints);

    /**
     * @brief True for Silhouette and Gradient Silhouette
     */
    static bool requiresSubjectMask(Style style);

    static QString styleToString(Style style);

    /**
     * @brief Parse a style name ("Flat", "gradient_silhouette", "Gradient Silhouette", ...)
     * @return true if the name is known
     */
    static bool styleFromString(const QString& name, Style& style);

    /**
     * @brief All styles in preview order
     */
    static QList<Style> allStyles();

    const RenderProfile& profile() const { return m_profile; }

private:
    /**
     * @brief Horizontal linear gradient spanning [x0, x1], ends extended
     * @return CV_8UC3 BGR image of the given size
     */
    cv::Mat renderGradient(const cv::Size& size, int x0, int x1, const RgbColor& color) const;

    /**
     * @brief Outline width for a shape, at least one pixel
     */
    int strokeThickness(const cv::Rect& shapeBounds) const;

    RenderProfile m_profile;

    // Rows processed between deadline checks
    static constexpr int ROW_BAND = 64;
};

#endif // STYLECOMPOSITOR_H
