#ifndef ANVILSPEC_H
#define ANVILSPEC_H

#include <QList>
#include <QPair>
#include <QString>
#include <QVariantMap>
#include <opencv2/core.hpp>

/**
 * @brief 8-bit RGB colour
 */
struct RgbColor {
    int r;
    int g;
    int b;

    RgbColor() : r(0), g(0), b(0) {}
    RgbColor(int red, int green, int blue) : r(red), g(green), b(blue) {}

    bool operator==(const RgbColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const RgbColor& other) const { return !(*this == other); }

    /**
     * @brief Format as upper-case "#RRGGBB"
     */
    QString toHex() const;

    /**
     * @brief OpenCV colour in BGRA channel order
     * @param alpha Alpha value (0-255)
     */
    cv::Vec4b toBgra(int alpha = 255) const;

    /**
     * @brief Parse "#RRGGBB" or "RRGGBB" (case-insensitive)
     * @param hex Hex string
     * @param color Parsed colour on success
     * @return true if the string is a valid colour
     */
    static bool fromHex(const QString& hex, RgbColor& color);

    /**
     * @brief Mix towards white (positive tint) or black (negative tint)
     * @param tint Amount in [-1, 1]; 0 returns the colour unchanged
     * @return Tinted colour
     */
    RgbColor tinted(double tint) const;
};

enum class AspectRatio {
    Landscape16x9,
    Square1x1,
    Portrait9x16
};

/**
 * @brief Parameters describing the anvil overlay of one job
 *
 * Immutable once a job starts: the scheduler copies it into the job record.
 */
struct AnvilSpec {
    double scale;            // Fraction of the crop box limiting dimension, [0.5, 1.0]
    double offsetX;          // Fraction of the remaining horizontal slack, [-1, 1]
    double offsetY;          // Fraction of the remaining vertical slack, [-1, 1]
    RgbColor color;
    double opacity;          // [0, 1]
    AspectRatio aspectRatio;

    AnvilSpec() :
        scale(0.7),
        offsetX(0.0),
        offsetY(0.0),
        color(0x00, 0x70, 0xF2),
        opacity(0.5),
        aspectRatio(AspectRatio::Landscape16x9)
    {}

    /**
     * @brief Check every field against its allowed range
     * @param errorMessage Set to a short reason when invalid
     * @return true if the spec is valid
     */
    bool validate(QString* errorMessage = nullptr) const;

    /**
     * @brief Build a spec from request parameters
     *
     * Recognised keys: "scale", "offsetX", "offsetY", "color", "opacity", "ratio".
     * Missing keys keep their defaults.
     *
     * @param params Parameter map handed over by the request layer
     * @param spec Parsed spec
     * @param errorMessage Reason on failure
     * @return true if all present values parsed and the result validates
     */
    static bool fromParameters(const QVariantMap& params, AnvilSpec& spec, QString* errorMessage = nullptr);

    /**
     * @brief Width divided by height for an aspect ratio
     */
    static double aspectRatioValue(AspectRatio ratio);

    static QString aspectRatioToString(AspectRatio ratio);
    static bool aspectRatioFromString(const QString& name, AspectRatio& ratio);
};

/**
 * @brief Named brand colours used for display names and file names
 */
class ColorPalette
{
public:
    /**
     * @brief Get all palette entries as (name, hex) pairs
     */
    static const QList<QPair<QString, QString>>& entries();

    /**
     * @brief Look up the display name of a colour
     * @param color Colour to look up
     * @return Palette name, or "Custom" if the colour is not in the palette
     */
    static QString nameFor(const RgbColor& color);

    /**
     * @brief Display name with spaces removed, for file names
     */
    static QString slugFor(const RgbColor& color);
};

#endif // ANVILSPEC_H
