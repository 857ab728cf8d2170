#include "anvilspec.h"
#include <algorithm>
#include <cmath>

namespace {

bool inRange(double value, double minValue, double maxValue)
{
    return std::isfinite(value) && value >= minValue && value <= maxValue;
}

bool readDouble(const QVariantMap& params, const QString& key, double& value, QString* errorMessage)
{
    if (!params.contains(key)) {
        return true;
    }
    bool ok = false;
    double parsed = params.value(key).toDouble(&ok);
    if (!ok) {
        if (errorMessage) {
            *errorMessage = QString("Parameter '%1' is not a number").arg(key);
        }
        return false;
    }
    value = parsed;
    return true;
}

} // namespace

QString RgbColor::toHex() const
{
    return QString("#%1%2%3")
        .arg(r, 2, 16, QChar('0'))
        .arg(g, 2, 16, QChar('0'))
        .arg(b, 2, 16, QChar('0'))
        .toUpper();
}

cv::Vec4b RgbColor::toBgra(int alpha) const
{
    return cv::Vec4b(static_cast<uchar>(b), static_cast<uchar>(g),
                     static_cast<uchar>(r), static_cast<uchar>(alpha));
}

bool RgbColor::fromHex(const QString& hex, RgbColor& color)
{
    QString digits = hex.trimmed();
    if (digits.startsWith('#')) {
        digits = digits.mid(1);
    }
    if (digits.size() != 6) {
        return false;
    }

    bool ok = false;
    uint value = digits.toUInt(&ok, 16);
    if (!ok) {
        return false;
    }

    color = RgbColor((value >> 16) & 0xFF, (value >> 8) & 0xFF, value & 0xFF);
    return true;
}

RgbColor RgbColor::tinted(double tint) const
{
    tint = std::max(-1.0, std::min(1.0, tint));
    auto mix = [tint](int channel) {
        double target = tint >= 0.0 ? 255.0 : 0.0;
        double amount = std::abs(tint);
        return static_cast<int>(channel + (target - channel) * amount);
    };
    return RgbColor(mix(r), mix(g), mix(b));
}

bool AnvilSpec::validate(QString* errorMessage) const
{
    QString reason;
    if (!inRange(scale, 0.5, 1.0)) {
        reason = QString("scale must be within [0.5, 1.0], got %1").arg(scale);
    } else if (!inRange(offsetX, -1.0, 1.0)) {
        reason = QString("offsetX must be within [-1, 1], got %1").arg(offsetX);
    } else if (!inRange(offsetY, -1.0, 1.0)) {
        reason = QString("offsetY must be within [-1, 1], got %1").arg(offsetY);
    } else if (!inRange(opacity, 0.0, 1.0)) {
        reason = QString("opacity must be within [0, 1], got %1").arg(opacity);
    } else if (color.r < 0 || color.r > 255 || color.g < 0 || color.g > 255 ||
               color.b < 0 || color.b > 255) {
        reason = "color channels must be within [0, 255]";
    }

    if (!reason.isEmpty()) {
        if (errorMessage) {
            *errorMessage = reason;
        }
        return false;
    }
    return true;
}

bool AnvilSpec::fromParameters(const QVariantMap& params, AnvilSpec& spec, QString* errorMessage)
{
    AnvilSpec parsed;

    if (!readDouble(params, "scale", parsed.scale, errorMessage) ||
        !readDouble(params, "offsetX", parsed.offsetX, errorMessage) ||
        !readDouble(params, "offsetY", parsed.offsetY, errorMessage) ||
        !readDouble(params, "opacity", parsed.opacity, errorMessage)) {
        return false;
    }

    if (params.contains("color")) {
        QString hex = params.value("color").toString();
        if (!RgbColor::fromHex(hex, parsed.color)) {
            if (errorMessage) {
                *errorMessage = QString("Invalid colour '%1'").arg(hex);
            }
            return false;
        }
    }

    if (params.contains("ratio")) {
        QString ratio = params.value("ratio").toString();
        if (!aspectRatioFromString(ratio, parsed.aspectRatio)) {
            if (errorMessage) {
                *errorMessage = QString("Unsupported aspect ratio '%1'").arg(ratio);
            }
            return false;
        }
    }

    if (!parsed.validate(errorMessage)) {
        return false;
    }

    spec = parsed;
    return true;
}

double AnvilSpec::aspectRatioValue(AspectRatio ratio)
{
    switch (ratio) {
        case AspectRatio::Landscape16x9:
            return 16.0 / 9.0;
        case AspectRatio::Square1x1:
            return 1.0;
        case AspectRatio::Portrait9x16:
            return 9.0 / 16.0;
        default:
            return 16.0 / 9.0;
    }
}

QString AnvilSpec::aspectRatioToString(AspectRatio ratio)
{
    switch (ratio) {
        case AspectRatio::Landscape16x9:
            return "16:9";
        case AspectRatio::Square1x1:
            return "1:1";
        case AspectRatio::Portrait9x16:
            return "9:16";
        default:
            return "16:9";
    }
}

bool AnvilSpec::aspectRatioFromString(const QString& name, AspectRatio& ratio)
{
    if (name == "16:9") {
        ratio = AspectRatio::Landscape16x9;
    } else if (name == "1:1") {
        ratio = AspectRatio::Square1x1;
    } else if (name == "9:16") {
        ratio = AspectRatio::Portrait9x16;
    } else {
        return false;
    }
    return true;
}

const QList<QPair<QString, QString>>& ColorPalette::entries()
{
    static const QList<QPair<QString, QString>> palette = {
        {"White", "#FFFFFF"},
        {"Black", "#000000"},
        {"Light Gray", "#EDEFF0"},
        {"Light Blue 1", "#D1EFFF"},
        {"Light Blue 2", "#AEDBFF"},
        {"Light Blue 3", "#7FC7FF"},
        {"Light Blue 4", "#4EAEFF"},
        {"Blue 1", "#1E90FF"},
        {"Blue 2", "#0070F2"},
        {"Dark Blue", "#0057B8"},
        {"Navy", "#00418A"},
        {"Deep Blue", "#002C5C"},
        {"Teal 1", "#7AD0C9"},
        {"Teal 2", "#2FA7A0"},
        {"Teal 3", "#0D7F7B"},
        {"Light Green", "#8FD99B"},
        {"Green 1", "#44B87B"},
        {"Green 2", "#2B7C46"},
        {"Cream", "#FFF2CC"},
        {"Yellow", "#FFD97A"},
        {"Orange 1", "#FFB300"},
        {"Orange 2", "#E37D00"},
        {"Brown", "#8A4B00"},
        {"Red 1", "#7A0613"},
        {"Red 2", "#AA0843"},
        {"Pink 1", "#D66D9E"},
        {"Pink 2", "#B94D85"}
    };
    return palette;
}

QString ColorPalette::nameFor(const RgbColor& color)
{
    const QString hex = color.toHex();
    for (const auto& entry : entries()) {
        if (entry.second.compare(hex, Qt::CaseInsensitive) == 0) {
            return entry.first;
        }
    }
    return "Custom";
}

QString ColorPalette::slugFor(const RgbColor& color)
{
    return nameFor(color).remove(' ');
}
