#include "layerexporter.h"
#include <QDebug>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QStringList>
#include <opencv2/imgproc.hpp>
#include "anvilerror.h"
#include "imageiohelper.h"

const QString LayerExporter::BACKGROUND_FILE = "01_background.png";
const QString LayerExporter::SUBJECT_FILE = "02_subject_cutout.png";
const QString LayerExporter::SHAPE_FILE = "03_anvil_shape.png";
const QString LayerExporter::COMPOSITE_FILE = "final_composite.png";
const QString LayerExporter::METADATA_FILE = "layer_info.json";
const QString LayerExporter::README_FILE = "README.txt";

const LayerArtifact* LayerPackage::find(const QString& fileName) const
{
    for (const LayerArtifact& artifact : artifacts) {
        if (artifact.fileName == fileName) {
            return &artifact;
        }
    }
    return nullptr;
}

QList<LayerArtifact> LayerPackage::layers() const
{
    QList<LayerArtifact> result;
    for (const LayerArtifact& artifact : artifacts) {
        if (artifact.fileName == LayerExporter::BACKGROUND_FILE ||
            artifact.fileName == LayerExporter::SUBJECT_FILE ||
            artifact.fileName == LayerExporter::SHAPE_FILE) {
            result.append(artifact);
        }
    }
    return result;
}

LayerPackage LayerExporter::buildPackage(const cv::Mat& background,
                                         const SubjectMask& subject,
                                         const cv::Mat& overlay,
                                         const cv::Mat& composite,
                                         const AnvilSpec& spec,
                                         Style style,
                                         const QString& sourceName,
                                         const QDateTime& createdAt)
{
    if (background.empty()) {
        throw AnvilError(ErrorKind::CompositeFailure, QString("Layer export needs a background image"));
    }

    const cv::Size size = background.size();
    if (overlay.size() != size || composite.size() != size || subject.alpha.size() != size) {
        throw AnvilError(ErrorKind::CompositeFailure,
                         QString("Layer sizes do not match the background (%1x%2)").arg(size.width).arg(size.height));
    }
    if (overlay.type() != CV_8UC4 || subject.alpha.type() != CV_8UC1) {
        throw AnvilError(ErrorKind::CompositeFailure, QString("Unexpected layer pixel format"));
    }

    cv::Mat backgroundBgr;
    if (background.channels() == 4) {
        cv::cvtColor(background, backgroundBgr, cv::COLOR_BGRA2BGR);
    } else {
        backgroundBgr = background;
    }

    // Cutout: the background with the subject mask as its alpha channel
    std::vector<cv::Mat> channels;
    cv::split(backgroundBgr, channels);
    channels.push_back(subject.alpha);
    cv::Mat cutout;
    cv::merge(channels, cutout);

    const QString colorName = ColorPalette::nameFor(spec.color);

    LayerPackage package;
    package.artifacts.append(encodeLayer("Background", BACKGROUND_FILE,
                                         "Original cropped image at full resolution", backgroundBgr));
    package.artifacts.append(encodeLayer("Subject Cutout", SUBJECT_FILE,
                                         subject.isDegraded()
                                             ? "Whole image, subject extraction was unavailable"
                                             : "Extracted person/object with transparency",
                                         cutout));
    package.artifacts.append(encodeLayer("Anvil Shape", SHAPE_FILE,
                                         QString("Anvil overlay in %1 (%2)").arg(colorName, spec.color.toHex()),
                                         overlay));

    const QList<LayerArtifact> stack = package.artifacts;

    package.artifacts.append(encodeLayer("Final Composite", COMPOSITE_FILE,
                                         "Ready-to-use flattened result", composite));

    package.metadata = createMetadata(style, spec, sourceName, size, subject, stack, createdAt);

    LayerArtifact metadataFile;
    metadataFile.name = "Layer Info";
    metadataFile.fileName = METADATA_FILE;
    metadataFile.description = "Technical metadata";
    metadataFile.bytes = QJsonDocument(package.metadata).toJson(QJsonDocument::Indented);
    package.artifacts.append(metadataFile);

    LayerArtifact readmeFile;
    readmeFile.name = "Readme";
    readmeFile.fileName = README_FILE;
    readmeFile.description = "Usage instructions";
    readmeFile.bytes = createReadme(style, spec.color, sourceName, size).toUtf8();
    package.artifacts.append(readmeFile);

    qInfo() << "LayerExporter: Built package for" << StyleCompositor::styleToString(style)
            << "at" << size.width << "x" << size.height << "with" << package.artifacts.size() << "files";

    return package;
}

LayerArtifact LayerExporter::encodeLayer(const QString& name,
                                         const QString& fileName,
                                         const QString& description,
                                         const cv::Mat& image)
{
    LayerArtifact artifact;
    artifact.name = name;
    artifact.fileName = fileName;
    artifact.description = description;
    artifact.size = image.size();
    artifact.bytes = ImageIOHelper::encodePng(image);
    if (artifact.bytes.isEmpty()) {
        throw AnvilError(ErrorKind::CompositeFailure, QString("Failed to encode %1").arg(fileName));
    }
    return artifact;
}

QJsonObject LayerExporter::createMetadata(Style style,
                                          const AnvilSpec& spec,
                                          const QString& sourceName,
                                          const cv::Size& resolution,
                                          const SubjectMask& subject,
                                          const QList<LayerArtifact>& layers,
                                          const QDateTime& createdAt)
{
    QJsonArray layerArray;
    for (const LayerArtifact& layer : layers) {
        QJsonObject entry;
        entry["name"] = layer.name;
        entry["file"] = layer.fileName;
        entry["description"] = layer.description;
        layerArray.append(entry);
    }

    QJsonObject color;
    color["name"] = ColorPalette::nameFor(spec.color);
    color["hex"] = spec.color.toHex();

    QJsonObject specObject;
    specObject["scale"] = spec.scale;
    specObject["offsetX"] = spec.offsetX;
    specObject["offsetY"] = spec.offsetY;
    specObject["opacity"] = spec.opacity;
    specObject["aspectRatio"] = AnvilSpec::aspectRatioToString(spec.aspectRatio);

    QJsonObject exportObject;
    exportObject["version"] = "1.0";
    exportObject["style"] = StyleCompositor::styleToString(style);
    exportObject["color"] = color;
    exportObject["original_filename"] = sourceName;
    exportObject["resolution"] = QString("%1x%2").arg(resolution.width).arg(resolution.height);
    exportObject["spec"] = specObject;
    exportObject["subject_model"] = SubjectMask::tagToString(subject.modelUsed);
    exportObject["layers"] = layerArray;
    exportObject["composite_file"] = COMPOSITE_FILE;
    exportObject["created_at"] = createdAt.toUTC().toString(Qt::ISODate);
    exportObject["instructions"] = "Import these layers into Photoshop, GIMP, or any layer-capable editor. "
                                   "Each PNG maintains transparency where appropriate.";

    QJsonObject root;
    root["anvilizer_export"] = exportObject;
    return root;
}

QString LayerExporter::createReadme(Style style,
                                    const RgbColor& color,
                                    const QString& sourceName,
                                    const cv::Size& resolution)
{
    const QString res = QString("%1x%2").arg(resolution.width).arg(resolution.height);

    QStringList lines;
    lines << "ANVILIZER LAYER PACKAGE"
          << "======================="
          << ""
          << QString("Style: %1").arg(StyleCompositor::styleToString(style))
          << QString("Color: %1 (%2)").arg(ColorPalette::nameFor(color), color.toHex())
          << QString("Original File: %1").arg(sourceName)
          << QString("Resolution: %1").arg(res)
          << ""
          << "FILES:"
          << "------"
          << QString("%1      - Original image background").arg(BACKGROUND_FILE)
          << QString("%1  - Extracted subject (person/object)").arg(SUBJECT_FILE)
          << QString("%1     - Anvil overlay shape").arg(SHAPE_FILE)
          << QString("%1    - Final flattened result").arg(COMPOSITE_FILE)
          << QString("%1        - Technical metadata").arg(METADATA_FILE)
          << ""
          << "USAGE:"
          << "------"
          << QString("1. Create a new document at %1").arg(res)
          << "2. Import each layer in order:"
          << QString("   - %1 (bottom layer)").arg(BACKGROUND_FILE)
          << QString("   - %1 (above background)").arg(SUBJECT_FILE)
          << QString("   - %1 (top layer)").arg(SHAPE_FILE)
          << "3. Each PNG keeps its alpha channel; edit layers independently"
          << ""
          << "Export format: 8-bit PNG with alpha channel, sRGB, lossless"
          << "";

    return lines.join('\n');
}

QString LayerExporter::baseName(const QString& sourceName)
{
    QString base = QFileInfo(sourceName).completeBaseName();
    base.replace(QRegularExpression("[^A-Za-z0-9_-]+"), "_");
    if (base.isEmpty()) {
        base = "image";
    }
    return base;
}

QString LayerExporter::friendlyFileName(const QString& sourceName, Style style, const RgbColor& color)
{
    QString styleKey = StyleCompositor::styleToString(style).toLower().replace(' ', '_');
    return QString("%1_%2_%3.png").arg(baseName(sourceName), styleKey, ColorPalette::slugFor(color));
}
