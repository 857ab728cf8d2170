#ifndef LAYEREXPORTER_H
#define LAYEREXPORTER_H

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <opencv2/core.hpp>
#include "anvilspec.h"
#include "stylecompositor.h"
#include "subjectextractor.h"

/**
 * @brief One file of a layer package
 */
struct LayerArtifact {
    QString name;          // Display name ("Background", "Anvil Shape", ...)
    QString fileName;      // "01_background.png", ...
    QString description;
    QByteArray bytes;      // Encoded file content
    cv::Size size;         // Raster size, empty for text files
};

/**
 * @brief Editable multi-layer export of one advanced job
 *
 * Layers are stored bottom to top: background, subject cutout, anvil shape.
 * They are followed by the flattened composite, layer_info.json and README.txt.
 */
struct LayerPackage {
    QList<LayerArtifact> artifacts;
    QJsonObject metadata;

    /**
     * @brief Find an artifact by file name
     * @return Pointer into artifacts, or nullptr
     */
    const LayerArtifact* find(const QString& fileName) const;

    /**
     * @brief Raster layers in stacking order (excludes the composite)
     */
    QList<LayerArtifact> layers() const;
};

/**
 * @brief Builds layer packages from the intermediates of a composite
 */
class LayerExporter
{
public:
    static const QString BACKGROUND_FILE;
    static const QString SUBJECT_FILE;
    static const QString SHAPE_FILE;
    static const QString COMPOSITE_FILE;
    static const QString METADATA_FILE;
    static const QString README_FILE;

    /**
     * @brief Assemble a package
     * @param background Cropped base image (BGR or BGRA)
     * @param subject Subject mask of the background size
     * @param overlay BGRA anvil layer from StyleCompositor::renderOverlay()
     * @param composite Flattened result from StyleCompositor::composite()
     * @param spec Anvil parameters used
     * @param style Rendered style
     * @param sourceName Original upload file name
     * @param createdAt Time stamp written to the metadata
     * @return Package with all artifacts encoded
     * @throws AnvilError CompositeFailure if the rasters disagree in size or cannot be encoded
     */
    static LayerPackage buildPackage(const cv::Mat& background,
                                     const SubjectMask& subject,
                                     const cv::Mat& overlay,
                                     const cv::Mat& composite,
                                     const AnvilSpec& spec,
                                     Style style,
                                     const QString& sourceName,
                                     const QDateTime& createdAt = QDateTime::currentDateTimeUtc());

    /**
     * @brief Download name for a single-style image
     *
     * "<base>_<style>_<ColourSlug>.png" with the style lower-cased and spaces
     * replaced by underscores, e.g. "team_gradient_silhouette_Blue2.png".
     */
    static QString friendlyFileName(const QString& sourceName, Style style, const RgbColor& color);

private:
    static QJsonObject createMetadata(Style style,
                                      const AnvilSpec& spec,
                                      const QString& sourceName,
                                      const cv::Size& resolution,
                                      const SubjectMask& subject,
                                      const QList<LayerArtifact>& layers,
                                      const QDateTime& createdAt);

    static QString createReadme(Style style,
                                const RgbColor& color,
                                const QString& sourceName,
                                const cv::Size& resolution);

    static LayerArtifact encodeLayer(const QString& name,
                                     const QString& fileName,
                                     const QString& description,
                                     const cv::Mat& image);

    static QString baseName(const QString& sourceName);
};

#endif // LAYEREXPORTER_H
