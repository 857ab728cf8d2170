#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QList>
#include <QObject>
#include <QSettings>
#include <QString>
#include <vector>
#include "jobscheduler.h"
#include "resolutionpipeline.h"
#include "segmentationservice.h"
#include "stylecompositor.h"

struct ExtractorConfig {
    int inferenceTimeoutMs;
    QString primaryModel;
    QString fallbackModel;
    QString executionProvider;   // "Auto", "CUDA" or "CPU"

    ExtractorConfig() :
        inferenceTimeoutMs(120000),
        primaryModel("models/u2net_human_seg.onnx"),
        fallbackModel("models/silueta.onnx"),
        executionProvider("Auto")
    {}
};

struct AnvilizerConfig {
    SchedulerConfig scheduler;
    PipelineConfig pipeline;
    ExtractorConfig extractor;
    RenderProfile render;
    QString loggingRules;

    AnvilizerConfig() :
        loggingRules("*.debug=false")
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @param filePath INI file to use; empty uses the platform default location
     */
    explicit ConfigManager(const QString& filePath = QString(), QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     *
     * Missing keys keep their defaults; malformed anvil paths or tint lists are
     * ignored with a warning.
     *
     * @return AnvilizerConfig structure with loaded settings
     */
    AnvilizerConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AnvilizerConfig& config);

    /**
     * Path of the backing settings file
     */
    QString fileName() const;

    /**
     * Segmentation models in priority order (primary, fallback)
     * @param config Extractor settings
     * @return Descriptors named after the model file
     */
    static QList<ModelDescriptor> modelChain(const ExtractorConfig& config);

    /**
     * Parse a comma separated tint list such as "0.5,0.25,0,-0.25"
     * @param text Serialized tints
     * @param tints Parsed tints on success
     * @return true if every value is a number in [-1, 1] and at least one is present
     */
    static bool parseTints(const QString& text, std::vector<double>& tints);

    static QString tintsToString(const std::vector<double>& tints);

private:
    /**
     * Read a value that may contain commas, with or without INI quoting
     */
    QString listValue(const QString& key, const QString& defaultValue) const;

    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_WORKER_COUNT;
    static const QString KEY_MAX_QUEUE_DEPTH;
    static const QString KEY_RESULT_TTL;
    static const QString KEY_CLEANUP_INTERVAL;
    static const QString KEY_PREVIEW_LONG_EDGE;
    static const QString KEY_UPSCALE_SMALL_PREVIEWS;
    static const QString KEY_MAX_NATIVE_LONG_EDGE;
    static const QString KEY_MAX_INPUT_DIMENSION;
    static const QString KEY_MAX_INPUT_PIXELS;
    static const QString KEY_COMPOSITE_TIMEOUT;
    static const QString KEY_INFERENCE_TIMEOUT;
    static const QString KEY_PRIMARY_MODEL;
    static const QString KEY_FALLBACK_MODEL;
    static const QString KEY_EXECUTION_PROVIDER;
    static const QString KEY_ANVIL_PATH;
    static const QString KEY_GRADIENT_TINTS;
    static const QString KEY_STROKE_WIDTH_FRACTION;
    static const QString KEY_LOGGING_RULES;
};

#endif // CONFIGMANAGER_H
