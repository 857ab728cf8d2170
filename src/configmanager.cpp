#include "configmanager.h"
#include <QDebug>
#include <QFileInfo>
#include <QStringList>
#include <cmath>

// Configuration keys
const QString ConfigManager::KEY_WORKER_COUNT = "scheduler/workerCount";
const QString ConfigManager::KEY_MAX_QUEUE_DEPTH = "scheduler/maxQueueDepth";
const QString ConfigManager::KEY_RESULT_TTL = "scheduler/resultTtlSeconds";
const QString ConfigManager::KEY_CLEANUP_INTERVAL = "scheduler/cleanupIntervalMs";
const QString ConfigManager::KEY_PREVIEW_LONG_EDGE = "pipeline/previewLongEdge";
const QString ConfigManager::KEY_UPSCALE_SMALL_PREVIEWS = "pipeline/upscaleSmallPreviews";
const QString ConfigManager::KEY_MAX_NATIVE_LONG_EDGE = "pipeline/maxNativeLongEdge";
const QString ConfigManager::KEY_MAX_INPUT_DIMENSION = "pipeline/maxInputDimension";
const QString ConfigManager::KEY_MAX_INPUT_PIXELS = "pipeline/maxInputPixels";
const QString ConfigManager::KEY_COMPOSITE_TIMEOUT = "pipeline/compositeTimeoutMs";
const QString ConfigManager::KEY_INFERENCE_TIMEOUT = "extractor/inferenceTimeoutMs";
const QString ConfigManager::KEY_PRIMARY_MODEL = "extractor/primaryModel";
const QString ConfigManager::KEY_FALLBACK_MODEL = "extractor/fallbackModel";
const QString ConfigManager::KEY_EXECUTION_PROVIDER = "extractor/executionProvider";
const QString ConfigManager::KEY_ANVIL_PATH = "render/anvilPath";
const QString ConfigManager::KEY_GRADIENT_TINTS = "render/gradientTints";
const QString ConfigManager::KEY_STROKE_WIDTH_FRACTION = "render/strokeWidthFraction";
const QString ConfigManager::KEY_LOGGING_RULES = "logging/rules";

ConfigManager::ConfigManager(const QString& filePath, QObject *parent)
    : QObject(parent)
{
    if (filePath.isEmpty()) {
        m_settings = new QSettings(QSettings::IniFormat, QSettings::UserScope, "Anvilizer", "Anvilizer", this);
    } else {
        m_settings = new QSettings(filePath, QSettings::IniFormat, this);
    }
}

QString ConfigManager::fileName() const
{
    return m_settings->fileName();
}

AnvilizerConfig ConfigManager::loadConfig()
{
    AnvilizerConfig config;

    SchedulerConfig& scheduler = config.scheduler;
    scheduler.workerCount = m_settings->value(KEY_WORKER_COUNT, scheduler.workerCount).toInt();
    scheduler.maxQueueDepth = m_settings->value(KEY_MAX_QUEUE_DEPTH, scheduler.maxQueueDepth).toInt();
    scheduler.resultTtlSeconds = m_settings->value(KEY_RESULT_TTL, scheduler.resultTtlSeconds).toInt();
    scheduler.cleanupIntervalMs = m_settings->value(KEY_CLEANUP_INTERVAL, scheduler.cleanupIntervalMs).toInt();

    if (scheduler.workerCount > SchedulerConfig::MAX_WORKERS) {
        qWarning() << "ConfigManager: workerCount" << scheduler.workerCount
                   << "exceeds the limit of" << SchedulerConfig::MAX_WORKERS;
        scheduler.workerCount = SchedulerConfig::MAX_WORKERS;
    } else if (scheduler.workerCount < 1) {
        qWarning() << "ConfigManager: workerCount must be at least 1";
        scheduler.workerCount = 1;
    }

    PipelineConfig& pipeline = config.pipeline;
    pipeline.previewLongEdge = m_settings->value(KEY_PREVIEW_LONG_EDGE, pipeline.previewLongEdge).toInt();
    pipeline.upscaleSmallPreviews = m_settings->value(KEY_UPSCALE_SMALL_PREVIEWS, pipeline.upscaleSmallPreviews).toBool();
    pipeline.maxNativeLongEdge = m_settings->value(KEY_MAX_NATIVE_LONG_EDGE, pipeline.maxNativeLongEdge).toInt();
    pipeline.maxInputDimension = m_settings->value(KEY_MAX_INPUT_DIMENSION, pipeline.maxInputDimension).toInt();
    pipeline.maxInputPixels = m_settings->value(KEY_MAX_INPUT_PIXELS, pipeline.maxInputPixels).toLongLong();
    pipeline.compositeTimeoutMs = m_settings->value(KEY_COMPOSITE_TIMEOUT, pipeline.compositeTimeoutMs).toInt();

    ExtractorConfig& extractor = config.extractor;
    extractor.inferenceTimeoutMs = m_settings->value(KEY_INFERENCE_TIMEOUT, extractor.inferenceTimeoutMs).toInt();
    extractor.primaryModel = m_settings->value(KEY_PRIMARY_MODEL, extractor.primaryModel).toString();
    extractor.fallbackModel = m_settings->value(KEY_FALLBACK_MODEL, extractor.fallbackModel).toString();
    extractor.executionProvider = m_settings->value(KEY_EXECUTION_PROVIDER, extractor.executionProvider).toString();

    RenderProfile& render = config.render;
    const QString pathText = listValue(KEY_ANVIL_PATH, render.path.toString());
    AnvilPath path;
    if (AnvilPath::fromString(pathText, path)) {
        render.path = path;
    } else {
        qWarning() << "ConfigManager: Ignoring invalid anvil path:" << pathText;
    }

    const QString tintsText = listValue(KEY_GRADIENT_TINTS, tintsToString(render.gradientTints));
    std::vector<double> tints;
    if (parseTints(tintsText, tints)) {
        render.gradientTints = tints;
    } else {
        qWarning() << "ConfigManager: Ignoring invalid gradient tints:" << tintsText;
    }

    render.strokeWidthFraction = m_settings->value(KEY_STROKE_WIDTH_FRACTION, render.strokeWidthFraction).toDouble();
    if (!(render.strokeWidthFraction > 0.0 && render.strokeWidthFraction < 0.5)) {
        qWarning() << "ConfigManager: Ignoring invalid stroke width fraction:" << render.strokeWidthFraction;
        render.strokeWidthFraction = RenderProfile().strokeWidthFraction;
    }

    config.loggingRules = m_settings->value(KEY_LOGGING_RULES, config.loggingRules).toString();

    return config;
}

QString ConfigManager::listValue(const QString& key, const QString& defaultValue) const
{
    // QSettings splits unquoted comma separated INI values into a string list
    const QVariant value = m_settings->value(key, defaultValue);
    if (value.typeId() == QMetaType::QStringList) {
        return value.toStringList().join(',');
    }
    return value.toString();
}

void ConfigManager::saveConfig(const AnvilizerConfig& config)
{
    m_settings->setValue(KEY_WORKER_COUNT, config.scheduler.workerCount);
    m_settings->setValue(KEY_MAX_QUEUE_DEPTH, config.scheduler.maxQueueDepth);
    m_settings->setValue(KEY_RESULT_TTL, config.scheduler.resultTtlSeconds);
    m_settings->setValue(KEY_CLEANUP_INTERVAL, config.scheduler.cleanupIntervalMs);

    m_settings->setValue(KEY_PREVIEW_LONG_EDGE, config.pipeline.previewLongEdge);
    m_settings->setValue(KEY_UPSCALE_SMALL_PREVIEWS, config.pipeline.upscaleSmallPreviews);
    m_settings->setValue(KEY_MAX_NATIVE_LONG_EDGE, config.pipeline.maxNativeLongEdge);
    m_settings->setValue(KEY_MAX_INPUT_DIMENSION, config.pipeline.maxInputDimension);
    m_settings->setValue(KEY_MAX_INPUT_PIXELS, config.pipeline.maxInputPixels);
    m_settings->setValue(KEY_COMPOSITE_TIMEOUT, config.pipeline.compositeTimeoutMs);

    m_settings->setValue(KEY_INFERENCE_TIMEOUT, config.extractor.inferenceTimeoutMs);
    m_settings->setValue(KEY_PRIMARY_MODEL, config.extractor.primaryModel);
    m_settings->setValue(KEY_FALLBACK_MODEL, config.extractor.fallbackModel);
    m_settings->setValue(KEY_EXECUTION_PROVIDER, config.extractor.executionProvider);

    m_settings->setValue(KEY_ANVIL_PATH, config.render.path.toString());
    m_settings->setValue(KEY_GRADIENT_TINTS, tintsToString(config.render.gradientTints));
    m_settings->setValue(KEY_STROKE_WIDTH_FRACTION, config.render.strokeWidthFraction);

    m_settings->setValue(KEY_LOGGING_RULES, config.loggingRules);

    m_settings->sync();
}

QList<ModelDescriptor> ConfigManager::modelChain(const ExtractorConfig& config)
{
    QList<ModelDescriptor> chain;
    for (const QString& path : {config.primaryModel, config.fallbackModel}) {
        if (path.isEmpty()) {
            continue;
        }
        ModelDescriptor descriptor;
        descriptor.name = QFileInfo(path).completeBaseName();
        descriptor.path = path;
        descriptor.executionProvider = config.executionProvider;
        chain.append(descriptor);
    }
    return chain;
}

bool ConfigManager::parseTints(const QString& text, std::vector<double>& tints)
{
    std::vector<double> parsed;
    const QStringList parts = text.split(',', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        bool ok = false;
        const double value = part.trimmed().toDouble(&ok);
        if (!ok || !std::isfinite(value) || value < -1.0 || value > 1.0) {
            return false;
        }
        parsed.push_back(value);
    }

    if (parsed.empty()) {
        return false;
    }
    tints = parsed;
    return true;
}

QString ConfigManager::tintsToString(const std::vector<double>& tints)
{
    QStringList parts;
    for (double tint : tints) {
        parts << QString::number(tint);
    }
    return parts.join(',');
}
