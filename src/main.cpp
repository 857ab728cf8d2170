#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTimer>
#include <memory>
#include "configmanager.h"
#include "imageiohelper.h"
#include "jobscheduler.h"
#include "layerexporter.h"
#include "resolutionpipeline.h"
#include "segmentationservice.h"
#include "subjectextractor.h"

namespace {

bool writeResult(const JobResult& result, const JobRequest& request, const QString& outputDir)
{
    QDir dir(outputDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        qCritical() << "Anvilizer: Failed to create output directory:" << outputDir;
        return false;
    }

    bool ok = true;
    for (const StyleResult& image : result.images) {
        const QString fileName = LayerExporter::friendlyFileName(request.sourceName, image.style, request.spec.color);
        const QString path = dir.filePath(fileName);
        if (ImageIOHelper::writeBytes(path, image.png)) {
            qInfo().noquote() << "Anvilizer: Wrote" << path << QString("(%1x%2)").arg(image.width).arg(image.height);
        } else {
            qCritical() << "Anvilizer: Failed to write" << path;
            ok = false;
        }
    }

    if (result.layers) {
        const QString base = QFileInfo(request.sourceName).completeBaseName();
        QDir packageDir(dir.filePath(base + "_layers"));
        if (!packageDir.exists() && !packageDir.mkpath(".")) {
            qCritical() << "Anvilizer: Failed to create package directory:" << packageDir.path();
            return false;
        }
        for (const LayerArtifact& artifact : result.layers->artifacts) {
            const QString path = packageDir.filePath(artifact.fileName);
            if (!ImageIOHelper::writeBytes(path, artifact.bytes)) {
                qCritical() << "Anvilizer: Failed to write" << path;
                ok = false;
            }
        }
        qInfo().noquote() << "Anvilizer: Wrote layer package to" << packageDir.path();
    }

    if (result.autoDownscaled) {
        qInfo() << "Anvilizer: Input exceeded the native resolution bound and was downscaled to"
                << result.outputSize.width << "x" << result.outputSize.height;
    }
    if (result.subjectExtracted && result.subjectModel == SubjectMask::ModelTag::Degraded) {
        qWarning() << "Anvilizer: Subject extraction unavailable, silhouettes show the whole image";
    }

    return ok;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Anvilizer");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Anvilizer");

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] (%{threadid}) %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Renders anvil brand overlays onto a photo");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "INI configuration file.", "file");
    QCommandLineOption kindOption("kind", "Job kind: preview or advanced.", "kind", "preview");
    QCommandLineOption styleOption("style", "Style for advanced jobs (Flat, Stroke, Gradient, Window, Silhouette, "
                                            "Gradient Silhouette).", "name", "Flat");
    QCommandLineOption layersOption("layers", "Also write the layered package (advanced jobs).");
    QCommandLineOption colorOption("color", "Anvil colour as #RRGGBB.", "hex", "#0070F2");
    QCommandLineOption opacityOption("opacity", "Flat style opacity, 0 to 1.", "value", "0.5");
    QCommandLineOption scaleOption("scale", "Anvil scale, 0.5 to 1.", "value", "0.7");
    QCommandLineOption offsetXOption("offset-x", "Horizontal offset, -1 to 1.", "value", "0");
    QCommandLineOption offsetYOption("offset-y", "Vertical offset, -1 to 1.", "value", "0");
    QCommandLineOption ratioOption("ratio", "Aspect ratio: 16:9, 1:1 or 9:16.", "ratio", "16:9");
    parser.addOptions({configOption, kindOption, styleOption, layersOption, colorOption, opacityOption,
                       scaleOption, offsetXOption, offsetYOption, ratioOption});
    parser.addPositionalArgument("input", "Input image.");
    parser.addPositionalArgument("outdir", "Output directory.");

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2) {
        parser.showHelp(1);
    }

    ConfigManager configManager(parser.value(configOption));
    const AnvilizerConfig config = configManager.loadConfig();
    QLoggingCategory::setFilterRules(config.loggingRules);

    JobRequest request;
    if (!jobKindFromString(parser.value(kindOption), request.kind)) {
        qCritical() << "Anvilizer: Unknown job kind:" << parser.value(kindOption);
        return 1;
    }
    if (!StyleCompositor::styleFromString(parser.value(styleOption), request.style)) {
        qCritical() << "Anvilizer: Unknown style:" << parser.value(styleOption);
        return 1;
    }
    request.layeredExport = parser.isSet(layersOption);

    QVariantMap params;
    params["color"] = parser.value(colorOption);
    params["opacity"] = parser.value(opacityOption);
    params["scale"] = parser.value(scaleOption);
    params["offsetX"] = parser.value(offsetXOption);
    params["offsetY"] = parser.value(offsetYOption);
    params["ratio"] = parser.value(ratioOption);
    QString specError;
    if (!AnvilSpec::fromParameters(params, request.spec, &specError)) {
        qCritical().noquote() << "Anvilizer: Invalid parameters:" << specError;
        return 1;
    }

    const QString inputPath = positional.at(0);
    const QString outputDir = positional.at(1);
    request.sourceName = QFileInfo(inputPath).fileName();
    request.image = ImageIOHelper::readImage(inputPath);
    if (request.image.empty()) {
        qCritical() << "Anvilizer: Failed to read image:" << inputPath;
        return 1;
    }

    auto service = std::make_shared<SegmentationService>(ConfigManager::modelChain(config.extractor));
    auto extractor = std::make_shared<const SubjectExtractor>(service, config.extractor.inferenceTimeoutMs);
    auto pipeline = std::make_shared<const ResolutionPipeline>(config.pipeline, extractor, config.render);

    JobScheduler scheduler(config.scheduler,
                           [pipeline](const JobRequest& job) { return pipeline->run(job); },
                           [pipeline](const JobRequest& job) { pipeline->checkAdmission(job); });

    const SubmitResult submitted = scheduler.submit(request);
    if (!submitted.ok) {
        qCritical().noquote() << "Anvilizer: Job rejected (" + AnvilError::kindToString(submitted.error) + "):"
                              << submitted.message;
        return 1;
    }

    int exitCode = 1;
    QTimer pollTimer;
    QObject::connect(&pollTimer, &QTimer::timeout, &app, [&]() {
        const JobStatusReport report = scheduler.status(submitted.jobId);
        if (!report.found) {
            qCritical() << "Anvilizer: Job disappeared:" << submitted.jobId;
            app.exit(1);
            return;
        }
        if (report.status == JobStatus::Done && report.result) {
            exitCode = writeResult(*report.result, request, outputDir) ? 0 : 1;
            app.exit(exitCode);
        } else if (report.status == JobStatus::Error) {
            qCritical().noquote() << "Anvilizer: Job failed (" + AnvilError::kindToString(report.errorKind) + "):"
                                  << report.errorDetail;
            app.exit(1);
        }
    });
    pollTimer.start(200);

    exitCode = app.exec();
    scheduler.shutdown();
    return exitCode;
}
