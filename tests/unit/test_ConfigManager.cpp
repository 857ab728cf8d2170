#include <doctest/doctest.h>

#include "configmanager.h"

#include <QFile>
#include <QTemporaryDir>

namespace {

void writeIni(const QString& path, const QByteArray& content) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
    file.close();
}

} // namespace

TEST_SUITE("ConfigManager") {

TEST_CASE("Missing file yields defaults") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ConfigManager manager(dir.filePath("absent.ini"));
    const AnvilizerConfig config = manager.loadConfig();

    CHECK(config.scheduler.workerCount == 1);
    CHECK(config.scheduler.maxQueueDepth == 10);
    CHECK(config.scheduler.resultTtlSeconds == 3600);
    CHECK(config.pipeline.previewLongEdge == 1920);
    CHECK(config.pipeline.upscaleSmallPreviews);
    CHECK(config.pipeline.maxNativeLongEdge == 7680);
    CHECK(config.extractor.inferenceTimeoutMs == 120000);
    CHECK(config.extractor.executionProvider == "Auto");
    CHECK(config.render.gradientTints == std::vector<double>({0.5, 0.25, 0.0, -0.25}));
    CHECK(config.render.path.vertices == AnvilPath::defaultPath().vertices);
    CHECK(config.loggingRules == "*.debug=false");
}

TEST_CASE("Saved settings load back") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("anvilizer.ini");

    AnvilizerConfig saved;
    saved.scheduler.workerCount = 3;
    saved.scheduler.maxQueueDepth = 25;
    saved.pipeline.previewLongEdge = 1280;
    saved.pipeline.upscaleSmallPreviews = false;
    saved.pipeline.maxInputPixels = 50000000;
    saved.extractor.primaryModel = "/opt/models/u2net.onnx";
    saved.extractor.executionProvider = "CPU";
    saved.render.gradientTints = {0.6, 0.0, -0.4};
    saved.render.strokeWidthFraction = 0.05;
    REQUIRE(AnvilPath::fromString("0,0;1,0;1,1;0,1", saved.render.path));
    {
        ConfigManager writer(path);
        writer.saveConfig(saved);
    }

    ConfigManager reader(path);
    CHECK(reader.fileName() == path);
    const AnvilizerConfig loaded = reader.loadConfig();
    CHECK(loaded.scheduler.workerCount == 3);
    CHECK(loaded.scheduler.maxQueueDepth == 25);
    CHECK(loaded.pipeline.previewLongEdge == 1280);
    CHECK_FALSE(loaded.pipeline.upscaleSmallPreviews);
    CHECK(loaded.pipeline.maxInputPixels == 50000000);
    CHECK(loaded.extractor.primaryModel == "/opt/models/u2net.onnx");
    CHECK(loaded.extractor.executionProvider == "CPU");
    CHECK(loaded.render.gradientTints == std::vector<double>({0.6, 0.0, -0.4}));
    CHECK(loaded.render.strokeWidthFraction == doctest::Approx(0.05));
    CHECK(loaded.render.path.vertices == saved.render.path.vertices);
}

TEST_CASE("Hand edited values") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("edited.ini");

    SUBCASE("Unquoted lists") {
        writeIni(path, "[render]\ngradientTints=0.3, 0, -0.3\n");
        CHECK(ConfigManager(path).loadConfig().render.gradientTints == std::vector<double>({0.3, 0.0, -0.3}));
    }
    SUBCASE("Worker count above the limit is clamped") {
        writeIni(path, "[scheduler]\nworkerCount=9\n");
        CHECK(ConfigManager(path).loadConfig().scheduler.workerCount == SchedulerConfig::MAX_WORKERS);
    }
    SUBCASE("Worker count below one is raised") {
        writeIni(path, "[scheduler]\nworkerCount=0\n");
        CHECK(ConfigManager(path).loadConfig().scheduler.workerCount == 1);
    }
    SUBCASE("Invalid render values fall back to defaults") {
        writeIni(path, "[render]\nanvilPath=\"0,0;2,0;0,1\"\ngradientTints=\"0.5,bright\"\nstrokeWidthFraction=0.9\n");
        const AnvilizerConfig config = ConfigManager(path).loadConfig();
        CHECK(config.render.path.vertices == AnvilPath::defaultPath().vertices);
        CHECK(config.render.gradientTints.size() == 4);
        CHECK(config.render.strokeWidthFraction == doctest::Approx(0.02));
    }
}

TEST_CASE("Model chain") {
    ExtractorConfig extractor;
    extractor.executionProvider = "CUDA";

    QList<ModelDescriptor> chain = ConfigManager::modelChain(extractor);
    REQUIRE(chain.size() == 2);
    CHECK(chain[0].name == "u2net_human_seg");
    CHECK(chain[0].path == "models/u2net_human_seg.onnx");
    CHECK(chain[0].executionProvider == "CUDA");
    CHECK(chain[1].name == "silueta");

    extractor.fallbackModel.clear();
    CHECK(ConfigManager::modelChain(extractor).size() == 1);
}

TEST_CASE("Tint lists") {
    std::vector<double> tints;
    CHECK(ConfigManager::parseTints("0.5,0.25,0,-0.25", tints));
    CHECK(tints.size() == 4);
    CHECK(ConfigManager::tintsToString(tints) == "0.5,0.25,0,-0.25");

    std::vector<double> untouched = {1.0};
    CHECK_FALSE(ConfigManager::parseTints("", untouched));
    CHECK_FALSE(ConfigManager::parseTints("0.5,1.5", untouched));
    CHECK(untouched == std::vector<double>({1.0}));
}

}
