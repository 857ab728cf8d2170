#include <doctest/doctest.h>

#include "anvilerror.h"
#include "imageiohelper.h"
#include "layerexporter.h"
#include "shapeengine.h"
#include "stylecompositor.h"
#include "TestHelpers.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <opencv2/imgproc.hpp>

using namespace TestHelpers;

namespace {

struct Render {
    cv::Mat background;
    SubjectMask subject;
    cv::Mat overlay;
    cv::Mat composite;
};

Render render(Style style, const AnvilSpec& spec, int width = 160, int height = 90) {
    Render r;
    r.background = makePhoto(width, height);
    r.subject.modelUsed = SubjectMask::ModelTag::Primary;
    r.subject.modelName = "primary";
    r.subject.alpha = cv::Mat::zeros(height, width, CV_8UC1);
    cv::ellipse(r.subject.alpha, cv::Point(width / 2, height / 2), cv::Size(width / 6, height / 3),
                0.0, 0.0, 360.0, cv::Scalar(255), cv::FILLED);
    // Soft edge so the cutout has partial alpha
    cv::GaussianBlur(r.subject.alpha, r.subject.alpha, cv::Size(5, 5), 0);

    StyleCompositor compositor;
    const cv::Mat shape = ShapeEngine::computeShapeMask(r.background.size(), spec);
    r.composite = compositor.composite(style, r.background, shape, r.subject.alpha, spec,
                                       QDeadlineTimer(QDeadlineTimer::Forever), &r.overlay);
    return r;
}

LayerPackage package(Style style, const AnvilSpec& spec, const Render& r) {
    return LayerExporter::buildPackage(r.background, r.subject, r.overlay, r.composite, spec, style,
                                       "My Photo.jpg", QDateTime(QDate(2026, 3, 1), QTime(12, 30, 0), Qt::UTC));
}

cv::Mat decodeArtifact(const LayerPackage& pkg, const QString& fileName) {
    const LayerArtifact* artifact = pkg.find(fileName);
    REQUIRE(artifact != nullptr);
    return ImageIOHelper::decode(artifact->bytes);
}

} // namespace

TEST_SUITE("LayerExporter") {

TEST_CASE("Package contents and order") {
    AnvilSpec spec;
    const Render r = render(Style::Flat, spec);
    const LayerPackage pkg = package(Style::Flat, spec, r);

    REQUIRE(pkg.artifacts.size() == 6);
    CHECK(pkg.artifacts[0].fileName == "01_background.png");
    CHECK(pkg.artifacts[1].fileName == "02_subject_cutout.png");
    CHECK(pkg.artifacts[2].fileName == "03_anvil_shape.png");
    CHECK(pkg.artifacts[3].fileName == "final_composite.png");
    CHECK(pkg.artifacts[4].fileName == "layer_info.json");
    CHECK(pkg.artifacts[5].fileName == "README.txt");

    const QList<LayerArtifact> layers = pkg.layers();
    REQUIRE(layers.size() == 3);
    for (const LayerArtifact& layer : layers) {
        CHECK(layer.size == cv::Size(160, 90));
        CHECK_FALSE(layer.bytes.isEmpty());
    }
    CHECK(pkg.find("missing.png") == nullptr);
}

TEST_CASE("Layer formats") {
    AnvilSpec spec;
    const Render r = render(Style::Stroke, spec);
    const LayerPackage pkg = package(Style::Stroke, spec, r);

    const cv::Mat background = decodeArtifact(pkg, LayerExporter::BACKGROUND_FILE);
    CHECK(background.type() == CV_8UC3);
    CHECK(identical(background, r.background));

    const cv::Mat cutout = decodeArtifact(pkg, LayerExporter::SUBJECT_FILE);
    REQUIRE(cutout.type() == CV_8UC4);
    std::vector<cv::Mat> channels;
    cv::split(cutout, channels);
    CHECK(identical(channels[3], r.subject.alpha));

    const cv::Mat shape = decodeArtifact(pkg, LayerExporter::SHAPE_FILE);
    CHECK(identical(shape, r.overlay));
}

TEST_CASE("Stacking the layers reproduces the composite") {
    AnvilSpec spec;
    spec.opacity = 0.65;
    spec.color = RgbColor(0xAA, 0x08, 0x43);

    for (Style style : {Style::Flat, Style::Stroke, Style::Gradient, Style::Silhouette, Style::GradientSilhouette}) {
        CAPTURE(StyleCompositor::styleToString(style).toStdString());
        const Render r = render(style, spec);
        const LayerPackage pkg = package(style, spec, r);

        const cv::Mat background = decodeArtifact(pkg, LayerExporter::BACKGROUND_FILE);
        const cv::Mat cutout = decodeArtifact(pkg, LayerExporter::SUBJECT_FILE);
        const cv::Mat shape = decodeArtifact(pkg, LayerExporter::SHAPE_FILE);
        const cv::Mat composite = decodeArtifact(pkg, LayerExporter::COMPOSITE_FILE);

        cv::Mat stacked = StyleCompositor::alphaOver(cutout, background);
        stacked = StyleCompositor::alphaOver(shape, stacked);
        CHECK(maxAbsDiff(stacked, composite) <= 1.0);
    }
}

TEST_CASE("Window layer is transparent outside the shape") {
    AnvilSpec spec;
    const Render r = render(Style::Window, spec);
    const LayerPackage pkg = package(Style::Window, spec, r);

    const cv::Mat shapeLayer = decodeArtifact(pkg, LayerExporter::SHAPE_FILE);
    const cv::Mat mask = ShapeEngine::computeShapeMask(r.background.size(), spec);
    std::vector<cv::Mat> channels;
    cv::split(shapeLayer, channels);
    cv::Mat transparent = channels[3] == 0;
    cv::Mat outside = mask == 0;
    CHECK(identical(transparent, outside));
    CHECK(identical(decodeArtifact(pkg, LayerExporter::COMPOSITE_FILE), r.composite));
}

TEST_CASE("Metadata describes the export") {
    AnvilSpec spec;
    spec.aspectRatio = AspectRatio::Square1x1;
    const Render r = render(Style::GradientSilhouette, spec);
    const LayerPackage pkg = package(Style::GradientSilhouette, spec, r);

    REQUIRE(pkg.metadata.contains("anvilizer_export"));
    const QJsonObject meta = pkg.metadata["anvilizer_export"].toObject();
    CHECK(meta["version"].toString() == "1.0");
    CHECK(meta["style"].toString() == "Gradient Silhouette");
    CHECK(meta["color"].toObject()["name"].toString() == "Blue 2");
    CHECK(meta["color"].toObject()["hex"].toString() == "#0070F2");
    CHECK(meta["original_filename"].toString() == "My Photo.jpg");
    CHECK(meta["resolution"].toString() == "160x90");
    CHECK(meta["subject_model"].toString() == "primary");
    CHECK(meta["composite_file"].toString() == "final_composite.png");
    CHECK(meta["created_at"].toString() == "2026-03-01T12:30:00Z");
    CHECK(meta["spec"].toObject()["aspectRatio"].toString() == "1:1");
    CHECK(meta["spec"].toObject()["scale"].toDouble() == doctest::Approx(0.7));

    const QJsonArray layers = meta["layers"].toArray();
    REQUIRE(layers.size() == 3);
    CHECK(layers[0].toObject()["file"].toString() == "01_background.png");
    CHECK(layers[2].toObject()["name"].toString() == "Anvil Shape");

    SUBCASE("JSON file matches the metadata") {
        const LayerArtifact* json = pkg.find(LayerExporter::METADATA_FILE);
        REQUIRE(json != nullptr);
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(json->bytes, &error);
        REQUIRE(error.error == QJsonParseError::NoError);
        CHECK(doc.object() == pkg.metadata);
    }
    SUBCASE("README names the layers") {
        const LayerArtifact* readme = pkg.find(LayerExporter::README_FILE);
        REQUIRE(readme != nullptr);
        const QString text = QString::fromUtf8(readme->bytes);
        CHECK(text.contains("Style: Gradient Silhouette"));
        CHECK(text.contains("Color: Blue 2 (#0070F2)"));
        CHECK(text.contains("03_anvil_shape.png"));
    }
}

TEST_CASE("Degraded subject is recorded") {
    AnvilSpec spec;
    Render r = render(Style::Flat, spec);
    r.subject = SubjectMask::degraded(r.background.size());
    const LayerPackage pkg = package(Style::Flat, spec, r);

    CHECK(pkg.metadata["anvilizer_export"].toObject()["subject_model"].toString() == "degraded");
    const LayerArtifact* cutout = pkg.find(LayerExporter::SUBJECT_FILE);
    REQUIRE(cutout != nullptr);
    CHECK(cutout->description.contains("unavailable"));
}

TEST_CASE("Mismatched inputs are rejected") {
    AnvilSpec spec;
    const Render r = render(Style::Flat, spec);

    SUBCASE("Overlay size") {
        cv::Mat small = cv::Mat::zeros(10, 10, CV_8UC4);
        try {
            LayerExporter::buildPackage(r.background, r.subject, small, r.composite, spec, Style::Flat, "a.png");
            FAIL("expected a CompositeFailure");
        } catch (const AnvilError& e) {
            CHECK(e.kind() == ErrorKind::CompositeFailure);
        }
    }
    SUBCASE("Overlay without alpha") {
        cv::Mat bgr = cv::Mat::zeros(r.background.size(), CV_8UC3);
        CHECK_THROWS_AS(LayerExporter::buildPackage(r.background, r.subject, bgr, r.composite, spec,
                                                    Style::Flat, "a.png"), AnvilError);
    }
    SUBCASE("Missing subject mask") {
        SubjectMask none;
        CHECK_THROWS_AS(LayerExporter::buildPackage(r.background, none, r.overlay, r.composite, spec,
                                                    Style::Flat, "a.png"), AnvilError);
    }
    SUBCASE("Empty background") {
        CHECK_THROWS_AS(LayerExporter::buildPackage(cv::Mat(), r.subject, r.overlay, r.composite, spec,
                                                    Style::Flat, "a.png"), AnvilError);
    }
}

TEST_CASE("Download names") {
    const RgbColor blue(0x00, 0x70, 0xF2);
    CHECK(LayerExporter::friendlyFileName("My Photo.jpg", Style::GradientSilhouette, blue) ==
          "My_Photo_gradient_silhouette_Blue2.png");
    CHECK(LayerExporter::friendlyFileName("team.png", Style::Flat, RgbColor(0xED, 0xEF, 0xF0)) ==
          "team_flat_LightGray.png");
    CHECK(LayerExporter::friendlyFileName("portrait.v2.jpeg", Style::Window, RgbColor(1, 2, 3)) ==
          "portrait_v2_window_Custom.png");
    CHECK(LayerExporter::friendlyFileName("", Style::Stroke, blue) == "image_stroke_Blue2.png");
}

}
