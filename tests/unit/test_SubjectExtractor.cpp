#include <doctest/doctest.h>

#include "onnxsegmentationmodel.h"
#include "subjectextractor.h"
#include "TestHelpers.hpp"

#include <QThread>
#include <atomic>
#include <thread>
#include <vector>

using namespace TestHelpers;

TEST_SUITE("SubjectExtractor") {

TEST_CASE("Primary model produces the mask") {
    auto stats = std::make_shared<FakeModelStats>();
    SubjectExtractor extractor(makeService({FakeBehavior::Succeed, FakeBehavior::Succeed}, stats));

    cv::Mat image = makePhoto(200, 120);
    SubjectMask mask = extractor.extractSubject(image);

    CHECK(mask.modelUsed == SubjectMask::ModelTag::Primary);
    CHECK(mask.modelName == "primary");
    CHECK_FALSE(mask.isDegraded());
    CHECK(stats->predictions.load() == 1);

    SUBCASE("Mask is resized to the input") {
        CHECK(mask.alpha.size() == image.size());
        CHECK(mask.alpha.type() == CV_8UC1);
    }
    SUBCASE("Mask separates subject from background") {
        CHECK(mask.alpha.at<uchar>(60, 100) == 255);
        CHECK(mask.alpha.at<uchar>(2, 2) == 0);
    }
}

TEST_CASE("Fallback after the primary throws") {
    auto stats = std::make_shared<FakeModelStats>();
    SubjectExtractor extractor(makeService({FakeBehavior::Throw, FakeBehavior::Succeed}, stats));

    SubjectMask mask = extractor.extractSubject(makePhoto(64, 64));
    CHECK(mask.modelUsed == SubjectMask::ModelTag::Fallback);
    CHECK(mask.modelName == "fallback");
    CHECK(stats->predictions.load() == 2);
}

TEST_CASE("Fallback after the primary fails to load") {
    auto stats = std::make_shared<FakeModelStats>();
    auto service = makeService({FakeBehavior::FailToLoad, FakeBehavior::Succeed}, stats);
    SubjectExtractor extractor(service);

    SubjectMask first = extractor.extractSubject(makePhoto(64, 64));
    SubjectMask second = extractor.extractSubject(makePhoto(64, 64));
    CHECK(first.modelUsed == SubjectMask::ModelTag::Fallback);
    CHECK(second.modelUsed == SubjectMask::ModelTag::Fallback);

    // The broken primary is not retried
    CHECK(service->loadAttempts() == 2);

    QString error;
    CHECK(service->model(0, &error) == nullptr);
    CHECK(error.contains("simulated load failure"));
}

TEST_CASE("Degraded mask when every model fails") {
    cv::Mat image = makePhoto(80, 40);

    SUBCASE("Both models throw") {
        SubjectExtractor extractor(makeService({FakeBehavior::Throw, FakeBehavior::Throw}));
        SubjectMask mask = extractor.extractSubject(image);
        CHECK(mask.isDegraded());
        CHECK(mask.modelName.isEmpty());
        REQUIRE(mask.alpha.size() == image.size());
        CHECK(cv::countNonZero(mask.alpha == 255) == image.rows * image.cols);
    }
    SUBCASE("Empty chain") {
        SubjectExtractor extractor(makeService({}));
        CHECK(extractor.extractSubject(image).isDegraded());
    }
    SUBCASE("No service") {
        SubjectExtractor extractor(nullptr);
        CHECK(extractor.extractSubject(image).isDegraded());
    }
}

TEST_CASE("Hanging model is interrupted after the timeout") {
    auto stats = std::make_shared<FakeModelStats>();
    SubjectExtractor extractor(makeService({FakeBehavior::Hang, FakeBehavior::Succeed}, stats), 50);

    SubjectMask mask = extractor.extractSubject(makePhoto(64, 64));
    CHECK(mask.modelUsed == SubjectMask::ModelTag::Fallback);
    CHECK(stats->stopsObserved.load() == 1);
}

TEST_CASE("Stop handler lifetime") {
    InferenceControl control;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    std::atomic<int> calls{0};

    SUBCASE("Clearing waits for a handler that is already running") {
        control.setStopHandler([&]() {
            entered = true;
            QThread::msleep(100);
            finished = true;
        });
        std::thread stopper([&]() { control.requestStop(); });
        while (!entered.load()) {
            QThread::msleep(1);
        }
        control.clearStopHandler();
        CHECK(finished.load());
        stopper.join();
        CHECK(control.stopRequested());
    }
    SUBCASE("Cleared handler is not invoked") {
        control.setStopHandler([&]() { ++calls; });
        control.clearStopHandler();
        control.requestStop();
        CHECK(calls.load() == 0);
        CHECK(control.stopRequested());
    }
    SUBCASE("Handler installed after a stop runs at once") {
        control.requestStop();
        control.setStopHandler([&]() { ++calls; });
        CHECK(calls.load() == 1);
    }
}

TEST_CASE("Models load once under concurrent first use") {
    auto stats = std::make_shared<FakeModelStats>();
    auto service = makeService({FakeBehavior::Succeed}, stats);
    SubjectExtractor extractor(service);
    const cv::Mat image = makePhoto(64, 48);

    std::vector<SubjectMask::ModelTag> tags(8, SubjectMask::ModelTag::Degraded);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < tags.size(); ++i) {
        threads.emplace_back([&extractor, &image, &tags, i]() {
            tags[i] = extractor.extractSubject(image).modelUsed;
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    CHECK(service->loadAttempts() == 1);
    CHECK(stats->predictions.load() == 8);
    for (SubjectMask::ModelTag tag : tags) {
        CHECK(tag == SubjectMask::ModelTag::Primary);
    }
}

TEST_CASE("Empty input yields an empty degraded mask") {
    SubjectExtractor extractor(makeService({FakeBehavior::Succeed}));
    SubjectMask mask = extractor.extractSubject(cv::Mat());
    CHECK(mask.isDegraded());
    CHECK(mask.alpha.empty());
}

TEST_CASE("Tag names") {
    CHECK(SubjectMask::tagToString(SubjectMask::ModelTag::Primary) == "primary");
    CHECK(SubjectMask::tagToString(SubjectMask::ModelTag::Fallback) == "fallback");
    CHECK(SubjectMask::tagToString(SubjectMask::ModelTag::Degraded) == "degraded");
}

TEST_CASE("ONNX backend with a missing model file") {
    OnnxSegmentationModel model("missing", "/nonexistent/u2net.onnx", OnnxSegmentationModel::ExecutionProvider::CPU);
    CHECK_FALSE(model.isInitialized());
    CHECK(model.getErrorMessage().contains("not found"));
    CHECK(model.getActiveExecutionProvider() == "CPU");
    CHECK(model.name() == "missing");

    SUBCASE("Factory reports the failure and the chain degrades") {
        ModelDescriptor descriptor;
        descriptor.name = "missing";
        descriptor.path = "/nonexistent/u2net.onnx";
        descriptor.executionProvider = "CPU";
        auto service = std::make_shared<SegmentationService>(QList<ModelDescriptor>{descriptor});

        QString error;
        CHECK(service->model(0, &error) == nullptr);
        CHECK(error.contains("not found"));

        SubjectExtractor extractor(service);
        CHECK(extractor.extractSubject(makePhoto(32, 32)).isDegraded());
    }
}

TEST_CASE("Execution provider names") {
    using Provider = OnnxSegmentationModel::ExecutionProvider;
    CHECK(OnnxSegmentationModel::stringToExecutionProvider("cuda") == Provider::CUDA);
    CHECK(OnnxSegmentationModel::stringToExecutionProvider("CPU") == Provider::CPU);
    CHECK(OnnxSegmentationModel::stringToExecutionProvider("anything") == Provider::Auto);
    CHECK(OnnxSegmentationModel::executionProviderToString(Provider::CUDA) == "CUDA");
}

}
