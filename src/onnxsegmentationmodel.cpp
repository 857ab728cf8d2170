#include "onnxsegmentationmodel.h"
#include <QDebug>
#include <QFile>
#include <algorithm>
#include <unordered_map>
#include <opencv2/imgproc.hpp>
#include "anvilerror.h"

OnnxSegmentationModel::OnnxSegmentationModel(const QString& name,
                                             const QString& modelPath,
                                             ExecutionProvider preferredProvider)
    : m_name(name)
    , m_memoryInfo(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
    , m_inputWidth(DEFAULT_INPUT_SIZE)
    , m_inputHeight(DEFAULT_INPUT_SIZE)
    , m_initialized(false)
{
    m_initialized = initializeSession(modelPath, preferredProvider);
    if (!m_initialized) {
        qWarning() << "OnnxSegmentationModel: Failed to initialize" << m_name << ":" << m_errorMessage;
    }
}

OnnxSegmentationModel::~OnnxSegmentationModel() = default;

bool OnnxSegmentationModel::isInitialized() const {
    return m_initialized;
}

QString OnnxSegmentationModel::getErrorMessage() const {
    return m_errorMessage;
}

QString OnnxSegmentationModel::getActiveExecutionProvider() const {
    return m_activeProvider;
}

QString OnnxSegmentationModel::name() const {
    return m_name;
}

QString OnnxSegmentationModel::executionProviderToString(ExecutionProvider provider) {
    switch (provider) {
        case ExecutionProvider::Auto: return "Auto";
        case ExecutionProvider::CUDA: return "CUDA";
        case ExecutionProvider::CPU:  return "CPU";
        default:                      return "Unknown";
    }
}

OnnxSegmentationModel::ExecutionProvider OnnxSegmentationModel::stringToExecutionProvider(const QString& providerStr) {
    if (providerStr.compare("CUDA", Qt::CaseInsensitive) == 0) return ExecutionProvider::CUDA;
    if (providerStr.compare("CPU", Qt::CaseInsensitive) == 0)  return ExecutionProvider::CPU;
    return ExecutionProvider::Auto;
}

bool OnnxSegmentationModel::initializeSession(const QString& modelPath, ExecutionProvider preferredProvider) {
    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "OnnxSegmentationModel");

        m_sessionOptions = std::make_unique<Ort::SessionOptions>();
        m_sessionOptions->SetIntraOpNumThreads(4);
        m_sessionOptions->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        bool providerAdded = false;
        if (preferredProvider != ExecutionProvider::CPU) {
            try {
                std::unordered_map<std::string, std::string> cuda_options;
                cuda_options["device_id"] = "0";
                cuda_options["gpu_mem_limit"] = "2147483648";  // 2GB limit
                cuda_options["arena_extend_strategy"] = "kSameAsRequested";
                m_sessionOptions->AppendExecutionProvider("CUDA", cuda_options);
                m_activeProvider = "CUDA";
                providerAdded = true;
                qInfo() << "OnnxSegmentationModel: Using CUDA execution provider for" << m_name;
            } catch (const std::exception& e) {
                qDebug() << "OnnxSegmentationModel: CUDA provider not available:" << e.what();
            }
        }

        if (!providerAdded) {
            m_activeProvider = "CPU";
            qInfo() << "OnnxSegmentationModel: Using CPU execution provider for" << m_name;
        }

        if (!QFile::exists(modelPath)) {
            m_errorMessage = QString("Model file not found: %1").arg(modelPath);
            return false;
        }

        if (modelPath.startsWith(":/") || modelPath.startsWith("qrc:")) {
            QFile modelFile(modelPath);
            if (!modelFile.open(QIODevice::ReadOnly)) {
                m_errorMessage = QString("Failed to open model file from resources: %1").arg(modelPath);
                return false;
            }
            QByteArray modelData = modelFile.readAll();
            m_session = std::make_unique<Ort::Session>(*m_env,
                                                       modelData.constData(),
                                                       modelData.size(),
                                                       *m_sessionOptions);
        } else {
            std::string stdModelPath = modelPath.toStdString();
            m_session = std::make_unique<Ort::Session>(*m_env, stdModelPath.c_str(), *m_sessionOptions);
        }

        Ort::AllocatorWithDefaultOptions allocator;

        if (m_session->GetInputCount() != 1) {
            m_errorMessage = QString("Expected 1 input node, got %1").arg(m_session->GetInputCount());
            return false;
        }
        if (m_session->GetOutputCount() < 1) {
            m_errorMessage = "Model has no outputs";
            return false;
        }

        Ort::AllocatedStringPtr inputNameAllocated = m_session->GetInputNameAllocated(0, allocator);
        m_inputName = std::string(inputNameAllocated.get());
        m_inputNames.clear();
        m_inputNames.push_back(m_inputName.c_str());

        // U^2-Net exports several side outputs; the first one is the fused map
        Ort::AllocatedStringPtr outputNameAllocated = m_session->GetOutputNameAllocated(0, allocator);
        m_outputName = std::string(outputNameAllocated.get());
        m_outputNames.clear();
        m_outputNames.push_back(m_outputName.c_str());

        Ort::TypeInfo inputTypeInfo = m_session->GetInputTypeInfo(0);
        std::vector<int64_t> inputShape = inputTypeInfo.GetTensorTypeAndShapeInfo().GetShape();
        if (inputShape.size() != 4 || (inputShape[1] > 0 && inputShape[1] != INPUT_CHANNELS)) {
            m_errorMessage = "Unexpected input shape, expected Nx3xHxW";
            return false;
        }

        // Dynamic axes are reported as -1
        m_inputHeight = inputShape[2] > 0 ? static_cast<int>(inputShape[2]) : DEFAULT_INPUT_SIZE;
        m_inputWidth = inputShape[3] > 0 ? static_cast<int>(inputShape[3]) : DEFAULT_INPUT_SIZE;

        qInfo() << "OnnxSegmentationModel: Model" << m_name << "loaded successfully";
        qInfo() << "  Input size:" << m_inputWidth << "x" << m_inputHeight;
        qInfo() << "  Execution provider:" << m_activeProvider;

        return true;

    } catch (const std::exception& e) {
        m_errorMessage = QString("Failed to initialize ONNX session: %1").arg(e.what());
        return false;
    }
}

cv::Mat OnnxSegmentationModel::predict(const cv::Mat& bgrImage, InferenceControl& control) {
    if (!m_initialized) {
        throw AnvilError(ErrorKind::ExtractionFailure,
                         QString("Model %1 not initialized: %2").arg(m_name, m_errorMessage));
    }
    if (bgrImage.empty()) {
        throw AnvilError(ErrorKind::Validation, QString("Empty input image"));
    }

    std::vector<float> inputTensor;
    preprocessImage(bgrImage, inputTensor);

    std::vector<int64_t> inputShape = {1, INPUT_CHANNELS, m_inputHeight, m_inputWidth};
    Ort::Value inputOrtValue = Ort::Value::CreateTensor<float>(
        m_memoryInfo,
        inputTensor.data(),
        inputTensor.size(),
        inputShape.data(),
        inputShape.size()
    );

    Ort::RunOptions runOptions;
    control.setStopHandler([&runOptions]() { runOptions.SetTerminate(); });

    std::vector<Ort::Value> outputTensors;
    try {
        outputTensors = m_session->Run(
            runOptions,
            m_inputNames.data(),
            &inputOrtValue,
            1,
            m_outputNames.data(),
            1
        );
    } catch (const std::exception&) {
        control.clearStopHandler();
        throw;
    }
    control.clearStopHandler();

    if (control.stopRequested()) {
        throw AnvilError(ErrorKind::Timeout, QString("Inference on %1 was interrupted").arg(m_name));
    }
    if (outputTensors.empty() || !outputTensors[0].IsTensor()) {
        throw AnvilError(ErrorKind::ExtractionFailure, QString("Model %1 returned no tensor").arg(m_name));
    }

    std::vector<int64_t> outputShape = outputTensors[0].GetTensorTypeAndShapeInfo().GetShape();
    if (outputShape.size() < 2) {
        throw AnvilError(ErrorKind::ExtractionFailure, QString("Model %1 returned an unexpected shape").arg(m_name));
    }
    const int outH = static_cast<int>(outputShape[outputShape.size() - 2]);
    const int outW = static_cast<int>(outputShape[outputShape.size() - 1]);

    const float* outputData = outputTensors[0].GetTensorData<float>();
    return postprocessMask(outputData, cv::Size(outW, outH), bgrImage.size());
}

void OnnxSegmentationModel::preprocessImage(const cv::Mat& bgrImage, std::vector<float>& inputTensor) const {
    cv::Mat imageRGB;
    if (bgrImage.channels() == 4) {
        cv::cvtColor(bgrImage, imageRGB, cv::COLOR_BGRA2RGB);
    } else if (bgrImage.channels() == 1) {
        cv::cvtColor(bgrImage, imageRGB, cv::COLOR_GRAY2RGB);
    } else {
        cv::cvtColor(bgrImage, imageRGB, cv::COLOR_BGR2RGB);
    }

    // INTER_AREA matches PIL's downsampling closely enough for the saliency models
    cv::Mat imageResized;
    cv::resize(imageRGB, imageResized, cv::Size(m_inputWidth, m_inputHeight), 0, 0, cv::INTER_AREA);

    // The rembg models expect the image divided by its own maximum, not by 255
    double maxValue = 0.0;
    cv::minMaxLoc(imageResized.reshape(1), nullptr, &maxValue);
    if (maxValue <= 0.0) {
        maxValue = 1.0;
    }

    cv::Mat imageFloat;
    imageResized.convertTo(imageFloat, CV_32F, 1.0 / maxValue);

    inputTensor.resize(1 * INPUT_CHANNELS * m_inputHeight * m_inputWidth);

    const int plane = m_inputHeight * m_inputWidth;
    for (int h = 0; h < m_inputHeight; ++h) {
        const cv::Vec3f* row = imageFloat.ptr<cv::Vec3f>(h);
        for (int w = 0; w < m_inputWidth; ++w) {
            for (int c = 0; c < INPUT_CHANNELS; ++c) {
                inputTensor[c * plane + h * m_inputWidth + w] = (row[w][c] - IMAGENET_MEAN[c]) / IMAGENET_STD[c];
            }
        }
    }
}

cv::Mat OnnxSegmentationModel::postprocessMask(const float* data, const cv::Size& outputSize, const cv::Size& targetSize) {
    cv::Mat prediction(outputSize, CV_32FC1, const_cast<float*>(data));

    double minValue = 0.0;
    double maxValue = 0.0;
    cv::minMaxLoc(prediction, &minValue, &maxValue);
    const double range = maxValue - minValue;

    cv::Mat normalized;
    if (range > 0.0) {
        prediction.convertTo(normalized, CV_8UC1, 255.0 / range, -minValue * 255.0 / range);
    } else {
        normalized = cv::Mat::zeros(outputSize, CV_8UC1);
    }

    cv::Mat mask;
    cv::resize(normalized, mask, targetSize, 0, 0, cv::INTER_LINEAR);
    return mask;
}
