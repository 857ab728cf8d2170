#ifndef ONNXSEGMENTATIONMODEL_H
#define ONNXSEGMENTATIONMODEL_H

#include <QString>
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>
#include "segmentationmodel.h"

/**
 * @brief Salient-object segmentation using ONNX Runtime
 *
 * Loads a U^2-Net family model (u2net_human_seg, silueta, ...) that takes a
 * 1x3xHxW float tensor and produces a 1x1xHxW saliency map as its first output.
 * The map is min-max normalized and resized back to the input image.
 *
 * Supports hardware acceleration via:
 * - Linux/Windows: CUDA
 * - Fallback: CPU
 */
class OnnxSegmentationModel : public SegmentationModel {
public:
    /**
     * @brief Execution provider types for hardware acceleration
     */
    enum class ExecutionProvider {
        Auto,       // Automatically select best available
        CUDA,       // NVIDIA CUDA
        CPU         // CPU only
    };

    /**
     * @brief Constructor
     * @param name Model name reported in logs and metadata
     * @param modelPath Path to ONNX model file
     * @param preferredProvider Preferred execution provider (default: Auto)
     */
    OnnxSegmentationModel(const QString& name,
                          const QString& modelPath,
                          ExecutionProvider preferredProvider = ExecutionProvider::Auto);

    ~OnnxSegmentationModel() override;

    /**
     * @brief Check if the session is initialized and ready
     * @return true if model loaded successfully
     */
    bool isInitialized() const;

    /**
     * @brief Get error message if initialization failed
     * @return Error message, empty if no error
     */
    QString getErrorMessage() const;

    /**
     * @brief Get the active execution provider name
     */
    QString getActiveExecutionProvider() const;

    QString name() const override;

    cv::Mat predict(const cv::Mat& bgrImage, InferenceControl& control) override;

    static QString executionProviderToString(ExecutionProvider provider);
    static ExecutionProvider stringToExecutionProvider(const QString& providerStr);

private:
    /**
     * @brief Initialize ONNX Runtime session with execution providers
     * @param modelPath Path to ONNX model
     * @param preferredProvider Preferred execution provider
     * @return true if initialization successful
     */
    bool initializeSession(const QString& modelPath, ExecutionProvider preferredProvider);

    /**
     * @brief Convert a BGR image into a normalized NCHW tensor
     * @param bgrImage Input image
     * @param inputTensor Output tensor data (1x3xHxW)
     */
    void preprocessImage(const cv::Mat& bgrImage, std::vector<float>& inputTensor) const;

    /**
     * @brief Turn the raw saliency map into an 8-bit alpha mask
     * @param data Output tensor data (HxW floats)
     * @param outputSize Size of the output map
     * @param targetSize Size of the original image
     * @return CV_8UC1 mask of targetSize
     */
    static cv::Mat postprocessMask(const float* data, const cv::Size& outputSize, const cv::Size& targetSize);

    QString m_name;

    // ONNX Runtime members
    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::SessionOptions> m_sessionOptions;
    Ort::MemoryInfo m_memoryInfo;

    // Model metadata
    std::string m_inputName;
    std::string m_outputName;
    std::vector<const char*> m_inputNames;   // Pointers to m_inputName
    std::vector<const char*> m_outputNames;  // Pointers to m_outputName
    int m_inputWidth;
    int m_inputHeight;

    QString m_activeProvider;

    // ImageNet normalization constants
    static constexpr float IMAGENET_MEAN[3] = {0.485f, 0.456f, 0.406f};
    static constexpr float IMAGENET_STD[3] = {0.229f, 0.224f, 0.225f};

    // Used when the model declares dynamic spatial dimensions
    static constexpr int DEFAULT_INPUT_SIZE = 320;
    static constexpr int INPUT_CHANNELS = 3;

    bool m_initialized;
    QString m_errorMessage;
};

#endif // ONNXSEGMENTATIONMODEL_H
