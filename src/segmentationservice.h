#ifndef SEGMENTATIONSERVICE_H
#define SEGMENTATIONSERVICE_H

#include <QList>
#include <QString>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "segmentationmodel.h"

/**
 * @brief Where to load a segmentation model from
 */
struct ModelDescriptor {
    QString name;               // e.g. "u2net_human_seg"
    QString path;               // ONNX file
    QString executionProvider;  // "Auto", "CUDA" or "CPU"
};

/**
 * @brief Creates a model from its descriptor; throws std::exception on failure
 */
using ModelFactory = std::function<std::unique_ptr<SegmentationModel>(const ModelDescriptor&)>;

/**
 * @brief Process-wide owner of the segmentation models
 *
 * Models are loaded lazily in priority order. Each model is loaded at most once:
 * concurrent first callers block until the load finishes, and a failed load is
 * remembered so later callers skip straight to the next model.
 */
class SegmentationService
{
public:
    /**
     * @brief Constructor
     * @param chain Models in priority order (primary first)
     * @param factory Model factory, defaults to the ONNX Runtime backend
     */
    explicit SegmentationService(const QList<ModelDescriptor>& chain,
                                 ModelFactory factory = onnxFactory());

    SegmentationService(const SegmentationService&) = delete;
    SegmentationService& operator=(const SegmentationService&) = delete;

    int modelCount() const;

    /**
     * @brief Get a loaded model, loading it on first use
     * @param index Position in the chain
     * @param errorMessage Receives the load failure, if any
     * @return Model or nullptr if it could not be loaded
     */
    SegmentationModel* model(int index, QString* errorMessage = nullptr);

    /**
     * @brief Descriptor of a chain entry
     */
    ModelDescriptor descriptor(int index) const;

    /**
     * @brief Number of factory invocations so far
     */
    int loadAttempts() const;

    /**
     * @brief Factory creating OnnxSegmentationModel instances
     */
    static ModelFactory onnxFactory();

private:
    struct Slot {
        ModelDescriptor descriptor;
        std::once_flag loaded;
        std::unique_ptr<SegmentationModel> model;
        QString error;
    };

    void load(Slot& slot);

    std::vector<std::unique_ptr<Slot>> m_slots;
    ModelFactory m_factory;
    std::atomic<int> m_loadAttempts;
};

#endif // SEGMENTATIONSERVICE_H
