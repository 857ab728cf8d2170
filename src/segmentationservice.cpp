#include "segmentationservice.h"
#include <QDebug>
#include <QElapsedTimer>
#include "anvilerror.h"
#include "onnxsegmentationmodel.h"

SegmentationService::SegmentationService(const QList<ModelDescriptor>& chain, ModelFactory factory)
    : m_factory(std::move(factory))
    , m_loadAttempts(0)
{
    for (const ModelDescriptor& descriptor : chain) {
        auto slot = std::make_unique<Slot>();
        slot->descriptor = descriptor;
        m_slots.push_back(std::move(slot));
    }
}

int SegmentationService::modelCount() const
{
    return static_cast<int>(m_slots.size());
}

ModelDescriptor SegmentationService::descriptor(int index) const
{
    if (index < 0 || index >= modelCount()) {
        return ModelDescriptor();
    }
    return m_slots[index]->descriptor;
}

int SegmentationService::loadAttempts() const
{
    return m_loadAttempts.load();
}

SegmentationModel* SegmentationService::model(int index, QString* errorMessage)
{
    if (index < 0 || index >= modelCount()) {
        if (errorMessage) {
            *errorMessage = QString("No model at index %1").arg(index);
        }
        return nullptr;
    }

    Slot& slot = *m_slots[index];
    std::call_once(slot.loaded, [this, &slot]() { load(slot); });

    if (!slot.model && errorMessage) {
        *errorMessage = slot.error;
    }
    return slot.model.get();
}

void SegmentationService::load(Slot& slot)
{
    ++m_loadAttempts;
    QElapsedTimer timer;
    timer.start();

    qInfo() << "SegmentationService: Loading model" << slot.descriptor.name << "from" << slot.descriptor.path;

    try {
        if (!m_factory) {
            throw AnvilError(ErrorKind::ExtractionFailure, QString("No model factory configured"));
        }
        slot.model = m_factory(slot.descriptor);
        if (!slot.model) {
            throw AnvilError(ErrorKind::ExtractionFailure, QString("Factory returned no model"));
        }
        qInfo() << "SegmentationService: Model" << slot.descriptor.name << "ready in" << timer.elapsed() << "ms";
    } catch (const std::exception& e) {
        // Remembered so the fallback chain does not retry a broken model
        slot.model.reset();
        slot.error = QString::fromUtf8(e.what());
        qWarning() << "SegmentationService: Failed to load" << slot.descriptor.name << ":" << slot.error;
    }
}

ModelFactory SegmentationService::onnxFactory()
{
    return [](const ModelDescriptor& descriptor) -> std::unique_ptr<SegmentationModel> {
        auto model = std::make_unique<OnnxSegmentationModel>(
            descriptor.name,
            descriptor.path,
            OnnxSegmentationModel::stringToExecutionProvider(descriptor.executionProvider));
        if (!model->isInitialized()) {
            throw AnvilError(ErrorKind::ExtractionFailure, model->getErrorMessage());
        }
        return model;
    };
}
