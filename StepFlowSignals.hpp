// StepFlow signal storage
//
// Base buffers, signal views and the buffer allocator. Every signal is placed
// in exactly one base buffer keyed by (element type, trailing shape,
// trainable); the view records where. Buffer elements are laid out as
// (row, trailing element, batch item) so stacked signals stay contiguous.
#pragma once
#include "StepFlowCore.hpp"
#include <string>
#include <vector>

namespace StepFlow {

struct BufferKey {
    ElementType dtype = ElementType::Float32;
    Shape trailing;
    bool trainable = false;

    // e.g. "float32_3x2_trainable" / "float32_scalar_state"
    std::string name() const;

    bool operator<(const BufferKey& other) const;
    bool operator==(const BufferKey& other) const;
    bool operator!=(const BufferKey& other) const { return !(*this == other); }
};

// Physical storage shared by one or more signals. Trainable buffers hold a
// single copy of each element, the others one copy per batch item.
struct BaseBuffer {
    BufferKey key;
    int rows = 0;
    int rowSize = 1; // trailing elements per row
    int batch = 1;
    std::vector<double> data;

    size_t extent() const { return data.size(); }
    // Round to the buffer's element type before storing
    double quantize(double v) const;
    void store(size_t index, double v) { data[index] = quantize(v); }
    void add(size_t index, double v) { data[index] = quantize(data[index] + v); }
};

// Location of one signal inside its base buffer (TensorSignal)
struct SignalView {
    SignalId signal = -1;
    BufferKey key;
    int buffer = -1;  // index into BufferLayout::keys
    size_t offset = 0; // element offset of the first row
    int rows = 0;
    Shape shape;
    std::vector<size_t> strides; // per shape dimension, in buffer elements
    int elements = 0; // signal elements per batch item
    int batch = 1;

    size_t extent() const { return static_cast<size_t>(elements) * static_cast<size_t>(batch); }
    size_t index(int element, int batchItem) const {
        return offset + static_cast<size_t>(element) * static_cast<size_t>(batch) + static_cast<size_t>(batchItem);
    }
};

struct BufferLayout {
    std::vector<BufferKey> keys;      // buffer creation order
    std::vector<BaseBuffer> initial;  // initial content, indexed like keys
    std::vector<SignalView> views;    // indexed by SignalId
    int batchSize = 1;

    const SignalView& view(SignalId id) const;
    int bufferIndex(const BufferKey& key) const; // -1 if missing
};

// Key of the buffer a signal belongs to; float signals take `floatType`
BufferKey bufferKeyFor(const Signal& signal, ElementType floatType);

// Concatenate signals (in `order`, then every remaining model signal in
// declaration order) into base buffers. Throws AllocationError on shape,
// type or initial-value contradictions.
BufferLayout createSignals(const Model& model, const std::vector<SignalId>& order, ElementType floatType,
                           int batchSize);

} // namespace StepFlow
