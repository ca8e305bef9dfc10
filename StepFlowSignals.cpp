// StepFlowSignals.cpp
//
// Buffer allocator: packs signals into base buffers and builds the
// Signal -> SignalView map.
#include "StepFlowSignals.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <tuple>
#include <unordered_set>

namespace StepFlow {

std::string BufferKey::name() const {
    std::string n = toString(dtype) + "_";
    if (trailing.empty()) {
        n += "scalar";
    } else {
        for (size_t i = 0; i < trailing.size(); ++i) {
            if (i) n += "x";
            n += std::to_string(trailing[i]);
        }
    }
    n += trainable ? "_trainable" : "_state";
    return n;
}

bool BufferKey::operator<(const BufferKey& other) const {
    return std::tie(dtype, trailing, trainable) < std::tie(other.dtype, other.trailing, other.trainable);
}

bool BufferKey::operator==(const BufferKey& other) const {
    return dtype == other.dtype && trailing == other.trailing && trainable == other.trainable;
}

double BaseBuffer::quantize(double v) const {
    switch (key.dtype) {
    case ElementType::Float32: return static_cast<double>(static_cast<float>(v));
    case ElementType::Int32: {
        if (std::isnan(v)) return 0.0;
        const double lo = std::numeric_limits<int32_t>::min();
        const double hi = std::numeric_limits<int32_t>::max();
        return std::trunc(std::max(lo, std::min(hi, v)));
    }
    case ElementType::Float64: break;
    }
    return v;
}

const SignalView& BufferLayout::view(SignalId id) const {
    if (id < 0 || static_cast<size_t>(id) >= views.size() || views[id].buffer < 0) {
        throw LookupError("No signal view for signal id " + std::to_string(id));
    }
    return views[id];
}

int BufferLayout::bufferIndex(const BufferKey& key) const {
    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) return static_cast<int>(i);
    }
    return -1;
}

BufferKey bufferKeyFor(const Signal& signal, ElementType floatType) {
    BufferKey key;
    if (signal.dataType == "float") key.dtype = floatType;
    else if (signal.dataType == "int") key.dtype = ElementType::Int32;
    else throw AllocationError("Signal '" + signal.name + "' has unsupported data type '" + signal.dataType + "'");
    key.trailing = signal.trailingShape();
    key.trainable = signal.trainable;
    return key;
}

BufferLayout createSignals(const Model& model, const std::vector<SignalId>& order, ElementType floatType,
                           int batchSize) {
    if (batchSize < 1) throw AllocationError("Batch size must be at least 1, got " + std::to_string(batchSize));

    // Full placement order: optimized signals first, then the rest
    std::vector<SignalId> placement;
    std::unordered_set<SignalId> placed;
    for (SignalId s : order) {
        if (s < 0 || static_cast<size_t>(s) >= model.signals.size()) {
            throw AllocationError("Signal order references unknown signal id " + std::to_string(s));
        }
        if (placed.insert(s).second) placement.push_back(s);
    }
    for (size_t s = 0; s < model.signals.size(); ++s) {
        if (placed.insert(static_cast<SignalId>(s)).second) placement.push_back(static_cast<SignalId>(s));
    }

    BufferLayout layout;
    layout.batchSize = batchSize;
    layout.views.resize(model.signals.size());

    // First pass: shapes, keys and row offsets
    for (SignalId id : placement) {
        const Signal& sig = model.signals[id];
        for (int d : sig.shape) {
            if (d < 0) throw AllocationError("Signal '" + sig.name + "' has a negative dimension");
        }
        if (!sig.initial.empty() && static_cast<int>(sig.initial.size()) != sig.size()) {
            throw AllocationError("Signal '" + sig.name + "' has " + std::to_string(sig.initial.size()) +
                                  " initial values for " + std::to_string(sig.size()) + " elements");
        }
        BufferKey key = bufferKeyFor(sig, floatType);
        int b = layout.bufferIndex(key);
        if (b < 0) {
            BaseBuffer buf;
            buf.key = key;
            buf.batch = key.trainable ? 1 : batchSize;
            buf.rowSize = 1;
            for (int d : key.trailing) buf.rowSize *= d;
            layout.keys.push_back(key);
            layout.initial.push_back(std::move(buf));
            b = static_cast<int>(layout.keys.size() - 1);
        }
        BaseBuffer& buf = layout.initial[b];

        SignalView& v = layout.views[id];
        v.signal = id;
        v.key = key;
        v.buffer = b;
        v.rows = sig.rows();
        v.shape = sig.shape;
        v.batch = buf.batch;
        v.elements = sig.size();
        v.offset = static_cast<size_t>(buf.rows) * buf.rowSize * buf.batch;
        v.strides.assign(sig.shape.size(), 0);
        size_t stride = static_cast<size_t>(buf.batch);
        for (size_t d = sig.shape.size(); d-- > 0;) {
            v.strides[d] = stride;
            stride *= static_cast<size_t>(sig.shape[d]);
        }
        buf.rows += v.rows;
    }

    // Second pass: initial content, replicated across batch items
    for (auto& buf : layout.initial) {
        buf.data.assign(static_cast<size_t>(buf.rows) * buf.rowSize * buf.batch, 0.0);
    }
    for (SignalId id : placement) {
        const Signal& sig = model.signals[id];
        const SignalView& v = layout.views[id];
        BaseBuffer& buf = layout.initial[v.buffer];
        if (v.offset + v.extent() > buf.extent()) {
            throw AllocationError("Signal '" + sig.name + "' does not fit its base buffer " + buf.key.name());
        }
        if (sig.initial.empty()) continue;
        for (int e = 0; e < v.elements; ++e) {
            for (int bi = 0; bi < v.batch; ++bi) buf.store(v.index(e, bi), sig.initial[e]);
        }
    }

    if (debugEnabled()) {
        for (const auto& buf : layout.initial) {
            logDebug("base buffer {}: rows={} elements={}", buf.key.name(), buf.rows, buf.extent());
        }
    }
    return layout;
}

} // namespace StepFlow
