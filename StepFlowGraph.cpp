// StepFlowGraph.cpp
//
// Step program construction/execution and the kernel-side signal accessors.
#include "StepFlowGraph.hpp"
#include <stdexcept>

namespace StepFlow {

void ProbeArray::write(size_t index, std::vector<double> values) {
    if (!dynamicSize && index >= capacity) {
        throw std::out_of_range("Probe array write at index " + std::to_string(index) +
                                " exceeds fixed size " + std::to_string(capacity));
    }
    if (rows.size() <= index) rows.resize(index + 1);
    rows[index] = std::move(values);
}

std::string toString(NodeKind kind) {
    switch (kind) {
    case NodeKind::StepIncrement: return "step_increment";
    case NodeKind::InputFeed: return "input_feed";
    case NodeKind::Kernel: return "kernel";
    case NodeKind::ProbeRead: return "probe_read";
    case NodeKind::ProbeWrite: return "probe_write";
    case NodeKind::Advance: return "advance";
    }
    return "unknown";
}

NodeId StepProgram::add(NodeKind kind, std::string name, std::function<void(LoopState&)> fn,
                        std::vector<NodeId> after) {
    StepNode n;
    n.id = static_cast<NodeId>(nodes_.size());
    n.kind = kind;
    n.name = std::move(name);
    n.fn = std::move(fn);
    n.after = std::move(after);
    for (NodeId dep : n.after) {
        // Edges may only point backwards; the program is built in a valid order
        if (dep != kLoopEntry && (dep < 0 || dep >= n.id)) {
            throw std::logic_error("Node '" + n.name + "' depends on node " + std::to_string(dep) +
                                   " which is not emitted before it");
        }
    }
    nodes_.push_back(std::move(n));
    return nodes_.back().id;
}

void StepProgram::execute(LoopState& state, size_t begin, size_t end, std::vector<char>& executed,
                          bool entryDone) const {
    if (executed.size() < nodes_.size()) executed.resize(nodes_.size(), 0);
    for (size_t i = begin; i < end; ++i) {
        const StepNode& n = nodes_[i];
        for (NodeId dep : n.after) {
            bool done = (dep == kLoopEntry) ? entryDone : executed[static_cast<size_t>(dep)] != 0;
            if (!done) {
                throw std::logic_error("Happens-before violated: '" + n.name + "' ran before its dependency " +
                                       (dep == kLoopEntry ? std::string("<loop entry>") : nodes_[dep].name));
            }
        }
        if (n.fn) n.fn(state);
        executed[i] = 1;
    }
}

SignalTable::SignalTable(const Model& model, const BufferLayout& layout, double dt)
    : model_(model), layout_(layout), dt_(dt) {}

void SignalTable::beginStep(StepProgram* program, std::string prefix, std::vector<NodeId> entry) {
    program_ = program;
    prefix_ = std::move(prefix);
    scope_.clear();
    entry_ = std::move(entry);
    lastKernel_ = kLoopEntry;
}

void SignalTable::endStep() {
    program_ = nullptr;
    scope_.clear();
}

NodeId SignalTable::emitKernel(const std::string& name, std::function<void(LoopState&)> fn) {
    if (!program_) throw std::logic_error("emitKernel called outside of a step build");
    std::vector<NodeId> after = entry_;
    if (lastKernel_ != kLoopEntry) after.push_back(lastKernel_);
    std::string full = prefix_;
    if (!scope_.empty()) full += scope_ + "/";
    full += name;
    lastKernel_ = program_->add(NodeKind::Kernel, std::move(full), std::move(fn), std::move(after));
    return lastKernel_;
}

int SignalTable::addRandomStream(unsigned seed) {
    streamSeeds_.push_back(seed);
    return static_cast<int>(streamSeeds_.size()) - 1;
}

double SignalTable::read(const LoopState& state, const SignalView& v, int element, int batchItem) {
    return state.base(v.buffer).data[v.index(element, v.batch == 1 ? 0 : batchItem)];
}

void SignalTable::write(LoopState& state, const SignalView& v, int element, int batchItem, double value) {
    state.base(v.buffer).store(v.index(element, v.batch == 1 ? 0 : batchItem), value);
}

void SignalTable::increment(LoopState& state, const SignalView& v, int element, int batchItem, double value) {
    state.base(v.buffer).add(v.index(element, v.batch == 1 ? 0 : batchItem), value);
}

std::vector<double> SignalTable::gather(const LoopState& state, const SignalView& v, int batchSize) {
    std::vector<double> out;
    out.reserve(static_cast<size_t>(v.elements) * batchSize);
    for (int e = 0; e < v.elements; ++e) {
        for (int b = 0; b < batchSize; ++b) out.push_back(read(state, v, e, b));
    }
    return out;
}

void SignalTable::scatter(LoopState& state, const SignalView& v, const std::vector<double>& values, int batchSize) {
    const size_t full = static_cast<size_t>(v.elements) * batchSize;
    if (values.size() != full && values.size() != static_cast<size_t>(v.elements) && values.size() != 1) {
        throw std::runtime_error("Cannot scatter " + std::to_string(values.size()) + " values into signal view of " +
                                 std::to_string(v.elements) + " elements x " + std::to_string(batchSize) + " batch");
    }
    for (int e = 0; e < v.elements; ++e) {
        for (int b = 0; b < batchSize; ++b) {
            double val;
            if (values.size() == full) val = values[static_cast<size_t>(e) * batchSize + b];
            else if (values.size() == 1) val = values[0];
            else val = values[static_cast<size_t>(e)];
            write(state, v, e, b, val);
        }
    }
}

} // namespace StepFlow
