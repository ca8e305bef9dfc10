// StepFlow step graph
//
// The emitted per-step computation. Builders and the loop assembler append
// StepNodes to a StepProgram; each node carries explicit happens-before edges
// ("after") instead of relying on incidental execution order. The executor
// runs nodes in program order and rejects any node whose edges are not yet
// satisfied, so the ordering contract is checked rather than assumed.
#pragma once
#include "StepFlowSignals.hpp"
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace StepFlow {

// Growable per-timestep observation buffer. Each row holds one step's value
// of the observed signal, element-major with batch items innermost.
struct ProbeArray {
    std::vector<std::vector<double>> rows;
    size_t capacity = 0;
    bool dynamicSize = true;

    void write(size_t index, std::vector<double> values);
};

// Loop-carried state, handed from one iteration to the next
struct LoopState {
    int step = 0;
    int stop = 0;
    int loopIndex = 0;
    std::vector<std::shared_ptr<BaseBuffer>> bases; // indexed like BufferLayout::keys
    std::vector<ProbeArray> probes;
    std::vector<std::vector<double>> probeStaging;   // forced copies awaiting write
    std::vector<std::vector<double>> inputs;         // per iteration, concatenated source data
    std::vector<std::mt19937> generators;            // random streams, indexed by stream id

    BaseBuffer& base(int index) { return *bases[index]; }
    const BaseBuffer& base(int index) const { return *bases[index]; }
};

enum class NodeKind { StepIncrement, InputFeed, Kernel, ProbeRead, ProbeWrite, Advance };

std::string toString(NodeKind kind);

using NodeId = int;
// Edge target meaning "the previous iteration's Advance node (or loop entry)"
constexpr NodeId kLoopEntry = -1;

struct StepNode {
    NodeId id = 0;
    NodeKind kind = NodeKind::Kernel;
    std::string name;
    std::function<void(LoopState&)> fn;
    std::vector<NodeId> after;
};

class StepProgram {
public:
    NodeId add(NodeKind kind, std::string name, std::function<void(LoopState&)> fn, std::vector<NodeId> after = {});

    const std::vector<StepNode>& nodes() const { return nodes_; }
    const StepNode& node(NodeId id) const { return nodes_.at(static_cast<size_t>(id)); }
    size_t size() const { return nodes_.size(); }

    // Run nodes [begin, end) in order. `executed` is indexed by node id;
    // `entryDone` tells whether kLoopEntry edges are satisfied.
    // Throws std::logic_error on an unsatisfied happens-before edge.
    void execute(LoopState& state, size_t begin, size_t end, std::vector<char>& executed, bool entryDone) const;

private:
    std::vector<StepNode> nodes_;
};

// Builder-facing view of the compiled signals (view table plus the emission
// target of the step currently being built)
class SignalTable {
public:
    SignalTable(const Model& model, const BufferLayout& layout, double dt);

    const Model& model() const { return model_; }
    const BufferLayout& layout() const { return layout_; }
    const SignalView& view(SignalId id) const { return layout_.view(id); }
    double dt() const { return dt_; }
    int batchSize() const { return layout_.batchSize; }

    // Emission target of the step being built. Kernels of one step are
    // chained in emission order and all happen after `entry`.
    void beginStep(StepProgram* program, std::string prefix, std::vector<NodeId> entry);
    void setScope(std::string scope) { scope_ = std::move(scope); }
    void endStep();
    NodeId lastKernel() const { return lastKernel_; }

    NodeId emitKernel(const std::string& name, std::function<void(LoopState&)> fn);

    // Register a random stream seeded with `seed`. Kernels draw from
    // LoopState::generators at the returned index.
    int addRandomStream(unsigned seed);
    const std::vector<unsigned>& randomStreams() const { return streamSeeds_; }

    // Element access used by kernels. Batch items of single-copy (trainable)
    // views all resolve to the one stored copy.
    static double read(const LoopState& state, const SignalView& v, int element, int batchItem);
    static void write(LoopState& state, const SignalView& v, int element, int batchItem, double value);
    static void increment(LoopState& state, const SignalView& v, int element, int batchItem, double value);
    // Copy of the view's current contents, laid out like ProbeArray rows
    static std::vector<double> gather(const LoopState& state, const SignalView& v, int batchSize);
    // Inverse of gather; a single value (or one value per element) is broadcast
    static void scatter(LoopState& state, const SignalView& v, const std::vector<double>& values, int batchSize);

private:
    const Model& model_;
    const BufferLayout& layout_;
    double dt_;
    StepProgram* program_ = nullptr;
    std::string prefix_;
    std::string scope_;
    std::vector<NodeId> entry_;
    NodeId lastKernel_ = kLoopEntry;
    std::vector<unsigned> streamSeeds_;
};

} // namespace StepFlow
