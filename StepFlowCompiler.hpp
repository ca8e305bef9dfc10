// StepFlow compiler
//
// Step compiler, loop assembler and the CompiledGraph they produce.
//
// compile() runs the whole pipeline once: dependency filter, greedy planner,
// signal layout optimizer, buffer allocator, then the per-kind builders
// (through the StepCompiler) and finally the LoopAssembler, which wraps the
// step computation either in N flat replicas (unrolled) or in one repeated
// body bounded by a stop counter. The result is an immutable value; the
// mutable simulation state is threaded explicitly through run().
#pragma once
#include "StepFlowBuilders.hpp"
#include "StepFlowGraph.hpp"
#include "StepFlowPlanner.hpp"
#include "StepFlowSignals.hpp"
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace StepFlow {

struct CompileOptions {
    std::optional<double> dt;      // defaults to the model's dt
    std::optional<int> stepBlocks; // steps per run() call; none = unbounded
    bool unroll = false;           // replicate the step stepBlocks times
    ElementType dtype = ElementType::Float32;
    int batchSize = 1;
    std::string device = "cpu";
    unsigned seed = 0;
};

// Loop-carried simulation state between run() calls. Trainable buffers are
// not part of it; they live in the graph's variable store.
struct SimulationState {
    int step = 0;
    std::map<BufferKey, BaseBuffer> buffers;
    std::vector<std::mt19937> generators; // one per random stream of the graph
};

struct RunResult {
    SimulationState state;
    // Per probe (model order): one row per executed step
    std::vector<std::vector<std::vector<double>>> probes;
};

// Values fed into a signal every iteration, computed before the loop runs
struct HoistedInput {
    std::string name;
    SignalId output = -1;
    SourceFunction function;
};

// Runs the two-phase builder protocol over the plan
class StepCompiler {
public:
    StepCompiler(const Plan& plan, const BuilderRegistry& builders, SignalTable& signals);

    // Once per compiled graph, groups in plan order
    void preBuild(std::mt19937& rng);

    // Once per built step. The SignalTable must be inside beginStep().
    // Returns the side-effect nodes of every group.
    std::vector<NodeId> buildStep();

private:
    const Plan& plan;
    const BuilderRegistry& builders;
    SignalTable& signals;
};

// Node ids of one assembled iteration
struct IterationNodes {
    NodeId stepIncrement = kLoopEntry;
    NodeId inputFeed = kLoopEntry;
    std::vector<NodeId> sideEffects;
    std::vector<NodeId> probeReads;
    std::vector<NodeId> probeWrites;
    NodeId advance = kLoopEntry;
    size_t end = 0; // one past the iteration's last node
};

class LoopAssembler {
public:
    LoopAssembler(StepCompiler& compiler, SignalTable& signals, const std::vector<HoistedInput>& inputs,
                  SignalId timeSignal);

    // Append one iteration whose first node runs after `entry`
    IterationNodes assembleIteration(StepProgram& program, const std::string& prefix, NodeId entry);

private:
    StepCompiler& compiler;
    SignalTable& signals;
    const std::vector<HoistedInput>& inputs;
    SignalId timeSignal;
};

using AdjustableBuffers = std::map<BufferKey, std::shared_ptr<BaseBuffer>>;

class CompiledGraph {
public:
    const Plan& plan() const { return plan_; }
    const std::vector<SignalId>& signalOrder() const { return signalOrder_; }
    const BufferLayout& layout() const { return layout_; }
    const StepProgram& program() const { return program_; }
    const CompileOptions& options() const { return options_; }
    const Model& model() const { return *model_; }
    double dt() const { return dt_; }
    bool unrolled() const { return options_.unroll; }
    // Unrolled replicas, or 1 for the looped form
    size_t iterationCount() const { return iterations_.size(); }
    const IterationNodes& iteration(size_t index) const { return iterations_.at(index); }

    // Step 0 with every non-trainable buffer at its initial content and every
    // random stream at its seed
    SimulationState initialState() const;

    // Advance `steps` steps from `state`. Throws std::invalid_argument when
    // steps is negative or exceeds the compiled step block.
    RunResult run(SimulationState state, int steps) const;

    // reuse=false: create fresh handles for the trainable buffers from their
    // initial content and use them for every later run(). reuse=true: the
    // handles of the last reuse=false call; LookupError if there was none.
    AdjustableBuffers getAdjustableBuffers(bool reuse);

    // Plan, buffers and views as JSON
    nlohmann::json describe() const;

private:
    friend CompiledGraph compile(const Model& model, const CompileOptions& options, const BuilderRegistry& builders);

    std::shared_ptr<const Model> model_;
    CompileOptions options_;
    double dt_ = 0.001;
    int filteredCount_ = 0;
    Plan plan_;
    std::vector<SignalId> signalOrder_;
    BufferLayout layout_;
    std::vector<HoistedInput> inputs_;
    StepProgram program_;
    std::vector<IterationNodes> iterations_;
    std::vector<unsigned> streamSeeds_;
    AdjustableBuffers variables_;
    bool adjustableCreated_ = false;
};

// Throws ModelGraphError (cycles, multiple writers, bad sources),
// AllocationError (unplaceable signals), LookupError (unregistered kinds)
// and std::invalid_argument (inconsistent options).
CompiledGraph compile(const Model& model, const CompileOptions& options, const BuilderRegistry& builders);

} // namespace StepFlow
