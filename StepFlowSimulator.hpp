// StepFlow simulator
//
// Convenience driver over a CompiledGraph: owns the model, the compiled graph
// and the loop-carried state, runs arbitrary step counts in chunks of the
// compiled step block and accumulates probe data across calls.
#pragma once
#include "StepFlowCompiler.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace StepFlow {

class Simulator {
public:
    Simulator(Model model, CompileOptions options, BuilderRegistry builders = BuilderRegistry::withDefaults());

    void runSteps(int steps);
    // Discard state and probe data and rebuild; a new seed replaces the
    // compile-time random state
    void reset(std::optional<unsigned> seed = std::nullopt);

    // Rows captured so far for the named probe. Throws LookupError.
    const std::vector<std::vector<double>>& data(const std::string& probe) const;

    int step() const { return state.step; }
    double time() const { return state.step * graph_.dt(); }

    CompiledGraph& graph() { return graph_; }
    const Model& model() const { return model_; }
    const SimulationState& currentState() const { return state; }

private:
    Model model_;
    CompileOptions options;
    BuilderRegistry builders;
    CompiledGraph graph_;
    SimulationState state;
    std::vector<std::vector<std::vector<double>>> probeData;
};

} // namespace StepFlow
