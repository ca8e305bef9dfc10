// StepFlowSimulator.cpp
//
// Chunked run loop over a CompiledGraph, probe accumulation and reset.
#include "StepFlowSimulator.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace StepFlow {

Simulator::Simulator(Model model, CompileOptions options, BuilderRegistry builders)
    : model_(std::move(model)), options(std::move(options)), builders(std::move(builders)),
      graph_(compile(model_, this->options, this->builders)), state(graph_.initialState()),
      probeData(model_.probes.size()) {}

void Simulator::runSteps(int steps) {
    if (steps < 0) throw std::invalid_argument("Cannot run a negative number of steps");
    const int block = options.stepBlocks ? *options.stepBlocks : std::max(steps, 1);
    int remaining = steps;
    while (remaining > 0) {
        const int chunk = std::min(block, remaining);
        RunResult result = graph_.run(std::move(state), chunk);
        state = std::move(result.state);
        for (size_t p = 0; p < result.probes.size(); ++p) {
            auto& rows = probeData[p];
            rows.insert(rows.end(), std::make_move_iterator(result.probes[p].begin()),
                        std::make_move_iterator(result.probes[p].end()));
        }
        remaining -= chunk;
    }
    logDebug("simulator at step {} (t={:.6f})", state.step, time());
}

void Simulator::reset(std::optional<unsigned> seed) {
    if (seed) options.seed = *seed;
    graph_ = compile(model_, options, builders);
    state = graph_.initialState();
    probeData.assign(model_.probes.size(), {});
}

const std::vector<std::vector<double>>& Simulator::data(const std::string& probe) const {
    int index = model_.findProbe(probe);
    if (index < 0) throw LookupError("No probe named '" + probe + "'");
    return probeData[static_cast<size_t>(index)];
}

} // namespace StepFlow
