// Small model-building helpers shared by the StepFlow tests
#pragma once
#include "StepFlowCore.hpp"
#include <string>
#include <vector>

namespace StepFlow {
namespace testing {

inline SignalId addSignal(Model& model, const std::string& name, Shape shape = {1}, bool trainable = false,
                          std::vector<double> initial = {}) {
    Signal s;
    s.name = name;
    s.shape = std::move(shape);
    s.trainable = trainable;
    s.initial = std::move(initial);
    return model.addSignal(std::move(s));
}

struct OpSpec {
    std::string kind;
    std::vector<SignalId> sets;
    std::vector<SignalId> incs;
    std::vector<SignalId> reads;
    std::vector<SignalId> updates;
    nlohmann::json params = nlohmann::json::object();
};

inline OperatorId addOp(Model& model, const std::string& id, OpSpec spec) {
    Operator op;
    op.id = id;
    op.kind = std::move(spec.kind);
    op.sets = std::move(spec.sets);
    op.incs = std::move(spec.incs);
    op.reads = std::move(spec.reads);
    op.updates = std::move(spec.updates);
    op.params = std::move(spec.params);
    return model.addOperator(std::move(op));
}

// time <- TimeUpdate, x <- constant source, y = lowpass(x), probes on y and time
inline Model lowpassModel(double tau = 0.01) {
    Model m;
    SignalId time = addSignal(m, "time", {});
    SignalId x = addSignal(m, "x", {1});
    SignalId y = addSignal(m, "y", {1});
    addOp(m, "time_update", {"TimeUpdate", {}, {}, {}, {time}});
    addOp(m, "lowpass", {"Synapse", {}, {}, {x}, {y}, {{"tau", tau}}});
    m.addSource("stim", x, [](double) { return std::vector<double>{1.0}; });
    m.addProbe("y", y);
    m.addProbe("time", time);
    return m;
}

} // namespace testing
} // namespace StepFlow
