// StepFlowBuilders.cpp
//
// Reference builders for the built-in operator kinds. Each group becomes one
// batched kernel that walks its members' views; views are resolved at build
// time and captured by value.
#include "StepFlowBuilders.hpp"
#include <cmath>
#include <stdexcept>

namespace StepFlow {

void OpBuilder::preBuild(const MergeGroup&, SignalTable&, std::mt19937&) {}

void HostFunctionTable::add(const std::string& name, HostFunction fn) {
    functions[name] = std::move(fn);
}

const HostFunction& HostFunctionTable::get(const std::string& name) const {
    auto it = functions.find(name);
    if (it == functions.end()) throw LookupError("No host function named '" + name + "'");
    return it->second;
}

HostFunctionTable HostFunctionTable::withDefaults() {
    HostFunctionTable table;
    table.add("identity", [](double, const std::vector<double>& x) { return x; });
    table.add("square", [](double, const std::vector<double>& x) {
        std::vector<double> y(x);
        for (auto& v : y) v *= v;
        return y;
    });
    table.add("sin", [](double t, const std::vector<double>& x) {
        if (x.empty()) return std::vector<double>{std::sin(t)};
        std::vector<double> y(x);
        for (auto& v : y) v = std::sin(v);
        return y;
    });
    table.add("sum", [](double, const std::vector<double>& x) {
        double s = 0.0;
        for (double v : x) s += v;
        return std::vector<double>{s};
    });
    table.add("print", [](double t, const std::vector<double>& x) {
        fmt::print("[host] t={:.4f} x=[", t);
        for (size_t i = 0; i < x.size(); ++i) fmt::print("{}{:.4g}", i ? ", " : "", x[i]);
        fmt::print("]\n");
        return std::vector<double>{};
    });
    return table;
}

namespace {

// Output signal of an operator: updates, then sets, then incs
SignalId outputOf(const Operator& op) {
    if (!op.updates.empty()) return op.updates[0];
    if (!op.sets.empty()) return op.sets[0];
    if (!op.incs.empty()) return op.incs[0];
    return -1;
}

void requireSignals(const Operator& op, size_t reads, bool needsOutput) {
    if (op.reads.size() < reads || (needsOutput && outputOf(op) < 0)) {
        throw ModelGraphError("Operator '" + op.id + "' of kind " + op.kind + " needs " + std::to_string(reads) +
                              " read signal(s)" + (needsOutput ? " and an output signal" : ""));
    }
}

std::vector<double> paramValues(const nlohmann::json& params, const char* key, double fallback) {
    std::vector<double> out;
    if (!params.contains(key)) {
        out.push_back(fallback);
    } else if (params[key].is_array()) {
        for (const auto& v : params[key]) out.push_back(v.get<double>());
    } else {
        out.push_back(params[key].get<double>());
    }
    return out;
}

class ResetBuilder : public OpBuilder {
public:
    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        struct Item { SignalView dst; std::vector<double> value; };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            requireSignals(op, 0, true);
            Item item{signals.view(outputOf(op)), paramValues(op.params, "value", 0.0)};
            if (item.value.size() != 1 && static_cast<int>(item.value.size()) != item.dst.elements) {
                throw ModelGraphError("Reset '" + op.id + "' value does not match its signal size");
            }
            items.push_back(std::move(item));
        }
        const int batch = signals.batchSize();
        signals.emitKernel("reset", [items, batch](LoopState& st) {
            for (const auto& it : items) SignalTable::scatter(st, it.dst, it.value, batch);
        });
        return {};
    }
};

class CopyBuilder : public OpBuilder {
public:
    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        struct Item { SignalView src; SignalView dst; bool inc; };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            requireSignals(op, 1, true);
            Item item{signals.view(op.reads[0]), signals.view(outputOf(op)), op.updates.empty() && op.sets.empty()};
            if (item.src.elements != 1 && item.src.elements != item.dst.elements) {
                throw ModelGraphError("Copy '" + op.id + "' source and destination sizes differ");
            }
            items.push_back(item);
        }
        const int batch = signals.batchSize();
        signals.emitKernel("copy", [items, batch](LoopState& st) {
            for (const auto& it : items) {
                // Read the whole source first so in-place copies stay consistent
                auto values = SignalTable::gather(st, it.src, batch);
                for (int e = 0; e < it.dst.elements; ++e) {
                    const int se = it.src.elements == 1 ? 0 : e;
                    for (int b = 0; b < batch; ++b) {
                        double v = values[static_cast<size_t>(se) * batch + b];
                        if (it.inc) SignalTable::increment(st, it.dst, e, b, v);
                        else SignalTable::write(st, it.dst, e, b, v);
                    }
                }
            }
        });
        return {};
    }
};

// Y += A * X, elementwise with scalar broadcast of A or X
class ElementwiseIncBuilder : public OpBuilder {
public:
    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        struct Item { SignalView a; SignalView x; SignalView y; };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            requireSignals(op, 2, true);
            Item item{signals.view(op.reads[0]), signals.view(op.reads[1]), signals.view(outputOf(op))};
            for (const SignalView* v : {&item.a, &item.x}) {
                if (v->elements != 1 && v->elements != item.y.elements) {
                    throw ModelGraphError("ElementwiseInc '" + op.id + "' operand sizes do not broadcast");
                }
            }
            items.push_back(item);
        }
        const int batch = signals.batchSize();
        signals.emitKernel("elementwise_inc", [items, batch](LoopState& st) {
            for (const auto& it : items) {
                for (int e = 0; e < it.y.elements; ++e) {
                    const int ea = it.a.elements == 1 ? 0 : e;
                    const int ex = it.x.elements == 1 ? 0 : e;
                    for (int b = 0; b < batch; ++b) {
                        SignalTable::increment(st, it.y, e, b,
                                               SignalTable::read(st, it.a, ea, b) * SignalTable::read(st, it.x, ex, b));
                    }
                }
            }
        });
        return {};
    }
};

// Y (n) += A (n x m) . X (m)
class DotIncBuilder : public OpBuilder {
public:
    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        struct Item { SignalView a; SignalView x; SignalView y; };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            requireSignals(op, 2, true);
            Item item{signals.view(op.reads[0]), signals.view(op.reads[1]), signals.view(outputOf(op))};
            if (item.a.elements != item.x.elements * item.y.elements) {
                throw ModelGraphError("DotInc '" + op.id + "' matrix size does not match its operands");
            }
            items.push_back(item);
        }
        const int batch = signals.batchSize();
        signals.emitKernel("dot_inc", [items, batch](LoopState& st) {
            for (const auto& it : items) {
                const int n = it.y.elements;
                const int m = it.x.elements;
                for (int b = 0; b < batch; ++b) {
                    for (int i = 0; i < n; ++i) {
                        double acc = 0.0;
                        for (int j = 0; j < m; ++j) {
                            acc += SignalTable::read(st, it.a, i * m + j, b) * SignalTable::read(st, it.x, j, b);
                        }
                        SignalTable::increment(st, it.y, i, b, acc);
                    }
                }
            }
        });
        return {};
    }
};

// First-order lowpass: Y = decay * Y + (1 - decay) * X, decay = exp(-dt / tau)
class SynapseBuilder : public OpBuilder {
public:
    void preBuild(const MergeGroup& group, SignalTable& signals, std::mt19937&) override {
        auto decay = std::make_shared<std::vector<double>>();
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            const double tau = op.params.value("tau", 0.005);
            decay->push_back(tau > 0.0 ? std::exp(-signals.dt() / tau) : 0.0);
        }
        decays[group.ops.front()] = std::move(decay);
    }

    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        auto it = decays.find(group.ops.front());
        if (it == decays.end()) throw std::logic_error("Synapse group built without its pre-build stage");
        struct Item { SignalView x; SignalView y; };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            requireSignals(op, 1, true);
            Item item{signals.view(op.reads[0]), signals.view(outputOf(op))};
            if (item.x.elements != item.y.elements) {
                throw ModelGraphError("Synapse '" + op.id + "' input and output sizes differ");
            }
            items.push_back(item);
        }
        auto decay = it->second;
        const int batch = signals.batchSize();
        signals.emitKernel("synapse", [items, decay, batch](LoopState& st) {
            for (size_t k = 0; k < items.size(); ++k) {
                const auto& item = items[k];
                const double a = (*decay)[k];
                for (int e = 0; e < item.y.elements; ++e) {
                    for (int b = 0; b < batch; ++b) {
                        double y = SignalTable::read(st, item.y, e, b);
                        double x = SignalTable::read(st, item.x, e, b);
                        SignalTable::write(st, item.y, e, b, a * y + (1.0 - a) * x);
                    }
                }
            }
        });
        return {};
    }

private:
    std::map<OperatorId, std::shared_ptr<std::vector<double>>> decays;
};

// Gaussian noise written into the output every step. Each group draws from
// its own random stream, seeded from the compile-time random state and
// carried in the simulation state.
class WhiteNoiseBuilder : public OpBuilder {
public:
    void preBuild(const MergeGroup& group, SignalTable& signals, std::mt19937& rng) override {
        streams[group.ops.front()] = signals.addRandomStream(static_cast<unsigned>(rng()));
    }

    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        auto it = streams.find(group.ops.front());
        if (it == streams.end()) throw std::logic_error("WhiteNoise group built without its pre-build stage");
        struct Item { SignalView y; double mean; double stddev; };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            requireSignals(op, 0, true);
            items.push_back({signals.view(outputOf(op)), op.params.value("mean", 0.0), op.params.value("std", 1.0)});
        }
        const size_t stream = static_cast<size_t>(it->second);
        const int batch = signals.batchSize();
        signals.emitKernel("white_noise", [items, stream, batch](LoopState& st) {
            std::mt19937& gen = st.generators.at(stream);
            for (const auto& item : items) {
                if (item.stddev <= 0.0) {
                    SignalTable::scatter(st, item.y, {item.mean}, batch);
                    continue;
                }
                std::normal_distribution<double> dist(item.mean, item.stddev);
                for (int e = 0; e < item.y.elements; ++e) {
                    for (int b = 0; b < batch; ++b) SignalTable::write(st, item.y, e, b, dist(gen));
                }
            }
        });
        return {};
    }

private:
    std::map<OperatorId, int> streams;
};

// Named host function applied to the input per batch item. The kernel is a
// side effect: it runs every step whether or not its output is read.
class HostFuncBuilder : public OpBuilder {
public:
    explicit HostFuncBuilder(std::shared_ptr<HostFunctionTable> table) : table(std::move(table)) {}

    std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) override {
        struct Item {
            std::string id;
            HostFunction fn;
            bool hasX = false;
            SignalView x;
            bool hasY = false;
            SignalView y;
            bool accumulate = false; // output is incremented rather than set
        };
        std::vector<Item> items;
        for (OperatorId id : group.ops) {
            const Operator& op = signals.model().operators[id];
            Item item;
            item.id = op.id;
            item.fn = table->get(op.params.value("function", std::string("identity")));
            item.hasX = !op.reads.empty();
            if (item.hasX) item.x = signals.view(op.reads[0]);
            SignalId out = outputOf(op);
            item.hasY = out >= 0;
            if (item.hasY) item.y = signals.view(out);
            item.accumulate = op.updates.empty() && op.sets.empty() && !op.incs.empty();
            items.push_back(std::move(item));
        }
        const int batch = signals.batchSize();
        const double dt = signals.dt();
        NodeId node = signals.emitKernel("host_func", [items, batch, dt](LoopState& st) {
            const double t = st.step * dt;
            for (const auto& item : items) {
                for (int b = 0; b < batch; ++b) {
                    std::vector<double> x;
                    if (item.hasX) {
                        for (int e = 0; e < item.x.elements; ++e) x.push_back(SignalTable::read(st, item.x, e, b));
                    }
                    std::vector<double> y = item.fn(t, x);
                    if (!item.hasY) continue;
                    if (y.size() != 1 && static_cast<int>(y.size()) != item.y.elements) {
                        throw std::runtime_error("Host function of '" + item.id + "' returned " +
                                                 std::to_string(y.size()) + " values for " +
                                                 std::to_string(item.y.elements) + " outputs");
                    }
                    for (int e = 0; e < item.y.elements; ++e) {
                        const double v = y[y.size() == 1 ? 0 : e];
                        if (item.accumulate) {
                            SignalTable::increment(st, item.y, e, b, v);
                        } else {
                            SignalTable::write(st, item.y, e, b, v);
                        }
                    }
                }
            }
        });
        return {node};
    }

private:
    std::shared_ptr<HostFunctionTable> table;
};

} // namespace

BuilderRegistry::BuilderRegistry() : hostFunctions_(std::make_shared<HostFunctionTable>()) {}

void BuilderRegistry::add(const std::string& kind, std::unique_ptr<OpBuilder> builder) {
    builders[kind] = std::move(builder);
}

OpBuilder& BuilderRegistry::get(const std::string& kind) const {
    auto it = builders.find(kind);
    if (it == builders.end()) throw LookupError("No builder registered for operator kind '" + kind + "'");
    return *it->second;
}

BuilderRegistry BuilderRegistry::withDefaults() {
    BuilderRegistry reg;
    *reg.hostFunctions_ = HostFunctionTable::withDefaults();
    reg.add("Reset", std::make_unique<ResetBuilder>());
    reg.add("Copy", std::make_unique<CopyBuilder>());
    reg.add("ElementwiseInc", std::make_unique<ElementwiseIncBuilder>());
    reg.add("DotInc", std::make_unique<DotIncBuilder>());
    reg.add("Synapse", std::make_unique<SynapseBuilder>());
    reg.add("WhiteNoise", std::make_unique<WhiteNoiseBuilder>());
    reg.add("HostFunc", std::make_unique<HostFuncBuilder>(reg.hostFunctions_));
    return reg;
}

} // namespace StepFlow
