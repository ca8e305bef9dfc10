// StepFlowCompiler.cpp
//
// Pipeline driver, step/loop assembly and the run loop over the emitted
// StepProgram.
#include "StepFlowCompiler.hpp"
#include <set>
#include <stdexcept>
#include <utility>

namespace StepFlow {

StepCompiler::StepCompiler(const Plan& plan, const BuilderRegistry& builders, SignalTable& signals)
    : plan(plan), builders(builders), signals(signals) {}

void StepCompiler::preBuild(std::mt19937& rng) {
    for (const auto& group : plan) {
        builders.get(group.kind).preBuild(group, signals, rng);
    }
}

std::vector<NodeId> StepCompiler::buildStep() {
    std::vector<NodeId> sideEffects;
    for (size_t g = 0; g < plan.size(); ++g) {
        const MergeGroup& group = plan[g];
        signals.setScope(fmt::format("group_{}_{}", g, group.kind));
        auto effects = builders.get(group.kind).build(group, signals);
        sideEffects.insert(sideEffects.end(), effects.begin(), effects.end());
    }
    signals.setScope("");
    return sideEffects;
}

LoopAssembler::LoopAssembler(StepCompiler& compiler, SignalTable& signals, const std::vector<HoistedInput>& inputs,
                             SignalId timeSignal)
    : compiler(compiler), signals(signals), inputs(inputs), timeSignal(timeSignal) {}

IterationNodes LoopAssembler::assembleIteration(StepProgram& program, const std::string& prefix, NodeId entry) {
    IterationNodes it;
    const int batch = signals.batchSize();
    const double dt = signals.dt();

    // Steps are 1-indexed once operators observe them
    bool hasTime = timeSignal >= 0;
    SignalView timeView = hasTime ? signals.view(timeSignal) : SignalView{};
    it.stepIncrement = program.add(NodeKind::StepIncrement, prefix + "step_increment",
                                   [hasTime, timeView, batch, dt](LoopState& st) {
                                       st.step += 1;
                                       if (hasTime) SignalTable::scatter(st, timeView, {st.step * dt}, batch);
                                   },
                                   {entry});

    // Hoisted inputs arrive concatenated, each expanded to its signal's size
    std::vector<std::pair<SignalView, size_t>> feeds;
    size_t offset = 0;
    for (const auto& input : inputs) {
        if (input.output < 0) continue;
        const SignalView& v = signals.view(input.output);
        feeds.emplace_back(v, offset);
        offset += static_cast<size_t>(v.elements);
    }
    it.inputFeed = program.add(NodeKind::InputFeed, prefix + "input_feed",
                               [feeds, batch](LoopState& st) {
                                   if (feeds.empty()) return;
                                   const auto& data = st.inputs.at(static_cast<size_t>(st.loopIndex));
                                   for (const auto& f : feeds) {
                                       auto first = data.begin() + static_cast<std::ptrdiff_t>(f.second);
                                       std::vector<double> values(first, first + f.first.elements);
                                       SignalTable::scatter(st, f.first, values, batch);
                                   }
                               },
                               {it.stepIncrement});

    signals.beginStep(&program, prefix, {it.inputFeed});
    it.sideEffects = compiler.buildStep();
    NodeId stepDone = signals.lastKernel() != kLoopEntry ? signals.lastKernel() : it.inputFeed;
    signals.endStep();

    // Forced copies: the next iteration overwrites the storage in place
    const auto& probes = signals.model().probes;
    for (size_t p = 0; p < probes.size(); ++p) {
        SignalView v = signals.view(probes[p].target);
        it.probeReads.push_back(program.add(NodeKind::ProbeRead, prefix + "probe_read/" + probes[p].name,
                                            [p, v, batch](LoopState& st) {
                                                st.probeStaging[p] = SignalTable::gather(st, v, batch);
                                            },
                                            {stepDone}));
    }
    for (size_t p = 0; p < probes.size(); ++p) {
        it.probeWrites.push_back(program.add(NodeKind::ProbeWrite, prefix + "probe_write/" + probes[p].name,
                                             [p](LoopState& st) {
                                                 st.probes[p].write(static_cast<size_t>(st.loopIndex),
                                                                    std::move(st.probeStaging[p]));
                                             },
                                             {it.probeReads[p]}));
    }

    std::vector<NodeId> barrier{stepDone};
    barrier.insert(barrier.end(), it.sideEffects.begin(), it.sideEffects.end());
    barrier.insert(barrier.end(), it.probeReads.begin(), it.probeReads.end());
    barrier.insert(barrier.end(), it.probeWrites.begin(), it.probeWrites.end());
    it.advance = program.add(NodeKind::Advance, prefix + "advance", [](LoopState& st) { st.loopIndex += 1; },
                             std::move(barrier));
    it.end = program.size();
    return it;
}

SimulationState CompiledGraph::initialState() const {
    SimulationState state;
    for (size_t i = 0; i < layout_.keys.size(); ++i) {
        if (!layout_.keys[i].trainable) state.buffers[layout_.keys[i]] = layout_.initial[i];
    }
    for (unsigned seed : streamSeeds_) state.generators.emplace_back(seed);
    return state;
}

RunResult CompiledGraph::run(SimulationState state, int steps) const {
    if (steps < 0) throw std::invalid_argument("Cannot run a negative number of steps");
    if (options_.stepBlocks && steps > *options_.stepBlocks) {
        throw std::invalid_argument(fmt::format("Cannot run {} steps; the graph was compiled for blocks of {}", steps,
                                                *options_.stepBlocks));
    }

    if (state.generators.size() != streamSeeds_.size()) {
        throw std::invalid_argument(fmt::format("Simulation state has {} random streams; the graph uses {}",
                                                state.generators.size(), streamSeeds_.size()));
    }

    LoopState st;
    st.step = state.step;
    st.generators = std::move(state.generators);
    st.stop = state.step + steps;
    for (size_t i = 0; i < layout_.keys.size(); ++i) {
        const BufferKey& key = layout_.keys[i];
        if (key.trainable) {
            st.bases.push_back(variables_.at(key));
            continue;
        }
        auto found = state.buffers.find(key);
        if (found == state.buffers.end()) throw LookupError("Simulation state has no buffer " + key.name());
        if (found->second.extent() != layout_.initial[i].extent()) {
            throw std::invalid_argument("Simulation state buffer " + key.name() + " does not match the layout");
        }
        st.bases.push_back(std::make_shared<BaseBuffer>(std::move(found->second)));
    }

    const auto& probes = model_->probes;
    st.probes.resize(probes.size());
    for (auto& pa : st.probes) {
        pa.dynamicSize = !options_.stepBlocks.has_value();
        pa.capacity = options_.stepBlocks ? static_cast<size_t>(*options_.stepBlocks) : 0;
    }
    st.probeStaging.resize(probes.size());

    // Hoisted inputs for every iteration of this run
    for (int i = 0; i < steps; ++i) {
        const double t = (state.step + 1 + i) * dt_;
        std::vector<double> row;
        for (const auto& input : inputs_) {
            std::vector<double> values = input.function(t);
            if (input.output < 0) continue;
            const int elements = layout_.view(input.output).elements;
            if (values.size() == 1) {
                row.insert(row.end(), static_cast<size_t>(elements), values[0]);
            } else if (static_cast<int>(values.size()) == elements) {
                row.insert(row.end(), values.begin(), values.end());
            } else {
                throw std::runtime_error(fmt::format("Input '{}' produced {} values for {} elements", input.name,
                                                     values.size(), elements));
            }
        }
        st.inputs.push_back(std::move(row));
    }

    if (options_.unroll) {
        std::vector<char> executed;
        size_t end = steps == 0 ? 0 : iterations_.at(static_cast<size_t>(steps - 1)).end;
        program_.execute(st, 0, end, executed, true);
    } else {
        bool entryDone = true;
        while (st.step < st.stop) {
            std::vector<char> executed;
            program_.execute(st, 0, program_.size(), executed, entryDone);
            entryDone = executed[static_cast<size_t>(iterations_.front().advance)] != 0;
        }
    }
    logDebug("ran {} steps, now at step {}", st.loopIndex, st.step);

    RunResult result;
    result.state.step = st.step;
    result.state.generators = std::move(st.generators);
    for (size_t i = 0; i < layout_.keys.size(); ++i) {
        if (!layout_.keys[i].trainable) result.state.buffers[layout_.keys[i]] = std::move(*st.bases[i]);
    }
    for (auto& pa : st.probes) {
        pa.rows.resize(static_cast<size_t>(st.loopIndex));
        result.probes.push_back(std::move(pa.rows));
    }
    return result;
}

AdjustableBuffers CompiledGraph::getAdjustableBuffers(bool reuse) {
    if (reuse) {
        if (!adjustableCreated_) {
            throw LookupError("Adjustable buffers requested for reuse before they were created");
        }
        return variables_;
    }
    AdjustableBuffers fresh;
    for (size_t i = 0; i < layout_.keys.size(); ++i) {
        if (layout_.keys[i].trainable) fresh[layout_.keys[i]] = std::make_shared<BaseBuffer>(layout_.initial[i]);
    }
    variables_ = fresh;
    adjustableCreated_ = true;
    return fresh;
}

nlohmann::json CompiledGraph::describe() const {
    nlohmann::json j;
    j["device"] = options_.device;
    j["dtype"] = toString(options_.dtype);
    j["batch_size"] = options_.batchSize;
    j["dt"] = dt_;
    j["step_blocks"] = options_.stepBlocks ? nlohmann::json(*options_.stepBlocks) : nlohmann::json(nullptr);
    j["unroll"] = options_.unroll;
    j["operators"] = filteredCount_;

    nlohmann::json plan = nlohmann::json::array();
    for (const auto& group : plan_) {
        nlohmann::json ops = nlohmann::json::array();
        for (OperatorId id : group.ops) ops.push_back(model_->operators[id].id);
        plan.push_back({{"kind", group.kind}, {"ops", ops}});
    }
    j["plan"] = plan;

    nlohmann::json order = nlohmann::json::array();
    for (SignalId id : signalOrder_) order.push_back(model_->signals[id].name);
    j["signal_order"] = order;

    nlohmann::json buffers = nlohmann::json::array();
    for (const auto& buf : layout_.initial) {
        buffers.push_back({{"key", buf.key.name()},
                           {"rows", buf.rows},
                           {"row_size", buf.rowSize},
                           {"batch", buf.batch},
                           {"elements", buf.extent()},
                           {"trainable", buf.key.trainable}});
    }
    j["buffers"] = buffers;

    nlohmann::json views = nlohmann::json::array();
    for (const auto& v : layout_.views) {
        views.push_back({{"signal", model_->signals[v.signal].name},
                         {"buffer", v.key.name()},
                         {"offset", v.offset},
                         {"shape", v.shape},
                         {"extent", v.extent()}});
    }
    j["views"] = views;

    j["program"] = {{"nodes", program_.size()}, {"iterations", iterations_.size()}};
    return j;
}

CompiledGraph compile(const Model& model, const CompileOptions& options, const BuilderRegistry& builders) {
    if (options.stepBlocks && *options.stepBlocks < 1) {
        throw std::invalid_argument("Step block size must be at least 1");
    }
    if (options.unroll && !options.stepBlocks) {
        throw std::invalid_argument("Unrolling the simulation requires a step block size");
    }

    CompiledGraph g;
    g.model_ = std::make_shared<const Model>(model);
    g.options_ = options;
    g.dt_ = options.dt.value_or(model.dt);
    if (!(g.dt_ > 0.0)) throw std::invalid_argument("Timestep must be positive");
    const Model& m = *g.model_;
    logDebug("compiling {} signals, {} operators for device {} ({}, batch {})", m.signals.size(),
             m.operators.size(), options.device, toString(options.dtype), options.batchSize);

    std::vector<OperatorId> ops = filterOperators(m);
    g.filteredCount_ = static_cast<int>(ops.size());
    for (OperatorId id : ops) {
        const Operator& op = m.operators[id];
        if (!builders.contains(op.kind)) {
            throw LookupError("No builder registered for operator kind '" + op.kind + "' (operator '" + op.id + "')");
        }
    }

    SignalOrder order = orderSignals(m, greedyPlanner(m, ops));
    g.plan_ = std::move(order.plan);
    g.signalOrder_ = std::move(order.signals);
    g.layout_ = createSignals(m, g.signalOrder_, options.dtype, options.batchSize);
    for (const auto& group : g.plan_) logDebug("group {}: {} ops", group.kind, group.ops.size());

    // Zero-input sources and input-less host functions are evaluated outside
    // the loop and fed each iteration
    std::set<std::string> sourceNames;
    for (const auto& src : m.sources) {
        if (src.output < 0 || static_cast<size_t>(src.output) >= m.signals.size()) {
            throw ModelGraphError("Source '" + src.name + "' has no valid output signal");
        }
        if (!src.function) throw ModelGraphError("Source '" + src.name + "' has no function");
        g.inputs_.push_back({src.name, src.output, src.function});
        sourceNames.insert(src.name);
    }
    for (const auto& op : m.operators) {
        if (op.kind != "HostFunc" || !op.reads.empty() || !op.incs.empty() || sourceNames.count(op.source)) continue;
        HostFunction fn = builders.sharedHostFunctions()->get(op.params.value("function", std::string("identity")));
        SignalId out = !op.updates.empty() ? op.updates[0] : (!op.sets.empty() ? op.sets[0] : -1);
        g.inputs_.push_back({op.id, out, [fn](double t) { return fn(t, {}); }});
    }

    for (size_t i = 0; i < g.layout_.keys.size(); ++i) {
        if (g.layout_.keys[i].trainable) {
            g.variables_[g.layout_.keys[i]] = std::make_shared<BaseBuffer>(g.layout_.initial[i]);
        }
    }

    SignalTable table(m, g.layout_, g.dt_);
    StepCompiler stepCompiler(g.plan_, builders, table);
    std::mt19937 rng(options.seed);
    stepCompiler.preBuild(rng);

    LoopAssembler assembler(stepCompiler, table, g.inputs_, findTimeSignal(m));
    const int iterations = options.unroll ? *options.stepBlocks : 1;
    NodeId entry = kLoopEntry;
    for (int k = 0; k < iterations; ++k) {
        std::string prefix = options.unroll ? fmt::format("iteration_{}/", k) : std::string();
        g.iterations_.push_back(assembler.assembleIteration(g.program_, prefix, entry));
        entry = g.iterations_.back().advance;
    }
    g.streamSeeds_ = table.randomStreams();
    logDebug("step program: {} nodes in {} iteration(s), {} base buffers", g.program_.size(), g.iterations_.size(),
             g.layout_.keys.size());
    return g;
}

} // namespace StepFlow
