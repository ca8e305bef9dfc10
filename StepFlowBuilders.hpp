// StepFlow operator builders
//
// Per-kind capability that turns a merge group into step-program kernels.
// Builders are resolved through an explicit registry handed to the compiler;
// nothing is looked up by runtime type inspection.
#pragma once
#include "StepFlowGraph.hpp"
#include "StepFlowPlanner.hpp"
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace StepFlow {

class OpBuilder {
public:
    virtual ~OpBuilder() = default;

    // One-time setup per compiled graph, independent of the timestep
    virtual void preBuild(const MergeGroup& group, SignalTable& signals, std::mt19937& rng);

    // Emit the group's computation for one step. Returns the nodes whose
    // effects must happen every step even if nothing reads their outputs.
    virtual std::vector<NodeId> build(const MergeGroup& group, SignalTable& signals) = 0;
};

// Host callback: (time, input values of one batch item) -> output values
using HostFunction = std::function<std::vector<double>(double t, const std::vector<double>& x)>;

class HostFunctionTable {
public:
    void add(const std::string& name, HostFunction fn);
    bool contains(const std::string& name) const { return functions.count(name) != 0; }
    // Throws LookupError for unknown names
    const HostFunction& get(const std::string& name) const;

    // identity, square, sin, sum, print
    static HostFunctionTable withDefaults();

private:
    std::map<std::string, HostFunction> functions;
};

class BuilderRegistry {
public:
    BuilderRegistry();

    void add(const std::string& kind, std::unique_ptr<OpBuilder> builder);
    bool contains(const std::string& kind) const { return builders.count(kind) != 0; }
    // Throws LookupError for unregistered kinds
    OpBuilder& get(const std::string& kind) const;

    HostFunctionTable& hostFunctions() { return *hostFunctions_; }
    std::shared_ptr<HostFunctionTable> sharedHostFunctions() const { return hostFunctions_; }

    // Reset, Copy, ElementwiseInc, DotInc, Synapse, WhiteNoise, HostFunc
    static BuilderRegistry withDefaults();

private:
    std::map<std::string, std::unique_ptr<OpBuilder>> builders;
    std::shared_ptr<HostFunctionTable> hostFunctions_;
};

} // namespace StepFlow
