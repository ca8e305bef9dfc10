// StepFlow planning stages
//
// Dependency filter, greedy merge planner and signal layout optimizer. These
// run once per compiled graph, in that order, and produce the Plan and the
// signal order consumed by the buffer allocator.
#pragma once
#include "StepFlowCore.hpp"
#include <string>
#include <vector>

namespace StepFlow {

// Same-kind operators with compatible shapes, executed as one batched step.
// Members never depend on each other.
struct MergeGroup {
    std::string kind;
    std::vector<OperatorId> ops;
};

// Ordered merge groups; order only matters across group boundaries
using Plan = std::vector<MergeGroup>;

// Remove operators that run outside the per-step loop: the TimeUpdate
// operator (owned by the loop assembler), input-less HostFunc operators
// (pure functions of time) and input-less operators that evaluate one of the
// model's zero-input sources. Declaration order is preserved.
std::vector<OperatorId> filterOperators(const Model& model);

// Signal written by the model's TimeUpdate operator, -1 if there is none
SignalId findTimeSignal(const Model& model);

// Kind-independent structural signature: per signal role, the data type,
// trainability and trailing shape of every signal the operator touches
std::string shapeSignature(const Model& model, const Operator& op);

// Direct dependencies of every operator in `ops` (indexed like `ops`,
// entries are positions into `ops`). Throws ModelGraphError when a signal has
// more than one writer.
std::vector<std::vector<int>> operatorDependencies(const Model& model, const std::vector<OperatorId>& ops);

// Greedy topological grouping. Throws ModelGraphError on a dependency cycle.
Plan greedyPlanner(const Model& model, const std::vector<OperatorId>& ops);

// True when every group only depends on earlier groups and no group holds
// two operators with an edge between them
bool isDependencyValid(const Model& model, const Plan& plan);

struct SignalOrder {
    std::vector<SignalId> signals; // every signal referenced by the plan
    Plan plan;                     // same groups, members possibly reordered
};

// Reorder signals (and group members) so each group's accesses form
// contiguous runs. Bounded number of improvement passes.
SignalOrder orderSignals(const Model& model, const Plan& plan, int nPasses = 10);

// Number of adjacent pairs inside the plan's access runs that are adjacent
// in memory under `order` (higher is better)
int contiguityScore(const Model& model, const Plan& plan, const std::vector<SignalId>& order);

} // namespace StepFlow
