// StepFlowPlanner.cpp
//
// Implements the dependency filter, the greedy merge planner and the signal
// layout optimizer. All three are deterministic: ties are broken by operator
// kind and declaration order so the same model always yields the same plan.
#include "StepFlowPlanner.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace StepFlow {

std::vector<OperatorId> filterOperators(const Model& model) {
    std::unordered_set<std::string> sourceNames;
    for (const auto& src : model.sources) sourceNames.insert(src.name);

    std::vector<OperatorId> out;
    for (size_t i = 0; i < model.operators.size(); ++i) {
        const Operator& op = model.operators[i];
        if (op.kind == "TimeUpdate") continue;
        // Input-less host functions that accumulate into their output stay in
        // the plan so they are ordered after the output's reset
        if (op.kind == "HostFunc" && op.reads.empty() && op.incs.empty()) continue;
        if (!op.source.empty() && op.reads.empty() && sourceNames.count(op.source)) continue;
        out.push_back(static_cast<OperatorId>(i));
    }
    logDebug("filtered operators: {} of {} kept", out.size(), model.operators.size());
    return out;
}

SignalId findTimeSignal(const Model& model) {
    for (const auto& op : model.operators) {
        if (op.kind != "TimeUpdate") continue;
        if (!op.updates.empty()) return op.updates[0];
        if (!op.sets.empty()) return op.sets[0];
    }
    return -1;
}

std::string shapeSignature(const Model& model, const Operator& op) {
    std::string sig;
    auto appendRole = [&](char role, const std::vector<SignalId>& ids) {
        sig += role;
        sig += std::to_string(ids.size());
        sig += '[';
        for (SignalId id : ids) {
            const Signal& s = model.signals[id];
            sig += s.dataType;
            sig += s.trainable ? ":t:" : ":n:";
            for (int d : s.trailingShape()) { sig += std::to_string(d); sig += 'x'; }
            sig += ';';
        }
        sig += ']';
    };
    appendRole('s', op.sets);
    appendRole('i', op.incs);
    appendRole('r', op.reads);
    appendRole('u', op.updates);
    return sig;
}

std::vector<std::vector<int>> operatorDependencies(const Model& model, const std::vector<OperatorId>& ops) {
    std::unordered_map<SignalId, int> writer;
    std::unordered_map<SignalId, std::vector<int>> incrementers;

    for (size_t p = 0; p < ops.size(); ++p) {
        const Operator& op = model.operators[ops[p]];
        auto claim = [&](SignalId s) {
            auto it = writer.find(s);
            if (it != writer.end() && it->second != static_cast<int>(p)) {
                throw ModelGraphError("Signal '" + model.signals[s].name + "' is written by both '" +
                                      model.operators[ops[it->second]].id + "' and '" + op.id + "'");
            }
            writer[s] = static_cast<int>(p);
        };
        for (SignalId s : op.sets) claim(s);
        for (SignalId s : op.updates) claim(s);
        for (SignalId s : op.incs) {
            auto& list = incrementers[s];
            if (list.empty() || list.back() != static_cast<int>(p)) list.push_back(static_cast<int>(p));
        }
    }

    std::vector<std::vector<int>> deps(ops.size());
    for (size_t p = 0; p < ops.size(); ++p) {
        const Operator& op = model.operators[ops[p]];
        auto& d = deps[p];
        auto addWriter = [&](SignalId s) {
            auto it = writer.find(s);
            if (it != writer.end() && it->second != static_cast<int>(p)) d.push_back(it->second);
        };
        for (SignalId s : op.incs) addWriter(s);
        for (SignalId s : op.reads) {
            addWriter(s);
            auto it = incrementers.find(s);
            if (it == incrementers.end()) continue;
            for (int q : it->second) if (q != static_cast<int>(p)) d.push_back(q);
        }
        std::sort(d.begin(), d.end());
        d.erase(std::unique(d.begin(), d.end()), d.end());
    }
    return deps;
}

Plan greedyPlanner(const Model& model, const std::vector<OperatorId>& ops) {
    const auto deps = operatorDependencies(model, ops);
    const size_t n = ops.size();

    std::vector<int> remaining(n, 0);
    std::vector<std::vector<int>> dependents(n);
    for (size_t p = 0; p < n; ++p) {
        remaining[p] = static_cast<int>(deps[p].size());
        for (int q : deps[p]) dependents[q].push_back(static_cast<int>(p));
    }

    std::vector<std::string> signatures(n);
    for (size_t p = 0; p < n; ++p) signatures[p] = shapeSignature(model, model.operators[ops[p]]);

    std::vector<int> ready;
    for (size_t p = 0; p < n; ++p) if (remaining[p] == 0) ready.push_back(static_cast<int>(p));

    Plan plan;
    size_t scheduled = 0;
    while (!ready.empty()) {
        // Bucket the ready set by (kind, shape signature); buckets keep
        // declaration order internally
        std::map<std::pair<std::string, std::string>, size_t> bucketIndex;
        std::vector<std::vector<int>> buckets;
        for (int p : ready) {
            const auto key = std::make_pair(model.operators[ops[p]].kind, signatures[p]);
            auto it = bucketIndex.find(key);
            if (it == bucketIndex.end()) {
                bucketIndex.emplace(key, buckets.size());
                buckets.push_back({p});
            } else {
                buckets[it->second].push_back(p);
            }
        }
        std::stable_sort(buckets.begin(), buckets.end(), [&](const std::vector<int>& a, const std::vector<int>& b) {
            const auto& ka = model.operators[ops[a.front()]].kind;
            const auto& kb = model.operators[ops[b.front()]].kind;
            if (ka != kb) return ka < kb;
            return a.front() < b.front();
        });

        std::vector<int> next;
        for (const auto& bucket : buckets) {
            MergeGroup group;
            group.kind = model.operators[ops[bucket.front()]].kind;
            for (int p : bucket) {
                group.ops.push_back(ops[p]);
                ++scheduled;
                for (int d : dependents[p]) {
                    if (--remaining[d] == 0) next.push_back(d);
                }
            }
            plan.push_back(std::move(group));
        }
        std::sort(next.begin(), next.end());
        ready = std::move(next);
    }

    if (scheduled != n) {
        std::string members;
        int listed = 0;
        for (size_t p = 0; p < n && listed < 8; ++p) {
            if (remaining[p] <= 0) continue;
            if (listed++) members += ", ";
            members += model.operators[ops[p]].id;
        }
        throw ModelGraphError("Dependency cycle detected among operators: " + members);
    }

    logDebug("plan: {} groups for {} operators", plan.size(), n);
    return plan;
}

bool isDependencyValid(const Model& model, const Plan& plan) {
    std::vector<OperatorId> flat;
    std::vector<size_t> groupOf;
    for (size_t g = 0; g < plan.size(); ++g) {
        for (OperatorId id : plan[g].ops) {
            flat.push_back(id);
            groupOf.push_back(g);
        }
    }
    const auto deps = operatorDependencies(model, flat);
    for (size_t p = 0; p < flat.size(); ++p) {
        for (int q : deps[p]) {
            if (groupOf[q] >= groupOf[p]) return false;
        }
    }
    return true;
}

namespace {

using Run = std::vector<SignalId>;

// Runs of signals accessed by one role of one group, in member order
std::vector<Run> accessRuns(const Model& model, const Plan& plan) {
    std::vector<Run> runs;
    for (const auto& group : plan) {
        size_t roles = 0;
        std::vector<std::vector<SignalId>> sigs;
        for (OperatorId id : group.ops) {
            sigs.push_back(model.operators[id].allSignals());
            roles = std::max(roles, sigs.back().size());
        }
        for (size_t r = 0; r < roles; ++r) {
            Run run;
            std::unordered_set<SignalId> seen;
            for (const auto& s : sigs) {
                if (r < s.size() && seen.insert(s[r]).second) run.push_back(s[r]);
            }
            if (run.size() >= 2) runs.push_back(std::move(run));
        }
    }
    return runs;
}

std::string layoutClass(const Signal& s) {
    std::string c = s.dataType + (s.trainable ? "|t|" : "|n|");
    for (int d : s.trailingShape()) c += std::to_string(d) + "x";
    return c;
}

int scoreRuns(const Model& model, const std::vector<Run>& runs, const std::vector<SignalId>& order) {
    // Position of each signal inside its buffer class (what the allocator
    // will turn into memory offsets)
    std::unordered_map<std::string, int> nextPos;
    std::unordered_map<SignalId, std::pair<const std::string*, int>> pos;
    std::vector<std::string> classes;
    classes.reserve(order.size());
    for (SignalId s : order) classes.push_back(layoutClass(model.signals[s]));
    for (size_t i = 0; i < order.size(); ++i) {
        pos[order[i]] = {&classes[i], nextPos[classes[i]]++};
    }
    int score = 0;
    for (const auto& run : runs) {
        for (size_t i = 0; i + 1 < run.size(); ++i) {
            auto a = pos.find(run[i]);
            auto b = pos.find(run[i + 1]);
            if (a == pos.end() || b == pos.end()) continue;
            if (*a->second.first == *b->second.first && b->second.second == a->second.second + 1) ++score;
        }
    }
    return score;
}

// Gather the run's members into one contiguous block, in run order, at the
// position of the earliest member
std::vector<SignalId> makeContiguous(const std::vector<SignalId>& order, const Run& run) {
    std::unordered_set<SignalId> members(run.begin(), run.end());
    std::vector<SignalId> out;
    out.reserve(order.size());
    bool inserted = false;
    for (SignalId s : order) {
        if (!members.count(s)) {
            out.push_back(s);
        } else if (!inserted) {
            out.insert(out.end(), run.begin(), run.end());
            inserted = true;
        }
    }
    return out;
}

} // namespace

int contiguityScore(const Model& model, const Plan& plan, const std::vector<SignalId>& order) {
    return scoreRuns(model, accessRuns(model, plan), order);
}

SignalOrder orderSignals(const Model& model, const Plan& plan, int nPasses) {
    SignalOrder result;
    result.plan = plan;

    std::unordered_set<SignalId> seen;
    for (const auto& group : plan) {
        for (OperatorId id : group.ops) {
            for (SignalId s : model.operators[id].allSignals()) {
                if (seen.insert(s).second) result.signals.push_back(s);
            }
        }
    }

    std::vector<Run> runs = accessRuns(model, plan);
    std::stable_sort(runs.begin(), runs.end(), [](const Run& a, const Run& b) { return a.size() > b.size(); });

    int best = scoreRuns(model, runs, result.signals);
    const int initial = best;
    int passes = 0;
    for (; passes < nPasses; ++passes) {
        bool changed = false;
        for (const auto& run : runs) {
            auto candidate = makeContiguous(result.signals, run);
            if (candidate == result.signals) continue;
            int score = scoreRuns(model, runs, candidate);
            if (score > best) {
                best = score;
                result.signals = std::move(candidate);
                changed = true;
            }
        }
        if (!changed) break;
    }

    // Reorder group members to follow the memory order of their first signal
    std::unordered_map<SignalId, int> position;
    for (size_t i = 0; i < result.signals.size(); ++i) position[result.signals[i]] = static_cast<int>(i);
    Plan reordered = result.plan;
    for (auto& group : reordered) {
        bool allHaveSignals = std::all_of(group.ops.begin(), group.ops.end(), [&](OperatorId id) {
            return !model.operators[id].allSignals().empty();
        });
        if (!allHaveSignals) continue;
        std::stable_sort(group.ops.begin(), group.ops.end(), [&](OperatorId a, OperatorId b) {
            return position[model.operators[a].allSignals()[0]] < position[model.operators[b].allSignals()[0]];
        });
    }
    int reorderedScore = contiguityScore(model, reordered, result.signals);
    if (reorderedScore >= contiguityScore(model, result.plan, result.signals)) result.plan = std::move(reordered);

    logDebug("signal order: {} signals, contiguity {} -> {} after {} passes",
             result.signals.size(), initial, best, passes);
    return result;
}

} // namespace StepFlow
