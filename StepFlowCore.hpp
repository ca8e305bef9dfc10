// StepFlow core types
//
// This header defines the in-memory simulation model (signals, operators,
// sources, probes), the error taxonomy shared by every compilation stage, and
// the small debug-logging helpers. The model is produced once (from JSON or
// programmatically) and is read-only for the compiler; only signal *values*
// change while a compiled graph runs.
#pragma once
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace StepFlow {

using SignalId = int;
using OperatorId = int;
using Shape = std::vector<int>;

// Model-correctness defects found while planning (cycles, multiple writers)
class ModelGraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A signal cannot be placed into any compatible base buffer
class AllocationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A handle, builder or name was requested before it existed
class LookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ElementType { Float32, Float64, Int32 };

std::string toString(ElementType type);
// Accepts "float32", "float64", "int32" (and the "float"/"double"/"int" aliases)
ElementType parseElementType(const std::string& name);

// Logical named region of simulation state
struct Signal {
    std::string name;
    Shape shape;                    // empty = scalar
    std::string dataType = "float"; // "float" or "int"
    bool trainable = false;
    std::vector<double> initial;    // row-major; empty means zeros

    int size() const;
    int rows() const { return shape.empty() ? 1 : shape[0]; }
    // Shape without the leading dimension; signals sharing it can be stacked
    Shape trailingShape() const;
};

// Computation node. Dependency edges are derived from the signal sets:
// writers (sets/updates) of S run before incrementers and readers of S,
// incrementers of S run before readers of S.
struct Operator {
    std::string id;
    std::string kind;
    std::vector<SignalId> sets;
    std::vector<SignalId> incs;
    std::vector<SignalId> reads;
    std::vector<SignalId> updates;
    nlohmann::json params = nlohmann::json::object();
    std::string source; // name of the zero-input source this op evaluates, if any

    // sets, incs, reads, updates concatenated in that order
    std::vector<SignalId> allSignals() const;
};

// Zero-input external source, evaluated outside the simulation loop
using SourceFunction = std::function<std::vector<double>(double t)>;

struct Source {
    std::string name;
    SignalId output = -1;
    SourceFunction function;
};

// Observation point: value of `target` captured after every step
struct Probe {
    std::string name;
    SignalId target = -1;
};

struct Model {
    std::vector<Signal> signals;
    std::vector<Operator> operators;
    std::vector<Source> sources;
    std::vector<Probe> probes;
    double dt = 0.001;

    SignalId addSignal(Signal signal);
    OperatorId addOperator(Operator op);
    void addSource(const std::string& name, SignalId output, SourceFunction function);
    void addProbe(const std::string& name, SignalId target);

    // -1 when no signal has this name
    SignalId findSignal(const std::string& name) const;
    int findProbe(const std::string& name) const;

    // Load a model from JSON (signals, operators, sources, probes, dt)
    void loadFromJson(const nlohmann::json& json);
    static Model fromJson(const nlohmann::json& json);
};

// Debug logging (stderr, "[DEBUG]" prefix). Enabled by setDebug() or the
// STEPFLOW_DEBUG environment variable.
bool debugEnabled();
void setDebug(bool enabled);

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    if (!debugEnabled()) return;
    fmt::print(stderr, "[DEBUG] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace StepFlow
