// StepFlowCore.cpp
//
// Implements the model container, JSON loading of models (signals, operators,
// sources, probes) and the debug-logging switch.
#include "StepFlowCore.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace StepFlow {

namespace {

bool debugFromEnvironment() {
    const char* env = std::getenv("STEPFLOW_DEBUG");
    return env && *env && std::string(env) != "0";
}

bool gDebug = debugFromEnvironment();

} // namespace

bool debugEnabled() { return gDebug; }
void setDebug(bool enabled) { gDebug = enabled; }

std::string toString(ElementType type) {
    switch (type) {
    case ElementType::Float32: return "float32";
    case ElementType::Float64: return "float64";
    case ElementType::Int32: return "int32";
    }
    return "unknown";
}

ElementType parseElementType(const std::string& name) {
    if (name == "float32" || name == "float") return ElementType::Float32;
    if (name == "float64" || name == "double") return ElementType::Float64;
    if (name == "int32" || name == "int") return ElementType::Int32;
    throw std::invalid_argument("Unknown element type: " + name);
}

int Signal::size() const {
    int n = 1;
    for (int d : shape) n *= d;
    return n;
}

Shape Signal::trailingShape() const {
    if (shape.size() <= 1) return {};
    return Shape(shape.begin() + 1, shape.end());
}

std::vector<SignalId> Operator::allSignals() const {
    std::vector<SignalId> out;
    out.reserve(sets.size() + incs.size() + reads.size() + updates.size());
    out.insert(out.end(), sets.begin(), sets.end());
    out.insert(out.end(), incs.begin(), incs.end());
    out.insert(out.end(), reads.begin(), reads.end());
    out.insert(out.end(), updates.begin(), updates.end());
    return out;
}

SignalId Model::addSignal(Signal signal) {
    signals.push_back(std::move(signal));
    return static_cast<SignalId>(signals.size() - 1);
}

OperatorId Model::addOperator(Operator op) {
    operators.push_back(std::move(op));
    return static_cast<OperatorId>(operators.size() - 1);
}

void Model::addSource(const std::string& name, SignalId output, SourceFunction function) {
    sources.push_back({name, output, std::move(function)});
}

void Model::addProbe(const std::string& name, SignalId target) {
    probes.push_back({name, target});
}

SignalId Model::findSignal(const std::string& name) const {
    for (size_t i = 0; i < signals.size(); ++i) {
        if (signals[i].name == name) return static_cast<SignalId>(i);
    }
    return -1;
}

int Model::findProbe(const std::string& name) const {
    for (size_t i = 0; i < probes.size(); ++i) {
        if (probes[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

namespace {

std::vector<double> numbersFromJson(const nlohmann::json& j) {
    std::vector<double> out;
    if (j.is_number()) {
        out.push_back(j.get<double>());
    } else if (j.is_array()) {
        for (const auto& v : j) {
            if (v.is_array()) {
                auto inner = numbersFromJson(v);
                out.insert(out.end(), inner.begin(), inner.end());
            } else {
                out.push_back(v.get<double>());
            }
        }
    }
    return out;
}

// Build a time function from its JSON description. Scalar results are
// broadcast to the output signal by the input feed.
SourceFunction sourceFunctionFromJson(const nlohmann::json& fj, double dt) {
    const std::string type = fj.value("type", std::string("constant"));
    if (type == "constant") {
        auto values = numbersFromJson(fj.contains("value") ? fj["value"] : nlohmann::json(0.0));
        return [values](double) { return values; };
    }
    if (type == "sine") {
        const double freq = fj.value("frequency", 1.0);
        const double amp = fj.value("amplitude", 1.0);
        const double phase = fj.value("phase", 0.0);
        return [freq, amp, phase](double t) {
            return std::vector<double>{amp * std::sin(2.0 * M_PI * freq * t + phase)};
        };
    }
    if (type == "ramp") {
        const double slope = fj.value("slope", 1.0);
        const double offset = fj.value("offset", 0.0);
        return [slope, offset](double t) { return std::vector<double>{offset + slope * t}; };
    }
    if (type == "table") {
        std::vector<std::vector<double>> rows;
        if (fj.contains("values")) {
            for (const auto& row : fj["values"]) rows.push_back(numbersFromJson(row));
        }
        if (rows.empty()) throw ModelGraphError("table source function needs at least one row");
        const double tableDt = fj.value("dt", dt);
        // Step k (1-indexed) reads row k-1; the last row is held afterwards
        return [rows, tableDt](double t) {
            long idx = std::lround(t / tableDt) - 1;
            idx = std::max(0L, std::min(idx, static_cast<long>(rows.size()) - 1));
            return rows[static_cast<size_t>(idx)];
        };
    }
    throw ModelGraphError("Unknown source function type: " + type);
}

} // namespace

void Model::loadFromJson(const nlohmann::json& json) {
    signals.clear();
    operators.clear();
    sources.clear();
    probes.clear();
    dt = json.value("dt", 0.001);

    std::unordered_map<std::string, SignalId> byName;
    if (json.contains("signals")) {
        for (const auto& sj : json["signals"]) {
            Signal sig;
            sig.name = sj["name"].get<std::string>();
            if (sj.contains("shape")) sig.shape = sj["shape"].get<Shape>();
            sig.dataType = sj.value("dtype", std::string("float"));
            sig.trainable = sj.value("trainable", false);
            if (sj.contains("initial")) sig.initial = numbersFromJson(sj["initial"]);
            if (byName.count(sig.name)) throw ModelGraphError("Duplicate signal name: " + sig.name);
            byName[sig.name] = addSignal(std::move(sig));
        }
    }

    auto resolve = [&](const std::string& name, const std::string& context) {
        auto it = byName.find(name);
        if (it == byName.end()) {
            throw ModelGraphError("Unknown signal '" + name + "' referenced by " + context);
        }
        return it->second;
    };
    auto resolveList = [&](const nlohmann::json& oj, const char* key, const std::string& context) {
        std::vector<SignalId> out;
        if (oj.contains(key)) {
            for (const auto& n : oj[key]) out.push_back(resolve(n.get<std::string>(), context));
        }
        return out;
    };

    if (json.contains("operators")) {
        for (const auto& oj : json["operators"]) {
            Operator op;
            op.kind = oj["kind"].get<std::string>();
            op.id = oj.value("id", op.kind + "_" + std::to_string(operators.size()));
            const std::string context = "operator '" + op.id + "'";
            op.sets = resolveList(oj, "sets", context);
            op.incs = resolveList(oj, "incs", context);
            op.reads = resolveList(oj, "reads", context);
            op.updates = resolveList(oj, "updates", context);
            if (oj.contains("params") && oj["params"].is_object()) op.params = oj["params"];
            op.source = oj.value("source", std::string());
            addOperator(std::move(op));
        }
    }

    if (json.contains("sources")) {
        for (const auto& srcJson : json["sources"]) {
            const std::string name = srcJson["name"].get<std::string>();
            SignalId out = resolve(srcJson["signal"].get<std::string>(), "source '" + name + "'");
            nlohmann::json fj = srcJson.contains("function") ? srcJson["function"] : nlohmann::json::object();
            addSource(name, out, sourceFunctionFromJson(fj, dt));
        }
    }

    if (json.contains("probes")) {
        for (const auto& pj : json["probes"]) {
            const std::string target = pj["signal"].get<std::string>();
            const std::string name = pj.value("name", target);
            addProbe(name, resolve(target, "probe '" + name + "'"));
        }
    }
}

Model Model::fromJson(const nlohmann::json& json) {
    Model m;
    m.loadFromJson(json);
    return m;
}

} // namespace StepFlow
