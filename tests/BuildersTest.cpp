#include "StepFlowCompiler.hpp"
#include "TestModels.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <cmath>
#include <memory>

using namespace StepFlow;
using namespace StepFlow::testing;

namespace {

CompileOptions float64Options() {
    CompileOptions options;
    options.dtype = ElementType::Float64;
    return options;
}

RunResult runModel(const Model& m, int steps, CompileOptions options = float64Options()) {
    BuilderRegistry builders = BuilderRegistry::withDefaults();
    CompiledGraph graph = compile(m, options, builders);
    return graph.run(graph.initialState(), steps);
}

} // namespace

TEST(BuilderRegistryTest, DefaultKindsAreRegistered) {
    BuilderRegistry builders = BuilderRegistry::withDefaults();
    for (const char* kind : {"Reset", "Copy", "ElementwiseInc", "DotInc", "Synapse", "WhiteNoise", "HostFunc"}) {
        EXPECT_TRUE(builders.contains(kind)) << kind;
    }
    EXPECT_FALSE(builders.contains("TimeUpdate"));
    EXPECT_THROW(builders.get("Conv2D"), LookupError);
    EXPECT_TRUE(builders.hostFunctions().contains("square"));
    EXPECT_THROW(builders.hostFunctions().get("nope"), LookupError);
}

TEST(BuildersTest, ResetWritesValue) {
    Model m;
    SignalId y = addSignal(m, "y", {2}, false, {9.0, 9.0});
    addOp(m, "reset", {"Reset", {y}, {}, {}, {}, {{"value", 2.5}}});
    m.addProbe("y", y);
    RunResult r = runModel(m, 1);
    ASSERT_EQ(r.probes[0].size(), 1u);
    EXPECT_EQ(r.probes[0][0], (std::vector<double>{2.5, 2.5}));
}

TEST(BuildersTest, CopyBroadcastsScalarSource) {
    Model m;
    SignalId x = addSignal(m, "x", {}, false, {3.0});
    SignalId y = addSignal(m, "y", {3});
    addOp(m, "copy", {"Copy", {}, {}, {x}, {y}});
    m.addProbe("y", y);
    RunResult r = runModel(m, 1);
    EXPECT_EQ(r.probes[0][0], (std::vector<double>{3.0, 3.0, 3.0}));
}

TEST(BuildersTest, CopyIntoIncrementTargetAccumulates) {
    Model m;
    SignalId x = addSignal(m, "x", {1}, false, {1.0});
    SignalId acc = addSignal(m, "acc", {1});
    addOp(m, "accumulate", {"Copy", {}, {acc}, {x}, {}});
    m.addProbe("acc", acc);
    RunResult r = runModel(m, 3);
    ASSERT_EQ(r.probes[0].size(), 3u);
    EXPECT_DOUBLE_EQ(r.probes[0][2][0], 3.0);
}

TEST(BuildersTest, ElementwiseIncMultipliesAndAccumulates) {
    Model m;
    SignalId a = addSignal(m, "a", {2}, false, {2.0, 3.0});
    SignalId x = addSignal(m, "x", {2}, false, {4.0, 5.0});
    SignalId y = addSignal(m, "y", {2});
    addOp(m, "reset", {"Reset", {y}, {}, {}, {}, {{"value", 1.0}}});
    addOp(m, "mul", {"ElementwiseInc", {}, {y}, {a, x}, {}});
    m.addProbe("y", y);
    RunResult r = runModel(m, 2);
    EXPECT_EQ(r.probes[0][1], (std::vector<double>{9.0, 16.0}));
}

TEST(BuildersTest, DotIncComputesMatrixVectorProduct) {
    Model m;
    SignalId A = addSignal(m, "A", {2, 3}, true, {1, 2, 3, 4, 5, 6});
    SignalId x = addSignal(m, "x", {3}, false, {1, 0, 2});
    SignalId y = addSignal(m, "y", {2});
    addOp(m, "reset", {"Reset", {y}, {}, {}, {}});
    addOp(m, "dot", {"DotInc", {}, {y}, {A, x}, {}});
    m.addProbe("y", y);
    RunResult r = runModel(m, 1);
    EXPECT_EQ(r.probes[0][0], (std::vector<double>{7.0, 16.0}));
}

TEST(BuildersTest, DotIncShapeMismatchIsModelGraphError) {
    Model m;
    SignalId A = addSignal(m, "A", {2, 2});
    SignalId x = addSignal(m, "x", {3});
    SignalId y = addSignal(m, "y", {2});
    addOp(m, "dot", {"DotInc", {}, {y}, {A, x}, {}});
    BuilderRegistry builders = BuilderRegistry::withDefaults();
    EXPECT_THROW(compile(m, CompileOptions(), builders), ModelGraphError);
}

TEST(BuildersTest, SynapseIsFirstOrderLowpass) {
    Model m = lowpassModel(0.01);
    RunResult r = runModel(m, 5);
    const double a = std::exp(-m.dt / 0.01);
    ASSERT_EQ(r.probes[0].size(), 5u);
    for (int k = 0; k < 5; ++k) {
        EXPECT_NEAR(r.probes[0][k][0], 1.0 - std::pow(a, k + 1), 1e-12) << "step " << k + 1;
    }
}

TEST(BuildersTest, WhiteNoiseIsReproducibleForASeed) {
    Model m;
    SignalId n = addSignal(m, "n", {3});
    addOp(m, "noise", {"WhiteNoise", {}, {}, {}, {n}, {{"mean", 1.0}, {"std", 0.5}}});
    m.addProbe("n", n);

    CompileOptions options = float64Options();
    options.seed = 7;
    RunResult first = runModel(m, 4, options);
    RunResult second = runModel(m, 4, options);
    EXPECT_EQ(first.probes[0], second.probes[0]);
    EXPECT_NE(first.probes[0][0], first.probes[0][1]);

    options.seed = 8;
    RunResult other = runModel(m, 4, options);
    EXPECT_NE(first.probes[0], other.probes[0]);
}

TEST(BuildersTest, WhiteNoiseWithZeroStdIsMean) {
    Model m;
    SignalId n = addSignal(m, "n", {2});
    addOp(m, "noise", {"WhiteNoise", {}, {}, {}, {n}, {{"mean", -0.25}, {"std", 0.0}}});
    m.addProbe("n", n);
    RunResult r = runModel(m, 2);
    EXPECT_EQ(r.probes[0][1], (std::vector<double>{-0.25, -0.25}));
}

TEST(BuildersTest, HostFuncAppliesNamedFunctionPerBatchItem) {
    Model m;
    SignalId x = addSignal(m, "x", {2}, false, {2.0, 3.0});
    SignalId y = addSignal(m, "y", {2});
    addOp(m, "square", {"HostFunc", {}, {}, {x}, {y}, {{"function", "square"}}});
    m.addProbe("y", y);

    CompileOptions options = float64Options();
    options.batchSize = 2;
    RunResult r = runModel(m, 1, options);
    // Element-major, batch innermost
    EXPECT_EQ(r.probes[0][0], (std::vector<double>{4.0, 4.0, 9.0, 9.0}));
}

TEST(BuildersTest, HostFuncRunsEveryStepWithoutConsumers) {
    Model m;
    SignalId time = addSignal(m, "time", {});
    SignalId x = addSignal(m, "x", {1}, false, {1.0});
    addOp(m, "time_update", {"TimeUpdate", {}, {}, {}, {time}});
    addOp(m, "log", {"HostFunc", {}, {}, {x}, {}, {{"function", "record"}}});

    auto calls = std::make_shared<std::vector<double>>();
    BuilderRegistry builders = BuilderRegistry::withDefaults();
    builders.hostFunctions().add("record", [calls](double t, const std::vector<double>&) {
        calls->push_back(t);
        return std::vector<double>{};
    });
    CompiledGraph graph = compile(m, float64Options(), builders);
    graph.run(graph.initialState(), 3);

    ASSERT_EQ(calls->size(), 3u);
    EXPECT_DOUBLE_EQ((*calls)[0], 1 * m.dt);
    EXPECT_DOUBLE_EQ((*calls)[2], 3 * m.dt);

    // The host func kernel is a side effect the advance waits for
    const IterationNodes& it = graph.iteration(0);
    ASSERT_EQ(it.sideEffects.size(), 1u);
    const auto& after = graph.program().node(it.advance).after;
    EXPECT_NE(std::find(after.begin(), after.end(), it.sideEffects[0]), after.end());
}

TEST(BuildersTest, UnknownHostFunctionIsLookupError) {
    Model m;
    SignalId x = addSignal(m, "x");
    SignalId y = addSignal(m, "y");
    addOp(m, "f", {"HostFunc", {}, {}, {x}, {y}, {{"function", "does_not_exist"}}});
    BuilderRegistry builders = BuilderRegistry::withDefaults();
    EXPECT_THROW(compile(m, CompileOptions(), builders), LookupError);
}

TEST(BuildersTest, MergedGroupRunsAllMembers) {
    Model m;
    SignalId a = addSignal(m, "a", {1}, false, {1.0});
    SignalId b = addSignal(m, "b", {1}, false, {2.0});
    SignalId ya = addSignal(m, "ya", {1});
    SignalId yb = addSignal(m, "yb", {1});
    addOp(m, "copy_a", {"Copy", {}, {}, {a}, {ya}});
    addOp(m, "copy_b", {"Copy", {}, {}, {b}, {yb}});
    m.addProbe("ya", ya);
    m.addProbe("yb", yb);

    BuilderRegistry builders = BuilderRegistry::withDefaults();
    CompiledGraph graph = compile(m, float64Options(), builders);
    ASSERT_EQ(graph.plan().size(), 1u);
    RunResult r = graph.run(graph.initialState(), 1);
    EXPECT_DOUBLE_EQ(r.probes[0][0][0], 1.0);
    EXPECT_DOUBLE_EQ(r.probes[1][0][0], 2.0);
}
