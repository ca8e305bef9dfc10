#include "StepFlowPlanner.hpp"
#include "StepFlowSignals.hpp"
#include "TestModels.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <utility>

using namespace StepFlow;
using namespace StepFlow::testing;

namespace {

Model mixedModel() {
    Model m;
    addSignal(m, "a", {3});
    addSignal(m, "b", {2});
    addSignal(m, "w", {4, 2}, true, {1, 2, 3, 4, 5, 6, 7, 8});
    addSignal(m, "v", {2, 2}, true);
    addSignal(m, "m", {3, 2});
    addSignal(m, "t", {});
    Signal count;
    count.name = "count";
    count.shape = {2};
    count.dataType = "int";
    m.addSignal(count);
    return m;
}

std::vector<SignalId> declarationOrder(const Model& m) {
    std::vector<SignalId> order;
    for (size_t i = 0; i < m.signals.size(); ++i) order.push_back(static_cast<SignalId>(i));
    return order;
}

} // namespace

TEST(SignalsTest, EverySignalHasExactlyOneNonOverlappingView) {
    Model m = mixedModel();
    BufferLayout layout = createSignals(m, {}, ElementType::Float32, 3);
    ASSERT_EQ(layout.views.size(), m.signals.size());

    for (size_t i = 0; i < m.signals.size(); ++i) {
        const SignalView& v = layout.view(static_cast<SignalId>(i));
        EXPECT_EQ(v.signal, static_cast<SignalId>(i));
        ASSERT_GE(v.buffer, 0);
        EXPECT_LE(v.offset + v.extent(), layout.initial[v.buffer].extent());
    }
    for (size_t i = 0; i < m.signals.size(); ++i) {
        for (size_t j = i + 1; j < m.signals.size(); ++j) {
            const SignalView& a = layout.views[i];
            const SignalView& b = layout.views[j];
            if (a.buffer != b.buffer) continue;
            bool disjoint = a.offset + a.extent() <= b.offset || b.offset + b.extent() <= a.offset;
            EXPECT_TRUE(disjoint) << m.signals[i].name << " overlaps " << m.signals[j].name;
        }
    }
}

TEST(SignalsTest, BuffersArePartitionedByTypeShapeAndTrainability) {
    Model m = mixedModel();
    BufferLayout layout = createSignals(m, declarationOrder(m), ElementType::Float64, 1);

    // a, b and t stack as scalar rows; w and v share trailing shape {2};
    // w and m differ only by trainability
    EXPECT_EQ(layout.views[0].buffer, layout.views[1].buffer);
    EXPECT_EQ(layout.views[0].buffer, layout.views[5].buffer);
    EXPECT_EQ(layout.views[2].buffer, layout.views[3].buffer);
    EXPECT_NE(layout.views[2].buffer, layout.views[4].buffer);
    EXPECT_NE(layout.views[0].buffer, layout.views[6].buffer);

    EXPECT_EQ(layout.keys.size(), 4u);
    for (size_t i = 0; i < layout.keys.size(); ++i) {
        EXPECT_EQ(layout.bufferIndex(layout.keys[i]), static_cast<int>(i));
    }
    EXPECT_EQ(layout.views[2].key.name(), "float64_2_trainable");
    EXPECT_EQ(layout.views[0].key.name(), "float64_scalar_state");
    EXPECT_EQ(layout.views[6].key.dtype, ElementType::Int32);
}

TEST(SignalsTest, OptimizedOrderIsPlacedFirst) {
    Model m = mixedModel();
    // b before a inside the shared scalar buffer
    BufferLayout layout = createSignals(m, {1, 0}, ElementType::Float32, 1);
    EXPECT_EQ(layout.views[1].offset, 0u);
    EXPECT_EQ(layout.views[0].offset, 2u);
    EXPECT_EQ(layout.views[5].offset, 5u);
}

TEST(SignalsTest, InitialContentIsReplicatedAcrossBatch) {
    Model m;
    addSignal(m, "x", {2}, false, {1.5, -2.0});
    addSignal(m, "w", {2}, true, {3.0, 4.0});
    BufferLayout layout = createSignals(m, {}, ElementType::Float64, 4);

    const SignalView& x = layout.view(0);
    const BaseBuffer& xb = layout.initial[x.buffer];
    EXPECT_EQ(x.batch, 4);
    EXPECT_EQ(xb.extent(), 8u);
    for (int b = 0; b < 4; ++b) {
        EXPECT_DOUBLE_EQ(xb.data[x.index(0, b)], 1.5);
        EXPECT_DOUBLE_EQ(xb.data[x.index(1, b)], -2.0);
    }

    // Trainable state is shared by every batch item
    const SignalView& w = layout.view(1);
    EXPECT_EQ(w.batch, 1);
    EXPECT_EQ(layout.initial[w.buffer].extent(), 2u);
    EXPECT_DOUBLE_EQ(layout.initial[w.buffer].data[w.index(1, 0)], 4.0);
}

TEST(SignalsTest, StridesFollowRowMajorShapeWithBatchInnermost) {
    Model m;
    addSignal(m, "m", {3, 2});
    BufferLayout layout = createSignals(m, {}, ElementType::Float32, 2);
    const SignalView& v = layout.view(0);
    EXPECT_EQ(v.strides, (std::vector<size_t>{4, 2}));
    EXPECT_EQ(v.rows, 3);
    EXPECT_EQ(v.elements, 6);
}

TEST(SignalsTest, Float32BuffersRoundValues) {
    Model m;
    addSignal(m, "x", {1}, false, {0.1});
    BufferLayout f32 = createSignals(m, {}, ElementType::Float32, 1);
    BufferLayout f64 = createSignals(m, {}, ElementType::Float64, 1);
    EXPECT_EQ(f32.initial[0].data[0], static_cast<double>(0.1f));
    EXPECT_EQ(f64.initial[0].data[0], 0.1);
}

TEST(SignalsTest, IntBuffersTruncate) {
    Model m;
    Signal s;
    s.name = "n";
    s.shape = {2};
    s.dataType = "int";
    s.initial = {2.7, -1.5};
    m.addSignal(s);
    BufferLayout layout = createSignals(m, {}, ElementType::Float32, 1);
    EXPECT_EQ(layout.initial[0].data, (std::vector<double>{2.0, -1.0}));
}

TEST(SignalsTest, InitialSizeMismatchIsAllocationError) {
    Model m;
    addSignal(m, "x", {3}, false, {1.0, 2.0});
    EXPECT_THROW(createSignals(m, {}, ElementType::Float32, 1), AllocationError);
}

TEST(SignalsTest, UnsupportedDataTypeIsAllocationError) {
    Model m;
    Signal s;
    s.name = "c";
    s.shape = {1};
    s.dataType = "complex";
    m.addSignal(s);
    EXPECT_THROW(createSignals(m, {}, ElementType::Float32, 1), AllocationError);
}

TEST(SignalsTest, NegativeDimensionIsAllocationError) {
    Model m;
    addSignal(m, "x", {-1});
    EXPECT_THROW(createSignals(m, {}, ElementType::Float32, 1), AllocationError);
}

TEST(SignalsTest, BatchBelowOneIsAllocationError) {
    Model m;
    addSignal(m, "x");
    EXPECT_THROW(createSignals(m, {}, ElementType::Float32, 0), AllocationError);
}

TEST(SignalsTest, UnknownSignalInOrderIsAllocationError) {
    Model m;
    addSignal(m, "x");
    EXPECT_THROW(createSignals(m, {7}, ElementType::Float32, 1), AllocationError);
}

TEST(SignalsTest, MissingViewIsLookupError) {
    Model m;
    addSignal(m, "x");
    BufferLayout layout = createSignals(m, {}, ElementType::Float32, 1);
    EXPECT_THROW(layout.view(5), LookupError);
}

TEST(SignalsTest, OptimizedGroupIsContiguousInMemory) {
    Model m;
    std::vector<SignalId> in, out;
    for (int i = 0; i < 3; ++i) {
        in.push_back(addSignal(m, "in" + std::to_string(i), {2}));
        out.push_back(addSignal(m, "out" + std::to_string(i), {2}));
    }
    std::vector<OperatorId> ops;
    for (int i = 0; i < 3; ++i) ops.push_back(addOp(m, "copy" + std::to_string(i), {"Copy", {}, {}, {in[i]}, {out[i]}}));

    SignalOrder order = orderSignals(m, greedyPlanner(m, ops));
    BufferLayout layout = createSignals(m, order.signals, ElementType::Float32, 1);
    // Reads of the merged group form one block of consecutive rows
    for (int i = 0; i + 1 < 3; ++i) {
        EXPECT_EQ(layout.views[in[i + 1]].offset, layout.views[in[i]].offset + 2);
        EXPECT_EQ(layout.views[out[i + 1]].offset, layout.views[out[i]].offset + 2);
    }
}
