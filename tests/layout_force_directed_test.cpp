#include "gtest/gtest.h"
#include "test_records.h"
#include <oceangraph/graph/graph_builder.h>
#include <oceangraph/layout/force_directed_layout.h>
#include <cmath>
#include <stdexcept>

using namespace oceangraph;
using graph::GraphSnapshot;
using layout::ForceDirectedLayout;

namespace {

GraphSnapshot TwoRegionSnapshot() {
    return graph::GraphBuilder().Build(testing_support::TwoRegionRecords());
}

void RunToConvergence(ForceDirectedLayout& layout, int limit = 2000) {
    for (int i = 0; i < limit && layout.IsRunning(); ++i) {
        layout.Step();
    }
}

float DistanceBetween(const ImVec2& a, const ImVec2& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

TEST(ForceDirectedLayoutTest, EmptySnapshotIsConvergedImmediately) {
    ForceDirectedLayout layout{GraphSnapshot()};
    EXPECT_TRUE(layout.IsConverged());
    EXPECT_TRUE(layout.Step().empty());
    EXPECT_EQ(layout.TickCount(), 0);

    layout.Reheat(0.5f);
    EXPECT_TRUE(layout.IsConverged());
}

TEST(ForceDirectedLayoutTest, InitialPositionsSurroundCanvasCentre) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    EXPECT_FLOAT_EQ(layout.Alpha(), 1.0f);

    ImVec2 center = layout.GetParams().CanvasCenter();
    for (const auto& entry : layout.Positions()) {
        EXPECT_LT(DistanceBetween(entry.second, center), 50.0f) << entry.first;
    }
}

TEST(ForceDirectedLayoutTest, AlphaDecaysMonotonicallyUntilConverged) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    const auto& params = layout.GetParams();

    float previous = layout.Alpha();
    layout.Step();
    EXPECT_NEAR(layout.Alpha(), previous * (1.0f - params.alpha_decay), 1e-6f);

    int ticks = 1;
    while (layout.IsRunning() && ticks < 2000) {
        previous = layout.Alpha();
        layout.Step();
        EXPECT_LE(layout.Alpha(), previous);
        ++ticks;
    }

    int bound = static_cast<int>(std::ceil(std::log(params.alpha_min) / std::log(1.0f - params.alpha_decay))) + 2;
    EXPECT_TRUE(layout.IsConverged());
    EXPECT_LE(ticks, bound);
    EXPECT_LT(layout.Alpha(), params.alpha_min);
}

TEST(ForceDirectedLayoutTest, ConvergedStepIsIdempotent) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    RunToConvergence(layout);
    ASSERT_TRUE(layout.IsConverged());

    int ticks = layout.TickCount();
    graph::PositionMap first = layout.Step();
    graph::PositionMap second = layout.Step();
    ASSERT_EQ(first.size(), second.size());
    for (const auto& entry : first) {
        EXPECT_EQ(entry.second.x, second.at(entry.first).x);
        EXPECT_EQ(entry.second.y, second.at(entry.first).y);
    }
    EXPECT_EQ(layout.TickCount(), ticks);
}

TEST(ForceDirectedLayoutTest, PinnedNodeLandsExactlyOnPin) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    layout.Step();

    layout.Pin("region:Pacific", 123.5f, -40.25f);
    graph::PositionMap positions = layout.Step();
    EXPECT_EQ(positions.at("region:Pacific").x, 123.5f);
    EXPECT_EQ(positions.at("region:Pacific").y, -40.25f);
    EXPECT_TRUE(layout.IsPinned("region:Pacific"));

    // The pin holds across further ticks despite the forces.
    for (int i = 0; i < 10; ++i) layout.Step();
    EXPECT_EQ(layout.PositionOf("region:Pacific").x, 123.5f);
    EXPECT_EQ(layout.PositionOf("region:Pacific").y, -40.25f);
}

TEST(ForceDirectedLayoutTest, PinWhileConvergedMovesNode) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    RunToConvergence(layout);

    layout.Pin("time:2025-01", 10.0f, 20.0f);
    graph::PositionMap positions = layout.Step();
    EXPECT_EQ(positions.at("time:2025-01").x, 10.0f);
    EXPECT_EQ(positions.at("time:2025-01").y, 20.0f);
}

TEST(ForceDirectedLayoutTest, PinFarOutsideCanvasIsHonoured) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    RunToConvergence(layout);
    layout.Reheat(0.3f);

    layout.Pin("region:Pacific", 1e12f, -1e12f);
    graph::PositionMap positions;
    for (int i = 0; i < 5; ++i) {
        positions = layout.Step();
    }
    EXPECT_EQ(positions.at("region:Pacific").x, 1e12f);
    EXPECT_EQ(positions.at("region:Pacific").y, -1e12f);
    for (const auto& entry : positions) {
        EXPECT_TRUE(std::isfinite(entry.second.x)) << entry.first;
        EXPECT_TRUE(std::isfinite(entry.second.y)) << entry.first;
    }
}

TEST(ForceDirectedLayoutTest, UnpinnedNodeResumesSimulation) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    layout.Pin("region:Atlantic", 700.0f, 500.0f);
    layout.Step();
    layout.Unpin("region:Atlantic");
    EXPECT_FALSE(layout.IsPinned("region:Atlantic"));

    layout.Step();
    ImVec2 after = layout.PositionOf("region:Atlantic");
    EXPECT_TRUE(after.x != 700.0f || after.y != 500.0f);
}

TEST(ForceDirectedLayoutTest, ReheatRaisesAlphaOnly) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    RunToConvergence(layout);
    graph::PositionMap before = layout.Positions();
    ImVec2 velocity_before = layout.VelocityOf("region:Pacific");

    layout.Reheat(0.3f);
    EXPECT_FLOAT_EQ(layout.Alpha(), 0.3f);
    EXPECT_TRUE(layout.IsRunning());
    graph::PositionMap after = layout.Positions();
    for (const auto& entry : before) {
        EXPECT_EQ(entry.second.x, after.at(entry.first).x);
        EXPECT_EQ(entry.second.y, after.at(entry.first).y);
    }
    EXPECT_EQ(layout.VelocityOf("region:Pacific").x, velocity_before.x);
    EXPECT_EQ(layout.VelocityOf("region:Pacific").y, velocity_before.y);

    // A lower target never cools the simulation.
    layout.Reheat(0.1f);
    EXPECT_FLOAT_EQ(layout.Alpha(), 0.3f);

    layout.Step();
    EXPECT_LT(layout.Alpha(), 0.3f);
}

TEST(ForceDirectedLayoutTest, SelectionIsPureRead) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    layout.Step();
    float alpha = layout.Alpha();
    graph::PositionMap before = layout.Positions();

    EXPECT_FALSE(layout.SelectedNode().has_value());
    layout.SelectNode("biology:plankton");
    ASSERT_TRUE(layout.SelectedNode().has_value());
    EXPECT_EQ(*layout.SelectedNode(), "biology:plankton");

    EXPECT_EQ(layout.Alpha(), alpha);
    EXPECT_FALSE(layout.IsPinned("biology:plankton"));
    graph::PositionMap after = layout.Positions();
    for (const auto& entry : before) {
        EXPECT_EQ(entry.second.x, after.at(entry.first).x);
    }

    layout.ClearSelection();
    EXPECT_FALSE(layout.SelectedNode().has_value());
}

TEST(ForceDirectedLayoutTest, ViewTransformIsIndependentOfSimulation) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    graph::PositionMap before = layout.Positions();
    float alpha = layout.Alpha();

    const graph::GraphViewState& view = layout.SetViewTransform(2.0f, -150.0f, 75.0f);
    EXPECT_FLOAT_EQ(view.zoom_scale, 2.0f);
    EXPECT_FLOAT_EQ(view.pan_offset.x, -150.0f);
    EXPECT_FLOAT_EQ(view.pan_offset.y, 75.0f);

    EXPECT_FLOAT_EQ(layout.SetViewTransform(25.0f, 0.0f, 0.0f).zoom_scale, 4.0f);
    EXPECT_FLOAT_EQ(layout.SetViewTransform(0.01f, 1e6f, -1e6f).zoom_scale, 0.1f);
    EXPECT_FLOAT_EQ(layout.GetViewState().pan_offset.x, 1e6f);

    EXPECT_EQ(layout.Alpha(), alpha);
    graph::PositionMap after = layout.Positions();
    for (const auto& entry : before) {
        EXPECT_EQ(entry.second.x, after.at(entry.first).x);
        EXPECT_EQ(entry.second.y, after.at(entry.first).y);
    }
}

TEST(ForceDirectedLayoutTest, SameSnapshotGivesSameLayout) {
    ForceDirectedLayout a(TwoRegionSnapshot());
    ForceDirectedLayout b(TwoRegionSnapshot());
    graph::PositionMap pa, pb;
    for (int i = 0; i < 50; ++i) {
        pa = a.Step();
        pb = b.Step();
    }
    for (const auto& entry : pa) {
        EXPECT_EQ(entry.second.x, pb.at(entry.first).x);
        EXPECT_EQ(entry.second.y, pb.at(entry.first).y);
    }
}

TEST(ForceDirectedLayoutTest, ConvergedLayoutAvoidsOverlap) {
    GraphSnapshot snapshot = TwoRegionSnapshot();
    ForceDirectedLayout layout(snapshot);
    RunToConvergence(layout);
    graph::PositionMap positions = layout.Positions();

    for (size_t i = 0; i < snapshot.nodes.size(); ++i) {
        for (size_t j = i + 1; j < snapshot.nodes.size(); ++j) {
            const auto& a = snapshot.nodes[i];
            const auto& b = snapshot.nodes[j];
            float d = DistanceBetween(positions.at(a.id), positions.at(b.id));
            EXPECT_GT(d, graph::NodeRadius(a.kind) + graph::NodeRadius(b.kind)) << a.id << " / " << b.id;
        }
    }
}

TEST(ForceDirectedLayoutTest, LargeGraphUsesApproximationAndStaysFinite) {
    std::vector<graph::MeasurementRecord> records;
    for (int i = 0; i < 80; ++i) {
        records.push_back(testing_support::MakeRecord("Zone" + std::to_string(i), "2024-0" + std::to_string(i % 9 + 1) + "-01"));
    }
    GraphSnapshot snapshot = graph::GraphBuilder().Build(records);
    ForceDirectedLayout layout(snapshot);
    ASSERT_GE(static_cast<int>(layout.NodeCount()), layout.GetParams().exact_charge_below);

    RunToConvergence(layout);
    EXPECT_TRUE(layout.IsConverged());
    for (const auto& entry : layout.Positions()) {
        EXPECT_TRUE(std::isfinite(entry.second.x)) << entry.first;
        EXPECT_TRUE(std::isfinite(entry.second.y)) << entry.first;
    }
}

TEST(ForceDirectedLayoutTest, ContractViolationsThrow) {
    ForceDirectedLayout layout(TwoRegionSnapshot());
    EXPECT_THROW(layout.Step(0.0f), std::invalid_argument);
    EXPECT_THROW(layout.Step(-1.0f), std::invalid_argument);
    EXPECT_THROW(layout.Pin("region:Nowhere", 0.0f, 0.0f), std::out_of_range);
    EXPECT_THROW(layout.Unpin("region:Nowhere"), std::out_of_range);
    EXPECT_THROW(layout.SelectNode("region:Nowhere"), std::out_of_range);
    EXPECT_THROW(layout.Reheat(0.0f), std::invalid_argument);
    EXPECT_EQ(layout.TickCount(), 0);
}

TEST(ForceDirectedLayoutTest, DanglingEdgeIsRejected) {
    GraphSnapshot snapshot = TwoRegionSnapshot();
    snapshot.edges.push_back(graph::GraphEdge{"region:Pacific", "parameter:turbidity", 1.0f,
                                              graph::EdgeCategory::ParameterLink});
    EXPECT_THROW(ForceDirectedLayout{snapshot}, std::invalid_argument);
    EXPECT_THROW(graph::ValidateSnapshot(snapshot), std::invalid_argument);
}

TEST(ForceDirectedLayoutTest, NonConvergingParamsAreRejected) {
    ForceDirectedLayout::LayoutParams params;
    params.alpha_decay = 1.0f;
    EXPECT_THROW(ForceDirectedLayout(TwoRegionSnapshot(), params), std::invalid_argument);
}
