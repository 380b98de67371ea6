#include "gtest/gtest.h"
#include <oceangraph/render/camera_utils.h>
#include <oceangraph/graph/graph_types.h> // For GraphViewState

using oceangraph::graph::GraphViewState;
using oceangraph::render::CameraUtils;

TEST(CameraUtilsTest, PanAndZoomInvariants) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(0, 0);
    view_state.zoom_scale = 1.0f;

    ImVec2 world_point(100, 200);

    // Initial state
    ImVec2 screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    ImVec2 world_point_rt = CameraUtils::ScreenToWorld(screen_point, view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    // Zoom
    view_state.zoom_scale = 2.0f;
    screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    EXPECT_NEAR(screen_point.x, 200.0f, 1e-3);
    world_point_rt = CameraUtils::ScreenToWorld(screen_point, view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    // Pan
    view_state.pan_offset = ImVec2(30, -40);
    screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    EXPECT_NEAR(screen_point.x, 230.0f, 1e-3);
    EXPECT_NEAR(screen_point.y, 360.0f, 1e-3);
    world_point_rt = CameraUtils::ScreenToWorld(screen_point, view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);
}

TEST(CameraUtilsTest, ZoomAtKeepsPointerFixed) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(15, 25);
    view_state.zoom_scale = 1.0f;

    ImVec2 pointer(320, 240);
    ImVec2 before = CameraUtils::ScreenToWorld(pointer, view_state);
    float applied = CameraUtils::ZoomAt(view_state, pointer, 1.5f, 0.1f, 4.0f);
    ImVec2 after = CameraUtils::ScreenToWorld(pointer, view_state);

    EXPECT_FLOAT_EQ(applied, 1.5f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 1.5f);
    EXPECT_NEAR(before.x, after.x, 1e-3);
    EXPECT_NEAR(before.y, after.y, 1e-3);
}

TEST(CameraUtilsTest, ZoomAtClampsToLimits) {
    GraphViewState view_state;
    view_state.zoom_scale = 3.0f;

    float applied = CameraUtils::ZoomAt(view_state, ImVec2(0, 0), 10.0f, 0.1f, 4.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 4.0f);
    EXPECT_NEAR(applied, 4.0f / 3.0f, 1e-5);

    CameraUtils::ZoomAt(view_state, ImVec2(0, 0), 0.001f, 0.1f, 4.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 0.1f);
}

TEST(CameraUtilsTest, WheelZoomFactor) {
    EXPECT_FLOAT_EQ(CameraUtils::WheelZoomFactor(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(CameraUtils::WheelZoomFactor(1.0f), 1.1f);
    EXPECT_FLOAT_EQ(CameraUtils::WheelZoomFactor(-1.0f), 0.9f);
    EXPECT_FLOAT_EQ(CameraUtils::WheelZoomFactor(-50.0f), 0.1f);
}
