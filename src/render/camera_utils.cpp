#include <oceangraph/render/camera_utils.h>
#include <oceangraph/graph/graph_types.h> // full definition for GraphViewState
#include <algorithm>

namespace oceangraph {
namespace render {

namespace {
constexpr float kZoomSensitivity = 0.1f;
}

ImVec2 CameraUtils::WorldToScreen(const ImVec2& world_pos, const graph::GraphViewState& view_state) {
    float screen_x = (world_pos.x * view_state.zoom_scale) + view_state.pan_offset.x;
    float screen_y = (world_pos.y * view_state.zoom_scale) + view_state.pan_offset.y;
    return ImVec2(screen_x, screen_y);
}

ImVec2 CameraUtils::ScreenToWorld(const ImVec2& screen_pos, const graph::GraphViewState& view_state) {
    if (view_state.zoom_scale == 0.0f) return ImVec2(0, 0);
    float world_x = (screen_pos.x - view_state.pan_offset.x) / view_state.zoom_scale;
    float world_y = (screen_pos.y - view_state.pan_offset.y) / view_state.zoom_scale;
    return ImVec2(world_x, world_y);
}

float CameraUtils::ZoomAt(graph::GraphViewState& view_state, const ImVec2& pointer, float zoom_factor,
                          float min_zoom, float max_zoom) {
    float old_zoom = view_state.zoom_scale;
    float new_zoom = std::max(min_zoom, std::min(old_zoom * zoom_factor, max_zoom));
    if (old_zoom == 0.0f) {
        view_state.zoom_scale = new_zoom;
        return 1.0f;
    }
    float applied = new_zoom / old_zoom;

    view_state.pan_offset.x = (view_state.pan_offset.x - pointer.x) * applied + pointer.x;
    view_state.pan_offset.y = (view_state.pan_offset.y - pointer.y) * applied + pointer.y;
    view_state.zoom_scale = new_zoom;
    return applied;
}

float CameraUtils::WheelZoomFactor(float wheel) {
    return std::max(0.1f, 1.0f + wheel * kZoomSensitivity);
}

} // namespace render
} // namespace oceangraph
