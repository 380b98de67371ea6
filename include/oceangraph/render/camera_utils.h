#ifndef OCEANGRAPH_RENDER_CAMERA_UTILS_H
#define OCEANGRAPH_RENDER_CAMERA_UTILS_H

#include <imgui.h>

namespace oceangraph {
namespace graph {
struct GraphViewState;
} // namespace graph

namespace render {

/*
 * Camera transformations for the graph view.
 * All methods are static; an instance of CameraUtils is never created.
 */
class CameraUtils {
public:
    // Converts simulation coordinates to screen coordinates.
    static ImVec2 WorldToScreen(const ImVec2& world_pos, const graph::GraphViewState& view_state);

    // Converts screen coordinates to simulation coordinates.
    static ImVec2 ScreenToWorld(const ImVec2& screen_pos, const graph::GraphViewState& view_state);

    // Multiplies the zoom by `zoom_factor` about `pointer` (screen space), keeping
    // the world point under the pointer fixed. The result is clamped to
    // [min_zoom, max_zoom]; returns the applied factor.
    static float ZoomAt(graph::GraphViewState& view_state, const ImVec2& pointer, float zoom_factor,
                        float min_zoom, float max_zoom);

    // Converts a mouse-wheel delta into a zoom factor.
    static float WheelZoomFactor(float wheel);
};

} // namespace render
} // namespace oceangraph

#endif // OCEANGRAPH_RENDER_CAMERA_UTILS_H
