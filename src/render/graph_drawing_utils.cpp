#include <oceangraph/render/graph_drawing_utils.h>
#include <oceangraph/render/camera_utils.h>
#include <algorithm>
#include <cmath>

namespace oceangraph {
namespace render {

namespace {
constexpr int kEdgeAlpha = 153;                 // 0.6 opacity
constexpr float kNodeStrokeWidth = 2.0f;
constexpr float kSelectedStrokeWidth = 4.0f;
constexpr float kLabelFontSize = 10.0f;
const ImU32 kNodeStrokeColor = IM_COL32(255, 255, 255, 255);
const ImU32 kSelectedStrokeColor = IM_COL32(4, 27, 73, 255);
const ImU32 kLabelColor = IM_COL32(4, 27, 73, 255);
} // end anonymous namespace

ImU32 NodeColor(graph::NodeKind kind) {
    switch (kind) {
        case graph::NodeKind::Region: return IM_COL32(17, 82, 212, 255);
        case graph::NodeKind::Parameter: return IM_COL32(34, 182, 195, 255);
        case graph::NodeKind::Biology: return IM_COL32(240, 110, 66, 255);
        case graph::NodeKind::TimePeriod: return IM_COL32(238, 189, 43, 255);
    }
    return IM_COL32(200, 200, 200, 255);
}

ImU32 EdgeColor(graph::EdgeCategory category) {
    switch (category) {
        case graph::EdgeCategory::ParameterLink: return IM_COL32(34, 182, 195, kEdgeAlpha);
        case graph::EdgeCategory::BiologyLink: return IM_COL32(240, 110, 66, kEdgeAlpha);
        case graph::EdgeCategory::TemporalLink: return IM_COL32(238, 189, 43, kEdgeAlpha);
    }
    return IM_COL32(166, 186, 198, kEdgeAlpha);
}

float EdgeThickness(float weight) {
    return std::sqrt(std::max(0.0f, weight)) * 2.0f;
}

DrawList BuildDrawList(const graph::GraphSnapshot& snapshot,
                       const graph::PositionMap& positions,
                       const graph::GraphViewState& view_state) {
    DrawList frame;
    const float zoom = view_state.zoom_scale;

    frame.edges.reserve(snapshot.edges.size());
    for (const auto& edge : snapshot.edges) {
        auto from_it = positions.find(edge.source_id);
        auto to_it = positions.find(edge.target_id);
        if (from_it == positions.end() || to_it == positions.end()) continue;

        EdgePrimitive line;
        line.from = CameraUtils::WorldToScreen(from_it->second, view_state);
        line.to = CameraUtils::WorldToScreen(to_it->second, view_state);
        line.color = EdgeColor(edge.category);
        line.thickness = EdgeThickness(edge.weight) * zoom;
        frame.edges.push_back(line);
    }

    frame.nodes.reserve(snapshot.nodes.size());
    frame.labels.reserve(snapshot.nodes.size());
    for (const auto& node : snapshot.nodes) {
        auto it = positions.find(node.id);
        if (it == positions.end()) continue;

        bool selected = view_state.selected_node_id && *view_state.selected_node_id == node.id;
        ImVec2 center = CameraUtils::WorldToScreen(it->second, view_state);

        NodePrimitive circle;
        circle.id = node.id;
        circle.center = center;
        circle.radius = graph::NodeRadius(node.kind) * zoom;
        circle.fill = NodeColor(node.kind);
        circle.stroke = selected ? kSelectedStrokeColor : kNodeStrokeColor;
        circle.stroke_width = (selected ? kSelectedStrokeWidth : kNodeStrokeWidth) * zoom;
        circle.selected = selected;
        frame.nodes.push_back(circle);

        frame.labels.push_back(LabelPrimitive{node.label, center, kLabelColor, kLabelFontSize * zoom});
    }

    return frame;
}

} // namespace render
} // namespace oceangraph
