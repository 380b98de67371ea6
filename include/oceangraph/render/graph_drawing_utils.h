#ifndef OCEANGRAPH_RENDER_GRAPH_DRAWING_UTILS_H
#define OCEANGRAPH_RENDER_GRAPH_DRAWING_UTILS_H

#include <string>
#include <vector>
#include <imgui.h>
#include <oceangraph/graph/graph_types.h>

namespace oceangraph {
namespace render {

// Screen-space primitives for a drawing layer. Edges are drawn first, then
// nodes, then labels.
struct EdgePrimitive {
    ImVec2 from;
    ImVec2 to;
    ImU32 color;
    float thickness;
};

struct NodePrimitive {
    std::string id;
    ImVec2 center;
    float radius;
    ImU32 fill;
    ImU32 stroke;
    float stroke_width;
    bool selected;
};

struct LabelPrimitive {
    std::string text;
    ImVec2 anchor;      // Centre of the text
    ImU32 color;
    float font_size;
};

struct DrawList {
    std::vector<EdgePrimitive> edges;
    std::vector<NodePrimitive> nodes;
    std::vector<LabelPrimitive> labels;
};

ImU32 NodeColor(graph::NodeKind kind);
ImU32 EdgeColor(graph::EdgeCategory category);
float EdgeThickness(float weight);

// Builds the frame for the current positions and view. Nodes without a
// position are skipped, as are edges touching them.
DrawList BuildDrawList(const graph::GraphSnapshot& snapshot,
                       const graph::PositionMap& positions,
                       const graph::GraphViewState& view_state);

} // namespace render
} // namespace oceangraph

#endif // OCEANGRAPH_RENDER_GRAPH_DRAWING_UTILS_H
