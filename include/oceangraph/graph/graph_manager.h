#ifndef OCEANGRAPH_GRAPH_GRAPH_MANAGER_H
#define OCEANGRAPH_GRAPH_GRAPH_MANAGER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <imgui.h>
#include <nlohmann/json.hpp>
#include <oceangraph/graph/graph_builder.h>
#include <oceangraph/graph/graph_types.h>
#include <oceangraph/layout/force_directed_layout.h>
#include <oceangraph/render/graph_drawing_utils.h>

namespace oceangraph {
namespace graph {

/*
 * One interactive knowledge-graph view: the current snapshot, its layout
 * engine and the pointer-interaction glue a front end needs.
 *
 * Regenerate discards the previous snapshot and engine; nothing is carried
 * over, including pan/zoom and selection. All calls are expected on the
 * thread that drives Tick.
 */
class GraphManager {
public:
    GraphManager(const GraphBuilder::BuilderParams& builder_params = GraphBuilder::BuilderParams(),
                 const layout::ForceDirectedLayout::LayoutParams& layout_params =
                     layout::ForceDirectedLayout::LayoutParams());

    void Regenerate(const std::vector<MeasurementRecord>& records);

    // Advances the layout by one frame and returns the positions.
    PositionMap Tick(float dt = 1.0f);

    // Pointer interaction. BeginDrag reheats and pins the node where it is;
    // EndDrag releases it and lets cooling resume.
    void BeginDrag(const std::string& node_id);
    void DragTo(const std::string& node_id, const ImVec2& world_pos);
    void DragToScreen(const std::string& node_id, const ImVec2& screen_pos);
    void EndDrag(const std::string& node_id);
    std::optional<std::string> DraggedNode() const { return dragged_node_; }

    // Returns the id of the topmost node under a screen position, if any.
    std::optional<std::string> HitTest(const ImVec2& screen_pos) const;

    void Select(const std::string& node_id);
    void ClearSelection();
    std::optional<GraphNode> SelectedNode() const;

    const GraphViewState& ZoomAt(const ImVec2& screen_pointer, float wheel);
    const GraphViewState& SetViewTransform(float scale, float translate_x, float translate_y);
    const GraphViewState& GetViewState() const;

    render::DrawList BuildFrame() const;
    nlohmann::json ExportJson(bool include_positions = true) const;

    const GraphSnapshot& GetSnapshot() const { return snapshot_; }
    const layout::ForceDirectedLayout& GetLayout() const { return *layout_; }
    bool IsLayoutRunning() const { return layout_->IsRunning(); }

private:
    GraphBuilder builder_;
    layout::ForceDirectedLayout::LayoutParams layout_params_;
    GraphSnapshot snapshot_;
    std::unique_ptr<layout::ForceDirectedLayout> layout_;
    std::optional<std::string> dragged_node_;
};

} // namespace graph
} // namespace oceangraph

#endif // OCEANGRAPH_GRAPH_GRAPH_MANAGER_H
