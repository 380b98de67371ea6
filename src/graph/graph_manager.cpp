#include <oceangraph/graph/graph_manager.h>
#include <oceangraph/graph/graph_serialization.h>
#include <oceangraph/render/camera_utils.h>
#include <utility>

namespace oceangraph {
namespace graph {

GraphManager::GraphManager(const GraphBuilder::BuilderParams& builder_params,
                           const layout::ForceDirectedLayout::LayoutParams& layout_params)
    : builder_(builder_params),
      layout_params_(layout_params),
      layout_(std::make_unique<layout::ForceDirectedLayout>(snapshot_, layout_params)) {}

void GraphManager::Regenerate(const std::vector<MeasurementRecord>& records) {
    // Build everything before touching the current state so a bad record
    // leaves the previous graph in place.
    GraphSnapshot snapshot = builder_.Build(records);
    auto layout = std::make_unique<layout::ForceDirectedLayout>(snapshot, layout_params_);

    snapshot_ = std::move(snapshot);
    layout_ = std::move(layout);
    dragged_node_.reset();
}

PositionMap GraphManager::Tick(float dt) {
    return layout_->Step(dt);
}

void GraphManager::BeginDrag(const std::string& node_id) {
    ImVec2 current = layout_->PositionOf(node_id);
    layout_->Reheat(layout_params_.drag_reheat_alpha);
    layout_->Pin(node_id, current.x, current.y);
    dragged_node_ = node_id;
}

void GraphManager::DragTo(const std::string& node_id, const ImVec2& world_pos) {
    layout_->Pin(node_id, world_pos.x, world_pos.y);
}

void GraphManager::DragToScreen(const std::string& node_id, const ImVec2& screen_pos) {
    DragTo(node_id, render::CameraUtils::ScreenToWorld(screen_pos, layout_->GetViewState()));
}

void GraphManager::EndDrag(const std::string& node_id) {
    layout_->Unpin(node_id);
    if (dragged_node_ && *dragged_node_ == node_id) {
        dragged_node_.reset();
    }
}

std::optional<std::string> GraphManager::HitTest(const ImVec2& screen_pos) const {
    const GraphViewState& view = layout_->GetViewState();
    // Later nodes are drawn on top, so search back to front.
    for (auto it = snapshot_.nodes.rbegin(); it != snapshot_.nodes.rend(); ++it) {
        ImVec2 center = render::CameraUtils::WorldToScreen(layout_->PositionOf(it->id), view);
        float radius = NodeRadius(it->kind) * view.zoom_scale;
        float dx = screen_pos.x - center.x;
        float dy = screen_pos.y - center.y;
        if (dx * dx + dy * dy <= radius * radius) {
            return it->id;
        }
    }
    return std::nullopt;
}

void GraphManager::Select(const std::string& node_id) {
    layout_->SelectNode(node_id);
}

void GraphManager::ClearSelection() {
    layout_->ClearSelection();
}

std::optional<GraphNode> GraphManager::SelectedNode() const {
    std::optional<std::string> selected = layout_->SelectedNode();
    if (!selected) return std::nullopt;
    const GraphNode* node = snapshot_.FindNode(*selected);
    if (!node) return std::nullopt;
    return *node;
}

const GraphViewState& GraphManager::ZoomAt(const ImVec2& screen_pointer, float wheel) {
    GraphViewState view = layout_->GetViewState();
    render::CameraUtils::ZoomAt(view, screen_pointer, render::CameraUtils::WheelZoomFactor(wheel),
                                layout_params_.min_zoom, layout_params_.max_zoom);
    return layout_->SetViewTransform(view.zoom_scale, view.pan_offset.x, view.pan_offset.y);
}

const GraphViewState& GraphManager::SetViewTransform(float scale, float translate_x, float translate_y) {
    return layout_->SetViewTransform(scale, translate_x, translate_y);
}

const GraphViewState& GraphManager::GetViewState() const {
    return layout_->GetViewState();
}

render::DrawList GraphManager::BuildFrame() const {
    return render::BuildDrawList(snapshot_, layout_->Positions(), layout_->GetViewState());
}

nlohmann::json GraphManager::ExportJson(bool include_positions) const {
    if (!include_positions) {
        return SnapshotToJson(snapshot_);
    }
    PositionMap positions = layout_->Positions();
    return SnapshotToJson(snapshot_, &positions);
}

} // namespace graph
} // namespace oceangraph
