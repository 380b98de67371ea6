#ifndef OCEANGRAPH_LAYOUT_FORCE_DIRECTED_LAYOUT_H
#define OCEANGRAPH_LAYOUT_FORCE_DIRECTED_LAYOUT_H

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <imgui.h>
#include <oceangraph/graph/graph_types.h>
#include <oceangraph/layout/forces.h>

namespace oceangraph {
namespace layout {

/*
 * Cooling force simulation over one graph snapshot.
 *
 * Each Step applies the link, charge, centering and collision forces (in that
 * order) into a shared displacement buffer, integrates velocities and
 * positions, then decays alpha by (1 - alpha_decay). Once alpha drops below
 * alpha_min the layout is converged and Step returns the last positions
 * unchanged; Reheat is the only way back.
 *
 * The engine is the only writer of node positions. Callers see copies.
 */
class ForceDirectedLayout {
public:
    struct LayoutParams {
        ImVec2 canvas_size;
        float link_distance;
        int link_iterations;
        float link_weight_ceiling;     // Weight at which links reach full stiffness
        float charge_strength;
        float charge_theta;
        float charge_distance_min;
        int exact_charge_below;        // Node count below which charge is computed pairwise
        float center_strength;
        float collision_margin;
        float collision_strength;
        int collision_iterations;
        float alpha_initial;
        float alpha_min;
        float alpha_decay;
        float velocity_decay;
        float min_zoom;
        float max_zoom;
        float drag_reheat_alpha;
        float initial_radius;
        unsigned random_seed;

        LayoutParams();
        ImVec2 CanvasCenter() const { return ImVec2(canvas_size.x * 0.5f, canvas_size.y * 0.5f); }
    };

    // Throws std::invalid_argument if an edge references a node that is not in
    // the snapshot, or if the parameters cannot converge.
    explicit ForceDirectedLayout(const graph::GraphSnapshot& snapshot,
                                 const LayoutParams& params = LayoutParams());

    ForceDirectedLayout(const ForceDirectedLayout&) = delete;
    ForceDirectedLayout& operator=(const ForceDirectedLayout&) = delete;

    // Advances one tick; dt scales the position update. No-op once converged.
    graph::PositionMap Step(float dt = 1.0f);

    // Pins a node at exactly (x, y) until Unpin. Takes effect immediately.
    void Pin(const std::string& node_id, float x, float y);
    void Unpin(const std::string& node_id);
    bool IsPinned(const std::string& node_id) const;

    // Raises alpha to at least `alpha`; positions and velocities are untouched.
    void Reheat(float alpha);

    // Replaces the pan/zoom transform; zoom is clamped to [min_zoom, max_zoom].
    const graph::GraphViewState& SetViewTransform(float scale, float translate_x, float translate_y);
    const graph::GraphViewState& GetViewState() const { return view_state_; }

    void SelectNode(const std::string& node_id);
    void ClearSelection();
    std::optional<std::string> SelectedNode() const { return view_state_.selected_node_id; }

    graph::PositionMap Positions() const;
    ImVec2 PositionOf(const std::string& node_id) const;
    ImVec2 VelocityOf(const std::string& node_id) const;

    float Alpha() const { return alpha_; }
    bool IsConverged() const;
    bool IsRunning() const { return !IsConverged(); }
    int TickCount() const { return tick_count_; }
    size_t NodeCount() const { return nodes_.size(); }
    const LayoutParams& GetParams() const { return params_; }

private:
    size_t IndexOf(const std::string& node_id) const;

    LayoutParams params_;
    std::vector<NodeState> nodes_;
    std::vector<LayoutLink> links_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::unique_ptr<Force>> forces_;
    std::vector<ImVec2> displacement_;
    float alpha_;
    int tick_count_ = 0;
    graph::GraphViewState view_state_;
    friend struct ForceDirectedLayoutDetail;
};

} // namespace layout
} // namespace oceangraph

#endif // OCEANGRAPH_LAYOUT_FORCE_DIRECTED_LAYOUT_H
