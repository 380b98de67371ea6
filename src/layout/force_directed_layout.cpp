#include <oceangraph/layout/force_directed_layout.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace oceangraph {
namespace layout {

namespace {
constexpr float kPi = 3.14159265358979f;
// Golden-angle increment for the initial spiral placement.
const float kInitialAngle = kPi * (3.0f - std::sqrt(5.0f));

bool IsFinite(float v) {
    return std::isfinite(v);
}
} // end anonymous namespace

struct ForceDirectedLayoutDetail {
    static void ValidateParams(const ForceDirectedLayout::LayoutParams& params) {
        if (!(params.alpha_decay > 0.0f && params.alpha_decay < 1.0f)) {
            throw std::invalid_argument("alpha_decay must lie in (0, 1)");
        }
        if (!(params.alpha_min > 0.0f)) {
            throw std::invalid_argument("alpha_min must be positive");
        }
        if (!(params.velocity_decay >= 0.0f && params.velocity_decay <= 1.0f)) {
            throw std::invalid_argument("velocity_decay must lie in [0, 1]");
        }
        if (!(params.min_zoom > 0.0f && params.min_zoom <= params.max_zoom)) {
            throw std::invalid_argument("zoom range must be positive and ordered");
        }
    }

    static void BuildNodesAndLinks(ForceDirectedLayout& layout, const graph::GraphSnapshot& snapshot) {
        layout.nodes_.reserve(snapshot.nodes.size());
        for (const auto& node : snapshot.nodes) {
            if (layout.index_.count(node.id) != 0) {
                throw std::invalid_argument("Duplicate node id in snapshot: " + node.id);
            }
            layout.index_[node.id] = layout.nodes_.size();
            NodeState state;
            state.id = node.id;
            state.kind = node.kind;
            state.position = ImVec2(0.0f, 0.0f);
            state.velocity = ImVec2(0.0f, 0.0f);
            state.radius = graph::NodeRadius(node.kind);
            layout.nodes_.push_back(state);
        }

        layout.links_.reserve(snapshot.edges.size());
        for (const auto& edge : snapshot.edges) {
            auto source_it = layout.index_.find(edge.source_id);
            auto target_it = layout.index_.find(edge.target_id);
            if (source_it == layout.index_.end() || target_it == layout.index_.end()) {
                throw std::invalid_argument("Dangling edge reference: " + edge.source_id + " -> " + edge.target_id);
            }
            layout.links_.push_back(LayoutLink{static_cast<int>(source_it->second),
                                               static_cast<int>(target_it->second),
                                               edge.weight});
        }
    }

    // Sunflower spiral around the canvas centre.
    static void InitializePositions(ForceDirectedLayout& layout) {
        const ImVec2 center = layout.params_.CanvasCenter();
        for (size_t i = 0; i < layout.nodes_.size(); ++i) {
            float radius = layout.params_.initial_radius * std::sqrt(0.5f + static_cast<float>(i));
            float angle = static_cast<float>(i) * kInitialAngle;
            layout.nodes_[i].position = ImVec2(center.x + radius * std::cos(angle),
                                               center.y + radius * std::sin(angle));
        }
    }

    static void BuildForces(ForceDirectedLayout& layout) {
        const auto& p = layout.params_;
        layout.forces_.push_back(std::make_unique<LinkForce>(
            p.link_distance, p.link_iterations, p.link_weight_ceiling, p.random_seed));
        layout.forces_.push_back(std::make_unique<ManyBodyForce>(
            p.charge_strength, p.charge_theta, p.charge_distance_min,
            static_cast<size_t>(std::max(0, p.exact_charge_below)), p.random_seed + 1));
        layout.forces_.push_back(std::make_unique<CenterForce>(p.CanvasCenter(), p.center_strength));
        layout.forces_.push_back(std::make_unique<CollideForce>(
            p.collision_margin, p.collision_strength, p.collision_iterations, p.random_seed + 2));

        for (auto& force : layout.forces_) {
            force->Initialize(layout.nodes_, layout.links_);
        }
    }

    static void Integrate(ForceDirectedLayout& layout, float dt) {
        const float retain = 1.0f - layout.params_.velocity_decay;
        for (size_t i = 0; i < layout.nodes_.size(); ++i) {
            NodeState& node = layout.nodes_[i];
            if (node.pin) {
                node.position = *node.pin;
                node.velocity = ImVec2(0.0f, 0.0f);
                continue;
            }
            node.velocity.x = (node.velocity.x + layout.displacement_[i].x) * retain;
            node.velocity.y = (node.velocity.y + layout.displacement_[i].y) * retain;
            node.position.x += node.velocity.x * dt;
            node.position.y += node.velocity.y * dt;
        }
    }
};

ForceDirectedLayout::LayoutParams::LayoutParams()
    : canvas_size(800.0f, 600.0f),
      link_distance(100.0f),
      link_iterations(1),
      link_weight_ceiling(10.0f),
      charge_strength(-300.0f),
      charge_theta(0.9f),
      charge_distance_min(1.0f),
      exact_charge_below(64),
      center_strength(0.1f),
      collision_margin(18.0f),
      collision_strength(0.7f),
      collision_iterations(1),
      alpha_initial(1.0f),
      alpha_min(0.001f),
      alpha_decay(0.0228f),
      velocity_decay(0.4f),
      min_zoom(0.1f),
      max_zoom(4.0f),
      drag_reheat_alpha(0.3f),
      initial_radius(10.0f),
      random_seed(123) {}

ForceDirectedLayout::ForceDirectedLayout(const graph::GraphSnapshot& snapshot, const LayoutParams& params)
    : params_(params), alpha_(params.alpha_initial) {
    ForceDirectedLayoutDetail::ValidateParams(params_);
    ForceDirectedLayoutDetail::BuildNodesAndLinks(*this, snapshot);
    ForceDirectedLayoutDetail::InitializePositions(*this);
    ForceDirectedLayoutDetail::BuildForces(*this);
    displacement_.assign(nodes_.size(), ImVec2(0.0f, 0.0f));
}

graph::PositionMap ForceDirectedLayout::Step(float dt) {
    if (!(dt > 0.0f) || !IsFinite(dt)) {
        throw std::invalid_argument("Step requires a positive, finite dt");
    }
    if (IsConverged()) {
        return Positions();
    }

    std::fill(displacement_.begin(), displacement_.end(), ImVec2(0.0f, 0.0f));
    for (auto& force : forces_) {
        force->Apply(nodes_, links_, alpha_, displacement_);
    }
    ForceDirectedLayoutDetail::Integrate(*this, dt);

    alpha_ *= (1.0f - params_.alpha_decay);
    ++tick_count_;
    return Positions();
}

void ForceDirectedLayout::Pin(const std::string& node_id, float x, float y) {
    if (!IsFinite(x) || !IsFinite(y)) {
        throw std::invalid_argument("Pin coordinates must be finite");
    }
    NodeState& node = nodes_[IndexOf(node_id)];
    node.pin = ImVec2(x, y);
    node.position = ImVec2(x, y);
    node.velocity = ImVec2(0.0f, 0.0f);
}

void ForceDirectedLayout::Unpin(const std::string& node_id) {
    nodes_[IndexOf(node_id)].pin.reset();
}

bool ForceDirectedLayout::IsPinned(const std::string& node_id) const {
    return nodes_[IndexOf(node_id)].pin.has_value();
}

void ForceDirectedLayout::Reheat(float alpha) {
    if (!(alpha > 0.0f) || !IsFinite(alpha)) {
        throw std::invalid_argument("Reheat requires a positive, finite alpha");
    }
    alpha_ = std::max(alpha_, alpha);
}

const graph::GraphViewState& ForceDirectedLayout::SetViewTransform(float scale, float translate_x, float translate_y) {
    if (!IsFinite(scale) || !IsFinite(translate_x) || !IsFinite(translate_y)) {
        throw std::invalid_argument("View transform components must be finite");
    }
    view_state_.zoom_scale = std::max(params_.min_zoom, std::min(params_.max_zoom, scale));
    view_state_.pan_offset = ImVec2(translate_x, translate_y);
    return view_state_;
}

void ForceDirectedLayout::SelectNode(const std::string& node_id) {
    IndexOf(node_id);
    view_state_.selected_node_id = node_id;
}

void ForceDirectedLayout::ClearSelection() {
    view_state_.selected_node_id.reset();
}

graph::PositionMap ForceDirectedLayout::Positions() const {
    graph::PositionMap positions;
    for (const auto& node : nodes_) {
        positions.emplace(node.id, node.position);
    }
    return positions;
}

ImVec2 ForceDirectedLayout::PositionOf(const std::string& node_id) const {
    return nodes_[IndexOf(node_id)].position;
}

ImVec2 ForceDirectedLayout::VelocityOf(const std::string& node_id) const {
    return nodes_[IndexOf(node_id)].velocity;
}

bool ForceDirectedLayout::IsConverged() const {
    return nodes_.empty() || alpha_ < params_.alpha_min;
}

size_t ForceDirectedLayout::IndexOf(const std::string& node_id) const {
    auto it = index_.find(node_id);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown node id: " + node_id);
    }
    return it->second;
}

} // namespace layout
} // namespace oceangraph
