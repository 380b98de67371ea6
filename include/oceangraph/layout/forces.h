#ifndef OCEANGRAPH_LAYOUT_FORCES_H
#define OCEANGRAPH_LAYOUT_FORCES_H

#include <optional>
#include <random>
#include <string>
#include <vector>
#include <imgui.h>
#include <oceangraph/graph/graph_types.h>
#include <oceangraph/layout/quad_tree.h>
#include <oceangraph/layout/spatial_hash.h>

namespace oceangraph {
namespace layout {

// Layout-time state of one node. Owned by ForceDirectedLayout.
struct NodeState {
    std::string id;
    graph::NodeKind kind;
    ImVec2 position;
    ImVec2 velocity;
    std::optional<ImVec2> pin;  // Free when empty, PinnedAt(x, y) otherwise
    float radius;               // Drawn radius for the node's kind
};

// Edge resolved to node indices.
struct LayoutLink {
    int source;
    int target;
    float weight;
};

/*
 * One contribution to the per-tick displacement.
 * Forces read the start-of-tick node state and add velocity deltas into
 * `displacement` (one entry per node); they never write node state.
 */
class Force {
public:
    virtual ~Force() = default;

    // Called once after the node and link sets are known.
    virtual void Initialize(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links) {
        (void)nodes;
        (void)links;
    }

    virtual void Apply(const std::vector<NodeState>& nodes,
                       const std::vector<LayoutLink>& links,
                       float alpha,
                       std::vector<ImVec2>& displacement) = 0;
};

// Springs toward a rest distance; stiffer for heavier edges and for edges
// touching low-degree nodes.
class LinkForce : public Force {
public:
    LinkForce(float distance, int iterations, float weight_ceiling, unsigned seed);

    void Initialize(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links) override;
    void Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
               float alpha, std::vector<ImVec2>& displacement) override;

    float StrengthOf(size_t link_index) const { return strengths_[link_index]; }

private:
    float distance_;
    int iterations_;
    float weight_ceiling_;
    std::vector<float> strengths_;
    std::vector<float> biases_;
    std::vector<ImVec2> delta_;
    std::mt19937 rng_;
};

// Pairwise charge. Exact below `exact_below` nodes, Barnes-Hut above.
class ManyBodyForce : public Force {
public:
    ManyBodyForce(float strength, float theta, float distance_min, size_t exact_below, unsigned seed);

    void Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
               float alpha, std::vector<ImVec2>& displacement) override;

private:
    void ApplyExact(const std::vector<NodeState>& nodes, float alpha, std::vector<ImVec2>& displacement);
    void ApplyApproximate(const std::vector<NodeState>& nodes, float alpha, std::vector<ImVec2>& displacement);

    float strength_;
    float theta2_;
    float distance_min2_;
    size_t exact_below_;
    QuadTree tree_;
    std::vector<ImVec2> positions_;
    std::vector<float> charges_;
    std::mt19937 rng_;
};

// Moves the centroid toward a fixed point.
class CenterForce : public Force {
public:
    CenterForce(const ImVec2& center, float strength);

    void Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
               float alpha, std::vector<ImVec2>& displacement) override;

private:
    ImVec2 center_;
    float strength_;
};

// Pushes overlapping circles apart. Radius is the node radius plus `margin`.
// Acts as a constraint, so its strength is independent of alpha.
class CollideForce : public Force {
public:
    CollideForce(float margin, float strength, int iterations, unsigned seed);

    void Initialize(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links) override;
    void Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
               float alpha, std::vector<ImVec2>& displacement) override;

private:
    float margin_;
    float strength_;
    int iterations_;
    float max_radius_;
    SpatialHash spatial_hash_;
    std::vector<ImVec2> predicted_;
    std::vector<ImVec2> delta_;
    std::mt19937 rng_;
};

} // namespace layout
} // namespace oceangraph

#endif // OCEANGRAPH_LAYOUT_FORCES_H
