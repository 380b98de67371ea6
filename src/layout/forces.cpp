#include <oceangraph/layout/forces.h>
#include <algorithm>
#include <cmath>

namespace oceangraph {
namespace layout {

namespace {
// Tiny random offset used to separate exactly coincident points.
float Jiggle(std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(-0.5f, 0.5f);
    return dist(rng) * 1e-6f;
}
} // end anonymous namespace

// --- LinkForce -------------------------------------------------------------

LinkForce::LinkForce(float distance, int iterations, float weight_ceiling, unsigned seed)
    : distance_(distance),
      iterations_(std::max(1, iterations)),
      weight_ceiling_(std::max(1e-3f, weight_ceiling)),
      rng_(seed) {}

void LinkForce::Initialize(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links) {
    std::vector<int> degree(nodes.size(), 0);
    for (const auto& link : links) {
        ++degree[static_cast<size_t>(link.source)];
        ++degree[static_cast<size_t>(link.target)];
    }

    strengths_.assign(links.size(), 0.0f);
    biases_.assign(links.size(), 0.5f);
    for (size_t k = 0; k < links.size(); ++k) {
        int ds = degree[static_cast<size_t>(links[k].source)];
        int dt = degree[static_cast<size_t>(links[k].target)];
        float weight = std::max(0.0f, std::min(weight_ceiling_, links[k].weight));
        float stiffness = 0.5f + 0.5f * weight / weight_ceiling_;
        strengths_[k] = stiffness / static_cast<float>(std::min(ds, dt));
        biases_[k] = static_cast<float>(ds) / static_cast<float>(ds + dt);
    }
}

void LinkForce::Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
                      float alpha, std::vector<ImVec2>& displacement) {
    delta_.assign(nodes.size(), ImVec2(0.0f, 0.0f));

    for (int iteration = 0; iteration < iterations_; ++iteration) {
        for (size_t k = 0; k < links.size(); ++k) {
            size_t s = static_cast<size_t>(links[k].source);
            size_t t = static_cast<size_t>(links[k].target);
            const NodeState& source = nodes[s];
            const NodeState& target = nodes[t];

            float dx = (target.position.x + target.velocity.x + delta_[t].x) -
                       (source.position.x + source.velocity.x + delta_[s].x);
            float dy = (target.position.y + target.velocity.y + delta_[t].y) -
                       (source.position.y + source.velocity.y + delta_[s].y);
            if (dx == 0.0f) dx = Jiggle(rng_);
            if (dy == 0.0f) dy = Jiggle(rng_);

            float length = std::sqrt(dx * dx + dy * dy);
            float scale = (length - distance_) / length * alpha * strengths_[k];
            dx *= scale;
            dy *= scale;

            float bias = biases_[k];
            delta_[t].x -= dx * bias;
            delta_[t].y -= dy * bias;
            delta_[s].x += dx * (1.0f - bias);
            delta_[s].y += dy * (1.0f - bias);
        }
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        displacement[i].x += delta_[i].x;
        displacement[i].y += delta_[i].y;
    }
}

// --- ManyBodyForce ---------------------------------------------------------

ManyBodyForce::ManyBodyForce(float strength, float theta, float distance_min, size_t exact_below, unsigned seed)
    : strength_(strength),
      theta2_(theta * theta),
      distance_min2_(distance_min * distance_min),
      exact_below_(exact_below),
      rng_(seed) {}

void ManyBodyForce::Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
                          float alpha, std::vector<ImVec2>& displacement) {
    (void)links;
    if (nodes.size() < 2) return;
    if (nodes.size() < exact_below_) {
        ApplyExact(nodes, alpha, displacement);
    } else {
        ApplyApproximate(nodes, alpha, displacement);
    }
}

void ManyBodyForce::ApplyExact(const std::vector<NodeState>& nodes, float alpha, std::vector<ImVec2>& displacement) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = 0; j < nodes.size(); ++j) {
            if (i == j) continue;
            float dx = nodes[j].position.x - nodes[i].position.x;
            float dy = nodes[j].position.y - nodes[i].position.y;
            if (dx == 0.0f) dx = Jiggle(rng_);
            if (dy == 0.0f) dy = Jiggle(rng_);
            float l = dx * dx + dy * dy;
            if (l < distance_min2_) l = std::sqrt(distance_min2_ * l);
            displacement[i].x += dx * strength_ * alpha / l;
            displacement[i].y += dy * strength_ * alpha / l;
        }
    }
}

void ManyBodyForce::ApplyApproximate(const std::vector<NodeState>& nodes, float alpha, std::vector<ImVec2>& displacement) {
    positions_.resize(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        positions_[i] = nodes[i].position;
    }
    charges_.assign(nodes.size(), strength_);
    tree_.Build(positions_, charges_);

    for (size_t i = 0; i < nodes.size(); ++i) {
        const ImVec2 p = positions_[i];
        ImVec2& out = displacement[i];

        tree_.Visit([&](const QuadTree::Quad& quad) {
            if (quad.count == 0) return true;

            if (!quad.IsLeaf()) {
                float dx = quad.centroid.x - p.x;
                float dy = quad.centroid.y - p.y;
                float l = dx * dx + dy * dy;
                bool contains_self = p.x >= quad.min.x && p.x <= quad.min.x + quad.size &&
                                     p.y >= quad.min.y && p.y <= quad.min.y + quad.size;
                // Far enough away: treat the whole quad as one charge.
                if (!contains_self && quad.size * quad.size / theta2_ < l) {
                    if (l < distance_min2_) l = std::sqrt(distance_min2_ * l);
                    out.x += dx * quad.charge * alpha / l;
                    out.y += dy * quad.charge * alpha / l;
                    return true;
                }
                return false;
            }

            for (int j : quad.points) {
                if (static_cast<size_t>(j) == i) continue;
                float dx = positions_[static_cast<size_t>(j)].x - p.x;
                float dy = positions_[static_cast<size_t>(j)].y - p.y;
                if (dx == 0.0f) dx = Jiggle(rng_);
                if (dy == 0.0f) dy = Jiggle(rng_);
                float l = dx * dx + dy * dy;
                if (l < distance_min2_) l = std::sqrt(distance_min2_ * l);
                float c = charges_[static_cast<size_t>(j)];
                out.x += dx * c * alpha / l;
                out.y += dy * c * alpha / l;
            }
            return true;
        });
    }
}

// --- CenterForce -----------------------------------------------------------

CenterForce::CenterForce(const ImVec2& center, float strength)
    : center_(center), strength_(strength) {}

void CenterForce::Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
                        float alpha, std::vector<ImVec2>& displacement) {
    (void)links;
    if (nodes.empty()) return;

    float sx = 0.0f, sy = 0.0f;
    for (const auto& node : nodes) {
        sx += node.position.x;
        sy += node.position.y;
    }
    float n = static_cast<float>(nodes.size());
    float shift_x = (center_.x - sx / n) * strength_ * alpha;
    float shift_y = (center_.y - sy / n) * strength_ * alpha;

    for (auto& d : displacement) {
        d.x += shift_x;
        d.y += shift_y;
    }
}

// --- CollideForce ----------------------------------------------------------

CollideForce::CollideForce(float margin, float strength, int iterations, unsigned seed)
    : margin_(margin),
      strength_(strength),
      iterations_(std::max(1, iterations)),
      max_radius_(0.0f),
      spatial_hash_(1.0f),
      rng_(seed) {}

void CollideForce::Initialize(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links) {
    (void)links;
    max_radius_ = 0.0f;
    for (const auto& node : nodes) {
        max_radius_ = std::max(max_radius_, node.radius + margin_);
    }
    spatial_hash_ = SpatialHash(2.0f * max_radius_);
}

void CollideForce::Apply(const std::vector<NodeState>& nodes, const std::vector<LayoutLink>& links,
                         float alpha, std::vector<ImVec2>& displacement) {
    (void)links;
    (void)alpha;
    if (nodes.size() < 2) return;

    delta_.assign(nodes.size(), ImVec2(0.0f, 0.0f));
    predicted_.resize(nodes.size());

    for (int iteration = 0; iteration < iterations_; ++iteration) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            predicted_[i] = ImVec2(nodes[i].position.x + nodes[i].velocity.x + delta_[i].x,
                                   nodes[i].position.y + nodes[i].velocity.y + delta_[i].y);
        }
        spatial_hash_.Insert(predicted_);

        for (size_t i = 0; i < nodes.size(); ++i) {
            float ri = nodes[i].radius + margin_;
            float ri2 = ri * ri;
            std::vector<int> neighbours = spatial_hash_.Query(predicted_[i], ri + max_radius_);

            for (int j_index : neighbours) {
                size_t j = static_cast<size_t>(j_index);
                if (j <= i) continue;

                float rj = nodes[j].radius + margin_;
                float r = ri + rj;
                float dx = predicted_[i].x - predicted_[j].x;
                float dy = predicted_[i].y - predicted_[j].y;
                float l = dx * dx + dy * dy;
                if (l >= r * r) continue;

                if (dx == 0.0f) { dx = Jiggle(rng_); l += dx * dx; }
                if (dy == 0.0f) { dy = Jiggle(rng_); l += dy * dy; }
                l = std::sqrt(l);
                float push = (r - l) / l * strength_;
                dx *= push;
                dy *= push;

                float rj2 = rj * rj;
                float share = rj2 / (ri2 + rj2);
                delta_[i].x += dx * share;
                delta_[i].y += dy * share;
                delta_[j].x -= dx * (1.0f - share);
                delta_[j].y -= dy * (1.0f - share);
            }
        }
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        displacement[i].x += delta_[i].x;
        displacement[i].y += delta_[i].y;
    }
}

} // namespace layout
} // namespace oceangraph
