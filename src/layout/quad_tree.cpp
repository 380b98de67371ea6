#include <oceangraph/layout/quad_tree.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace oceangraph {
namespace layout {

void QuadTree::Build(const std::vector<ImVec2>& positions, const std::vector<float>& charges) {
    if (positions.size() != charges.size()) {
        throw std::invalid_argument("QuadTree::Build: positions and charges differ in length");
    }
    quads_.clear();
    positions_ = &positions;
    charges_ = &charges;
    if (positions.empty()) return;

    float min_x = positions[0].x, max_x = positions[0].x;
    float min_y = positions[0].y, max_y = positions[0].y;
    for (const auto& p : positions) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    Quad root;
    root.min = ImVec2(min_x, min_y);
    root.size = std::max(1.0f, std::max(max_x - min_x, max_y - min_y));
    quads_.reserve(positions.size() * 2 + 1);
    quads_.push_back(root);

    for (size_t i = 0; i < positions.size(); ++i) {
        Insert(0, static_cast<int>(i), 0);
    }
    Accumulate(0);
}

int QuadTree::ChildFor(int quad_index, const ImVec2& p) {
    const Quad& quad = quads_[static_cast<size_t>(quad_index)];
    float half = quad.size * 0.5f;
    int slot = (p.x >= quad.min.x + half ? 1 : 0) + (p.y >= quad.min.y + half ? 2 : 0);
    return quad.children[slot];
}

void QuadTree::Insert(int quad_index, int point, int depth) {
    const std::vector<ImVec2>& positions = *positions_;
    const ImVec2& p = positions[static_cast<size_t>(point)];

    if (!quads_[static_cast<size_t>(quad_index)].IsLeaf()) {
        Insert(ChildFor(quad_index, p), point, depth + 1);
        return;
    }

    std::vector<int>& points = quads_[static_cast<size_t>(quad_index)].points;
    if (points.empty() || depth >= kMaxDepth) {
        points.push_back(point);
        return;
    }
    const ImVec2& first = positions[static_cast<size_t>(points.front())];
    if (first.x == p.x && first.y == p.y) {
        points.push_back(point);
        return;
    }

    // Split the leaf and push its residents one level down.
    std::vector<int> residents = std::move(points);
    quads_[static_cast<size_t>(quad_index)].points.clear();

    ImVec2 origin = quads_[static_cast<size_t>(quad_index)].min;
    float half = quads_[static_cast<size_t>(quad_index)].size * 0.5f;
    for (int slot = 0; slot < 4; ++slot) {
        Quad child;
        child.min = ImVec2(origin.x + ((slot & 1) ? half : 0.0f),
                           origin.y + ((slot & 2) ? half : 0.0f));
        child.size = half;
        quads_.push_back(child);
        quads_[static_cast<size_t>(quad_index)].children[slot] = static_cast<int>(quads_.size() - 1);
    }

    for (int resident : residents) {
        const ImVec2& rp = positions[static_cast<size_t>(resident)];
        Insert(ChildFor(quad_index, rp), resident, depth + 1);
    }
    Insert(ChildFor(quad_index, p), point, depth + 1);
}

void QuadTree::Accumulate(int quad_index) {
    const std::vector<ImVec2>& positions = *positions_;
    const std::vector<float>& charges = *charges_;

    float charge = 0.0f;
    float weight = 0.0f;
    float wx = 0.0f, wy = 0.0f;
    float sx = 0.0f, sy = 0.0f;
    int count = 0;

    Quad& quad = quads_[static_cast<size_t>(quad_index)];
    if (quad.IsLeaf()) {
        for (int point : quad.points) {
            const ImVec2& p = positions[static_cast<size_t>(point)];
            float c = charges[static_cast<size_t>(point)];
            float w = std::abs(c);
            charge += c;
            weight += w;
            wx += p.x * w;
            wy += p.y * w;
            sx += p.x;
            sy += p.y;
            ++count;
        }
    } else {
        std::array<int, 4> children = quad.children;
        for (int child_index : children) {
            Accumulate(child_index);
            const Quad& child = quads_[static_cast<size_t>(child_index)];
            if (child.count == 0) continue;
            float w = std::abs(child.charge);
            charge += child.charge;
            weight += w;
            wx += child.centroid.x * w;
            wy += child.centroid.y * w;
            sx += child.centroid.x * static_cast<float>(child.count);
            sy += child.centroid.y * static_cast<float>(child.count);
            count += child.count;
        }
    }

    Quad& target = quads_[static_cast<size_t>(quad_index)];
    target.charge = charge;
    target.count = count;
    if (count == 0) {
        target.centroid = ImVec2(target.min.x + target.size * 0.5f, target.min.y + target.size * 0.5f);
    } else if (weight > 0.0f) {
        target.centroid = ImVec2(wx / weight, wy / weight);
    } else {
        target.centroid = ImVec2(sx / static_cast<float>(count), sy / static_cast<float>(count));
    }
}

} // namespace layout
} // namespace oceangraph
