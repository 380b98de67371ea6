#ifndef OCEANGRAPH_LAYOUT_QUAD_TREE_H
#define OCEANGRAPH_LAYOUT_QUAD_TREE_H

#include <imgui.h>
#include <array>
#include <cstddef>
#include <vector>

namespace oceangraph {
namespace layout {

/*
 * Region quad-tree used for the Barnes-Hut approximation of many-body forces.
 *
 * Every quad aggregates the total charge and the charge-weighted centroid of
 * the points below it. Points that coincide (or that reach kMaxDepth) share a
 * leaf instead of subdividing further.
 */
class QuadTree {
public:
    struct Quad {
        ImVec2 min;                 // Top-left corner
        float size = 0.0f;          // Side length of the square cell
        ImVec2 centroid;            // Charge-weighted centre of the points below
        float charge = 0.0f;        // Sum of charges below
        int count = 0;              // Number of points below
        std::array<int, 4> children{{-1, -1, -1, -1}};
        std::vector<int> points;    // Only populated for leaves

        bool IsLeaf() const {
            return children[0] < 0 && children[1] < 0 && children[2] < 0 && children[3] < 0;
        }
    };

    static constexpr int kMaxDepth = 24;

    QuadTree() = default;

    // Rebuilds the tree over `positions`; `charges` must have the same length.
    void Build(const std::vector<ImVec2>& positions, const std::vector<float>& charges);

    bool Empty() const { return quads_.empty(); }
    const Quad& Root() const { return quads_.front(); }
    const Quad& At(int index) const { return quads_[static_cast<size_t>(index)]; }
    size_t QuadCount() const { return quads_.size(); }

    // Pre-order traversal. The visitor returns true to skip a quad's children.
    template <typename Visitor>
    void Visit(Visitor&& visitor) const {
        if (quads_.empty()) return;
        std::vector<int> stack{0};
        while (!stack.empty()) {
            int index = stack.back();
            stack.pop_back();
            const Quad& quad = quads_[static_cast<size_t>(index)];
            if (visitor(quad)) continue;
            for (int c = 3; c >= 0; --c) {
                if (quad.children[c] >= 0) stack.push_back(quad.children[c]);
            }
        }
    }

private:
    void Insert(int quad_index, int point, int depth);
    int ChildFor(int quad_index, const ImVec2& p);
    void Accumulate(int quad_index);

    std::vector<Quad> quads_;
    const std::vector<ImVec2>* positions_ = nullptr;
    const std::vector<float>* charges_ = nullptr;
};

} // namespace layout
} // namespace oceangraph

#endif // OCEANGRAPH_LAYOUT_QUAD_TREE_H
