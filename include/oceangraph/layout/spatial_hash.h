#ifndef OCEANGRAPH_LAYOUT_SPATIAL_HASH_H
#define OCEANGRAPH_LAYOUT_SPATIAL_HASH_H

#include <imgui.h>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace oceangraph {
namespace layout {

namespace detail {
// Pack 2D grid cell coordinates into a 64-bit key for unordered_map buckets
constexpr uint64_t PackCell(int32_t x, int32_t y) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
           static_cast<uint32_t>(y);
}

} // namespace detail

// Uniform grid over point indices, rebuilt every tick for neighbour queries.
class SpatialHash {
public:
    explicit SpatialHash(float cell_size);
    void Insert(const std::vector<ImVec2>& points);
    // Indices of points in cells overlapping the square of half-width `radius`.
    std::vector<int> Query(const ImVec2& position, float radius) const;
    float CellSize() const { return cell_size_; }

private:
    float cell_size_;
    std::unordered_map<uint64_t, std::vector<int>> buckets_;
    bool populated_ = false;
};

} // namespace layout
} // namespace oceangraph

#endif // OCEANGRAPH_LAYOUT_SPATIAL_HASH_H
