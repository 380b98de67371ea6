#include <oceangraph/layout/spatial_hash.h>
#include <cmath>
#include <algorithm>
#include <limits>

namespace oceangraph {
namespace layout {

namespace {
constexpr int64_t kMinCell = static_cast<int64_t>(std::numeric_limits<int32_t>::min()) + 1;
constexpr int64_t kMaxCell = static_cast<int64_t>(std::numeric_limits<int32_t>::max()) - 1;

// Far-away coordinates saturate into the outermost cells.
int64_t CellIndex(float coord, float cell_size) {
    double cell = std::floor(static_cast<double>(coord) / static_cast<double>(cell_size));
    if (std::isnan(cell)) return 0;
    if (cell < static_cast<double>(kMinCell)) return kMinCell;
    if (cell > static_cast<double>(kMaxCell)) return kMaxCell;
    return static_cast<int64_t>(cell);
}
} // end anonymous namespace

SpatialHash::SpatialHash(float cell_size) : cell_size_(std::max(1.0f, cell_size)) {}

void SpatialHash::Insert(const std::vector<ImVec2>& points) {
    buckets_.clear();
    buckets_.reserve(points.size() * 2);

    for (size_t idx = 0; idx < points.size(); ++idx) {
        const ImVec2& p = points[idx];
        int32_t cx = static_cast<int32_t>(CellIndex(p.x, cell_size_));
        int32_t cy = static_cast<int32_t>(CellIndex(p.y, cell_size_));
        buckets_[detail::PackCell(cx, cy)].push_back(static_cast<int>(idx));
    }
    populated_ = true;
}

std::vector<int> SpatialHash::Query(const ImVec2& position, float radius) const {
    if (!populated_) return {};

    std::vector<int> result;
    int64_t center_cx = CellIndex(position.x, cell_size_);
    int64_t center_cy = CellIndex(position.y, cell_size_);

    int64_t search_radius = static_cast<int64_t>(std::ceil(std::max(0.0f, radius) / cell_size_));

    for (int64_t cx = std::max(kMinCell, center_cx - search_radius);
         cx <= std::min(kMaxCell, center_cx + search_radius); ++cx) {
        for (int64_t cy = std::max(kMinCell, center_cy - search_radius);
             cy <= std::min(kMaxCell, center_cy + search_radius); ++cy) {
            uint64_t key = detail::PackCell(static_cast<int32_t>(cx), static_cast<int32_t>(cy));
            auto bucket_it = buckets_.find(key);
            if (bucket_it != buckets_.end()) {
                result.insert(result.end(), bucket_it->second.begin(), bucket_it->second.end());
            }
        }
    }
    return result;
}

} // namespace layout
} // namespace oceangraph
