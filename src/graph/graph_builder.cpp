#include <oceangraph/graph/graph_builder.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace oceangraph {
namespace graph {

namespace {

constexpr size_t kYearMonthLength = 7;

// Running sums of every catalog field for one region.
struct RegionAccumulator {
    std::map<std::string, double> sums;
    size_t count = 0;

    void Add(const MeasurementRecord& record) {
        for (const auto& field : ParameterFields()) {
            sums[field] += FieldValue(record, field);
        }
        for (const auto& field : BiologyFields()) {
            sums[field] += FieldValue(record, field);
        }
        ++count;
    }

    double Mean(const std::string& field) const {
        auto it = sums.find(field);
        if (it == sums.end() || count == 0) return 0.0;
        return it->second / static_cast<double>(count);
    }
};

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // end anonymous namespace

GraphBuilder::BuilderParams::BuilderParams()
    : parameter_scale(10.0),
      biology_scale(100.0),
      min_weight(0.1f),
      max_weight(10.0f) {}

GraphBuilder::GraphBuilder(const BuilderParams& params) : params_(params) {
    if (params_.parameter_scale == 0.0 || params_.biology_scale == 0.0) {
        throw std::invalid_argument("Builder scale constants must be non-zero");
    }
    if (params_.min_weight > params_.max_weight) {
        throw std::invalid_argument("Builder min_weight exceeds max_weight");
    }
}

std::string YearMonthOf(const std::string& date) {
    if (date.size() < kYearMonthLength) {
        throw std::invalid_argument("Date too short for a YYYY-MM token: '" + date + "'");
    }
    for (size_t i = 0; i < kYearMonthLength; ++i) {
        bool ok = (i == 4) ? date[i] == '-' : IsDigit(date[i]);
        if (!ok) {
            throw std::invalid_argument("Date does not start with YYYY-MM: '" + date + "'");
        }
    }
    int month = (date[5] - '0') * 10 + (date[6] - '0');
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range in date: '" + date + "'");
    }
    return date.substr(0, kYearMonthLength);
}

float GraphBuilder::ClampWeight(double value) const {
    double clamped = std::max(static_cast<double>(params_.min_weight),
                              std::min(static_cast<double>(params_.max_weight), value));
    return static_cast<float>(clamped);
}

GraphSnapshot GraphBuilder::Build(const std::vector<MeasurementRecord>& records) const {
    GraphSnapshot snapshot;
    if (records.empty()) {
        return snapshot;
    }

    // Single pass over the input: first-occurrence orders, per-region sums and
    // the deduplicated (month, region) pairs grouped by month.
    std::vector<std::string> region_order;
    std::map<std::string, RegionAccumulator> region_stats;
    std::vector<std::string> month_order;
    std::map<std::string, std::vector<std::string>> month_regions;
    std::set<std::pair<std::string, std::string>> seen_pairs;

    for (size_t i = 0; i < records.size(); ++i) {
        const MeasurementRecord& record = records[i];
        std::string month;
        try {
            month = YearMonthOf(record.date);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("Record " + std::to_string(i) + ": " + e.what());
        }

        auto stats_it = region_stats.find(record.region);
        if (stats_it == region_stats.end()) {
            region_order.push_back(record.region);
            stats_it = region_stats.emplace(record.region, RegionAccumulator()).first;
        }
        stats_it->second.Add(record);

        if (month_regions.find(month) == month_regions.end()) {
            month_order.push_back(month);
            month_regions[month];
        }
        if (seen_pairs.insert(std::make_pair(month, record.region)).second) {
            month_regions[month].push_back(record.region);
        }
    }

    // Nodes first so every edge below refers to an existing id.
    for (const auto& region : region_order) {
        snapshot.nodes.emplace_back(NodeKind::Region, region);
    }
    for (const auto& field : ParameterFields()) {
        snapshot.nodes.emplace_back(NodeKind::Parameter, field);
    }
    for (const auto& field : BiologyFields()) {
        snapshot.nodes.emplace_back(NodeKind::Biology, field);
    }
    for (const auto& month : month_order) {
        snapshot.nodes.emplace_back(NodeKind::TimePeriod, month);
    }

    for (const auto& region : region_order) {
        const RegionAccumulator& stats = region_stats.at(region);
        const std::string region_id = MakeNodeId(NodeKind::Region, region);

        for (const auto& field : ParameterFields()) {
            snapshot.edges.push_back(GraphEdge{
                region_id, MakeNodeId(NodeKind::Parameter, field),
                ClampWeight(stats.Mean(field) / params_.parameter_scale),
                EdgeCategory::ParameterLink});
        }
        for (const auto& field : BiologyFields()) {
            snapshot.edges.push_back(GraphEdge{
                region_id, MakeNodeId(NodeKind::Biology, field),
                ClampWeight(stats.Mean(field) / params_.biology_scale),
                EdgeCategory::BiologyLink});
        }
    }

    for (const auto& month : month_order) {
        const std::string month_id = MakeNodeId(NodeKind::TimePeriod, month);
        for (const auto& region : month_regions[month]) {
            snapshot.edges.push_back(GraphEdge{
                month_id, MakeNodeId(NodeKind::Region, region), 1.0f,
                EdgeCategory::TemporalLink});
        }
    }

    return snapshot;
}

} // namespace graph
} // namespace oceangraph
