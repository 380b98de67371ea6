#ifndef OCEANGRAPH_GRAPH_GRAPH_BUILDER_H
#define OCEANGRAPH_GRAPH_GRAPH_BUILDER_H

#include <string>
#include <vector>
#include <oceangraph/graph/graph_types.h>

namespace oceangraph {
namespace graph {

/*
 * Turns a validated measurement table into a knowledge-graph snapshot.
 *
 * Node order is deterministic: regions (first occurrence), the parameter
 * catalog, the biology catalog, then year-months (first occurrence). Edges are
 * emitted region by region (parameters then biology), followed by one temporal
 * edge per distinct (year-month, region) pair.
 */
class GraphBuilder {
public:
    struct BuilderParams {
        double parameter_scale;   // Divisor applied to parameter means
        double biology_scale;     // Divisor applied to biology means
        float min_weight;
        float max_weight;

        BuilderParams();
    };

    explicit GraphBuilder(const BuilderParams& params = BuilderParams());

    // Empty input yields an empty snapshot. Throws std::invalid_argument when a
    // record's date does not start with a "YYYY-MM" token.
    GraphSnapshot Build(const std::vector<MeasurementRecord>& records) const;

    const BuilderParams& GetParams() const { return params_; }

private:
    float ClampWeight(double value) const;

    BuilderParams params_;
};

// Returns the "YYYY-MM" prefix of a date string. Throws std::invalid_argument if
// the first seven characters are not four digits, '-', and a month 01..12.
std::string YearMonthOf(const std::string& date);

} // namespace graph
} // namespace oceangraph

#endif // OCEANGRAPH_GRAPH_GRAPH_BUILDER_H
