#ifndef OCEANGRAPH_GRAPH_GRAPH_TYPES_H
#define OCEANGRAPH_GRAPH_GRAPH_TYPES_H

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <imgui.h> // For ImVec2

namespace oceangraph {
namespace graph {

// One validated row of the measurement table.
struct MeasurementRecord {
    std::string region;
    std::string date;               // Calendar date, "YYYY-MM-DD..."
    double depth = 0.0;
    double salinity = 0.0;
    double temperature = 0.0;
    double ph = 0.0;
    double dissolved_oxygen = 0.0;
    double fish_population = 0.0;
    double plankton = 0.0;
    double coral_coverage = 0.0;
};

enum class NodeKind {
    Region,
    Parameter,
    Biology,
    TimePeriod
};

enum class EdgeCategory {
    ParameterLink,
    BiologyLink,
    TemporalLink
};

struct GraphNode {
    std::string id;     // "<kind>:<label>", unique across the snapshot
    NodeKind kind;
    std::string label;  // Region name, field name or "YYYY-MM"
    int group;          // 1..4, styling only

    GraphNode(NodeKind k, const std::string& lbl);
};

struct GraphEdge {
    std::string source_id;
    std::string target_id;
    float weight;
    EdgeCategory category;
};

// Immutable result of one GraphBuilder::Build call.
struct GraphSnapshot {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    bool empty() const { return nodes.empty(); }
    const GraphNode* FindNode(const std::string& id) const;
};

// Pan/zoom state and selection; never feeds back into the simulation.
struct GraphViewState {
    ImVec2 pan_offset;
    float zoom_scale;
    std::optional<std::string> selected_node_id;

    GraphViewState() : pan_offset(0.0f, 0.0f), zoom_scale(1.0f) {}
};

using PositionMap = std::map<std::string, ImVec2>;

// Field catalogs, in node-creation order.
const std::vector<std::string>& ParameterFields();
const std::vector<std::string>& BiologyFields();

// Reads a catalog field by name. Throws std::invalid_argument on an unknown name.
double FieldValue(const MeasurementRecord& record, const std::string& field);

std::string MakeNodeId(NodeKind kind, const std::string& label);
const char* KindName(NodeKind kind);
const char* CategoryName(EdgeCategory category);
int GroupForKind(NodeKind kind);

// Collision radius per kind, before the layout's shared margin.
float NodeRadius(NodeKind kind);

// Throws std::invalid_argument on duplicate node ids or an edge whose endpoint is
// not in the node set.
void ValidateSnapshot(const GraphSnapshot& snapshot);

} // namespace graph
} // namespace oceangraph

#endif // OCEANGRAPH_GRAPH_GRAPH_TYPES_H
