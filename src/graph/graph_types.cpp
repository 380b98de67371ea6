#include <oceangraph/graph/graph_types.h>
#include <set>
#include <stdexcept>

namespace oceangraph {
namespace graph {

GraphNode::GraphNode(NodeKind k, const std::string& lbl)
    : id(MakeNodeId(k, lbl)), kind(k), label(lbl), group(GroupForKind(k)) {}

const GraphNode* GraphSnapshot::FindNode(const std::string& id) const {
    for (const auto& node : nodes) {
        if (node.id == id) {
            return &node;
        }
    }
    return nullptr;
}

const std::vector<std::string>& ParameterFields() {
    static const std::vector<std::string> fields = {
        "salinity", "temperature", "ph", "dissolved_oxygen", "depth"
    };
    return fields;
}

const std::vector<std::string>& BiologyFields() {
    static const std::vector<std::string> fields = {
        "fish_population", "plankton", "coral_coverage"
    };
    return fields;
}

double FieldValue(const MeasurementRecord& record, const std::string& field) {
    if (field == "depth") return record.depth;
    if (field == "salinity") return record.salinity;
    if (field == "temperature") return record.temperature;
    if (field == "ph") return record.ph;
    if (field == "dissolved_oxygen") return record.dissolved_oxygen;
    if (field == "fish_population") return record.fish_population;
    if (field == "plankton") return record.plankton;
    if (field == "coral_coverage") return record.coral_coverage;
    throw std::invalid_argument("Unknown measurement field: " + field);
}

std::string MakeNodeId(NodeKind kind, const std::string& label) {
    return std::string(KindName(kind)) + ":" + label;
}

const char* KindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Region: return "region";
        case NodeKind::Parameter: return "parameter";
        case NodeKind::Biology: return "biology";
        case NodeKind::TimePeriod: return "time";
    }
    return "unknown";
}

const char* CategoryName(EdgeCategory category) {
    switch (category) {
        case EdgeCategory::ParameterLink: return "parameter";
        case EdgeCategory::BiologyLink: return "biology";
        case EdgeCategory::TemporalLink: return "temporal";
    }
    return "unknown";
}

int GroupForKind(NodeKind kind) {
    switch (kind) {
        case NodeKind::Region: return 1;
        case NodeKind::Parameter: return 2;
        case NodeKind::Biology: return 3;
        case NodeKind::TimePeriod: return 4;
    }
    return 0;
}

float NodeRadius(NodeKind kind) {
    switch (kind) {
        case NodeKind::Region: return 12.0f;
        case NodeKind::Parameter: return 10.0f;
        case NodeKind::Biology: return 8.0f;
        case NodeKind::TimePeriod: return 6.0f;
    }
    return 8.0f;
}

void ValidateSnapshot(const GraphSnapshot& snapshot) {
    std::set<std::string> ids;
    for (const auto& node : snapshot.nodes) {
        if (!ids.insert(node.id).second) {
            throw std::invalid_argument("Duplicate node id in snapshot: " + node.id);
        }
    }
    for (const auto& edge : snapshot.edges) {
        if (ids.count(edge.source_id) == 0) {
            throw std::invalid_argument("Edge references missing source node: " + edge.source_id);
        }
        if (ids.count(edge.target_id) == 0) {
            throw std::invalid_argument("Edge references missing target node: " + edge.target_id);
        }
    }
}

} // namespace graph
} // namespace oceangraph
