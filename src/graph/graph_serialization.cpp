#include <oceangraph/graph/graph_serialization.h>
#include <stdexcept>

namespace oceangraph {
namespace graph {

NodeKind KindFromName(const std::string& name) {
    if (name == "region") return NodeKind::Region;
    if (name == "parameter") return NodeKind::Parameter;
    if (name == "biology") return NodeKind::Biology;
    if (name == "time") return NodeKind::TimePeriod;
    throw std::invalid_argument("Unknown node kind: " + name);
}

EdgeCategory CategoryFromName(const std::string& name) {
    if (name == "parameter") return EdgeCategory::ParameterLink;
    if (name == "biology") return EdgeCategory::BiologyLink;
    if (name == "temporal") return EdgeCategory::TemporalLink;
    throw std::invalid_argument("Unknown edge category: " + name);
}

nlohmann::json SnapshotToJson(const GraphSnapshot& snapshot, const PositionMap* positions) {
    nlohmann::json j;
    j["nodes"] = nlohmann::json::array();
    j["links"] = nlohmann::json::array();

    for (const auto& node : snapshot.nodes) {
        nlohmann::json entry = {
            {"id", node.id},
            {"kind", KindName(node.kind)},
            {"label", node.label},
            {"group", node.group}
        };
        if (positions) {
            auto it = positions->find(node.id);
            if (it != positions->end()) {
                entry["x"] = it->second.x;
                entry["y"] = it->second.y;
            }
        }
        j["nodes"].push_back(entry);
    }

    for (const auto& edge : snapshot.edges) {
        j["links"].push_back({
            {"source", edge.source_id},
            {"target", edge.target_id},
            {"value", edge.weight},
            {"type", CategoryName(edge.category)}
        });
    }
    return j;
}

GraphSnapshot SnapshotFromJson(const nlohmann::json& j) {
    GraphSnapshot snapshot;
    try {
        for (const auto& entry : j.at("nodes")) {
            GraphNode node(KindFromName(entry.at("kind").get<std::string>()),
                           entry.at("label").get<std::string>());
            if (entry.contains("id") && entry["id"].get<std::string>() != node.id) {
                throw std::invalid_argument("Node id '" + entry["id"].get<std::string>() +
                                            "' does not match its kind and label");
            }
            snapshot.nodes.push_back(node);
        }
        for (const auto& entry : j.at("links")) {
            snapshot.edges.push_back(GraphEdge{
                entry.at("source").get<std::string>(),
                entry.at("target").get<std::string>(),
                entry.at("value").get<float>(),
                CategoryFromName(entry.at("type").get<std::string>())});
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed snapshot JSON: ") + e.what());
    }
    ValidateSnapshot(snapshot);
    return snapshot;
}

std::vector<MeasurementRecord> RecordsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Measurement records must be a JSON array");
    }
    std::vector<MeasurementRecord> records;
    records.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& entry = j[i];
        try {
            MeasurementRecord record;
            record.region = entry.at("region").get<std::string>();
            record.date = entry.at("date").get<std::string>();
            record.depth = entry.at("depth").get<double>();
            record.salinity = entry.at("salinity").get<double>();
            record.temperature = entry.at("temperature").get<double>();
            record.ph = entry.at("ph").get<double>();
            record.dissolved_oxygen = entry.at("dissolved_oxygen").get<double>();
            record.fish_population = entry.at("fish_population").get<double>();
            record.plankton = entry.at("plankton").get<double>();
            record.coral_coverage = entry.at("coral_coverage").get<double>();
            records.push_back(record);
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument("Record " + std::to_string(i) + ": " + e.what());
        }
    }
    return records;
}

} // namespace graph
} // namespace oceangraph
