#ifndef OCEANGRAPH_GRAPH_GRAPH_SERIALIZATION_H
#define OCEANGRAPH_GRAPH_GRAPH_SERIALIZATION_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <oceangraph/graph/graph_types.h>

namespace oceangraph {
namespace graph {

/*
 * JSON form of a snapshot:
 *   {"nodes": [{"id", "kind", "label", "group", ["x", "y"]}],
 *    "links": [{"source", "target", "value", "type"}]}
 * Writing it to a file is left to the caller.
 */
nlohmann::json SnapshotToJson(const GraphSnapshot& snapshot, const PositionMap* positions = nullptr);

// Throws std::invalid_argument on missing fields, unknown kinds or categories,
// and dangling edge references.
GraphSnapshot SnapshotFromJson(const nlohmann::json& j);

// Reads a JSON array of measurement objects. Throws std::invalid_argument on
// a malformed entry.
std::vector<MeasurementRecord> RecordsFromJson(const nlohmann::json& j);

NodeKind KindFromName(const std::string& name);
EdgeCategory CategoryFromName(const std::string& name);

} // namespace graph
} // namespace oceangraph

#endif // OCEANGRAPH_GRAPH_GRAPH_SERIALIZATION_H
