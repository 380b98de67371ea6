#include "gtest/gtest.h"
#include "test_records.h"
#include <oceangraph/graph/graph_builder.h>
#include <oceangraph/graph/graph_serialization.h>
#include <stdexcept>

using namespace oceangraph::graph;
using oceangraph::testing_support::TwoRegionRecords;

TEST(GraphSerializationTest, SnapshotFieldsAreNamed) {
    GraphSnapshot snapshot = GraphBuilder().Build(TwoRegionRecords());
    nlohmann::json j = SnapshotToJson(snapshot);

    ASSERT_EQ(j["nodes"].size(), snapshot.nodes.size());
    ASSERT_EQ(j["links"].size(), snapshot.edges.size());
    EXPECT_EQ(j["nodes"][0]["id"].get<std::string>(), "region:Pacific");
    EXPECT_EQ(j["nodes"][0]["kind"].get<std::string>(), "region");
    EXPECT_EQ(j["nodes"][0]["group"].get<int>(), 1);
    EXPECT_FALSE(j["nodes"][0].contains("x"));
    EXPECT_EQ(j["links"][0]["source"].get<std::string>(), "region:Pacific");
    EXPECT_EQ(j["links"][0]["type"].get<std::string>(), "parameter");

    nlohmann::json last_link = j["links"].back();
    EXPECT_EQ(last_link["type"].get<std::string>(), "temporal");
    EXPECT_EQ(last_link["value"].get<float>(), 1.0f);
}

TEST(GraphSerializationTest, PositionsAreAttachedWhenGiven) {
    GraphSnapshot snapshot;
    snapshot.nodes.push_back(GraphNode(NodeKind::Biology, "plankton"));
    PositionMap positions;
    positions["biology:plankton"] = ImVec2(12.5f, -4.0f);

    nlohmann::json j = SnapshotToJson(snapshot, &positions);
    EXPECT_FLOAT_EQ(j["nodes"][0]["x"].get<float>(), 12.5f);
    EXPECT_FLOAT_EQ(j["nodes"][0]["y"].get<float>(), -4.0f);
}

TEST(GraphSerializationTest, SnapshotReadsBack) {
    GraphSnapshot snapshot = GraphBuilder().Build(TwoRegionRecords());
    GraphSnapshot copy = SnapshotFromJson(SnapshotToJson(snapshot));

    ASSERT_EQ(copy.nodes.size(), snapshot.nodes.size());
    ASSERT_EQ(copy.edges.size(), snapshot.edges.size());
    EXPECT_EQ(copy.nodes[5].id, snapshot.nodes[5].id);
    EXPECT_EQ(copy.edges[3].category, snapshot.edges[3].category);
    EXPECT_FLOAT_EQ(copy.edges[3].weight, snapshot.edges[3].weight);
}

TEST(GraphSerializationTest, MalformedSnapshotsAreRejected) {
    nlohmann::json missing_links = {{"nodes", nlohmann::json::array()}};
    EXPECT_THROW(SnapshotFromJson(missing_links), std::invalid_argument);

    nlohmann::json dangling = nlohmann::json::parse(R"({
        "nodes": [{"kind": "region", "label": "Pacific"}],
        "links": [{"source": "region:Pacific", "target": "parameter:ph", "value": 1.0, "type": "parameter"}]
    })");
    EXPECT_THROW(SnapshotFromJson(dangling), std::invalid_argument);

    nlohmann::json bad_kind = nlohmann::json::parse(R"({
        "nodes": [{"kind": "island", "label": "Bali"}],
        "links": []
    })");
    EXPECT_THROW(SnapshotFromJson(bad_kind), std::invalid_argument);

    nlohmann::json wrong_id = nlohmann::json::parse(R"({
        "nodes": [{"id": "region:Atlantic", "kind": "region", "label": "Pacific"}],
        "links": []
    })");
    EXPECT_THROW(SnapshotFromJson(wrong_id), std::invalid_argument);
}

TEST(GraphSerializationTest, RecordsFromJson) {
    nlohmann::json j = nlohmann::json::parse(R"([
        {"region": "Pacific", "date": "2025-01-15", "depth": 40, "salinity": 34.5,
         "temperature": 18.2, "ph": 8.05, "dissolved_oxygen": 6.1,
         "fish_population": 310, "plankton": 95, "coral_coverage": 22.5}
    ])");
    std::vector<MeasurementRecord> records = RecordsFromJson(j);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].region, "Pacific");
    EXPECT_DOUBLE_EQ(records[0].salinity, 34.5);
    EXPECT_DOUBLE_EQ(records[0].coral_coverage, 22.5);

    EXPECT_THROW(RecordsFromJson(nlohmann::json::object()), std::invalid_argument);
    nlohmann::json incomplete = nlohmann::json::parse(R"([{"region": "Pacific", "date": "2025-01-15"}])");
    EXPECT_THROW(RecordsFromJson(incomplete), std::invalid_argument);
}

TEST(GraphSerializationTest, NamesMapBothWays) {
    EXPECT_EQ(KindFromName(KindName(NodeKind::TimePeriod)), NodeKind::TimePeriod);
    EXPECT_EQ(CategoryFromName(CategoryName(EdgeCategory::BiologyLink)), EdgeCategory::BiologyLink);
    EXPECT_THROW(KindFromName("ocean"), std::invalid_argument);
    EXPECT_THROW(CategoryFromName("spatial"), std::invalid_argument);
}
