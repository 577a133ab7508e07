#include <gtest/gtest.h>
#include <strata/layout/util/LayoutSerializer.h>
#include <strata/layout/config/LayoutOptions.h>
#include <strata/layout/config/LayoutResult.h>
#include <strata/core/GraphData.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace strata;

// --- Graph input ---

TEST(LayoutSerializerTest, GraphFromJson_StringEndpoints) {
    GraphData graph = LayoutSerializer::graphFromJson(R"({
        "nodes": [{"id": "a", "label": "Start"}, {"id": "b"}],
        "edges": [{"id": "e1", "source": "a", "target": "b", "label": "go"}]
    })");

    ASSERT_EQ(graph.nodeCount(), 2u);
    EXPECT_EQ(graph.nodes()[0].label, "Start");
    EXPECT_TRUE(graph.nodes()[1].label.empty());
    ASSERT_EQ(graph.edgeCount(), 1u);
    EXPECT_EQ(endpointId(graph.edges()[0].source), "a");
    EXPECT_EQ(endpointId(graph.edges()[0].target), "b");
    EXPECT_EQ(graph.edges()[0].label, "go");
}

TEST(LayoutSerializerTest, GraphFromJson_ObjectEndpoints) {
    GraphData graph = LayoutSerializer::graphFromJson(R"({
        "nodes": [{"id": "a"}, {"id": "b"}],
        "edges": [{"id": "e1", "source": {"id": "a"}, "target": {"id": "b", "label": "B"}}]
    })");

    ASSERT_EQ(graph.edgeCount(), 1u);
    const EdgeData& edge = graph.edges()[0];
    ASSERT_TRUE(std::holds_alternative<NodeData>(edge.target));
    EXPECT_EQ(std::get<NodeData>(edge.target).label, "B");
    EXPECT_EQ(endpointId(edge.source), "a");
}

TEST(LayoutSerializerTest, GraphFromJson_MissingSectionsGiveEmptyGraph) {
    GraphData graph = LayoutSerializer::graphFromJson("{}");

    EXPECT_TRUE(graph.empty());
    EXPECT_EQ(graph.edgeCount(), 0u);
}

TEST(LayoutSerializerTest, GraphFromJson_DanglingEdgesAreKept) {
    GraphData graph = LayoutSerializer::graphFromJson(R"({
        "nodes": [{"id": "a"}],
        "edges": [{"id": "e1", "source": "a", "target": "ghost"}]
    })");

    EXPECT_EQ(graph.edgeCount(), 1u);
}

TEST(LayoutSerializerTest, GraphFromJson_MalformedThrows) {
    EXPECT_THROW(LayoutSerializer::graphFromJson("{\"nodes\": ["), std::runtime_error);
    EXPECT_THROW(LayoutSerializer::graphFromJson(R"({"nodes": [{"label": "no id"}]})"),
                 std::runtime_error);
    EXPECT_THROW(LayoutSerializer::graphFromJson(R"({"edges": [{"id": "e", "source": "a"}]})"),
                 std::runtime_error);
}

// --- Options ---

TEST(LayoutSerializerTest, OptionsFromJson_PartialKeepsDefaults) {
    LayoutOptions options = LayoutSerializer::optionsFromJson(R"({
        "direction": "LR",
        "nodeSeparation": 20,
        "rootNodes": ["a"],
        "coordinateAssignment": "simple"
    })");

    EXPECT_EQ(options.direction, Direction::LeftToRight);
    EXPECT_FLOAT_EQ(options.nodeSeparation, 20.0f);
    EXPECT_EQ(options.rootNodes, std::vector<std::string>({"a"}));
    EXPECT_EQ(options.coordinateAssignment, CoordinateAssignment::Simple);
    EXPECT_FLOAT_EQ(options.levelSeparation, 100.0f);
    EXPECT_EQ(options.crossingMinimization, CrossingMinimization::Barycenter);
    EXPECT_FLOAT_EQ(options.margin, 50.0f);
}

TEST(LayoutSerializerTest, OptionsFromJson_UnknownEnumNamesFallBack) {
    LayoutOptions options = LayoutSerializer::optionsFromJson(R"({
        "direction": "diagonal",
        "rankingAlgorithm": "magic",
        "crossingMinimization": "random",
        "coordinateAssignment": "spring"
    })");

    EXPECT_EQ(options.direction, Direction::TopToBottom);
    EXPECT_EQ(options.rankingAlgorithm, RankingAlgorithm::LongestPath);
    EXPECT_EQ(options.crossingMinimization, CrossingMinimization::Barycenter);
    EXPECT_EQ(options.coordinateAssignment, CoordinateAssignment::BrandesKopf);
}

TEST(LayoutSerializerTest, OptionsFromJson_WrongTypeThrows) {
    EXPECT_THROW(LayoutSerializer::optionsFromJson(R"({"direction": 3})"), std::runtime_error);
    EXPECT_THROW(LayoutSerializer::optionsFromJson("[1, 2"), std::runtime_error);
}

TEST(LayoutSerializerTest, Options_WrittenJsonReadsBack) {
    LayoutOptions options = LayoutOptions::fromPreset(LayoutPreset::Dag);
    options.setDirection(Direction::BottomToTop).setGrid(true, 8.0f).setRootNodes({"r"});

    LayoutOptions restored = LayoutSerializer::optionsFromJson(LayoutSerializer::toJson(options));

    EXPECT_EQ(restored.direction, Direction::BottomToTop);
    EXPECT_EQ(restored.rankingAlgorithm, RankingAlgorithm::NetworkSimplex);
    EXPECT_EQ(restored.crossingMinimization, CrossingMinimization::Median);
    EXPECT_EQ(restored.crossingIterations, 48);
    EXPECT_TRUE(restored.alignToGrid);
    EXPECT_FLOAT_EQ(restored.gridSize, 8.0f);
    EXPECT_FALSE(restored.compact);
    EXPECT_EQ(restored.rootNodes, std::vector<std::string>({"r"}));
}

// --- Enum names ---

TEST(LayoutSerializerTest, EnumNames) {
    EXPECT_EQ(LayoutSerializer::directionToString(Direction::RightToLeft), "RL");
    EXPECT_EQ(LayoutSerializer::stringToDirection("BT"), Direction::BottomToTop);
    EXPECT_EQ(LayoutSerializer::rankingToString(RankingAlgorithm::TightTree), "tight-tree");
    EXPECT_EQ(LayoutSerializer::stringToRanking("network-simplex"),
              RankingAlgorithm::NetworkSimplex);
    EXPECT_EQ(LayoutSerializer::crossingToString(CrossingMinimization::None), "none");
    EXPECT_EQ(LayoutSerializer::stringToCrossing("median"), CrossingMinimization::Median);
    EXPECT_EQ(LayoutSerializer::coordinateToString(CoordinateAssignment::BrandesKopf),
              "brandes-kopf");
    EXPECT_EQ(LayoutSerializer::stringToCoordinate("tight"), CoordinateAssignment::Tight);
}

TEST(LayoutSerializerTest, StringToPreset) {
    LayoutPreset preset = LayoutPreset::Default;

    EXPECT_TRUE(LayoutSerializer::stringToPreset("wide", preset));
    EXPECT_EQ(preset, LayoutPreset::Wide);
    EXPECT_TRUE(LayoutSerializer::stringToPreset("compact", preset));
    EXPECT_EQ(preset, LayoutPreset::Compact);

    EXPECT_FALSE(LayoutSerializer::stringToPreset("Wide", preset));
    EXPECT_EQ(preset, LayoutPreset::Compact);
}

// --- Result documents ---

TEST(LayoutSerializerTest, ResultJson_NodesListedByLevelThenOrder) {
    LayoutResult result;
    result.setNodeLayout({"bottom", {50.0f, 250.0f}, 2, 0});
    result.setNodeLayout({"right", {100.0f, 150.0f}, 1, 1});
    result.setNodeLayout({"top", {75.0f, 50.0f}, 0, 0});
    result.setNodeLayout({"left", {50.0f, 150.0f}, 1, 0});

    std::string json = LayoutSerializer::toJson(result);

    size_t top = json.find("\"id\": \"top\"");
    size_t left = json.find("\"id\": \"left\"");
    size_t right = json.find("\"id\": \"right\"");
    size_t bottom = json.find("\"id\": \"bottom\"");
    ASSERT_NE(top, std::string::npos);
    ASSERT_NE(bottom, std::string::npos);
    EXPECT_LT(top, left);
    EXPECT_LT(left, right);
    EXPECT_LT(right, bottom);
}

TEST(LayoutSerializerTest, ResultJson_SameContentSameText) {
    LayoutResult first;
    LayoutResult second;
    for (int i = 0; i < 20; ++i) {
        first.setNodeLayout({"n" + std::to_string(i), {0.0f, 0.0f}, i % 3, i});
        second.setNodeLayout({"n" + std::to_string(19 - i), {0.0f, 0.0f}, (19 - i) % 3, 19 - i});
    }

    EXPECT_EQ(LayoutSerializer::toJson(first), LayoutSerializer::toJson(second));
}

// --- Result files ---

class LayoutSerializerFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "strata_serializer_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string pathFor(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::filesystem::path dir_;
};

TEST_F(LayoutSerializerFileTest, SaveThenLoad) {
    LayoutResult original;
    original.setNodeLayout({"a", {50.0f, 50.0f}, 0, 0});
    original.setNodeLayout({"b", {50.0f, 150.0f}, 1, 0});
    EdgeLayout edge;
    edge.id = "ab";
    edge.source = "a";
    edge.target = "b";
    edge.controlPoints = {{50.0f, 50.0f}, {50.0f, 150.0f}};
    original.addEdgeLayout(edge);
    original.setLevelCount(2);

    ASSERT_TRUE(LayoutSerializer::saveToFile(original, pathFor("layout.json")));

    LayoutResult loaded;
    ASSERT_TRUE(LayoutSerializer::loadFromFile(loaded, pathFor("layout.json")));
    EXPECT_EQ(loaded.nodeCount(), 2u);
    EXPECT_EQ(loaded.position("b"), Point(50.0f, 150.0f));
    EXPECT_EQ(loaded.getEdgeLayout("ab")->controlPoints.size(), 2u);
    EXPECT_EQ(loaded.levelCount(), 2);
}

TEST_F(LayoutSerializerFileTest, LoadMissingFileReturnsFalse) {
    LayoutResult result;
    result.setNodeLayout({"keep", {1.0f, 2.0f}, 0, 0});

    EXPECT_FALSE(LayoutSerializer::loadFromFile(result, pathFor("absent.json")));
    EXPECT_TRUE(result.hasNodeLayout("keep"));
}

TEST_F(LayoutSerializerFileTest, SaveToMissingDirectoryReturnsFalse) {
    LayoutResult result;

    EXPECT_FALSE(LayoutSerializer::saveToFile(result, pathFor("no/such/dir/out.json")));
}

TEST_F(LayoutSerializerFileTest, LoadCorruptFileThrows) {
    {
        std::ofstream file(pathFor("corrupt.json"));
        file << "{\"nodes\": [";
    }
    LayoutResult result;

    EXPECT_THROW(LayoutSerializer::loadFromFile(result, pathFor("corrupt.json")),
                 std::runtime_error);
}
