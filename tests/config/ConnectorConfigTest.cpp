#include <gtest/gtest.h>
#include <orthoedge/orthoedge.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace orthoedge;

// ============== Defaults / Validation Tests ==============

TEST(ConnectorConfigTest, Defaults) {
    ConnectorConfig config;

    EXPECT_FLOAT_EQ(config.mergeThreshold, 4.0f);
    EXPECT_TRUE(config.reduceCollinear);
    EXPECT_FLOAT_EQ(config.anchorOffset, 20.0f);
    EXPECT_FLOAT_EQ(config.obstacleMargin, 10.0f);
    EXPECT_FLOAT_EQ(config.handlerWidth, 20.0f);
    EXPECT_FLOAT_EQ(config.handlerThickness, 6.0f);
}

TEST(ConnectorConfigTest, Validate_DefaultsAreValid) {
    ConnectorConfig config;

    EXPECT_FALSE(config.validate());
    EXPECT_EQ(config, ConnectorConfig{});
}

TEST(ConnectorConfigTest, Validate_ReplacesBadValues) {
    ConnectorConfig config;
    config.mergeThreshold = 0.0f;
    config.anchorOffset = -5.0f;
    config.obstacleMargin = std::numeric_limits<float>::infinity();
    config.handlerThickness = -1.0f;

    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config, ConnectorConfig{});
}

TEST(ConnectorConfigTest, Validate_ZeroDistancesAreAllowed) {
    ConnectorConfig config;
    config.anchorOffset = 0.0f;
    config.obstacleMargin = 0.0f;

    EXPECT_FALSE(config.validate());
    EXPECT_FLOAT_EQ(config.anchorOffset, 0.0f);
    EXPECT_FLOAT_EQ(config.obstacleMargin, 0.0f);
}

// ============== Serializer Tests ==============

TEST(ConnectorConfigSerializerTest, JsonRoundTrip) {
    ConnectorConfig config;
    config.mergeThreshold = 2.5f;
    config.reduceCollinear = false;
    config.anchorOffset = 30.0f;
    config.obstacleMargin = 4.0f;
    config.handlerWidth = 24.0f;
    config.handlerThickness = 8.0f;

    auto restored = ConnectorConfigSerializer::fromJson(ConnectorConfigSerializer::toJson(config));

    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, config);
}

TEST(ConnectorConfigSerializerTest, MissingKeysKeepDefaults) {
    auto config = ConnectorConfigSerializer::fromJson(R"({"anchorOffset": 12, "handle": {"width": 30}})");

    ASSERT_TRUE(config.has_value());
    EXPECT_FLOAT_EQ(config->anchorOffset, 12.0f);
    EXPECT_FLOAT_EQ(config->handlerWidth, 30.0f);
    EXPECT_FLOAT_EQ(config->handlerThickness, 6.0f);
    EXPECT_FLOAT_EQ(config->mergeThreshold, 4.0f);
    EXPECT_TRUE(config->reduceCollinear);
}

TEST(ConnectorConfigSerializerTest, WrongTypesAndUnknownKeysAreIgnored) {
    auto config = ConnectorConfigSerializer::fromJson(
        R"({"mergeThreshold": "large", "reduceCollinear": 0, "gridSize": 8})");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, ConnectorConfig{});
}

TEST(ConnectorConfigSerializerTest, OutOfRangeValuesAreValidated) {
    auto config = ConnectorConfigSerializer::fromJson(R"({"mergeThreshold": -3, "obstacleMargin": -1})");

    ASSERT_TRUE(config.has_value());
    EXPECT_FLOAT_EQ(config->mergeThreshold, 4.0f);
    EXPECT_FLOAT_EQ(config->obstacleMargin, 10.0f);
}

TEST(ConnectorConfigSerializerTest, RejectsMalformedInput) {
    EXPECT_FALSE(ConnectorConfigSerializer::fromJson("{ mergeThreshold: ").has_value());
    EXPECT_FALSE(ConnectorConfigSerializer::fromJson("[1, 2, 3]").has_value());
    EXPECT_FALSE(ConnectorConfigSerializer::fromJson("").has_value());
}

// ============== File Tests ==============

class ConnectorConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "orthoedge_connector_config_test.json").string();
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(ConnectorConfigFileTest, SaveAndLoad) {
    ConnectorConfig config;
    config.obstacleMargin = 15.0f;

    ASSERT_TRUE(ConnectorConfigSerializer::saveToFile(config, path_));
    auto loaded = ConnectorConfigSerializer::loadFromFile(path_);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, config);
}

TEST_F(ConnectorConfigFileTest, MissingFile) {
    EXPECT_FALSE(ConnectorConfigSerializer::loadFromFile(path_ + ".missing").has_value());
}

TEST_F(ConnectorConfigFileTest, CorruptFile) {
    {
        std::ofstream file(path_);
        file << "not json";
    }

    EXPECT_FALSE(ConnectorConfigSerializer::loadFromFile(path_).has_value());
}
