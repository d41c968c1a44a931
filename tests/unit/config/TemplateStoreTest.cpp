/**
 * @file TemplateStoreTest.cpp
 * @brief Unit tests for sensor template loading
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config/TemplateStore.hpp"
#include "core/PublishLoop.hpp"
#include "core/SensorTemplateExpander.hpp"
#include "fixtures/TestFixtures.hpp"

#include <algorithm>
#include <filesystem>

class TemplateStoreTest : public LogCaptureFixture {
protected:
    static auto LoadShipped() -> std::expected<std::vector<SensorTemplate>, util::Error> {
        return config::load_sensor_templates(
            std::filesystem::path{HDSENTINEL_MQTT_SOURCE_DIR} / "config" / "sensors.json");
    }
};

TEST_F(TemplateStoreTest, Parse_ReadsInternalFieldsAndPassthrough) {
    auto templates = config::parse_sensor_templates(R"({
        "sensor": {
            "max_temp": {
                "_key": "maximum_temperature_during_entire_lifespan",
                "_type": "float",
                "device_class": "temperature",
                "unit_of_measurement": "°C"
            }
        }
    })");

    ASSERT_TRUE(templates.has_value()) << templates.error().message;
    ASSERT_EQ(templates->size(), 1u);
    const auto& sensor = templates->front();
    EXPECT_EQ(sensor.kind, SensorKind::SENSOR);
    EXPECT_EQ(sensor.name, "max_temp");
    EXPECT_EQ(sensor.query_key, "maximum_temperature_during_entire_lifespan");
    EXPECT_EQ(sensor.value_type, ValueType::FLOAT);
    EXPECT_EQ(sensor.extra_payload,
              nlohmann::json({{"device_class", "temperature"}, {"unit_of_measurement", "°C"}}));
}

TEST_F(TemplateStoreTest, Parse_DefaultsKeyToNameAndTypeToStr) {
    auto templates = config::parse_sensor_templates(R"({"sensor": {"tip": null, "interface": {}}})");

    ASSERT_TRUE(templates.has_value());
    ASSERT_EQ(templates->size(), 2u);
    EXPECT_EQ((*templates)[0].name, "interface");
    EXPECT_EQ((*templates)[0].query_key, "interface");
    EXPECT_EQ((*templates)[1].name, "tip");
    EXPECT_EQ((*templates)[1].value_type, ValueType::STR);
    EXPECT_TRUE((*templates)[1].extra_payload.empty());
}

// Test: "_Type" and "__key" are the same fields as "_type" and "_key"
TEST_F(TemplateStoreTest, Parse_InternalFieldsAreCaseInsensitive) {
    auto templates =
        config::parse_sensor_templates(R"({"sensor": {"number": {"__KEY": "hard_disk_number", "_Type": "int"}}})");

    ASSERT_TRUE(templates.has_value());
    EXPECT_EQ(templates->front().query_key, "hard_disk_number");
    EXPECT_EQ(templates->front().value_type, ValueType::INT);
}

TEST_F(TemplateStoreTest, Parse_OrdersBinarySensorsFirst) {
    auto templates = config::parse_sensor_templates(
        R"({"sensor": {"health": {}}, "binary_sensor": {"failing": {}}})");

    ASSERT_TRUE(templates.has_value());
    ASSERT_EQ(templates->size(), 2u);
    EXPECT_EQ((*templates)[0].kind, SensorKind::BINARY_SENSOR);
    EXPECT_EQ((*templates)[1].kind, SensorKind::SENSOR);
}

TEST_F(TemplateStoreTest, Parse_RejectsUnknownInternalField) {
    auto templates = config::parse_sensor_templates(R"({"sensor": {"health": {"_unit": "%"}}})");

    ASSERT_FALSE(templates.has_value());
    EXPECT_EQ(templates.error().kind, util::ErrorKind::CONFIGURATION);
    EXPECT_THAT(templates.error().message, testing::HasSubstr("_unit"));
}

TEST_F(TemplateStoreTest, Parse_RejectsUnknownValueType) {
    auto templates = config::parse_sensor_templates(R"({"sensor": {"health": {"_type": "double"}}})");

    ASSERT_FALSE(templates.has_value());
    EXPECT_EQ(templates.error().kind, util::ErrorKind::CONFIGURATION);
}

TEST_F(TemplateStoreTest, Parse_RejectsMalformedDocuments) {
    EXPECT_FALSE(config::parse_sensor_templates("{not json").has_value());
    EXPECT_FALSE(config::parse_sensor_templates("[]").has_value());
    EXPECT_FALSE(config::parse_sensor_templates(R"({"sensor": []})").has_value());
    EXPECT_FALSE(config::parse_sensor_templates(R"({"sensor": {"health": 5}})").has_value());
    EXPECT_FALSE(config::parse_sensor_templates(R"({"sensor": {"health": {"_key": ""}}})").has_value());
}

TEST_F(TemplateStoreTest, Parse_WarnsAboutUnknownKind) {
    auto templates = config::parse_sensor_templates(R"({"switch": {"power": {}}, "sensor": {}})");

    ASSERT_TRUE(templates.has_value());
    EXPECT_TRUE(templates->empty());
    EXPECT_THAT(info_output.str(), testing::HasSubstr("switch"));
}

TEST_F(TemplateStoreTest, Load_MissingFileIsConfigurationError) {
    auto templates = config::load_sensor_templates("/nonexistent/sensors.json");

    ASSERT_FALSE(templates.has_value());
    EXPECT_EQ(templates.error().kind, util::ErrorKind::CONFIGURATION);
}

// Test: the shipped template file is valid and complete
TEST_F(TemplateStoreTest, Load_ShippedSensorsFile) {
    auto templates = LoadShipped();

    ASSERT_TRUE(templates.has_value()) << templates.error().message;
    EXPECT_EQ(templates->size(), 16u);

    const auto value_types = core::collect_value_types(*templates);
    EXPECT_EQ(value_types.at("hard_disk_number"), ValueType::INT);
    EXPECT_EQ(value_types.at("current_temperature"), ValueType::FLOAT);
    EXPECT_EQ(value_types.at("estimated_remaining_lifetime"), ValueType::INT);
    EXPECT_EQ(value_types.at("tip"), ValueType::STR);
}

// Test: written totals keep their GB/TB unit so the template can scale them
TEST_F(TemplateStoreTest, Load_ShippedLifetimeWritesKeepsUnit) {
    auto templates = LoadShipped();
    ASSERT_TRUE(templates.has_value()) << templates.error().message;

    const auto sensor = std::ranges::find(*templates, std::string{"lifetime_writes"},
                                          &SensorTemplate::name);
    ASSERT_NE(sensor, templates->end());
    EXPECT_EQ(sensor->value_type, ValueType::STR);
    EXPECT_THAT(sensor->extra_payload.at("value_template").get<std::string>(),
                testing::HasSubstr("multiply(0.001)"));

    const auto state = core::PublishLoop::build_state_payload(
        {{"Lifetime_Writes", "1234 GB"}}, core::collect_value_types(*templates));
    EXPECT_EQ(state.at("lifetime_writes"), "1234 GB");

    const auto terabytes = core::PublishLoop::build_state_payload(
        {{"Lifetime_Writes", "12.34 TB"}}, core::collect_value_types(*templates));
    EXPECT_EQ(terabytes.at("lifetime_writes"), "12.34 TB");
}

TEST_F(TemplateStoreTest, Parse_RejectsQueryKeysUnsafeForTopics) {
    for (const auto* key : {"health/raw", "health+", "#", "power on", "{{x}}"}) {
        auto templates = config::parse_sensor_templates(
            nlohmann::json{{"sensor", {{"health", {{"_key", key}}}}}}.dump());
        ASSERT_FALSE(templates.has_value()) << "_key=" << key;
        EXPECT_EQ(templates.error().kind, util::ErrorKind::CONFIGURATION);
    }
}

// Test: without _key the template name is the query key and is checked too
TEST_F(TemplateStoreTest, Parse_RejectsUnsafeTemplateName) {
    auto templates = config::parse_sensor_templates(R"({"sensor": {"disk/health": null}})");

    ASSERT_FALSE(templates.has_value());
    EXPECT_THAT(templates.error().message, testing::HasSubstr("disk/health"));
}
