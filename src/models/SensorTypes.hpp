/**
 * @file SensorTypes.hpp
 * @brief Sensor template and discovery descriptor types
 */

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

/**
 * @enum SensorKind
 * @brief Home Assistant entity component a template registers as
 */
enum class SensorKind {
    BINARY_SENSOR,
    SENSOR
};

/// Kinds in the order templates are expanded
inline constexpr std::array SENSOR_KINDS{SensorKind::BINARY_SENSOR, SensorKind::SENSOR};

[[nodiscard]] constexpr auto to_string(SensorKind kind) -> std::string_view {
    switch (kind) {
        case SensorKind::BINARY_SENSOR:
            return "binary_sensor";
        case SensorKind::SENSOR:
            return "sensor";
    }
    return "sensor";
}

/**
 * @enum ValueType
 * @brief Declared type of a sensor value in the state payload
 */
enum class ValueType {
    INT,
    FLOAT,
    STR
};

[[nodiscard]] constexpr auto to_string(ValueType type) -> std::string_view {
    switch (type) {
        case ValueType::INT:
            return "int";
        case ValueType::FLOAT:
            return "float";
        case ValueType::STR:
            return "str";
    }
    return "str";
}

[[nodiscard]] inline auto parse_value_type(std::string_view name) -> std::optional<ValueType> {
    if (name == "int") {
        return ValueType::INT;
    }
    if (name == "float") {
        return ValueType::FLOAT;
    }
    if (name == "str") {
        return ValueType::STR;
    }
    return std::nullopt;
}

/**
 * @struct SensorTemplate
 * @brief One declarative sensor definition from the template store
 */
struct SensorTemplate {
    SensorKind kind = SensorKind::SENSOR;
    std::string name;                   ///< Template name, used in the entity name
    std::string query_key;              ///< Attribute key in the state payload
    ValueType value_type = ValueType::STR;
    nlohmann::json extra_payload = nlohmann::json::object();  ///< Passthrough discovery fields

    auto operator==(const SensorTemplate&) const -> bool = default;
};

/**
 * @struct SensorDescriptor
 * @brief Discovery message (topic + payload) registering one sensor of one disk
 */
struct SensorDescriptor {
    std::string topic;
    nlohmann::json payload;

    auto operator==(const SensorDescriptor&) const -> bool = default;
};

/**
 * @enum Availability
 * @brief Last availability value published for a disk
 */
enum class Availability {
    UNKNOWN,
    ONLINE,
    OFFLINE
};

[[nodiscard]] constexpr auto to_string(Availability availability) -> std::string_view {
    switch (availability) {
        case Availability::UNKNOWN:
            return "unknown";
        case Availability::ONLINE:
            return "online";
        case Availability::OFFLINE:
            return "offline";
    }
    return "unknown";
}
