/**
 * @file Settings.hpp
 * @brief Runtime configuration of the agent, read from the environment
 */

#pragma once

#include "util/Error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace config {

/**
 * @enum SnapshotMode
 * @brief Which backend collects disk telemetry
 */
enum class SnapshotMode {
    XML_REPORT,  ///< One `hdsentinel -xml` report covering every disk
    DEVICE_SCAN  ///< One `hdsentinel -dev` run per block device
};

/**
 * @struct MqttSettings
 * @brief Broker connection parameters
 */
struct MqttSettings {
    std::string host;
    uint16_t port = 1883;
    std::optional<std::string> username;  ///< Set only together with password
    std::optional<std::string> password;
    bool use_tls = false;
    std::string ca_path = "/etc/ssl/certs";
    std::string client_id = "hdsentinel-mqtt";
};

/**
 * @struct Settings
 * @brief Complete agent configuration
 */
struct Settings {
    MqttSettings mqtt;
    std::string base_topic = "hdsentinel";
    std::string discovery_prefix = "homeassistant";
    std::chrono::seconds poll_interval{600};
    SnapshotMode snapshot_mode = SnapshotMode::XML_REPORT;
    std::optional<std::filesystem::path> xml_report_path;  ///< Read instead of running hdsentinel
    std::filesystem::path hdsentinel_binary = "/usr/sbin/hdsentinel";
    std::filesystem::path sensors_config;
    std::optional<std::filesystem::path> log_dir;
    bool debug_logging = false;
};

/// Returns the value of a variable, or nullopt when it is unset
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by the process environment
 */
[[nodiscard]] auto process_environment() -> EnvironmentLookup;

/**
 * @brief Build settings from environment variables
 *
 * Recognised variables: MQTT_HOST (required), MQTT_PORT, MQTT_USER,
 * MQTT_PASSWORD, MQTT_USE_TLS, MQTT_CA_PATH, MQTT_CLIENT_ID, MQTT_TOPIC,
 * HA_DISCOVERY_PREFIX, HDSENTINEL_INTERVAL, HDSENTINEL_XML_PATH,
 * HDSENTINEL_MODE, HDSENTINEL_BIN, HDSENTINEL_SENSORS_CONFIG,
 * HDSENTINEL_LOG_DIR, DEBUG.
 *
 * @return Settings, or a configuration error naming the offending variable
 */
[[nodiscard]] auto load_settings(const EnvironmentLookup& env)
    -> std::expected<Settings, util::Error>;

}  // namespace config
