#include "config/Settings.hpp"

#include "config.h"

#include <glib.h>

#include <charconv>
#include <format>
#include <limits>

namespace config {

namespace {

auto config_error(std::string message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::CONFIGURATION, std::move(message)});
}

auto non_empty(const EnvironmentLookup& env, const std::string& name) -> std::optional<std::string> {
    auto value = env(name);
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

auto parse_number(const std::string& name, const std::string& text, int64_t min, int64_t max)
    -> std::expected<int64_t, util::Error> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < min || value > max) {
        return config_error(
            std::format("{}={} is not an integer in [{}, {}]", name, text, min, max));
    }
    return value;
}

// Flags are enabled only by the exact value "1"
auto flag(const EnvironmentLookup& env, const std::string& name) -> bool {
    return env(name).value_or("0") == "1";
}

}  // namespace

auto process_environment() -> EnvironmentLookup {
    return [](const std::string& name) -> std::optional<std::string> {
        const gchar* value = g_getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string{value};
    };
}

auto load_settings(const EnvironmentLookup& env) -> std::expected<Settings, util::Error> {
    Settings settings;
    settings.sensors_config = std::filesystem::path{HDSENTINEL_MQTT_DATADIR} / "sensors.json";

    auto host = non_empty(env, "MQTT_HOST");
    if (!host) {
        return config_error("MQTT_HOST environment variable is not set");
    }
    settings.mqtt.host = *host;

    if (auto port = non_empty(env, "MQTT_PORT")) {
        auto value = parse_number("MQTT_PORT", *port, 1, std::numeric_limits<uint16_t>::max());
        if (!value) {
            return std::unexpected(value.error());
        }
        settings.mqtt.port = static_cast<uint16_t>(*value);
    }

    auto user = non_empty(env, "MQTT_USER");
    auto password = non_empty(env, "MQTT_PASSWORD");
    if (user && password) {
        settings.mqtt.username = std::move(user);
        settings.mqtt.password = std::move(password);
    }

    settings.mqtt.use_tls = flag(env, "MQTT_USE_TLS");
    if (auto ca_path = non_empty(env, "MQTT_CA_PATH")) {
        settings.mqtt.ca_path = *ca_path;
    }
    if (auto client_id = non_empty(env, "MQTT_CLIENT_ID")) {
        settings.mqtt.client_id = *client_id;
    }
    if (auto topic = non_empty(env, "MQTT_TOPIC")) {
        settings.base_topic = *topic;
    }
    if (auto prefix = non_empty(env, "HA_DISCOVERY_PREFIX")) {
        settings.discovery_prefix = *prefix;
    }

    if (auto interval = non_empty(env, "HDSENTINEL_INTERVAL")) {
        // Upper bound keeps ceil(1.5 * interval) and the sleep arithmetic in range
        auto value = parse_number("HDSENTINEL_INTERVAL", *interval, 1, 365 * 24 * 3600);
        if (!value) {
            return std::unexpected(value.error());
        }
        settings.poll_interval = std::chrono::seconds{*value};
    }

    if (auto mode = non_empty(env, "HDSENTINEL_MODE")) {
        if (*mode == "xml") {
            settings.snapshot_mode = SnapshotMode::XML_REPORT;
        } else if (*mode == "device") {
            settings.snapshot_mode = SnapshotMode::DEVICE_SCAN;
        } else {
            return config_error(std::format("HDSENTINEL_MODE={} must be 'xml' or 'device'", *mode));
        }
    }

    if (auto xml_path = non_empty(env, "HDSENTINEL_XML_PATH")) {
        if (settings.snapshot_mode == SnapshotMode::DEVICE_SCAN) {
            return config_error("HDSENTINEL_XML_PATH cannot be used with HDSENTINEL_MODE=device");
        }
        settings.xml_report_path = std::filesystem::path{*xml_path};
    }
    if (auto binary = non_empty(env, "HDSENTINEL_BIN")) {
        settings.hdsentinel_binary = *binary;
    }
    if (auto sensors = non_empty(env, "HDSENTINEL_SENSORS_CONFIG")) {
        settings.sensors_config = *sensors;
    }
    if (auto log_dir = non_empty(env, "HDSENTINEL_LOG_DIR")) {
        settings.log_dir = std::filesystem::path{*log_dir};
    }
    settings.debug_logging = flag(env, "DEBUG");

    return settings;
}

}  // namespace config
