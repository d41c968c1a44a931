/**
 * @file SensorTemplateExpander.hpp
 * @brief Expansion of sensor templates into per-disk discovery descriptors
 *
 * For one disk, every template becomes one retained discovery message on
 * {discovery_prefix}/{kind}/{device_prefix}_{alias}/{query_key}/config.
 * The payload ties the entity to the disk's device block, its shared state
 * and availability topics and a value_template reading query_key from the
 * state JSON. Template passthrough fields are merged last and win.
 *
 * Expansion is pure: same inputs, byte-identical descriptors.
 */

#pragma once

#include "models/DiskInfo.hpp"
#include "models/SensorTypes.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace core {

/**
 * @struct DiscoveryOptions
 * @brief Naming and timing parameters shared by every disk
 */
struct DiscoveryOptions {
    std::chrono::seconds poll_interval{600};
    std::string discovery_prefix = "homeassistant";
    std::string device_prefix = "hdsentinel";
    std::string manufacturer = "hdsentinel";
};

/**
 * @struct DiskTopics
 * @brief Per-disk state and availability topics
 */
struct DiskTopics {
    std::string state_topic;         ///< {base}/{alias}/hdsentinel
    std::string availability_topic;  ///< {base}/{alias}/availability
};

[[nodiscard]] auto build_disk_topics(const std::string& base_topic, const std::string& alias)
    -> DiskTopics;

/**
 * @brief Seconds after which Home Assistant marks a sensor stale: ceil(1.5 * interval)
 */
[[nodiscard]] auto expire_after(std::chrono::seconds poll_interval) -> std::int64_t;

/**
 * @brief Expand @p templates for one disk
 * @return Descriptors ordered by sensor kind, then template name
 */
[[nodiscard]] auto expand_templates(const DiskIdentity& identity, const std::string& alias,
                                    const DiskTopics& topics,
                                    const std::vector<SensorTemplate>& templates,
                                    const DiscoveryOptions& options)
    -> std::vector<SensorDescriptor>;

/**
 * @brief query_key -> declared value type, used to coerce state values
 */
[[nodiscard]] auto collect_value_types(const std::vector<SensorTemplate>& templates)
    -> std::map<std::string, ValueType>;

/**
 * @brief Serialize a payload with sorted keys
 */
[[nodiscard]] auto serialize_payload(const nlohmann::json& payload) -> std::string;

}  // namespace core
