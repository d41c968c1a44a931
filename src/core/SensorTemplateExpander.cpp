#include "core/SensorTemplateExpander.hpp"

#include <algorithm>
#include <format>

namespace core {

namespace {

constexpr auto UNKNOWN_FIELD = "Unknown";

auto or_unknown(const std::string& value) -> std::string {
    return value.empty() ? std::string{UNKNOWN_FIELD} : value;
}

auto kind_rank(SensorKind kind) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::find(SENSOR_KINDS, kind) - SENSOR_KINDS.begin());
}

auto build_descriptor(const DiskIdentity& identity, const std::string& alias,
                      const DiskTopics& topics, const SensorTemplate& sensor,
                      const DiscoveryOptions& options) -> SensorDescriptor {
    const auto device_id = std::format("{}_{}", options.device_prefix, identity.serial_number);

    SensorDescriptor descriptor;
    descriptor.topic = std::format("{}/{}/{}_{}/{}/config", options.discovery_prefix,
                                   to_string(sensor.kind), options.device_prefix, alias,
                                   sensor.query_key);

    descriptor.payload = {
        {"device",
         {
             {"identifiers", nlohmann::json::array({device_id})},
             {"manufacturer", options.manufacturer},
             {"name", alias},
             {"model", or_unknown(identity.model_id)},
             {"sw_version", or_unknown(identity.firmware_revision)},
         }},
        {"expire_after", expire_after(options.poll_interval)},
        {"unique_id", std::format("{}_{}", device_id, sensor.query_key)},
        {"name", std::format("{}_{}", alias, sensor.name)},
        {"availability_topic", topics.availability_topic},
        {"state_topic", topics.state_topic},
        {"json_attributes_topic", topics.state_topic},
        {"value_template", std::format("{{{{value_json.{}}}}}", sensor.query_key)},
    };

    for (const auto& [key, value] : sensor.extra_payload.items()) {
        descriptor.payload[key] = value;
    }

    return descriptor;
}

}  // namespace

auto build_disk_topics(const std::string& base_topic, const std::string& alias) -> DiskTopics {
    return DiskTopics{.state_topic = std::format("{}/{}/hdsentinel", base_topic, alias),
                      .availability_topic = std::format("{}/{}/availability", base_topic, alias)};
}

auto expire_after(std::chrono::seconds poll_interval) -> std::int64_t {
    const auto seconds = static_cast<std::int64_t>(poll_interval.count());
    return (3 * seconds + 1) / 2;
}

auto expand_templates(const DiskIdentity& identity, const std::string& alias,
                      const DiskTopics& topics, const std::vector<SensorTemplate>& templates,
                      const DiscoveryOptions& options) -> std::vector<SensorDescriptor> {
    std::vector<const SensorTemplate*> ordered;
    ordered.reserve(templates.size());
    for (const auto& sensor : templates) {
        ordered.push_back(&sensor);
    }
    std::ranges::stable_sort(ordered, [](const SensorTemplate* lhs, const SensorTemplate* rhs) {
        if (lhs->kind != rhs->kind) {
            return kind_rank(lhs->kind) < kind_rank(rhs->kind);
        }
        return lhs->name < rhs->name;
    });

    std::vector<SensorDescriptor> descriptors;
    descriptors.reserve(ordered.size());
    for (const auto* sensor : ordered) {
        descriptors.push_back(build_descriptor(identity, alias, topics, *sensor, options));
    }
    return descriptors;
}

auto collect_value_types(const std::vector<SensorTemplate>& templates)
    -> std::map<std::string, ValueType> {
    std::map<std::string, ValueType> value_types;
    for (const auto& sensor : templates) {
        value_types[sensor.query_key] = sensor.value_type;
    }
    return value_types;
}

auto serialize_payload(const nlohmann::json& payload) -> std::string {
    // Invalid UTF-8 in raw attribute text is replaced, not thrown
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace core
