#include "core/PublishLoop.hpp"

#include "core/AliasBuilder.hpp"
#include "core/ValueCoercion.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>
#include <utility>

namespace core {

namespace {

constexpr auto COMPONENT = "PublishLoop";

auto to_lower_ascii(std::string_view text) -> std::string {
    std::string lowered{text};
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

}  // namespace

PublishLoop::PublishLoop(std::shared_ptr<ISnapshotSource> source,
                         std::shared_ptr<ITransport> transport,
                         std::vector<SensorTemplate> templates, PublishLoopOptions options)
    : source_(std::move(source)),
      transport_(std::move(transport)),
      templates_(std::move(templates)),
      value_types_(collect_value_types(templates_)),
      options_(std::move(options)) {}

auto PublishLoop::run(util::CancellationToken& token) -> int {
    enter_phase(LoopPhase::BOOTSTRAPPING);
    LOG_INFO(COMPONENT, "Get initial data from hdsentinel...");
    if (auto result = bootstrap(); !result) {
        LOG_ERROR(COMPONENT, std::format("{}. Exiting.", result.error().message));
        enter_phase(LoopPhase::TERMINATED);
        return EXIT_STARTUP_FAILURE;
    }

    enter_phase(LoopPhase::STEADY);
    const auto interval =
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.discovery.poll_interval);
    while (!token.is_cancelled()) {
        run_cycle();
        if (token.wait_for(interval)) {
            break;
        }
    }
    LOG_INFO(COMPONENT, "Exiting main loop...");

    enter_phase(LoopPhase::DRAINING);
    drain();
    enter_phase(LoopPhase::TERMINATED);
    return EXIT_OK;
}

void PublishLoop::enter_phase(LoopPhase phase) {
    if (phase != phase_) {
        LOG_DEBUG(COMPONENT, std::format("Phase {} -> {}", to_string(phase_), to_string(phase)));
    }
    phase_ = phase;
}

auto PublishLoop::bootstrap() -> std::expected<void, util::Error> {
    auto snapshot = source_->take_snapshot();
    if (!snapshot) {
        return std::unexpected(util::Error{
            util::ErrorKind::SNAPSHOT,
            std::format("Error getting disk data: {}", snapshot.error().message)});
    }
    if (snapshot->empty()) {
        return std::unexpected(util::Error{util::ErrorKind::SNAPSHOT, "No disks found"});
    }

    for (const auto& [serial, attributes] : *snapshot) {
        try {
            LOG_INFO(COMPONENT, std::format("Processing disk: {}", serial));
            auto disk = register_disk(serial, attributes);
            LOG_INFO(COMPONENT, std::format("Using alias: {}", disk.alias));
            publish_discovery(disk);
            disks_.insert_or_assign(serial, std::move(disk));
        } catch (const std::exception& e) {
            LOG_ERROR(COMPONENT, std::format("Error setting up disk {}: {}", serial, e.what()));
        }
    }

    if (disks_.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::SNAPSHOT, "No disk could be registered"});
    }
    return {};
}

auto PublishLoop::register_disk(const std::string& serial, const DiskAttributes& attributes)
    -> DiskRuntimeState {
    DiskRuntimeState disk;
    disk.identity = DiskIdentity::from_attributes(serial, attributes);
    disk.alias = build_disk_alias(disk.identity.model_id, disk.identity.serial_number);
    disk.topics = build_disk_topics(options_.base_topic, disk.alias);
    disk.sensor_configs =
        expand_templates(disk.identity, disk.alias, disk.topics, templates_, options_.discovery);
    disk.value_types = value_types_;
    return disk;
}

void PublishLoop::publish_discovery(const DiskRuntimeState& disk) {
    std::vector<MqttMessage> messages;
    messages.reserve(disk.sensor_configs.size());
    for (const auto& sensor : disk.sensor_configs) {
        messages.push_back(MqttMessage{
            .topic = sensor.topic, .payload = serialize_payload(sensor.payload), .retain = true});
    }

    LOG_INFO(COMPONENT, std::format("Publishing {} sensors for {}", messages.size(), disk.alias));
    if (auto result = transport_->publish_multiple(messages); !result) {
        // Registration stands; state and availability still flow for this disk
        LOG_ERROR(COMPONENT, std::format("Failed to publish discovery for {}: {}", disk.alias,
                                         result.error().message));
    }
}

void PublishLoop::run_cycle() {
    auto snapshot = source_->take_snapshot();
    if (!snapshot) {
        LOG_ERROR(COMPONENT,
                  std::format("Error in main loop: {}", snapshot.error().message));
        return;
    }

    for (const auto& serial : *snapshot | std::views::keys) {
        if (!disks_.contains(serial)) {
            LOG_WARNING(COMPONENT,
                        std::format("Skipping new disk {} that wasn't in initial configuration",
                                    serial));
        }
    }

    for (auto& [serial, disk] : disks_) {
        try {
            if (auto it = snapshot->find(serial); it != snapshot->end()) {
                publish_state(disk, it->second);
            } else {
                LOG_DEBUG(COMPONENT, std::format("Disk {} is missing from snapshot", serial));
                publish_availability(disk, Availability::OFFLINE, false);
            }
        } catch (const std::exception& e) {
            LOG_ERROR(COMPONENT, std::format("Error processing disk {}: {}", serial, e.what()));
        }
    }
}

void PublishLoop::publish_state(DiskRuntimeState& disk, const DiskAttributes& attributes) {
    const auto payload = serialize_payload(build_state_payload(attributes, disk.value_types));
    LOG_DEBUG(COMPONENT, std::format("Publishing status for {}: {}...", disk.topics.state_topic,
                                     payload.substr(0, 100)));

    if (auto result = transport_->publish_single(disk.topics.state_topic, payload, false);
        !result) {
        LOG_ERROR(COMPONENT, std::format("Failed to publish state for {}: {}", disk.alias,
                                         result.error().message));
        return;
    }
    publish_availability(disk, Availability::ONLINE, false);
}

auto PublishLoop::publish_availability(DiskRuntimeState& disk, Availability availability,
                                       bool force) -> bool {
    if (!force && disk.last_published_availability == availability) {
        return true;
    }

    LOG_INFO(COMPONENT, std::format("Publishing status: {} for {}", to_string(availability),
                                    disk.alias));
    if (auto result = transport_->publish_single(disk.topics.availability_topic,
                                                 std::string{to_string(availability)}, true);
        !result) {
        LOG_ERROR(COMPONENT, std::format("Failed to publish status {} for {}: {}",
                                         to_string(availability), disk.alias,
                                         result.error().message));
        return false;
    }
    disk.last_published_availability = availability;
    return true;
}

void PublishLoop::drain() {
    for (auto& [serial, disk] : disks_) {
        LOG_INFO(COMPONENT, std::format("Publishing offline status for {}", serial));
        try {
            publish_availability(disk, Availability::OFFLINE, true);
        } catch (const std::exception& e) {
            LOG_ERROR(COMPONENT,
                      std::format("Error publishing offline status for {}: {}", serial, e.what()));
        }
    }
}

auto PublishLoop::build_state_payload(const DiskAttributes& attributes,
                                      const std::map<std::string, ValueType>& value_types)
    -> nlohmann::json {
    auto state = nlohmann::json::object();
    for (const auto& [name, raw] : attributes) {
        auto key = to_lower_ascii(name);
        if (auto it = value_types.find(key); it != value_types.end()) {
            state[key] = to_json(coerce_value(raw, it->second));
        } else {
            state[key] = raw;
        }
    }
    return state;
}

}  // namespace core
