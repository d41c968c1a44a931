/**
 * @file PublishLoop.hpp
 * @brief Discovery, polling and availability state machine of the agent
 *
 * Lifecycle: BOOTSTRAPPING -> STEADY -> DRAINING -> TERMINATED.
 *
 * Bootstrapping takes one snapshot, registers every disk in it and publishes
 * its retained discovery messages. Steady polls on the configured interval,
 * publishes one state JSON per registered disk and tracks availability so
 * that "online"/"offline" are only sent on transitions. Draining publishes
 * "offline" for every registered disk before the process exits.
 */

#pragma once

#include "core/SensorTemplateExpander.hpp"
#include "models/DiskInfo.hpp"
#include "models/SensorTypes.hpp"
#include "services/ISnapshotSource.hpp"
#include "services/ITransport.hpp"
#include "util/CancellationToken.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/**
 * @struct DiskRuntimeState
 * @brief Everything known about one registered disk
 *
 * Only last_published_availability changes after registration.
 */
struct DiskRuntimeState {
    DiskIdentity identity;
    std::string alias;
    DiskTopics topics;
    std::vector<SensorDescriptor> sensor_configs;
    std::map<std::string, ValueType> value_types;
    Availability last_published_availability = Availability::UNKNOWN;
};

/**
 * @struct PublishLoopOptions
 * @brief Loop configuration
 */
struct PublishLoopOptions {
    DiscoveryOptions discovery;
    std::string base_topic = "hdsentinel";
};

/**
 * @enum LoopPhase
 * @brief Current state of the loop
 */
enum class LoopPhase {
    BOOTSTRAPPING,
    STEADY,
    DRAINING,
    TERMINATED
};

[[nodiscard]] constexpr auto to_string(LoopPhase phase) -> std::string_view {
    switch (phase) {
        case LoopPhase::BOOTSTRAPPING:
            return "bootstrapping";
        case LoopPhase::STEADY:
            return "steady";
        case LoopPhase::DRAINING:
            return "draining";
        case LoopPhase::TERMINATED:
            return "terminated";
    }
    return "terminated";
}

/**
 * @class PublishLoop
 * @brief Drives the snapshot source and publishes everything through the transport
 *
 * Runs on the calling thread. Errors from the source or the transport are
 * logged and never escape run().
 */
class PublishLoop {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_STARTUP_FAILURE = 1;

    PublishLoop(std::shared_ptr<ISnapshotSource> source, std::shared_ptr<ITransport> transport,
                std::vector<SensorTemplate> templates, PublishLoopOptions options);

    /**
     * @brief Bootstrap, poll until @p token is cancelled, then drain
     * @return EXIT_OK after draining, EXIT_STARTUP_FAILURE if bootstrapping failed
     *
     * A token cancelled before the call still bootstraps and then drains
     * without polling.
     */
    auto run(util::CancellationToken& token) -> int;

    /**
     * @brief Register every disk of one snapshot and publish its discovery messages
     * @return Error if the snapshot failed, was empty, or no disk could be registered
     */
    [[nodiscard]] auto bootstrap() -> std::expected<void, util::Error>;

    /**
     * @brief One polling cycle: snapshot, state and availability publishes
     */
    void run_cycle();

    /**
     * @brief Publish "offline" for every registered disk, ignoring previous state
     */
    void drain();

    [[nodiscard]] auto phase() const -> LoopPhase {
        return phase_;
    }

    /// Registered disks keyed by serial number
    [[nodiscard]] auto disks() const -> const std::map<std::string, DiskRuntimeState>& {
        return disks_;
    }

    /**
     * @brief State JSON of one disk
     *
     * Attribute names are lowercased. Values whose name has a declared type
     * are coerced; all others are published as strings.
     */
    [[nodiscard]] static auto build_state_payload(
        const DiskAttributes& attributes, const std::map<std::string, ValueType>& value_types)
        -> nlohmann::json;

private:
    void enter_phase(LoopPhase phase);
    [[nodiscard]] auto register_disk(const std::string& serial, const DiskAttributes& attributes)
        -> DiskRuntimeState;
    void publish_discovery(const DiskRuntimeState& disk);
    void publish_state(DiskRuntimeState& disk, const DiskAttributes& attributes);
    auto publish_availability(DiskRuntimeState& disk, Availability availability, bool force)
        -> bool;

    std::shared_ptr<ISnapshotSource> source_;
    std::shared_ptr<ITransport> transport_;
    std::vector<SensorTemplate> templates_;
    std::map<std::string, ValueType> value_types_;
    PublishLoopOptions options_;
    std::map<std::string, DiskRuntimeState> disks_;
    LoopPhase phase_ = LoopPhase::BOOTSTRAPPING;
};

}  // namespace core
