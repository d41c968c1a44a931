/**
 * @file ITransport.hpp
 * @brief Interface for publishing messages to the MQTT broker
 */

#pragma once

#include "util/Error.hpp"

#include <expected>
#include <string>
#include <vector>

/**
 * @struct MqttMessage
 * @brief One message of a batch publish
 */
struct MqttMessage {
    std::string topic;
    std::string payload;
    bool retain = false;

    bool operator==(const MqttMessage&) const = default;
};

/**
 * @class ITransport
 * @brief Publish-only broker client
 *
 * Each call connects, publishes, flushes and disconnects. Nothing is kept
 * between calls, so a broker outage only fails the calls made during it.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Publish one message
     */
    [[nodiscard]] virtual auto publish_single(const std::string& topic, const std::string& payload,
                                              bool retain) -> std::expected<void, util::Error> = 0;

    /**
     * @brief Publish a batch over a single connection, in order
     */
    [[nodiscard]] virtual auto publish_multiple(const std::vector<MqttMessage>& messages)
        -> std::expected<void, util::Error> = 0;
};
