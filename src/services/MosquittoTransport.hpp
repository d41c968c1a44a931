/**
 * @file MosquittoTransport.hpp
 * @brief ITransport implementation on top of libmosquitto
 */

#pragma once

#include "config/Settings.hpp"
#include "services/ITransport.hpp"

#include <chrono>

/**
 * @class MosquittoTransport
 * @brief Connect-publish-disconnect MQTT client
 *
 * Messages are sent with QoS 0. A call returns once the broker accepted the
 * connection and every message was written to the socket, or fails after
 * the operation timeout.
 */
class MosquittoTransport : public ITransport {
public:
    explicit MosquittoTransport(config::MqttSettings settings,
                                std::chrono::milliseconds operation_timeout = DEFAULT_TIMEOUT);
    ~MosquittoTransport() override = default;

    MosquittoTransport(const MosquittoTransport&) = delete;
    MosquittoTransport& operator=(const MosquittoTransport&) = delete;

    [[nodiscard]] auto publish_single(const std::string& topic, const std::string& payload,
                                      bool retain) -> std::expected<void, util::Error> override;

    [[nodiscard]] auto publish_multiple(const std::vector<MqttMessage>& messages)
        -> std::expected<void, util::Error> override;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{std::chrono::seconds{10}};

private:
    config::MqttSettings settings_;
    std::chrono::milliseconds operation_timeout_;
};
