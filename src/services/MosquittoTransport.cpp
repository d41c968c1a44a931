#include "services/MosquittoTransport.hpp"

#include "util/Logger.hpp"

#include <mosquitto.h>

#include <format>
#include <memory>

namespace {

constexpr auto COMPONENT = "MosquittoTransport";
constexpr int KEEPALIVE_SECONDS = 60;
constexpr int LOOP_TIMEOUT_MS = 100;

// mosquitto_lib_init() must run once per process before any client exists
class MosquittoLibrary {
public:
    static void ensure_initialized() {
        static MosquittoLibrary library;
    }

    MosquittoLibrary(const MosquittoLibrary&) = delete;
    MosquittoLibrary& operator=(const MosquittoLibrary&) = delete;

private:
    MosquittoLibrary() {
        mosquitto_lib_init();
    }
    ~MosquittoLibrary() {
        mosquitto_lib_cleanup();
    }
};

struct SessionState {
    int connack_code = -1;  ///< -1 until CONNACK arrives
    size_t published = 0;
};

void on_connect(mosquitto* /*mosq*/, void* userdata, int rc) {
    static_cast<SessionState*>(userdata)->connack_code = rc;
}

void on_publish(mosquitto* /*mosq*/, void* userdata, int /*mid*/) {
    ++static_cast<SessionState*>(userdata)->published;
}

using ClientHandle = std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)>;

auto transport_error(std::string message, int code = 0) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::TRANSPORT, std::move(message), code});
}

}  // namespace

MosquittoTransport::MosquittoTransport(config::MqttSettings settings,
                                       std::chrono::milliseconds operation_timeout)
    : settings_(std::move(settings)), operation_timeout_(operation_timeout) {}

auto MosquittoTransport::publish_single(const std::string& topic, const std::string& payload,
                                        bool retain) -> std::expected<void, util::Error> {
    return publish_multiple({MqttMessage{.topic = topic, .payload = payload, .retain = retain}});
}

auto MosquittoTransport::publish_multiple(const std::vector<MqttMessage>& messages)
    -> std::expected<void, util::Error> {
    if (messages.empty()) {
        return {};
    }

    MosquittoLibrary::ensure_initialized();

    SessionState state;
    ClientHandle client{mosquitto_new(settings_.client_id.c_str(), true, &state),
                        mosquitto_destroy};
    if (!client) {
        return transport_error("Failed to create MQTT client");
    }
    mosquitto_connect_callback_set(client.get(), on_connect);
    mosquitto_publish_callback_set(client.get(), on_publish);

    if (settings_.username && settings_.password) {
        if (int rc = mosquitto_username_pw_set(client.get(), settings_.username->c_str(),
                                               settings_.password->c_str());
            rc != MOSQ_ERR_SUCCESS) {
            return transport_error(
                std::format("Failed to set credentials: {}", mosquitto_strerror(rc)), rc);
        }
    }

    if (settings_.use_tls) {
        if (int rc = mosquitto_tls_set(client.get(), nullptr, settings_.ca_path.c_str(), nullptr,
                                       nullptr, nullptr);
            rc != MOSQ_ERR_SUCCESS) {
            return transport_error(
                std::format("Failed to configure TLS: {}", mosquitto_strerror(rc)), rc);
        }
    }

    LOG_DEBUG(COMPONENT, std::format("Connecting to {}:{} ({} messages)", settings_.host,
                                     settings_.port, messages.size()));

    if (int rc = mosquitto_connect(client.get(), settings_.host.c_str(), settings_.port,
                                   KEEPALIVE_SECONDS);
        rc != MOSQ_ERR_SUCCESS) {
        return transport_error(std::format("Failed to connect to {}:{}: {}", settings_.host,
                                           settings_.port, mosquitto_strerror(rc)),
                               rc);
    }

    const auto deadline = std::chrono::steady_clock::now() + operation_timeout_;

    while (state.connack_code < 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return transport_error("Timed out waiting for broker CONNACK");
        }
        if (int rc = mosquitto_loop(client.get(), LOOP_TIMEOUT_MS, 1); rc != MOSQ_ERR_SUCCESS) {
            return transport_error(std::format("Connection failed: {}", mosquitto_strerror(rc)),
                                   rc);
        }
    }
    if (state.connack_code != 0) {
        return transport_error(std::format("Broker refused connection: {}",
                                           mosquitto_connack_string(state.connack_code)),
                               state.connack_code);
    }

    for (const auto& message : messages) {
        int rc = mosquitto_publish(client.get(), nullptr, message.topic.c_str(),
                                   static_cast<int>(message.payload.size()),
                                   message.payload.data(), 0, message.retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            mosquitto_disconnect(client.get());
            return transport_error(std::format("Failed to publish to {}: {}", message.topic,
                                               mosquitto_strerror(rc)),
                                   rc);
        }
    }

    while (state.published < messages.size()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            mosquitto_disconnect(client.get());
            return transport_error(std::format("Timed out flushing messages ({} of {} sent)",
                                               state.published, messages.size()));
        }
        if (int rc = mosquitto_loop(client.get(), LOOP_TIMEOUT_MS, 1); rc != MOSQ_ERR_SUCCESS) {
            return transport_error(std::format("Connection lost: {}", mosquitto_strerror(rc)),
                                   rc);
        }
    }

    mosquitto_disconnect(client.get());
    return {};
}
