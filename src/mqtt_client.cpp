/**
 * @file mqtt_client.cpp
 * @brief Delivery of rendered publications to an MQTT broker.
 */

#include <tempest/log.hpp>
#include <tempest/mqtt_client.hpp>

#include <mosquitto.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace tempest {

namespace {

// Quality of service of every publication: at least once
constexpr int QOS_AT_LEAST_ONCE = 1;

// Reconnect backoff of the network thread, in seconds
constexpr unsigned int RECONNECT_DELAY_MIN = 1;
constexpr unsigned int RECONNECT_DELAY_MAX = 30;

struct Library {
    Library() {
        mosquitto_lib_init();
    }
    ~Library() {
        mosquitto_lib_cleanup();
    }
    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;
};

void ensure_library() {
    static Library library;
}

std::string describe_failure(int rc) {
    if (rc == MOSQ_ERR_ERRNO) {
        return std::strerror(errno);
    }
    return mosquitto_strerror(rc);
}

} // namespace

Error MqttParams::validate() const noexcept {
    if (host.empty() || port == 0) {
        return Error::InvalidArg;
    }
    return Error::Ok;
}

MqttClient::MqttClient(MqttParams params) : params_(std::move(params)) {}

MqttClient::~MqttClient() {
    disconnect();
}

Error MqttClient::connect(std::string& reason) {
    if (params_.validate() != Error::Ok) {
        reason = "broker host must be set and port must be 1-65535";
        return Error::InvalidArg;
    }
    disconnect();
    ensure_library();

    handle_ = mosquitto_new(MQTT_CLIENT_ID, true, this);
    if (handle_ == nullptr) {
        reason = std::string("mosquitto_new: ") + std::strerror(errno);
        return Error::Io;
    }
    mosquitto_connect_callback_set(handle_, &MqttClient::on_connect);
    mosquitto_disconnect_callback_set(handle_, &MqttClient::on_disconnect);
    mosquitto_publish_callback_set(handle_, &MqttClient::on_publish);
    mosquitto_reconnect_delay_set(handle_, RECONNECT_DELAY_MIN, RECONNECT_DELAY_MAX, true);

    int rc = mosquitto_int_option(handle_, MOSQ_OPT_PROTOCOL_VERSION, MQTT_PROTOCOL_V311);
    if (rc != MOSQ_ERR_SUCCESS) {
        reason = "protocol version: " + describe_failure(rc);
        disconnect();
        return Error::Io;
    }
    if (!params_.username.empty()) {
        rc = mosquitto_username_pw_set(handle_, params_.username.c_str(),
                                       params_.password.empty() ? nullptr
                                                                : params_.password.c_str());
        if (rc != MOSQ_ERR_SUCCESS) {
            reason = "credentials: " + describe_failure(rc);
            disconnect();
            return Error::Io;
        }
    }

    rc = mosquitto_connect(handle_, params_.host.c_str(), params_.port,
                           static_cast<int>(MQTT_KEEPALIVE.count()));
    if (rc != MOSQ_ERR_SUCCESS) {
        reason = params_.host + ":" + std::to_string(params_.port) + ": " + describe_failure(rc);
        disconnect();
        return Error::Io;
    }

    rc = mosquitto_loop_start(handle_);
    if (rc != MOSQ_ERR_SUCCESS) {
        reason = "network thread: " + describe_failure(rc);
        disconnect();
        return Error::Io;
    }
    loop_running_ = true;

    log_info("MQTT session to %s:%u started", params_.host.c_str(),
             static_cast<unsigned>(params_.port));
    return Error::Ok;
}

void MqttClient::disconnect() noexcept {
    if (handle_ == nullptr) {
        return;
    }
    int rc = mosquitto_disconnect(handle_);
    if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
        log_warn("MQTT disconnect failed: %s", mosquitto_strerror(rc));
    }
    if (loop_running_) {
        rc = mosquitto_loop_stop(handle_, false);
        if (rc != MOSQ_ERR_SUCCESS) {
            log_warn("MQTT network thread did not stop cleanly: %s", mosquitto_strerror(rc));
        }
        loop_running_ = false;
    }
    mosquitto_destroy(handle_);
    handle_ = nullptr;
    connected_.store(false, std::memory_order_release);
    pending_.store(0, std::memory_order_relaxed);
}

Error MqttClient::publish(const Publication& publication) {
    if (handle_ == nullptr) {
        log_error("MQTT publish failed: %s: no session", publication.topic.c_str());
        return Error::Io;
    }
    if (pending_.load(std::memory_order_relaxed) >= MQTT_QUEUE_CAPACITY) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        log_warn("MQTT queue full, dropping %s", publication.topic.c_str());
        return Error::Io;
    }

    pending_.fetch_add(1, std::memory_order_relaxed);
    int rc = mosquitto_publish(handle_, nullptr, publication.topic.c_str(),
                               static_cast<int>(publication.payload.size()),
                               publication.payload.data(), QOS_AT_LEAST_ONCE, publication.retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        pending_.fetch_sub(1, std::memory_order_relaxed);
        log_error("MQTT publish failed: %s: %s", publication.topic.c_str(),
                  describe_failure(rc).c_str());
        return Error::Io;
    }
    return Error::Ok;
}

std::size_t MqttClient::publish_report(const Message& message,
                                       const StationParams& station_params) {
    std::size_t accepted = 0;
    for (const Publication& publication : render_publications(message, station_params)) {
        if (publish(publication) == Error::Ok) {
            ++accepted;
        }
    }
    return accepted;
}

void MqttClient::on_connect(mosquitto* /*handle*/, void* self, int rc) {
    auto* client = static_cast<MqttClient*>(self);
    if (rc == 0) {
        client->connected_.store(true, std::memory_order_release);
        log_info("Connected to MQTT broker %s:%u", client->params_.host.c_str(),
                 static_cast<unsigned>(client->params_.port));
    } else {
        log_error("MQTT broker refused the connection: %s", mosquitto_connack_string(rc));
    }
}

void MqttClient::on_disconnect(mosquitto* /*handle*/, void* self, int rc) {
    auto* client = static_cast<MqttClient*>(self);
    client->connected_.store(false, std::memory_order_release);
    if (rc != 0) {
        log_warn("MQTT connection lost, reconnecting");
    }
}

void MqttClient::on_publish(mosquitto* /*handle*/, void* self, int /*message_id*/) {
    auto* client = static_cast<MqttClient*>(self);
    std::size_t pending = client->pending_.load(std::memory_order_relaxed);
    while (pending > 0 && !client->pending_.compare_exchange_weak(pending, pending - 1,
                                                                  std::memory_order_relaxed)) {
    }
}

} // namespace tempest
