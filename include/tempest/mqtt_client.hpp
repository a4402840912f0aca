/**
 * @file mqtt_client.hpp
 * @brief Delivery of rendered publications to an MQTT broker.
 *
 * Wraps a libmosquitto session. connect() establishes the first connection
 * and starts the library's network thread, which keeps the session alive and
 * reconnects after a loss. Every publication goes out at QoS 1 (at least
 * once) with its retain flag. Publications not yet acknowledged by the
 * broker are bounded by MQTT_QUEUE_CAPACITY; beyond that new ones are
 * dropped and counted.
 */

#ifndef TEMPEST_MQTT_CLIENT_HPP
#define TEMPEST_MQTT_CLIENT_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config.hpp"
#include "error.hpp"
#include "messages.hpp"
#include "publisher.hpp"
#include "station.hpp"

struct mosquitto;

namespace tempest {

/**
 * @brief Broker address and credentials.
 */
struct MqttParams {
    std::string host;
    std::uint16_t port = MQTT_PORT;
    std::string username; ///< Empty for an anonymous session
    std::string password;

    /**
     * @brief Check the address is usable.
     * @return Error::Ok, or Error::InvalidArg for an empty host or port 0
     */
    [[nodiscard]] Error validate() const noexcept;
};

class MqttClient {
public:
    explicit MqttClient(MqttParams params);
    ~MqttClient();

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    /**
     * @brief Connect to the broker and start the network thread.
     *
     * @param[out] reason Failure detail
     * @return Error::Ok, Error::InvalidArg for unusable parameters or
     *         Error::Io when the broker cannot be reached
     */
    Error connect(std::string& reason);

    /// Close the session and join the network thread
    void disconnect() noexcept;

    /// True between the broker's connection acknowledgement and a loss
    [[nodiscard]] bool is_connected() const noexcept {
        return connected_.load(std::memory_order_acquire);
    }

    /**
     * @brief Queue one publication.
     *
     * @return Error::Ok once handed to the session; Error::Io without a
     *         session, with the queue full or on a library failure
     */
    Error publish(const Publication& publication);

    /**
     * @brief Render a message and queue all of its publications.
     *
     * @return Number of publications accepted
     */
    std::size_t publish_report(const Message& message, const StationParams& station_params);

    /// Publications handed over but not yet acknowledged
    [[nodiscard]] std::size_t pending_count() const noexcept {
        return pending_.load(std::memory_order_relaxed);
    }

    /// Publications refused because the queue was full
    [[nodiscard]] std::uint64_t dropped_count() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const MqttParams& params() const noexcept {
        return params_;
    }

private:
    static void on_connect(mosquitto* handle, void* self, int rc);
    static void on_disconnect(mosquitto* handle, void* self, int rc);
    static void on_publish(mosquitto* handle, void* self, int message_id);

    MqttParams params_;
    mosquitto* handle_ = nullptr;
    bool loop_running_ = false;
    std::atomic<bool> connected_{false};
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace tempest

#endif // TEMPEST_MQTT_CLIENT_HPP
