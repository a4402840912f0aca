/**
 * @file messages.hpp
 * @brief Validated, strongly typed Tempest messages.
 *
 * The six message kinds are fixed by the hub protocol, so they form a closed
 * std::variant; consumers dispatch with std::visit.
 */

#ifndef TEMPEST_MESSAGES_HPP
#define TEMPEST_MESSAGES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "observation.hpp"
#include "status_flags.hpp"
#include "wind.hpp"

namespace tempest {

struct PrecipEvent {
    std::string serial_number;
    std::optional<std::string> hub_serial_number;
    Timestamp timestamp{};
};

struct StrikeEvent {
    std::string serial_number;
    std::optional<std::string> hub_serial_number;
    Timestamp timestamp{};
    double distance = 0.0; ///< km
    double energy = 0.0;
};

struct RapidWind {
    std::string serial_number;
    std::optional<std::string> hub_serial_number;
    Timestamp timestamp{};
    Wind wind{0.0, 0.0};
};

struct DeviceStatus {
    std::string serial_number;
    std::optional<std::string> hub_serial_number;
    Timestamp timestamp{};
    std::chrono::seconds uptime{0};
    double voltage = 0.0;
    std::int32_t firmware_revision = 0;
    double rssi = 0.0;
    double hub_rssi = 0.0;
    SensorStatus sensor_status;
    bool debug = false;
};

struct HubStatus {
    std::string serial_number;
    std::string firmware_revision;
    std::chrono::seconds uptime{0};
    double rssi = 0.0;
    Timestamp timestamp{};
    ResetFlags reset_flags;
    std::int32_t seq = 0;
    RadioStats radio_stats;
};

/**
 * @brief Any decoded message.
 */
using Message =
    std::variant<PrecipEvent, StrikeEvent, RapidWind, Observation, DeviceStatus, HubStatus>;

/**
 * @brief Protocol tag of a decoded message (same as its raw counterpart).
 */
const char* message_type_tag(const Message& message) noexcept;

/**
 * @brief Metric label of a decoded message kind, e.g. "precip_event".
 */
const char* message_kind_name(const Message& message) noexcept;

} // namespace tempest

#endif // TEMPEST_MESSAGES_HPP
