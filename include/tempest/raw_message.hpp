/**
 * @file raw_message.hpp
 * @brief Wire-shaped records of the six Tempest UDP message types.
 *
 * These mirror the JSON documents broadcast by the hub one-to-one: fields
 * keep their positional layout and the observation payload keeps its
 * optional slots. Validation and naming happen in the decoder.
 */

#ifndef TEMPEST_RAW_MESSAGE_HPP
#define TEMPEST_RAW_MESSAGE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "config.hpp"

namespace tempest {

/**
 * @brief Index of each slot of the obs_st "obs" array.
 *
 * This is the only place the protocol's positional layout is written down;
 * the decoder and the reader address slots exclusively through it.
 */
enum class ObservationSlot : std::size_t {
    Timestamp = 0,            ///< Epoch seconds (UTC)
    WindLull = 1,             ///< Minimum 3 second sample (m/s)
    WindAvg = 2,              ///< Average over report interval (m/s)
    WindGust = 3,             ///< Maximum 3 second sample (m/s)
    WindDirection = 4,        ///< Degrees
    WindSampleInterval = 5,   ///< Seconds
    StationPressure = 6,      ///< hPa
    AirTemperature = 7,       ///< Degrees C
    RelativeHumidity = 8,     ///< Percent
    Illuminance = 9,          ///< Lux
    UltravioletIndex = 10,    ///< Index
    SolarIrradiance = 11,     ///< W/m^2
    RainLastMinute = 12,      ///< mm
    PrecipType = 13,          ///< 0 none, 1 rain, 2 hail, 3 rain + hail
    LightningDistance = 14,   ///< km
    LightningCount = 15,      ///< Strikes
    BatteryVolts = 16,        ///< Volts
    ReportIntervalMinutes = 17 ///< Minutes
};

static_assert(static_cast<std::size_t>(ObservationSlot::ReportIntervalMinutes) + 1 ==
                  OBSERVATION_SLOTS,
              "ObservationSlot must cover every obs_st slot");

/**
 * @brief Fixed-width obs_st payload; any slot may be null on the wire.
 */
using ObservationSlots = std::array<std::optional<double>, OBSERVATION_SLOTS>;

/// Slot accessor keyed by the layout enum
inline const std::optional<double>& slot(const ObservationSlots& slots, ObservationSlot which) noexcept {
    return slots[static_cast<std::size_t>(which)];
}

inline std::optional<double>& slot(ObservationSlots& slots, ObservationSlot which) noexcept {
    return slots[static_cast<std::size_t>(which)];
}

/// Slot name used in diagnostics
const char* slot_name(ObservationSlot which) noexcept;

/**
 * @brief evt_precip: rain start event.
 */
struct RawPrecipEvent {
    std::string serial_number;
    std::optional<std::string> hub_sn;
    std::int64_t timestamp = 0; ///< evt[0]
};

/**
 * @brief evt_strike: lightning strike event.
 */
struct RawStrikeEvent {
    std::string serial_number;
    std::optional<std::string> hub_sn;
    std::int64_t timestamp = 0; ///< evt[0]
    double distance = 0.0;      ///< evt[1], km
    double energy = 0.0;        ///< evt[2]
};

/**
 * @brief rapid_wind: 3 second wind sample.
 */
struct RawRapidWind {
    std::string serial_number;
    std::optional<std::string> hub_sn;
    std::int64_t timestamp = 0; ///< ob[0]
    double speed = 0.0;         ///< ob[1], m/s
    double direction = 0.0;     ///< ob[2], degrees
};

/**
 * @brief obs_st: periodic station observation.
 */
struct RawObservation {
    std::string serial_number;
    std::optional<std::string> hub_sn;
    ObservationSlots obs{};     ///< obs[0]
    std::int32_t firmware_revision = 0;
};

/**
 * @brief device_status: sensor unit health report.
 */
struct RawDeviceStatus {
    std::string serial_number;
    std::optional<std::string> hub_sn;
    std::int64_t timestamp = 0;
    std::int64_t uptime = 0; ///< Seconds
    double voltage = 0.0;
    std::int32_t firmware_revision = 0;
    double rssi = 0.0;
    double hub_rssi = 0.0;
    std::uint32_t sensor_status = 0; ///< Bitfield, see SensorStatus
    std::int32_t debug = 0;
};

/**
 * @brief hub_status: hub health report.
 */
struct RawHubStatus {
    std::string serial_number;
    std::optional<std::string> hub_sn; ///< Never sent by current firmware
    std::string firmware_revision;
    std::int64_t uptime = 0; ///< Seconds
    double rssi = 0.0;
    std::int64_t timestamp = 0;
    std::string reset_flags; ///< Comma separated labels, see ResetFlags
    std::int32_t seq = 0;
    std::array<std::int32_t, RADIO_STATS_SLOTS> radio_stats{};
};

/**
 * @brief Any raw message, tagged by the protocol's "type" discriminator.
 */
using RawMessage = std::variant<RawPrecipEvent, RawStrikeEvent, RawRapidWind, RawObservation,
                                RawDeviceStatus, RawHubStatus>;

/**
 * @brief Wire discriminator of a raw message.
 *
 * @return One of evt_precip, evt_strike, rapid_wind, obs_st, device_status,
 *         hub_status
 */
const char* raw_type_tag(const RawMessage& message) noexcept;

/**
 * @brief Serial number of the device that sent a raw message.
 */
const std::string& raw_serial_number(const RawMessage& message) noexcept;

/**
 * @brief One-line human readable rendering for diagnostics.
 */
std::string describe(const RawMessage& message);

} // namespace tempest

#endif // TEMPEST_RAW_MESSAGE_HPP
