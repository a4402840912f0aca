/**
 * @file config.hpp
 * @brief tempest compile-time configuration.
 *
 * Constants of the WeatherFlow Tempest local UDP API and the default
 * validity windows applied to exported values. Every constant can be
 * overridden at build time with the matching TEMPEST_* macro.
 *
 * @see https://weatherflow.github.io/Tempest/api/udp/v171/ Tempest UDP API
 */

#ifndef TEMPEST_CONFIG_HPP
#define TEMPEST_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tempest {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// UDP port the hub broadcasts on
#ifndef TEMPEST_UDP_PORT
#define TEMPEST_UDP_PORT 50222U
#endif

/// Largest datagram accepted from the hub
#ifndef TEMPEST_MAX_DATAGRAM_BYTES
#define TEMPEST_MAX_DATAGRAM_BYTES 1024U
#endif

/// Seconds an instantaneous wind reading stays exported
#ifndef TEMPEST_RAPID_WIND_VALIDITY_SEC
#define TEMPEST_RAPID_WIND_VALIDITY_SEC 15
#endif

/// Number of report intervals an observation stays exported
#ifndef TEMPEST_OBSERVATION_VALIDITY_INTERVALS
#define TEMPEST_OBSERVATION_VALIDITY_INTERVALS 3
#endif

/// Seconds a device or hub status stays exported
#ifndef TEMPEST_STATUS_VALIDITY_SEC
#define TEMPEST_STATUS_VALIDITY_SEC 300
#endif

/// Upper bound on any validity window, in hours
#ifndef TEMPEST_MAX_VALIDITY_HOURS
#define TEMPEST_MAX_VALIDITY_HOURS 8760
#endif

/// TCP port of the metrics endpoint
#ifndef TEMPEST_METRICS_PORT
#define TEMPEST_METRICS_PORT 8080U
#endif

/// Default MQTT broker port
#ifndef TEMPEST_MQTT_PORT
#define TEMPEST_MQTT_PORT 1883U
#endif

/// Seconds between MQTT keep-alive pings
#ifndef TEMPEST_MQTT_KEEPALIVE_SEC
#define TEMPEST_MQTT_KEEPALIVE_SEC 15
#endif

/// Publications the MQTT client holds while the broker is unreachable
#ifndef TEMPEST_MQTT_QUEUE_CAPACITY
#define TEMPEST_MQTT_QUEUE_CAPACITY 1024U
#endif

inline constexpr std::uint16_t UDP_PORT = TEMPEST_UDP_PORT;
inline constexpr std::size_t MAX_DATAGRAM_BYTES = TEMPEST_MAX_DATAGRAM_BYTES;
inline constexpr std::chrono::seconds RAPID_WIND_VALIDITY{TEMPEST_RAPID_WIND_VALIDITY_SEC};
inline constexpr int OBSERVATION_VALIDITY_INTERVALS = TEMPEST_OBSERVATION_VALIDITY_INTERVALS;
inline constexpr std::chrono::seconds STATUS_VALIDITY{TEMPEST_STATUS_VALIDITY_SEC};
inline constexpr std::chrono::hours MAX_VALIDITY{TEMPEST_MAX_VALIDITY_HOURS};
inline constexpr std::uint16_t METRICS_PORT = TEMPEST_METRICS_PORT;
inline constexpr std::uint16_t MQTT_PORT = TEMPEST_MQTT_PORT;
inline constexpr std::chrono::seconds MQTT_KEEPALIVE{TEMPEST_MQTT_KEEPALIVE_SEC};
inline constexpr std::size_t MQTT_QUEUE_CAPACITY = TEMPEST_MQTT_QUEUE_CAPACITY;

/// Client identifier presented to the MQTT broker
inline constexpr const char* MQTT_CLIENT_ID = "tempest-exporter";

/// Number of positional slots in an obs_st payload
inline constexpr std::size_t OBSERVATION_SLOTS = 18U;

/// Number of counters in a hub_status radio_stats array
inline constexpr std::size_t RADIO_STATS_SLOTS = 5U;

/// Prefix of every metric and MQTT topic
inline constexpr const char* NAMESPACE = "tempest";

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define TEMPEST_NO_EXCEPTIONS=1 to drop the throwing convenience wrappers.
 * @{
 */
#ifndef TEMPEST_NO_EXCEPTIONS
#define TEMPEST_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace tempest

#endif // TEMPEST_CONFIG_HPP
