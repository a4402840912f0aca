/**
 * @file publisher.hpp
 * @brief MQTT topic and payload rendering of decoded messages.
 *
 * Produces retained publications under the "tempest/" topic root for rapid
 * wind and observation messages; MqttClient delivers them to a broker.
 * Quantities a message does not carry are not published, so a
 * retained topic keeps its last known value instead of being overwritten.
 */

#ifndef TEMPEST_PUBLISHER_HPP
#define TEMPEST_PUBLISHER_HPP

#include <optional>
#include <string>
#include <vector>

#include "messages.hpp"
#include "station.hpp"

namespace tempest {

struct Publication {
    std::string topic;
    bool retain = true;
    std::string payload;
};

/**
 * @brief Render the publications of one message.
 *
 * @return Publications in topic order; empty for message kinds that are
 *         not published
 */
std::vector<Publication> render_publications(const Message& message,
                                             const StationParams& station_params);

/// Shortest round-trip decimal rendering of a number
std::string format_number(double value);

/**
 * @brief RFC 3339 rendering in UTC, e.g. 2020-05-08T14:36:54+00:00
 *
 * @return The rendering, or nullopt when the instant has no calendar
 *         representation; the observation timestamp topic is then skipped
 */
std::optional<std::string> format_timestamp(Timestamp timestamp);

} // namespace tempest

#endif // TEMPEST_PUBLISHER_HPP
