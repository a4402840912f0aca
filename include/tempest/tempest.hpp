/**
 * @file tempest.hpp
 * @brief High-level tempest API.
 *
 * Pulls in the whole pipeline: a JSON document source (UdpReceiver or
 * LineReader) feeds a JsonReader, whose raw messages feed a DecodeStream;
 * decoded messages go to an Exporter, scraped through a MetricsServer, and
 * to an MqttClient that publishes what render_publications() produces.
 *
 * @see https://weatherflow.github.io/Tempest/api/udp/v171/ Tempest UDP API
 */

#ifndef TEMPEST_HPP
#define TEMPEST_HPP

#include "config.hpp"
#include "decode_stream.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "exporter.hpp"
#include "log.hpp"
#include "messages.hpp"
#include "metrics_server.hpp"
#include "mqtt_client.hpp"
#include "observation.hpp"
#include "perishable.hpp"
#include "publisher.hpp"
#include "raw_message.hpp"
#include "reader.hpp"
#include "receiver.hpp"
#include "station.hpp"
#include "status_flags.hpp"
#include "wind.hpp"

namespace tempest {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.1.0";
}

} // namespace tempest

#endif // TEMPEST_HPP
