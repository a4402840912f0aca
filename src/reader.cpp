/**
 * @file reader.cpp
 * @brief JSON datagram to raw message parsing.
 */

#include <tempest/reader.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace tempest {

using nlohmann::json;

namespace {

class MalformedDocument : public std::runtime_error {
public:
    explicit MalformedDocument(const std::string& message) : std::runtime_error(message) {}
};

std::optional<std::string> optional_string(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// evt and ob arrays: [timestamp, a, b]
const json& positional(const json& document, const char* key, std::size_t min_size) {
    const json& array = document.at(key);
    if (!array.is_array() || array.size() < min_size) {
        throw MalformedDocument(std::string("\"") + key + "\" has too few elements");
    }
    return array;
}

RawObservation read_observation(const json& document) {
    RawObservation raw;
    raw.serial_number = document.at("serial_number").get<std::string>();
    raw.hub_sn = optional_string(document, "hub_sn");
    raw.firmware_revision = document.value("firmware_revision", 0);

    const json& outer = positional(document, "obs", 1);
    const json& obs = outer.at(0);
    if (!obs.is_array()) {
        throw MalformedDocument("\"obs[0]\" is not an array");
    }
    for (std::size_t i = 0; i < raw.obs.size() && i < obs.size(); ++i) {
        if (!obs[i].is_null()) {
            raw.obs[i] = obs[i].get<double>();
        }
    }
    return raw;
}

RawHubStatus read_hub_status(const json& document) {
    RawHubStatus raw;
    raw.serial_number = document.at("serial_number").get<std::string>();
    raw.hub_sn = optional_string(document, "hub_sn");
    raw.firmware_revision = document.at("firmware_revision").get<std::string>();
    raw.uptime = document.at("uptime").get<std::int64_t>();
    raw.rssi = document.at("rssi").get<double>();
    raw.timestamp = document.at("timestamp").get<std::int64_t>();
    raw.reset_flags = document.at("reset_flags").get<std::string>();
    raw.seq = document.at("seq").get<std::int32_t>();
    const json& stats = positional(document, "radio_stats", RADIO_STATS_SLOTS);
    for (std::size_t i = 0; i < RADIO_STATS_SLOTS; ++i) {
        raw.radio_stats[i] = stats[i].get<std::int32_t>();
    }
    return raw;
}

RawMessage read_document(const json& document) {
    const std::string type = document.at("type").get<std::string>();

    if (type == "evt_precip") {
        RawPrecipEvent raw;
        raw.serial_number = document.at("serial_number").get<std::string>();
        raw.hub_sn = optional_string(document, "hub_sn");
        raw.timestamp = positional(document, "evt", 1)[0].get<std::int64_t>();
        return raw;
    }
    if (type == "evt_strike") {
        RawStrikeEvent raw;
        raw.serial_number = document.at("serial_number").get<std::string>();
        raw.hub_sn = optional_string(document, "hub_sn");
        const json& evt = positional(document, "evt", 3);
        raw.timestamp = evt[0].get<std::int64_t>();
        raw.distance = evt[1].get<double>();
        raw.energy = evt[2].get<double>();
        return raw;
    }
    if (type == "rapid_wind") {
        RawRapidWind raw;
        raw.serial_number = document.at("serial_number").get<std::string>();
        raw.hub_sn = optional_string(document, "hub_sn");
        const json& ob = positional(document, "ob", 3);
        raw.timestamp = ob[0].get<std::int64_t>();
        raw.speed = ob[1].get<double>();
        raw.direction = ob[2].get<double>();
        return raw;
    }
    if (type == "obs_st") {
        return read_observation(document);
    }
    if (type == "device_status") {
        RawDeviceStatus raw;
        raw.serial_number = document.at("serial_number").get<std::string>();
        raw.hub_sn = optional_string(document, "hub_sn");
        raw.timestamp = document.at("timestamp").get<std::int64_t>();
        raw.uptime = document.at("uptime").get<std::int64_t>();
        raw.voltage = document.at("voltage").get<double>();
        raw.firmware_revision = document.at("firmware_revision").get<std::int32_t>();
        raw.rssi = document.at("rssi").get<double>();
        raw.hub_rssi = document.at("hub_rssi").get<double>();
        raw.sensor_status = document.at("sensor_status").get<std::uint32_t>();
        raw.debug = document.value("debug", 0);
        return raw;
    }
    if (type == "hub_status") {
        return read_hub_status(document);
    }

    throw MalformedDocument("unknown message type \"" + type + "\"");
}

} // namespace

Error parse_raw_message(std::string_view text, RawMessage& message, std::string& reason) {
    json document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        reason = "not a JSON object";
        return Error::InvalidData;
    }

    try {
        message = read_document(document);
    } catch (const json::exception& e) {
        reason = e.what();
        return Error::InvalidData;
    } catch (const MalformedDocument& e) {
        reason = e.what();
        return Error::InvalidData;
    }
    return Error::Ok;
}

} // namespace tempest
