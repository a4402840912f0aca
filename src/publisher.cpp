/**
 * @file publisher.cpp
 * @brief MQTT topic and payload rendering of decoded messages.
 */

#include <tempest/log.hpp>
#include <tempest/overloaded.hpp>
#include <tempest/publisher.hpp>

#include <charconv>
#include <ctime>

namespace tempest {

namespace {

class Sink {
public:
    explicit Sink(std::vector<Publication>& out) : out_(out) {}

    void send(std::string topic, std::string payload) {
        out_.push_back(Publication{std::move(topic), true, std::move(payload)});
    }

    void send(std::string topic, const std::optional<double>& value) {
        if (value) {
            send(std::move(topic), format_number(*value));
        }
    }

private:
    std::vector<Publication>& out_;
};

std::string topic(const std::string& suffix) {
    return std::string(NAMESPACE) + "/" + suffix;
}

void publish_wind(Sink& sink, const std::string& prefix, const Wind& wind) {
    sink.send(prefix + "/speed_magnitude_m_per_s", format_number(wind.speed_magnitude()));
    sink.send(prefix + "/source_direction_deg", format_number(wind.source_direction()));
    Components velocity = wind.component_velocity();
    sink.send(prefix + "/component_velocity_m_per_s",
              format_number(velocity.north) + " " + format_number(velocity.east));
}

void publish_observation(Sink& sink, const Observation& obs, const StationParams& station_params) {
    if (auto timestamp = format_timestamp(obs.timestamp)) {
        sink.send(topic("observation/timestamp"), std::move(*timestamp));
    } else {
        log_warn("Observation from %s has an unrepresentable timestamp %lld",
                 obs.serial_number.c_str(),
                 static_cast<long long>(obs.timestamp.time_since_epoch().count()));
    }
    if (obs.wind) {
        publish_wind(sink, topic("observation/wind/lull"), obs.wind->lull);
        publish_wind(sink, topic("observation/wind/avg"), obs.wind->avg);
        publish_wind(sink, topic("observation/wind/gust"), obs.wind->gust);
    }
    sink.send(topic("observation/pressure/station_hpa"), obs.station_pressure);
    sink.send(topic("observation/pressure/barometric_hpa"),
              obs.barometric_pressure(station_params.elevation));
    sink.send(topic("observation/thermal/temperature_deg_c"), obs.air_temperature);
    sink.send(topic("observation/thermal/relative_humidity_pct"), obs.relative_humidity);
    sink.send(topic("observation/thermal/dew_point_deg_c"), obs.dew_point());
    sink.send(topic("observation/thermal/wet_bulb_temperature_deg_c"), obs.wet_bulb_temperature());
    sink.send(topic("observation/thermal/apparent_temperature_deg_c"), obs.apparent_temperature());
    if (obs.solar) {
        sink.send(topic("observation/solar/illuminance_lux"), format_number(obs.solar->illuminance));
        sink.send(topic("observation/solar/irradiance_w_per_m2"),
                  format_number(obs.solar->irradiance));
        sink.send(topic("observation/solar/uv_index"), format_number(obs.solar->ultraviolet_index));
    }
    if (obs.precip) {
        sink.send(topic("observation/precip/previous_minute_rain_mm"),
                  format_number(obs.precip->quantity_last_minute));
        sink.send(topic("observation/precip/type"), precip_kind_name(obs.precip->kind));
    }
}

} // namespace

std::string format_number(double value) {
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return "NaN";
    }
    return std::string(buffer, end);
}

std::optional<std::string> format_timestamp(Timestamp timestamp) {
    std::time_t seconds = static_cast<std::time_t>(timestamp.time_since_epoch().count());
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return std::nullopt;
    }
    char buffer[64];
    std::size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+00:00", &utc);
    if (n == 0) {
        return std::nullopt;
    }
    return std::string(buffer, n);
}

std::vector<Publication> render_publications(const Message& message,
                                             const StationParams& station_params) {
    std::vector<Publication> out;
    Sink sink(out);

    std::visit(overloaded{
                   [&sink](const RapidWind& rw) { publish_wind(sink, topic("instant_wind"), rw.wind); },
                   [&](const Observation& obs) { publish_observation(sink, obs, station_params); },
                   [](const PrecipEvent&) {},
                   [](const StrikeEvent&) {},
                   [](const DeviceStatus&) {},
                   [](const HubStatus&) {},
               },
               message);

    return out;
}

} // namespace tempest
