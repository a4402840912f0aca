/**
 * @file exporter.cpp
 * @brief Metric cells fed by decoded messages, rendered as Prometheus text.
 */

#include <tempest/exporter.hpp>
#include <tempest/log.hpp>
#include <tempest/overloaded.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>

namespace tempest {

namespace {

std::string station(const std::string& name) {
    return std::string(NAMESPACE) + "_station_" + name;
}

std::string exporter(const std::string& name) {
    return std::string(NAMESPACE) + "_exporter_" + name;
}

const char* const KIND_LABELS[MessageCounter::KINDS] = {
    "precip_event", "strike_event", "rapid_wind", "observation", "device_status", "hub_status",
};

void append_value(std::string& out, double value) {
    if (std::isnan(value)) {
        out += "NaN";
        return;
    }
    if (std::isinf(value)) {
        out += value > 0 ? "+Inf" : "-Inf";
        return;
    }
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        out += "NaN";
        return;
    }
    out.append(buffer, end);
}

void append_header(std::string& out, const std::string& name, const std::string& help,
                   const char* type) {
    out += "# HELP ";
    out += name;
    out += ' ';
    out += help;
    out += "\n# TYPE ";
    out += name;
    out += ' ';
    out += type;
    out += '\n';
}

template <typename Rep, typename Period>
void set_if_present(GaugeCell& cell, const std::optional<double>& value,
                    std::chrono::duration<Rep, Period> valid_for) {
    if (value) {
        cell.freshen(valid_for).set(*value);
    }
}

} // namespace

WindMetrics::WindMetrics(const std::string& name, const std::string& description)
    : speed_magnitude_(station(name + "_speed_magnitude_m_per_s"),
                       description + " speed magnitude (m/s)")
    , source_direction_(station(name + "_source_direction_deg"),
                        description + " source direction (deg)")
    , component_velocity_north_(station(name + "_component_velocity_north_m_per_s"),
                                description + " component velocity North (m/s)")
    , component_velocity_east_(station(name + "_component_velocity_east_m_per_s"),
                               description + " component velocity East (m/s)") {}

void WindMetrics::register_all(std::vector<const GaugeCell*>& registry) const {
    registry.push_back(&speed_magnitude_);
    registry.push_back(&source_direction_);
    registry.push_back(&component_velocity_north_);
    registry.push_back(&component_velocity_east_);
}

ExportedMetrics::ExportedMetrics()
    : instant_wind("instant_wind", "Instantaneous wind")
    , observation_timestamp(station("observation_timestamp_unix_sec"),
                            "Current observation Unix timestamp (s)")
    , observation_wind_lull("observation_wind_lull", "Wind lull over the sample interval")
    , observation_wind_avg("observation_wind_avg", "Wind average over the sample interval")
    , observation_wind_gust("observation_wind_gust", "Wind gust over the sample interval")
    , observation_station_pressure(station("observation_station_pressure_hpa"),
                                   "Current station pressure (hPa)")
    , observation_barometric_pressure(station("observation_barometric_pressure_hpa"),
                                      "Current barometric pressure, mean sea level (hPa)")
    , observation_temperature(station("observation_temperature_deg_c"),
                              "Current temperature (deg C)")
    , observation_relative_humidity(station("observation_relative_humidity_pct"),
                                    "Current relative humidity (%)")
    , observation_dew_point(station("observation_dew_point_deg_c"), "Current dew point (deg C)")
    , observation_wet_bulb_temperature(station("observation_wet_bulb_temperature_deg_c"),
                                       "Current wet bulb temperature (deg C)")
    , observation_apparent_temperature(station("observation_apparent_temperature_deg_c"),
                                       "Current apparent temperature (deg C)")
    , observation_illuminance(station("observation_illuminance_lux"), "Current illuminance (lux)")
    , observation_uv_index(station("observation_uv_index"), "Current UV index")
    , observation_irradiance(station("observation_irradiance_w_per_m2"),
                             "Current solar irradiance (W/m^2)")
    , observation_rain_last_minute(station("observation_rain_last_minute_mm"),
                                   "Rain over the previous minute (mm)")
    , observation_lightning_distance(station("observation_lightning_distance_km"),
                                     "Average lightning strike distance (km)")
    , observation_lightning_count(station("observation_lightning_count"),
                                  "Lightning strikes over the report interval")
    , observation_battery(station("observation_battery_volts"), "Station battery voltage (V)")
    , device_voltage(station("device_voltage_volts"), "Device reported voltage (V)")
    , device_rssi(station("device_rssi_dbm"), "Device signal strength (dBm)")
    , device_hub_rssi(station("device_hub_rssi_dbm"), "Hub signal strength seen by device (dBm)")
    , device_uptime(station("device_uptime_sec"), "Device uptime (s)")
    , device_sensor_failed(station("device_sensor_failed"),
                           "1 when any device sensor reports a failure")
    , hub_rssi(station("hub_rssi_dbm"), "Hub signal strength (dBm)")
    , hub_uptime(station("hub_uptime_sec"), "Hub uptime (s)") {
    instant_wind.register_all(gauges);
    gauges.push_back(&observation_timestamp);
    observation_wind_lull.register_all(gauges);
    observation_wind_avg.register_all(gauges);
    observation_wind_gust.register_all(gauges);
    for (const GaugeCell* cell :
         {&observation_station_pressure, &observation_barometric_pressure,
          &observation_temperature, &observation_relative_humidity, &observation_dew_point,
          &observation_wet_bulb_temperature, &observation_apparent_temperature,
          &observation_illuminance, &observation_uv_index, &observation_irradiance,
          &observation_rain_last_minute, &observation_lightning_distance,
          &observation_lightning_count, &observation_battery, &device_voltage, &device_rssi,
          &device_hub_rssi, &device_uptime, &device_sensor_failed, &hub_rssi, &hub_uptime}) {
        gauges.push_back(cell);
    }
}

Exporter::Exporter(StationParams station_params) : station_params_(station_params) {}

void Exporter::handle_report(const Message& message) {
    ExportedMetrics& m = metrics_;
    m.messages_received.inc(message);

    std::visit(
        overloaded{
            [](const PrecipEvent&) {},
            [](const StrikeEvent&) {},
            [&m](const RapidWind& rw) { m.instant_wind.export_wind(rw.wind, RAPID_WIND_VALIDITY); },
            [&m, this](const Observation& obs) {
                constexpr auto longest =
                    std::chrono::duration_cast<std::chrono::minutes>(MAX_VALIDITY);
                auto interval = std::clamp(obs.report_interval, std::chrono::minutes{1}, longest);
                auto valid_for = std::min(interval * OBSERVATION_VALIDITY_INTERVALS, longest);

                m.observation_timestamp.freshen(valid_for).set(
                    static_cast<double>(obs.timestamp.time_since_epoch().count()));
                if (obs.wind) {
                    m.observation_wind_lull.export_wind(obs.wind->lull, valid_for);
                    m.observation_wind_avg.export_wind(obs.wind->avg, valid_for);
                    m.observation_wind_gust.export_wind(obs.wind->gust, valid_for);
                }
                set_if_present(m.observation_station_pressure, obs.station_pressure, valid_for);
                set_if_present(m.observation_barometric_pressure,
                               obs.barometric_pressure(station_params_.elevation), valid_for);
                set_if_present(m.observation_temperature, obs.air_temperature, valid_for);
                set_if_present(m.observation_relative_humidity, obs.relative_humidity, valid_for);
                set_if_present(m.observation_dew_point, obs.dew_point(), valid_for);
                set_if_present(m.observation_wet_bulb_temperature, obs.wet_bulb_temperature(),
                               valid_for);
                set_if_present(m.observation_apparent_temperature, obs.apparent_temperature(),
                               valid_for);
                if (obs.solar) {
                    m.observation_illuminance.freshen(valid_for).set(obs.solar->illuminance);
                    m.observation_uv_index.freshen(valid_for).set(obs.solar->ultraviolet_index);
                    m.observation_irradiance.freshen(valid_for).set(obs.solar->irradiance);
                }
                if (obs.precip) {
                    m.observation_rain_last_minute.freshen(valid_for).set(
                        obs.precip->quantity_last_minute);
                }
                if (obs.lightning) {
                    m.observation_lightning_distance.freshen(valid_for).set(
                        obs.lightning->average_distance);
                    m.observation_lightning_count.freshen(valid_for).set(
                        static_cast<double>(obs.lightning->count));
                }
                m.observation_battery.freshen(valid_for).set(obs.battery_volts);
            },
            [&m](const DeviceStatus& ds) {
                m.device_voltage.freshen(STATUS_VALIDITY).set(ds.voltage);
                m.device_rssi.freshen(STATUS_VALIDITY).set(ds.rssi);
                m.device_hub_rssi.freshen(STATUS_VALIDITY).set(ds.hub_rssi);
                m.device_uptime.freshen(STATUS_VALIDITY).set(static_cast<double>(ds.uptime.count()));
                m.device_sensor_failed.freshen(STATUS_VALIDITY).set(
                    ds.sensor_status.any_failed() ? 1.0 : 0.0);
            },
            [&m](const HubStatus& hs) {
                m.hub_rssi.freshen(STATUS_VALIDITY).set(hs.rssi);
                m.hub_uptime.freshen(STATUS_VALIDITY).set(static_cast<double>(hs.uptime.count()));
            },
        },
        message);
}

std::string Exporter::encode() const {
    std::string out;

    std::string counter_name = exporter("messages_received");
    append_header(out, counter_name, "API messages received", "counter");
    for (std::size_t kind = 0; kind < MessageCounter::KINDS; ++kind) {
        out += counter_name;
        out += "{type=\"";
        out += KIND_LABELS[kind];
        out += "\"} ";
        out += std::to_string(metrics_.messages_received.count(kind));
        out += '\n';
    }

    for (const GaugeCell* cell : metrics_.gauges) {
        // One read of the value per cell, skipped entirely once stale
        auto value = cell->map([](const Gauge& gauge) { return gauge.value(); });
        if (!value) {
            continue;
        }
        const Gauge& gauge = cell->get();
        append_header(out, gauge.name(), gauge.help(), "gauge");
        out += gauge.name();
        out += ' ';
        append_value(out, *value);
        out += '\n';
    }

    return out;
}

void Exporter::dump() const {
    log_info("Metric dump\n%s", encode().c_str());
}

} // namespace tempest
