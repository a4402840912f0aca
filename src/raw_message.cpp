/**
 * @file raw_message.cpp
 * @brief Diagnostics helpers for raw messages.
 */

#include <tempest/overloaded.hpp>
#include <tempest/raw_message.hpp>

#include <cinttypes>
#include <cstdarg>
#include <cstdio>

namespace tempest {

const char* slot_name(ObservationSlot which) noexcept {
    switch (which) {
    case ObservationSlot::Timestamp:
        return "timestamp";
    case ObservationSlot::WindLull:
        return "wind_lull";
    case ObservationSlot::WindAvg:
        return "wind_avg";
    case ObservationSlot::WindGust:
        return "wind_gust";
    case ObservationSlot::WindDirection:
        return "wind_direction";
    case ObservationSlot::WindSampleInterval:
        return "wind_sample_interval";
    case ObservationSlot::StationPressure:
        return "station_pressure";
    case ObservationSlot::AirTemperature:
        return "air_temperature";
    case ObservationSlot::RelativeHumidity:
        return "relative_humidity";
    case ObservationSlot::Illuminance:
        return "illuminance";
    case ObservationSlot::UltravioletIndex:
        return "uv_index";
    case ObservationSlot::SolarIrradiance:
        return "solar_irradiance";
    case ObservationSlot::RainLastMinute:
        return "rain_last_minute";
    case ObservationSlot::PrecipType:
        return "precip_type";
    case ObservationSlot::LightningDistance:
        return "lightning_distance";
    case ObservationSlot::LightningCount:
        return "lightning_count";
    case ObservationSlot::BatteryVolts:
        return "battery_volts";
    case ObservationSlot::ReportIntervalMinutes:
        return "report_interval";
    default:
        return "unknown";
    }
}

const char* raw_type_tag(const RawMessage& message) noexcept {
    return std::visit(overloaded{
                          [](const RawPrecipEvent&) { return "evt_precip"; },
                          [](const RawStrikeEvent&) { return "evt_strike"; },
                          [](const RawRapidWind&) { return "rapid_wind"; },
                          [](const RawObservation&) { return "obs_st"; },
                          [](const RawDeviceStatus&) { return "device_status"; },
                          [](const RawHubStatus&) { return "hub_status"; },
                      },
                      message);
}

const std::string& raw_serial_number(const RawMessage& message) noexcept {
    return std::visit([](const auto& raw) -> const std::string& { return raw.serial_number; },
                      message);
}

static void append(std::string& out, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

static void append(std::string& out, const char* fmt, ...) {
    char buffer[128];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    if (n > 0) {
        out.append(buffer, static_cast<std::size_t>(n) < sizeof(buffer) ? static_cast<std::size_t>(n)
                                                                         : sizeof(buffer) - 1);
    }
}

std::string describe(const RawMessage& message) {
    std::string out = raw_type_tag(message);
    out += " from ";
    out += raw_serial_number(message);

    std::visit(overloaded{
                   [&out](const RawPrecipEvent& raw) {
                       append(out, " evt=[%" PRId64 "]", raw.timestamp);
                   },
                   [&out](const RawStrikeEvent& raw) {
                       append(out, " evt=[%" PRId64 ", %g, %g]", raw.timestamp, raw.distance,
                              raw.energy);
                   },
                   [&out](const RawRapidWind& raw) {
                       append(out, " ob=[%" PRId64 ", %g, %g]", raw.timestamp, raw.speed,
                              raw.direction);
                   },
                   [&out](const RawObservation& raw) {
                       out += " obs=[";
                       for (std::size_t i = 0; i < raw.obs.size(); ++i) {
                           if (i > 0) {
                               out += ", ";
                           }
                           if (raw.obs[i]) {
                               append(out, "%g", *raw.obs[i]);
                           } else {
                               out += "null";
                           }
                       }
                       out += "]";
                   },
                   [&out](const RawDeviceStatus& raw) {
                       append(out, " timestamp=%" PRId64 " voltage=%g sensor_status=0x%" PRIx32,
                              raw.timestamp, raw.voltage, raw.sensor_status);
                   },
                   [&out](const RawHubStatus& raw) {
                       append(out, " timestamp=%" PRId64 " seq=%" PRId32 " reset_flags=\"",
                              raw.timestamp, raw.seq);
                       out += raw.reset_flags;
                       out += "\"";
                   },
               },
               message);

    return out;
}

} // namespace tempest
