/**
 * @file decoder.cpp
 * @brief Raw message to domain message decoding.
 */

#include <tempest/decoder.hpp>
#include <tempest/overloaded.hpp>

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace tempest {

namespace {

Timestamp from_epoch(std::int64_t seconds) {
    return Timestamp{std::chrono::seconds{seconds}};
}

// Whole number held in a slot; absent when the slot is absent or unusable
std::optional<std::int64_t> integer_slot(const ObservationSlots& obs, ObservationSlot which) {
    const std::optional<double>& value = slot(obs, which);
    if (!value || !std::isfinite(*value)) {
        return std::nullopt;
    }
    constexpr double LIMIT = 9.2e18;
    if (*value > LIMIT || *value < -LIMIT) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*value);
}

} // namespace

Error decode_precip_kind(std::int64_t code, PrecipKind& kind) noexcept {
    switch (code) {
    case 0:
        kind = PrecipKind::None;
        return Error::Ok;
    case 1:
        kind = PrecipKind::Rain;
        return Error::Ok;
    case 2:
        kind = PrecipKind::Hail;
        return Error::Ok;
    case 3:
        kind = PrecipKind::RainHail;
        return Error::Ok;
    default:
        return Error::UnrecognizedCode;
    }
}

std::optional<WindObservation> make_wind_observation(const ObservationSlots& obs) {
    const auto& lull = slot(obs, ObservationSlot::WindLull);
    const auto& avg = slot(obs, ObservationSlot::WindAvg);
    const auto& gust = slot(obs, ObservationSlot::WindGust);
    const auto& direction = slot(obs, ObservationSlot::WindDirection);
    auto interval = integer_slot(obs, ObservationSlot::WindSampleInterval);
    if (!lull || !avg || !gust || !direction || !interval) {
        return std::nullopt;
    }

    return WindObservation{
        Wind(*lull, *direction),
        Wind(*avg, *direction),
        Wind(*gust, *direction),
        std::chrono::seconds{*interval},
    };
}

std::optional<SolarObservation> make_solar_observation(const ObservationSlots& obs) {
    const auto& illuminance = slot(obs, ObservationSlot::Illuminance);
    const auto& uv = slot(obs, ObservationSlot::UltravioletIndex);
    const auto& irradiance = slot(obs, ObservationSlot::SolarIrradiance);
    if (!illuminance || !uv || !irradiance) {
        return std::nullopt;
    }
    return SolarObservation{*illuminance, *uv, *irradiance};
}

std::optional<LightningObservation> make_lightning_observation(const ObservationSlots& obs) {
    const auto& distance = slot(obs, ObservationSlot::LightningDistance);
    auto count = integer_slot(obs, ObservationSlot::LightningCount);
    if (!distance || !count) {
        return std::nullopt;
    }
    return LightningObservation{*distance, *count};
}

Error make_precip_observation(const ObservationSlots& obs, std::optional<PrecipObservation>& group) {
    group.reset();

    const auto& quantity = slot(obs, ObservationSlot::RainLastMinute);
    const auto& code = slot(obs, ObservationSlot::PrecipType);
    if (!quantity || !code) {
        return Error::Ok;
    }

    // A fractional or non-finite code is as unknown as an out of range one
    PrecipKind kind = PrecipKind::None;
    if (!std::isfinite(*code) || std::trunc(*code) != *code ||
        decode_precip_kind(static_cast<std::int64_t>(*code), kind) != Error::Ok) {
        return Error::UnrecognizedCode;
    }

    group = PrecipObservation{*quantity, kind};
    return Error::Ok;
}

PrecipEvent decode_precip_event(const RawPrecipEvent& raw) {
    return PrecipEvent{raw.serial_number, raw.hub_sn, from_epoch(raw.timestamp)};
}

StrikeEvent decode_strike_event(const RawStrikeEvent& raw) {
    return StrikeEvent{raw.serial_number, raw.hub_sn, from_epoch(raw.timestamp), raw.distance,
                       raw.energy};
}

RapidWind decode_rapid_wind(const RawRapidWind& raw) {
    return RapidWind{raw.serial_number, raw.hub_sn, from_epoch(raw.timestamp),
                     Wind(raw.speed, raw.direction)};
}

DeviceStatus decode_device_status(const RawDeviceStatus& raw) {
    DeviceStatus status;
    status.serial_number = raw.serial_number;
    status.hub_serial_number = raw.hub_sn;
    status.timestamp = from_epoch(raw.timestamp);
    status.uptime = std::chrono::seconds{raw.uptime};
    status.voltage = raw.voltage;
    status.firmware_revision = raw.firmware_revision;
    status.rssi = raw.rssi;
    status.hub_rssi = raw.hub_rssi;
    status.sensor_status = SensorStatus::from_bits(raw.sensor_status);
    status.debug = raw.debug == 1;
    return status;
}

Error decode_observation(const RawObservation& raw, Observation& out, std::string& reason) {
    const ObservationSlots& obs = raw.obs;

    auto timestamp = integer_slot(obs, ObservationSlot::Timestamp);
    if (!timestamp) {
        reason = "Missing observation timestamp";
        return Error::MissingField;
    }

    std::optional<PrecipObservation> precip;
    if (make_precip_observation(obs, precip) != Error::Ok) {
        char code_text[32];
        std::snprintf(code_text, sizeof(code_text), "%g", *slot(obs, ObservationSlot::PrecipType));
        reason = std::string("Unrecognized precip type ") + code_text;
        return Error::UnrecognizedCode;
    }

    const auto& battery = slot(obs, ObservationSlot::BatteryVolts);
    if (!battery) {
        reason = "Missing battery voltage";
        return Error::MissingField;
    }

    auto interval = integer_slot(obs, ObservationSlot::ReportIntervalMinutes);
    if (!interval) {
        reason = "Missing report interval";
        return Error::MissingField;
    }

    out.serial_number = raw.serial_number;
    out.hub_serial_number = raw.hub_sn;
    out.firmware_revision = raw.firmware_revision;
    out.timestamp = from_epoch(*timestamp);
    out.wind = make_wind_observation(obs);
    out.station_pressure = slot(obs, ObservationSlot::StationPressure);
    out.air_temperature = slot(obs, ObservationSlot::AirTemperature);
    out.relative_humidity = slot(obs, ObservationSlot::RelativeHumidity);
    out.solar = make_solar_observation(obs);
    out.precip = precip;
    out.lightning = make_lightning_observation(obs);
    out.battery_volts = *battery;
    out.report_interval = std::chrono::minutes{*interval};
    return Error::Ok;
}

Error decode_hub_status(const RawHubStatus& raw, HubStatus& out, std::string& reason) {
    ResetFlags flags;
    std::string bad_label;
    Error result = ResetFlags::parse(raw.reset_flags, flags, &bad_label);
    if (result != Error::Ok) {
        reason = "Unrecognized reset flag label \"" + bad_label + "\"";
        return result;
    }

    out.serial_number = raw.serial_number;
    out.firmware_revision = raw.firmware_revision;
    out.uptime = std::chrono::seconds{raw.uptime};
    out.rssi = raw.rssi;
    out.timestamp = from_epoch(raw.timestamp);
    out.reset_flags = flags;
    out.seq = raw.seq;
    out.radio_stats = RadioStats::from_array(raw.radio_stats);
    return Error::Ok;
}

DecodeResult decode(RawMessage raw) {
    std::string reason;
    Error code = Error::Ok;

    std::optional<Message> decoded = std::visit(
        overloaded{
            [](const RawPrecipEvent& r) -> std::optional<Message> { return decode_precip_event(r); },
            [](const RawStrikeEvent& r) -> std::optional<Message> { return decode_strike_event(r); },
            [](const RawRapidWind& r) -> std::optional<Message> { return decode_rapid_wind(r); },
            [](const RawDeviceStatus& r) -> std::optional<Message> {
                return decode_device_status(r);
            },
            [&](const RawObservation& r) -> std::optional<Message> {
                Observation observation;
                code = decode_observation(r, observation, reason);
                if (code != Error::Ok) {
                    return std::nullopt;
                }
                return Message{std::move(observation)};
            },
            [&](const RawHubStatus& r) -> std::optional<Message> {
                HubStatus status;
                code = decode_hub_status(r, status, reason);
                if (code != Error::Ok) {
                    return std::nullopt;
                }
                return Message{std::move(status)};
            },
        },
        raw);

    if (!decoded) {
        return DecodeFailure{std::move(raw), code, std::move(reason)};
    }
    return std::move(*decoded);
}

} // namespace tempest
