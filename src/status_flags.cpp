/**
 * @file status_flags.cpp
 * @brief Device sensor bitfield, hub reset labels and hub radio counters.
 */

#include <tempest/status_flags.hpp>

namespace tempest {

SensorStatus SensorStatus::from_bits(std::uint32_t field) noexcept {
    using namespace sensor_bits;
    SensorStatus status;
    status.lightning_failed = (field & LIGHTNING_FAILED) != 0;
    status.lightning_noise = (field & LIGHTNING_NOISE) != 0;
    status.lightning_disturber = (field & LIGHTNING_DISTURBER) != 0;
    status.pressure_failed = (field & PRESSURE_FAILED) != 0;
    status.temperature_failed = (field & TEMPERATURE_FAILED) != 0;
    status.humidity_failed = (field & HUMIDITY_FAILED) != 0;
    status.wind_failed = (field & WIND_FAILED) != 0;
    status.precip_failed = (field & PRECIP_FAILED) != 0;
    status.irradiance_failed = (field & IRRADIANCE_FAILED) != 0;
    status.power_booster_depleted = (field & POWER_BOOSTER_DEPLETED) != 0;
    status.power_booster_shore_power = (field & POWER_BOOSTER_SHORE_POWER) != 0;
    return status;
}

bool SensorStatus::any_failed() const noexcept {
    return lightning_failed || pressure_failed || temperature_failed || humidity_failed ||
           wind_failed || precip_failed || irradiance_failed;
}

Error ResetFlags::parse(std::string_view labels, ResetFlags& flags, std::string* bad_label) {
    ResetFlags parsed;

    std::size_t start = 0;
    while (true) {
        std::size_t comma = labels.find(',', start);
        std::string_view label = labels.substr(start, comma == std::string_view::npos
                                                           ? std::string_view::npos
                                                           : comma - start);

        if (label == "BOR") {
            parsed.brownout = true;
        } else if (label == "PIN") {
            parsed.pin = true;
        } else if (label == "POR") {
            parsed.power_on = true;
        } else if (label == "SFT") {
            parsed.software = true;
        } else if (label == "WDG") {
            parsed.watchdog = true;
        } else if (label == "WWD") {
            parsed.window_watchdog = true;
        } else if (label == "LPW") {
            parsed.low_power = true;
        } else if (label == "HRDFLT") {
            parsed.hard_fault = true;
        } else {
            if (bad_label != nullptr) {
                bad_label->assign(label);
            }
            return Error::UnrecognizedLabel;
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    flags = parsed;
    return Error::Ok;
}

#if !TEMPEST_NO_EXCEPTIONS
ResetFlags ResetFlags::from_string(std::string_view labels) {
    ResetFlags flags;
    std::string bad_label;
    Error result = parse(labels, flags, &bad_label);
    if (result != Error::Ok) {
        throw DecodeException("Unrecognized reset flag label \"" + bad_label + "\"", result);
    }
    return flags;
}
#endif

RadioStats RadioStats::from_array(const std::array<std::int32_t, RADIO_STATS_SLOTS>& stats) noexcept {
    RadioStats decoded;
    decoded.version = stats[0];
    decoded.reboot_count = stats[1];
    decoded.i2c_bus_error_count = stats[2];
    decoded.radio_status = stats[3];
    decoded.radio_network_id = stats[4];
    return decoded;
}

bool RadioStats::known_radio_status(RadioStatus& status) const noexcept {
    switch (radio_status) {
    case static_cast<std::int32_t>(RadioStatus::Off):
    case static_cast<std::int32_t>(RadioStatus::On):
    case static_cast<std::int32_t>(RadioStatus::Active):
    case static_cast<std::int32_t>(RadioStatus::BleConnected):
        status = static_cast<RadioStatus>(radio_status);
        return true;
    default:
        return false;
    }
}

} // namespace tempest
