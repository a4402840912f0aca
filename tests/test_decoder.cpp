/**
 * @file test_decoder.cpp
 * @brief Tests for raw message to domain message decoding.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tempest/decoder.hpp>

#include <cmath>
#include <string>

#include "test_support.hpp"

using namespace tempest;
using namespace tempest::test;
using Catch::Matchers::WithinAbs;

namespace {

Observation decode_ok(const RawObservation& raw) {
    DecodeResult result = decode(raw);
    REQUIRE(result.ok());
    REQUIRE(std::holds_alternative<Observation>(result.message()));
    return std::get<Observation>(result.message());
}

DecodeFailure decode_failed(const RawMessage& raw) {
    DecodeResult result = decode(raw);
    REQUIRE_FALSE(result.ok());
    return result.failure();
}

} // namespace

TEST_CASE("Decode a complete observation", "[decoder][observation]") {
    Observation obs = decode_ok(sample_raw_observation());

    REQUIRE(obs.serial_number == "ST-00000512");
    REQUIRE(obs.hub_serial_number == std::optional<std::string>("HB-00013030"));
    REQUIRE(obs.firmware_revision == 129);
    REQUIRE(obs.timestamp.time_since_epoch().count() == 1588948614);

    REQUIRE(obs.wind.has_value());
    REQUIRE(obs.wind->lull.speed_magnitude() == 0.18);
    REQUIRE(obs.wind->avg.speed_magnitude() == 0.22);
    REQUIRE(obs.wind->gust.speed_magnitude() == 0.27);
    REQUIRE(obs.wind->gust.source_direction() == 144.0);
    REQUIRE(obs.wind->interval == std::chrono::seconds{6});

    REQUIRE(obs.station_pressure == std::optional<double>(1017.57));
    REQUIRE(obs.air_temperature == std::optional<double>(22.37));
    REQUIRE(obs.relative_humidity == std::optional<double>(50.26));

    REQUIRE(obs.solar.has_value());
    REQUIRE(obs.solar->illuminance == 328.0);
    REQUIRE(obs.solar->ultraviolet_index == 0.03);
    REQUIRE(obs.solar->irradiance == 3.0);

    REQUIRE(obs.precip.has_value());
    REQUIRE(obs.precip->quantity_last_minute == 0.0);
    REQUIRE(obs.precip->kind == PrecipKind::None);

    REQUIRE(obs.lightning.has_value());
    REQUIRE(obs.lightning->count == 0);

    REQUIRE(obs.battery_volts == 2.410);
    REQUIRE(obs.report_interval == std::chrono::minutes{1});
}

TEST_CASE("Observation groups are all or nothing", "[decoder][observation]") {
    RawObservation raw = sample_raw_observation();

    SECTION("missing wind direction drops the wind group only") {
        slot(raw.obs, ObservationSlot::WindDirection).reset();
        Observation obs = decode_ok(raw);
        REQUIRE_FALSE(obs.wind.has_value());
        REQUIRE(obs.solar.has_value());
        REQUIRE(obs.air_temperature.has_value());
    }

    SECTION("missing sample interval drops the wind group") {
        slot(raw.obs, ObservationSlot::WindSampleInterval).reset();
        REQUIRE_FALSE(decode_ok(raw).wind.has_value());
    }

    SECTION("missing uv index drops the solar group") {
        slot(raw.obs, ObservationSlot::UltravioletIndex).reset();
        Observation obs = decode_ok(raw);
        REQUIRE_FALSE(obs.solar.has_value());
        REQUIRE(obs.wind.has_value());
    }

    SECTION("missing rain amount drops the precip group") {
        slot(raw.obs, ObservationSlot::RainLastMinute).reset();
        REQUIRE_FALSE(decode_ok(raw).precip.has_value());
    }

    SECTION("missing precip type drops the precip group") {
        slot(raw.obs, ObservationSlot::PrecipType).reset();
        REQUIRE_FALSE(decode_ok(raw).precip.has_value());
    }

    SECTION("missing strike count drops the lightning group") {
        slot(raw.obs, ObservationSlot::LightningCount).reset();
        REQUIRE_FALSE(decode_ok(raw).lightning.has_value());
    }

    SECTION("scalar quantities may be absent independently") {
        slot(raw.obs, ObservationSlot::StationPressure).reset();
        slot(raw.obs, ObservationSlot::RelativeHumidity).reset();
        Observation obs = decode_ok(raw);
        REQUIRE_FALSE(obs.station_pressure.has_value());
        REQUIRE_FALSE(obs.relative_humidity.has_value());
        REQUIRE(obs.air_temperature.has_value());
        REQUIRE_FALSE(obs.dew_point().has_value());
    }
}

TEST_CASE("Precipitation type codes", "[decoder][precip]") {
    RawObservation raw = sample_raw_observation();

    SECTION("known codes") {
        const PrecipKind expected[] = {PrecipKind::None, PrecipKind::Rain, PrecipKind::Hail,
                                       PrecipKind::RainHail};
        for (int code = 0; code < 4; ++code) {
            slot(raw.obs, ObservationSlot::PrecipType) = code;
            REQUIRE(decode_ok(raw).precip->kind == expected[code]);
        }
    }

    SECTION("unknown code fails the whole message") {
        slot(raw.obs, ObservationSlot::PrecipType) = 9.0;
        DecodeFailure failure = decode_failed(raw);
        REQUIRE(failure.code == Error::UnrecognizedCode);
        REQUIRE(failure.reason == "Unrecognized precip type 9");
    }

    SECTION("fractional code is unknown") {
        slot(raw.obs, ObservationSlot::PrecipType) = 1.5;
        REQUIRE(decode_failed(raw).code == Error::UnrecognizedCode);
    }

    SECTION("negative code is unknown") {
        slot(raw.obs, ObservationSlot::PrecipType) = -1.0;
        REQUIRE(decode_failed(raw).code == Error::UnrecognizedCode);
    }

    SECTION("decode_precip_kind directly") {
        PrecipKind kind = PrecipKind::None;
        REQUIRE(decode_precip_kind(2, kind) == Error::Ok);
        REQUIRE(kind == PrecipKind::Hail);
        REQUIRE(decode_precip_kind(4, kind) == Error::UnrecognizedCode);
        REQUIRE(kind == PrecipKind::Hail);
    }
}

TEST_CASE("Observation required fields", "[decoder][observation]") {
    RawObservation raw = sample_raw_observation();

    SECTION("timestamp") {
        slot(raw.obs, ObservationSlot::Timestamp).reset();
        DecodeFailure failure = decode_failed(raw);
        REQUIRE(failure.code == Error::MissingField);
        REQUIRE(failure.reason == "Missing observation timestamp");
    }

    SECTION("battery voltage") {
        slot(raw.obs, ObservationSlot::BatteryVolts).reset();
        DecodeFailure failure = decode_failed(raw);
        REQUIRE(failure.code == Error::MissingField);
        REQUIRE(failure.reason == "Missing battery voltage");
    }

    SECTION("report interval") {
        slot(raw.obs, ObservationSlot::ReportIntervalMinutes).reset();
        DecodeFailure failure = decode_failed(raw);
        REQUIRE(failure.code == Error::MissingField);
        REQUIRE(failure.reason == "Missing report interval");
    }

    SECTION("timestamp is checked before the precip code") {
        slot(raw.obs, ObservationSlot::Timestamp).reset();
        slot(raw.obs, ObservationSlot::PrecipType) = 9.0;
        REQUIRE(decode_failed(raw).reason == "Missing observation timestamp");
    }

    SECTION("non-finite timestamp counts as missing") {
        slot(raw.obs, ObservationSlot::Timestamp) = std::nan("");
        REQUIRE(decode_failed(raw).code == Error::MissingField);
    }
}

TEST_CASE("Failure carries the raw message unchanged", "[decoder]") {
    RawObservation raw = sample_raw_observation();
    slot(raw.obs, ObservationSlot::PrecipType) = 9.0;

    DecodeFailure failure = decode_failed(raw);
    REQUIRE(std::holds_alternative<RawObservation>(failure.raw));
    const RawObservation& kept = std::get<RawObservation>(failure.raw);
    REQUIRE(kept.serial_number == raw.serial_number);
    REQUIRE(kept.hub_sn == raw.hub_sn);
    REQUIRE(kept.firmware_revision == raw.firmware_revision);
    REQUIRE(kept.obs == raw.obs);
}

TEST_CASE("Decode events, rapid wind and device status", "[decoder]") {
    SECTION("precip event") {
        RawPrecipEvent raw{"SK-00008453", std::string("HB-00000001"), 1493322445};
        PrecipEvent event = decode_precip_event(raw);
        REQUIRE(event.serial_number == "SK-00008453");
        REQUIRE(event.hub_serial_number == std::optional<std::string>("HB-00000001"));
        REQUIRE(event.timestamp.time_since_epoch().count() == 1493322445);
    }

    SECTION("strike event") {
        RawStrikeEvent raw{"AR-00004049", std::nullopt, 1493322445, 27.0, 3848.0};
        DecodeResult result = decode(raw);
        REQUIRE(result.ok());
        const auto& strike = std::get<StrikeEvent>(result.message());
        REQUIRE_FALSE(strike.hub_serial_number.has_value());
        REQUIRE(strike.distance == 27.0);
        REQUIRE(strike.energy == 3848.0);
    }

    SECTION("rapid wind") {
        RapidWind wind = decode_rapid_wind(sample_raw_rapid_wind());
        REQUIRE(wind.timestamp.time_since_epoch().count() == 1493322445);
        REQUIRE(wind.wind.speed_magnitude() == 2.3);
        REQUIRE(wind.wind.source_direction() == 128.0);
    }

    SECTION("device status") {
        RawDeviceStatus raw = sample_raw_device_status();
        raw.sensor_status = sensor_bits::WIND_FAILED | sensor_bits::LIGHTNING_NOISE;
        raw.debug = 1;
        DeviceStatus status = decode_device_status(raw);
        REQUIRE(status.uptime == std::chrono::seconds{2189});
        REQUIRE(status.voltage == 3.50);
        REQUIRE(status.firmware_revision == 17);
        REQUIRE(status.rssi == -17.0);
        REQUIRE(status.hub_rssi == -87.0);
        REQUIRE(status.sensor_status.wind_failed);
        REQUIRE(status.sensor_status.lightning_noise);
        REQUIRE(status.sensor_status.any_failed());
        REQUIRE(status.debug);
    }

    SECTION("device debug flag is set only by 1") {
        RawDeviceStatus raw = sample_raw_device_status();
        raw.debug = 2;
        REQUIRE_FALSE(decode_device_status(raw).debug);
    }
}

TEST_CASE("Decode hub status", "[decoder][hub]") {
    RawHubStatus raw = sample_raw_hub_status();

    SECTION("valid reset flags") {
        HubStatus status;
        std::string reason;
        REQUIRE(decode_hub_status(raw, status, reason) == Error::Ok);
        REQUIRE(status.serial_number == "HB-00000001");
        REQUIRE(status.firmware_revision == "35");
        REQUIRE(status.uptime == std::chrono::seconds{1670133});
        REQUIRE(status.timestamp.time_since_epoch().count() == 1495724691);
        REQUIRE(status.reset_flags.brownout);
        REQUIRE(status.reset_flags.pin);
        REQUIRE(status.reset_flags.power_on);
        REQUIRE_FALSE(status.reset_flags.watchdog);
        REQUIRE(status.seq == 48);
        REQUIRE(status.radio_stats.radio_network_id == 2839);
    }

    SECTION("unknown reset flag fails the message") {
        raw.reset_flags = "BOR,XYZ";
        DecodeFailure failure = decode_failed(raw);
        REQUIRE(failure.code == Error::UnrecognizedLabel);
        REQUIRE(failure.reason == "Unrecognized reset flag label \"XYZ\"");
        REQUIRE(std::get<RawHubStatus>(failure.raw).reset_flags == "BOR,XYZ");
    }
}

TEST_CASE("Message tags", "[decoder]") {
    DecodeResult wind = decode(sample_raw_rapid_wind());
    REQUIRE(std::string(message_type_tag(wind.message())) == "rapid_wind");
    REQUIRE(std::string(message_kind_name(wind.message())) == "rapid_wind");

    DecodeResult obs = decode(sample_raw_observation());
    REQUIRE(std::string(message_type_tag(obs.message())) == "obs_st");
    REQUIRE(std::string(message_kind_name(obs.message())) == "observation");

    REQUIRE(std::string(raw_type_tag(sample_raw_hub_status())) == "hub_status");
}
