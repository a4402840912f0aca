/**
 * @file test_status_flags.cpp
 * @brief Tests for sensor status bits, reset flags and radio stats.
 */

#include <catch2/catch_test_macros.hpp>
#include <tempest/error.hpp>
#include <tempest/status_flags.hpp>

#include <string>

using namespace tempest;

TEST_CASE("SensorStatus decodes each bit", "[status][sensor]") {
    SECTION("zero means all sensors ok") {
        SensorStatus status = SensorStatus::from_bits(0);
        REQUIRE_FALSE(status.any_failed());
        REQUIRE_FALSE(status.lightning_noise);
        REQUIRE_FALSE(status.power_booster_shore_power);
    }

    SECTION("individual failure bits") {
        REQUIRE(SensorStatus::from_bits(0x001).lightning_failed);
        REQUIRE(SensorStatus::from_bits(0x008).pressure_failed);
        REQUIRE(SensorStatus::from_bits(0x010).temperature_failed);
        REQUIRE(SensorStatus::from_bits(0x020).humidity_failed);
        REQUIRE(SensorStatus::from_bits(0x040).wind_failed);
        REQUIRE(SensorStatus::from_bits(0x080).precip_failed);
        REQUIRE(SensorStatus::from_bits(0x100).irradiance_failed);
    }

    SECTION("noise and disturber are not failures") {
        SensorStatus status = SensorStatus::from_bits(0x006);
        REQUIRE(status.lightning_noise);
        REQUIRE(status.lightning_disturber);
        REQUIRE_FALSE(status.any_failed());
    }

    SECTION("power booster bits") {
        SensorStatus status = SensorStatus::from_bits(0x18000);
        REQUIRE(status.power_booster_depleted);
        REQUIRE(status.power_booster_shore_power);
        REQUIRE_FALSE(status.any_failed());
    }

    SECTION("unassigned bits are ignored") {
        SensorStatus status = SensorStatus::from_bits(0x00007E00U);
        REQUIRE_FALSE(status.any_failed());
        REQUIRE_FALSE(status.power_booster_depleted);
    }
}

TEST_CASE("ResetFlags parsing", "[status][reset]") {
    ResetFlags flags;

    SECTION("several labels") {
        REQUIRE(ResetFlags::parse("BOR,PIN,POR", flags) == Error::Ok);
        REQUIRE(flags.brownout);
        REQUIRE(flags.pin);
        REQUIRE(flags.power_on);
        REQUIRE_FALSE(flags.software);
        REQUIRE_FALSE(flags.hard_fault);
    }

    SECTION("every label") {
        REQUIRE(ResetFlags::parse("BOR,PIN,POR,SFT,WDG,WWD,LPW,HRDFLT", flags) == Error::Ok);
        ResetFlags all{true, true, true, true, true, true, true, true};
        REQUIRE(flags == all);
    }

    SECTION("repeated labels are harmless") {
        REQUIRE(ResetFlags::parse("WDG,WDG", flags) == Error::Ok);
        REQUIRE(flags.watchdog);
    }

    SECTION("unknown label fails and names the label") {
        std::string bad_label;
        REQUIRE(ResetFlags::parse("BOR,XYZ", flags, &bad_label) == Error::UnrecognizedLabel);
        REQUIRE(bad_label == "XYZ");
    }

    SECTION("labels are case sensitive") {
        REQUIRE(ResetFlags::parse("bor", flags) == Error::UnrecognizedLabel);
    }

    SECTION("empty string is an unrecognized label") {
        std::string bad_label = "unchanged";
        REQUIRE(ResetFlags::parse("", flags, &bad_label) == Error::UnrecognizedLabel);
        REQUIRE(bad_label.empty());
    }

    SECTION("trailing comma yields an empty label") {
        REQUIRE(ResetFlags::parse("BOR,", flags) == Error::UnrecognizedLabel);
    }

    SECTION("failure leaves the output untouched") {
        flags.hard_fault = true;
        REQUIRE(ResetFlags::parse("BOR,NOPE", flags) == Error::UnrecognizedLabel);
        REQUIRE(flags.hard_fault);
        REQUIRE_FALSE(flags.brownout);
    }
}

#if !TEMPEST_NO_EXCEPTIONS
TEST_CASE("ResetFlags::from_string throws on unknown labels", "[status][reset]") {
    REQUIRE(ResetFlags::from_string("SFT").software);
    REQUIRE_THROWS_AS(ResetFlags::from_string("SFT,???"), DecodeException);

    try {
        (void)ResetFlags::from_string("QQQ");
        FAIL("expected DecodeException");
    } catch (const DecodeException& e) {
        REQUIRE(e.code() == Error::UnrecognizedLabel);
    }
}
#endif

TEST_CASE("RadioStats from the positional array", "[status][radio]") {
    RadioStats stats = RadioStats::from_array({2, 1, 0, 3, 2839});
    REQUIRE(stats.version == 2);
    REQUIRE(stats.reboot_count == 1);
    REQUIRE(stats.i2c_bus_error_count == 0);
    REQUIRE(stats.radio_status == 3);
    REQUIRE(stats.radio_network_id == 2839);

    RadioStatus status = RadioStatus::Off;
    REQUIRE(stats.known_radio_status(status));
    REQUIRE(status == RadioStatus::Active);

    SECTION("unknown status codes are kept raw") {
        RadioStats odd = RadioStats::from_array({2, 0, 0, 5, 0});
        REQUIRE(odd.radio_status == 5);
        REQUIRE_FALSE(odd.known_radio_status(status));
    }
}
