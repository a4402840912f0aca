/**
 * @file status_flags.hpp
 * @brief Device sensor bitfield, hub reset labels and hub radio counters.
 */

#ifndef TEMPEST_STATUS_FLAGS_HPP
#define TEMPEST_STATUS_FLAGS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace tempest {

/**
 * @brief Bit masks of the device_status sensor_status field.
 */
namespace sensor_bits {
inline constexpr std::uint32_t LIGHTNING_FAILED = 0x00000001U;
inline constexpr std::uint32_t LIGHTNING_NOISE = 0x00000002U;
inline constexpr std::uint32_t LIGHTNING_DISTURBER = 0x00000004U;
inline constexpr std::uint32_t PRESSURE_FAILED = 0x00000008U;
inline constexpr std::uint32_t TEMPERATURE_FAILED = 0x00000010U;
inline constexpr std::uint32_t HUMIDITY_FAILED = 0x00000020U;
inline constexpr std::uint32_t WIND_FAILED = 0x00000040U;
inline constexpr std::uint32_t PRECIP_FAILED = 0x00000080U;
inline constexpr std::uint32_t IRRADIANCE_FAILED = 0x00000100U;
inline constexpr std::uint32_t POWER_BOOSTER_DEPLETED = 0x00008000U;
inline constexpr std::uint32_t POWER_BOOSTER_SHORE_POWER = 0x00010000U;
} // namespace sensor_bits

/**
 * @brief Decoded sensor_status bitfield. Undefined bits are ignored.
 */
struct SensorStatus {
    bool lightning_failed = false;
    bool lightning_noise = false;
    bool lightning_disturber = false;
    bool pressure_failed = false;
    bool temperature_failed = false;
    bool humidity_failed = false;
    bool wind_failed = false;
    bool precip_failed = false;
    bool irradiance_failed = false;
    bool power_booster_depleted = false;
    bool power_booster_shore_power = false;

    [[nodiscard]] static SensorStatus from_bits(std::uint32_t field) noexcept;

    /// True when any sensor reports a failure (noise and disturber excluded)
    [[nodiscard]] bool any_failed() const noexcept;
};

/**
 * @brief Decoded hub reset cause labels.
 *
 * Labels: BOR brownout, PIN pin reset, POR power on, SFT software,
 * WDG watchdog, WWD window watchdog, LPW low power, HRDFLT hard fault.
 */
struct ResetFlags {
    bool brownout = false;
    bool pin = false;
    bool power_on = false;
    bool software = false;
    bool watchdog = false;
    bool window_watchdog = false;
    bool low_power = false;
    bool hard_fault = false;

    /**
     * @brief Parse a comma separated label list.
     *
     * Every token must be a known label; the empty token is not.
     *
     * @param labels Label list, e.g. "BOR,PIN,SFT"
     * @param[out] flags Parsed flags (untouched on error)
     * @param[out] bad_label First unrecognized token, on error
     * @return Error::Ok or Error::UnrecognizedLabel
     */
    static Error parse(std::string_view labels, ResetFlags& flags, std::string* bad_label = nullptr);

#if !TEMPEST_NO_EXCEPTIONS
    /**
     * @brief Throwing form of parse().
     * @throws DecodeException on an unrecognized label
     */
    static ResetFlags from_string(std::string_view labels);
#endif

    bool operator==(const ResetFlags&) const = default;
};

/**
 * @brief Radio state reported in radio_stats[3].
 */
enum class RadioStatus : std::int32_t {
    Off = 0,
    On = 1,
    Active = 3,
    BleConnected = 7
};

/**
 * @brief Decoded hub radio_stats array.
 */
struct RadioStats {
    std::int32_t version = 0;
    std::int32_t reboot_count = 0;
    std::int32_t i2c_bus_error_count = 0;
    std::int32_t radio_status = 0; ///< Raw code, see known_radio_status()
    std::int32_t radio_network_id = 0;

    [[nodiscard]] static RadioStats from_array(
        const std::array<std::int32_t, RADIO_STATS_SLOTS>& stats) noexcept;

    /**
     * @brief Map the raw radio_status code onto RadioStatus.
     *
     * @param[out] status Decoded status
     * @return false for a code outside the documented set
     */
    bool known_radio_status(RadioStatus& status) const noexcept;
};

} // namespace tempest

#endif // TEMPEST_STATUS_FLAGS_HPP
