/**
 * @file observation.hpp
 * @brief Decoded station observation and derived quantities.
 *
 * Every optional group is either fully present or absent. Derived
 * quantities are computed on demand and return std::nullopt as soon as any
 * input they need is absent; nothing is defaulted.
 *
 * Formulas:
 * - Barometric pressure: hypsometric reduction to sea level with a standard
 *   lapse rate.
 * - Vapor pressure: Arden Buck (1981/1996) best fit over water.
 * - Wet bulb: Stull (2011) empirical fit, valid for RH 5-99 % and
 *   -20..50 C.
 * - Apparent temperature: Steadman (1994) with solar radiation.
 */

#ifndef TEMPEST_OBSERVATION_HPP
#define TEMPEST_OBSERVATION_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "wind.hpp"

namespace tempest {

using Timestamp = std::chrono::sys_seconds;

/**
 * @brief Precipitation type of the last minute.
 */
enum class PrecipKind {
    None = 0,
    Rain = 1,
    Hail = 2,
    RainHail = 3
};

const char* precip_kind_name(PrecipKind kind) noexcept;

/**
 * @brief Wind statistics over the sample interval. One direction for all.
 */
struct WindObservation {
    Wind lull;
    Wind avg;
    Wind gust;
    std::chrono::seconds interval;
};

struct SolarObservation {
    double illuminance;       ///< Lux
    double ultraviolet_index; ///< Index
    double irradiance;        ///< W/m^2
};

struct PrecipObservation {
    double quantity_last_minute; ///< mm
    PrecipKind kind;
};

struct LightningObservation {
    double average_distance; ///< km
    std::int64_t count;
};

/**
 * @brief obs_st decoded.
 */
struct Observation {
    std::string serial_number;
    std::optional<std::string> hub_serial_number;
    std::int32_t firmware_revision = 0;

    Timestamp timestamp{};
    std::optional<WindObservation> wind;
    std::optional<double> station_pressure;  ///< hPa
    std::optional<double> air_temperature;   ///< Degrees C
    std::optional<double> relative_humidity; ///< Percent
    std::optional<SolarObservation> solar;
    std::optional<PrecipObservation> precip;
    std::optional<LightningObservation> lightning;
    double battery_volts = 0.0;
    std::chrono::minutes report_interval{0};

    /**
     * @brief Station pressure reduced to mean sea level (hPa).
     *
     * @param station_elevation Elevation of the station (m); the ratio is
     *        exactly 1 at 0 m
     * @return std::nullopt without pressure or temperature, or for a
     *         non-finite elevation
     */
    [[nodiscard]] std::optional<double> barometric_pressure(double station_elevation) const noexcept;

    /// Saturation vapor pressure at air temperature (hPa)
    [[nodiscard]] std::optional<double> vapor_pressure_saturated() const noexcept;

    /// Partial pressure of water vapor (hPa)
    [[nodiscard]] std::optional<double> vapor_pressure_actual() const noexcept;

    /// Dew point (degrees C), inverse of the saturation formula
    [[nodiscard]] std::optional<double> dew_point() const noexcept;

    [[nodiscard]] std::optional<double> wet_bulb_temperature() const noexcept;

    /// Needs temperature, humidity, average wind and irradiance
    [[nodiscard]] std::optional<double> apparent_temperature() const noexcept;
};

} // namespace tempest

#endif // TEMPEST_OBSERVATION_HPP
