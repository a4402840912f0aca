/**
 * @file observation.cpp
 * @brief Derived meteorological quantities.
 */

#include <tempest/observation.hpp>

#include <cmath>

namespace tempest {

namespace {

constexpr double LAMBDA = -0.0065; // Temperature lapse rate (K/m)
constexpr double R_SUB_D = 287.0;  // Specific gas constant of dry air (J/(kg K))
constexpr double G = 9.80665;      // Standard gravity (m/s^2)
constexpr double G_OVER_RD_LAMBDA = -G / (R_SUB_D * LAMBDA);
constexpr double ZERO_C_KELVIN = 273.15;

// Arden Buck saturation vapor pressure fit
constexpr double ARDEN_BUCK_A = 6.1121;
constexpr double ARDEN_BUCK_B = 18.678;
constexpr double ARDEN_BUCK_C = 257.14;
constexpr double ARDEN_BUCK_D = 234.5;

// Stull wet bulb fit
constexpr double STULL_A = 0.151977;
constexpr double STULL_B = 8.313659;
constexpr double STULL_C = -1.676311;
constexpr double STULL_D = 0.00391838;
constexpr double STULL_E = 0.023101;
constexpr double STULL_F = -4.686035;

// Steadman apparent temperature with radiation
constexpr double STEADMAN_CE = 0.348;
constexpr double STEADMAN_CWS = -0.70;
constexpr double STEADMAN_CQ = 0.70;
constexpr double STEADMAN_OWS = 10.0;
constexpr double STEADMAN_B = -4.25;

} // namespace

const char* precip_kind_name(PrecipKind kind) noexcept {
    switch (kind) {
    case PrecipKind::None:
        return "none";
    case PrecipKind::Rain:
        return "rain";
    case PrecipKind::Hail:
        return "hail";
    case PrecipKind::RainHail:
        return "rain_hail";
    default:
        return "unknown";
    }
}

std::optional<double> Observation::barometric_pressure(double station_elevation) const noexcept {
    if (!station_pressure || !air_temperature || !std::isfinite(station_elevation)) {
        return std::nullopt;
    }

    double t_kelvin = *air_temperature + ZERO_C_KELVIN;
    double lapse = LAMBDA * station_elevation;
    double ratio = std::pow(1.0 + lapse / (t_kelvin - lapse), -G_OVER_RD_LAMBDA);
    return *station_pressure * ratio;
}

std::optional<double> Observation::vapor_pressure_saturated() const noexcept {
    if (!air_temperature) {
        return std::nullopt;
    }

    double t = *air_temperature;
    return ARDEN_BUCK_A * std::exp((ARDEN_BUCK_B - t / ARDEN_BUCK_D) * (t / (ARDEN_BUCK_C + t)));
}

std::optional<double> Observation::vapor_pressure_actual() const noexcept {
    auto saturated = vapor_pressure_saturated();
    if (!saturated || !relative_humidity) {
        return std::nullopt;
    }
    return *saturated * (*relative_humidity / 100.0);
}

std::optional<double> Observation::dew_point() const noexcept {
    auto actual = vapor_pressure_actual();
    if (!actual) {
        return std::nullopt;
    }

    // l = (B - T/D) * T / (C + T) solved for T: T^2 + D(l - B)T + DlC = 0.
    // The smaller root is the physical one; as D grows it tends to Cl/(B - l).
    double ln_ratio = std::log(*actual / ARDEN_BUCK_A);
    double linear = ARDEN_BUCK_D * (ARDEN_BUCK_B - ln_ratio);
    double product = ARDEN_BUCK_D * ln_ratio * ARDEN_BUCK_C;
    double root = std::sqrt(linear * linear - 4.0 * product);
    return 2.0 * product / (linear + root);
}

std::optional<double> Observation::wet_bulb_temperature() const noexcept {
    if (!air_temperature || !relative_humidity) {
        return std::nullopt;
    }

    double t = *air_temperature;
    double rh = *relative_humidity;
    return t * std::atan(STULL_A * std::sqrt(rh + STULL_B)) + std::atan(t + rh) -
           std::atan(rh + STULL_C) + STULL_D * std::pow(rh, 1.5) * std::atan(STULL_E * rh) +
           STULL_F;
}

std::optional<double> Observation::apparent_temperature() const noexcept {
    auto e = vapor_pressure_actual();
    if (!e || !wind || !solar) {
        return std::nullopt;
    }

    double ta = *air_temperature;
    double ws = wind->avg.speed_magnitude();
    double q = solar->irradiance;
    return ta + STEADMAN_CE * *e + STEADMAN_CWS * ws + (STEADMAN_CQ * q) / (ws + STEADMAN_OWS) +
           STEADMAN_B;
}

} // namespace tempest
