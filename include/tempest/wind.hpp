/**
 * @file wind.hpp
 * @brief Wind speed/direction value type.
 *
 * Direction follows the meteorological convention: the bearing in degrees
 * the wind blows *from*, clockwise from true north.
 */

#ifndef TEMPEST_WIND_HPP
#define TEMPEST_WIND_HPP

#include <cmath>
#include <numbers>

namespace tempest {

/**
 * @brief North/east pair of vector components.
 */
struct Components {
    double north = 0.0;
    double east = 0.0;
};

/**
 * @brief Immutable wind reading.
 */
class Wind {
public:
    /**
     * @brief Construct a wind reading.
     *
     * @param speed Speed magnitude (m/s)
     * @param direction Source direction (degrees), used as given
     */
    Wind(double speed, double direction) noexcept
        : speed_magnitude_(speed), source_direction_(direction) {}

    [[nodiscard]] double speed_magnitude() const noexcept {
        return speed_magnitude_;
    }

    [[nodiscard]] double source_direction() const noexcept {
        return source_direction_;
    }

    /**
     * @brief Unit vector of the source direction.
     *
     * @return (cos, sin) of the direction in radians as (north, east)
     */
    [[nodiscard]] Components component_direction() const noexcept {
        double radians = source_direction_ * (std::numbers::pi / 180.0);
        return {std::cos(radians), std::sin(radians)};
    }

    /**
     * @brief Unit vector scaled by the speed magnitude.
     */
    [[nodiscard]] Components component_velocity() const noexcept {
        Components unit = component_direction();
        return {speed_magnitude_ * unit.north, speed_magnitude_ * unit.east};
    }

private:
    double speed_magnitude_;
    double source_direction_;
};

} // namespace tempest

#endif // TEMPEST_WIND_HPP
