/**
 * @file station.hpp
 * @brief Per-installation parameters.
 */

#ifndef TEMPEST_STATION_HPP
#define TEMPEST_STATION_HPP

#include <cmath>

#include "error.hpp"

namespace tempest {

/**
 * @brief Site parameters that derived quantities depend on.
 */
struct StationParams {
    double elevation = 0.0; ///< Station elevation above mean sea level (m)

    /**
     * @brief Check the parameters before use.
     *
     * Elevation must be finite and not negative.
     *
     * @return Error::Ok or Error::InvalidArg
     */
    [[nodiscard]] Error validate() const noexcept {
        if (!std::isfinite(elevation) || elevation < 0.0) {
            return Error::InvalidArg;
        }
        return Error::Ok;
    }

#if !TEMPEST_NO_EXCEPTIONS
    /**
     * @throws InvalidArgumentException when validate() fails
     */
    void validate_or_throw() const {
        if (validate() != Error::Ok) {
            throw InvalidArgumentException("Station elevation must be a finite, non-negative number");
        }
    }
#endif
};

} // namespace tempest

#endif // TEMPEST_STATION_HPP
