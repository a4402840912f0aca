/**
 * @file decoder.hpp
 * @brief Raw message to domain message decoding.
 *
 * Decoding is message-scoped: a malformed message yields a DecodeFailure
 * that carries the untouched raw input, the error code and a reason, and
 * nothing else is affected. Events, rapid wind and device status are pure
 * reshaping and cannot fail. An observation fails without its timestamp,
 * battery voltage or report interval, or with an unknown precipitation
 * code; its optional groups are built all-or-nothing. A hub status fails on
 * an unknown reset flag label.
 */

#ifndef TEMPEST_DECODER_HPP
#define TEMPEST_DECODER_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "error.hpp"
#include "messages.hpp"
#include "raw_message.hpp"

namespace tempest {

/**
 * @brief A message that could not be decoded, with context for logging.
 */
struct DecodeFailure {
    RawMessage raw;     ///< The input, exactly as received
    Error code;         ///< Failure category
    std::string reason; ///< Human readable detail
};

/**
 * @brief Outcome of decoding one raw message.
 */
class DecodeResult {
public:
    DecodeResult(Message message) : value_(std::move(message)) {}
    DecodeResult(DecodeFailure failure) : value_(std::move(failure)) {}

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<Message>(value_);
    }

    /// Precondition: ok()
    [[nodiscard]] Message& message() noexcept {
        return *std::get_if<Message>(&value_);
    }

    [[nodiscard]] const Message& message() const noexcept {
        return *std::get_if<Message>(&value_);
    }

    /// Precondition: !ok()
    [[nodiscard]] const DecodeFailure& failure() const noexcept {
        return *std::get_if<DecodeFailure>(&value_);
    }

private:
    std::variant<Message, DecodeFailure> value_;
};

/**
 * @brief Decode one raw message of any kind.
 *
 * @param raw Raw message, moved into the result on both paths
 * @return The decoded message, or the failure holding raw
 */
DecodeResult decode(RawMessage raw);

/**
 * @defgroup decode_variants Per-variant decoders
 * @{
 */
PrecipEvent decode_precip_event(const RawPrecipEvent& raw);
StrikeEvent decode_strike_event(const RawStrikeEvent& raw);
RapidWind decode_rapid_wind(const RawRapidWind& raw);
DeviceStatus decode_device_status(const RawDeviceStatus& raw);

/**
 * @param[out] out Decoded observation, unspecified on error
 * @param[out] reason Failure detail
 * @return Error::Ok, Error::MissingField or Error::UnrecognizedCode
 */
Error decode_observation(const RawObservation& raw, Observation& out, std::string& reason);

/**
 * @param[out] out Decoded hub status, unspecified on error
 * @param[out] reason Failure detail
 * @return Error::Ok or Error::UnrecognizedLabel
 */
Error decode_hub_status(const RawHubStatus& raw, HubStatus& out, std::string& reason);
/** @} */

/**
 * @defgroup observation_groups Observation group constructors
 *
 * Each returns a group only when every slot it needs is present.
 * @{
 */
std::optional<WindObservation> make_wind_observation(const ObservationSlots& obs);
std::optional<SolarObservation> make_solar_observation(const ObservationSlots& obs);
std::optional<LightningObservation> make_lightning_observation(const ObservationSlots& obs);

/**
 * @brief Precipitation group; the kind code must be 0-3 when present.
 *
 * @param[out] group Group, std::nullopt when a slot is absent
 * @return Error::Ok or Error::UnrecognizedCode
 */
Error make_precip_observation(const ObservationSlots& obs, std::optional<PrecipObservation>& group);
/** @} */

/**
 * @brief Map a precipitation type code onto PrecipKind.
 *
 * @return Error::Ok or Error::UnrecognizedCode
 */
Error decode_precip_kind(std::int64_t code, PrecipKind& kind) noexcept;

} // namespace tempest

#endif // TEMPEST_DECODER_HPP
