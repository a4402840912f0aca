/**
 * @file messages.cpp
 * @brief Message kind names.
 */

#include <tempest/messages.hpp>
#include <tempest/overloaded.hpp>

namespace tempest {

const char* message_type_tag(const Message& message) noexcept {
    return std::visit(overloaded{
                          [](const PrecipEvent&) { return "evt_precip"; },
                          [](const StrikeEvent&) { return "evt_strike"; },
                          [](const RapidWind&) { return "rapid_wind"; },
                          [](const Observation&) { return "obs_st"; },
                          [](const DeviceStatus&) { return "device_status"; },
                          [](const HubStatus&) { return "hub_status"; },
                      },
                      message);
}

const char* message_kind_name(const Message& message) noexcept {
    return std::visit(overloaded{
                          [](const PrecipEvent&) { return "precip_event"; },
                          [](const StrikeEvent&) { return "strike_event"; },
                          [](const RapidWind&) { return "rapid_wind"; },
                          [](const Observation&) { return "observation"; },
                          [](const DeviceStatus&) { return "device_status"; },
                          [](const HubStatus&) { return "hub_status"; },
                      },
                      message);
}

} // namespace tempest
