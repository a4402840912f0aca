/**
 * @file decode_stream.cpp
 * @brief Default decode failure reporting.
 */

#include <tempest/decode_stream.hpp>
#include <tempest/log.hpp>

namespace tempest {

void log_decode_failure(const DecodeFailure& failure) {
    log_warn("Dropped undecodable message: %s", describe(failure.raw).c_str());
    log_warn(".. error was: %s (%s)", failure.reason.c_str(), error_string(failure.code));
}

} // namespace tempest
