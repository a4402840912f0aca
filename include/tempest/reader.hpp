/**
 * @file reader.hpp
 * @brief JSON datagram to raw message parsing.
 *
 * The hub broadcasts one JSON document per datagram; its "type" member
 * selects the raw message shape. Unreadable documents are reported and
 * dropped without ending the sequence.
 */

#ifndef TEMPEST_READER_HPP
#define TEMPEST_READER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "error.hpp"
#include "log.hpp"
#include "raw_message.hpp"

namespace tempest {

/**
 * @brief Parse one JSON document into a raw message.
 *
 * Observation slots holding JSON null, or missing from a short array, are
 * absent.
 *
 * @param json Document text
 * @param[out] message Parsed message, unspecified on error
 * @param[out] reason Failure detail
 * @return Error::Ok or Error::InvalidData
 */
Error parse_raw_message(std::string_view json, RawMessage& message, std::string& reason);

/**
 * @brief Lifts a source of JSON documents into a raw message source.
 *
 * @tparam Source Type with `std::optional<std::string> next()`
 */
template <typename Source>
class JsonReader {
public:
    explicit JsonReader(Source source) : source_(std::move(source)) {}

    /**
     * @return Next readable raw message, std::nullopt once the source ends
     */
    std::optional<RawMessage> next() {
        while (std::optional<std::string> json = source_.next()) {
            RawMessage message;
            std::string reason;
            if (parse_raw_message(*json, message, reason) == Error::Ok) {
                return message;
            }
            ++dropped_;
            log_warn("Dropped unreadable message: %s", json->c_str());
            log_warn(".. error was: %s", reason.c_str());
        }
        return std::nullopt;
    }

    [[nodiscard]] std::uint64_t dropped_count() const noexcept {
        return dropped_;
    }

    Source& source() noexcept {
        return source_;
    }

private:
    Source source_;
    std::uint64_t dropped_ = 0;
};

} // namespace tempest

#endif // TEMPEST_READER_HPP
