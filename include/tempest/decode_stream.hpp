/**
 * @file decode_stream.hpp
 * @brief Lazy decoding over a pull-based raw message source.
 *
 * A source is any type with a member `std::optional<RawMessage> next()`
 * that returns std::nullopt once it is exhausted or has failed. The stream
 * pulls one raw message at a time, decodes it, and yields only successes;
 * each failure is reported to the failure handler (by default, logged) and
 * iteration moves on. The stream ends only when the source does or when
 * stop() was requested, which takes effect between whole messages.
 */

#ifndef TEMPEST_DECODE_STREAM_HPP
#define TEMPEST_DECODE_STREAM_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "decoder.hpp"
#include "messages.hpp"
#include "raw_message.hpp"

namespace tempest {

using DecodeFailureHandler = std::function<void(const DecodeFailure&)>;

/**
 * @brief Default failure handler: two warning lines, message then error.
 */
void log_decode_failure(const DecodeFailure& failure);

/**
 * @brief Decoding transformation over a raw message source.
 *
 * @tparam Source Raw message source, owned by the stream
 */
template <typename Source>
class DecodeStream {
public:
    explicit DecodeStream(Source source, DecodeFailureHandler on_failure = log_decode_failure)
        : source_(std::move(source)), on_failure_(std::move(on_failure)) {}

    /**
     * @brief Pull the next decodable message.
     *
     * @return The next message, or std::nullopt once the source is
     *         exhausted or stop() was called
     */
    std::optional<Message> next() {
        while (!stopped_.load(std::memory_order_acquire)) {
            std::optional<RawMessage> raw = source_.next();
            if (!raw) {
                return std::nullopt;
            }

            DecodeResult result = decode(std::move(*raw));
            if (result.ok()) {
                ++decoded_;
                return std::move(result.message());
            }

            ++dropped_;
            if (on_failure_) {
                on_failure_(result.failure());
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Request the stream to end before the next message.
     *
     * Safe to call from another thread.
     */
    void stop() noexcept {
        stopped_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool stopped() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint64_t decoded_count() const noexcept {
        return decoded_;
    }

    [[nodiscard]] std::uint64_t dropped_count() const noexcept {
        return dropped_;
    }

    Source& source() noexcept {
        return source_;
    }

private:
    Source source_;
    DecodeFailureHandler on_failure_;
    std::atomic<bool> stopped_{false};
    std::uint64_t decoded_ = 0;
    std::uint64_t dropped_ = 0;
};

} // namespace tempest

#endif // TEMPEST_DECODE_STREAM_HPP
