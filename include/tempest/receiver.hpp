/**
 * @file receiver.hpp
 * @brief Sources of JSON documents: the hub's UDP broadcast and replay files.
 */

#ifndef TEMPEST_RECEIVER_HPP
#define TEMPEST_RECEIVER_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

#include "config.hpp"
#include "error.hpp"

namespace tempest {

/**
 * @brief Bound UDP socket yielding one datagram per next().
 *
 * Owns its file descriptor. A receive error ends the sequence, as does a
 * receive interrupted by a signal whose handler was installed without
 * SA_RESTART; the socket stays open in that case.
 */
class UdpReceiver {
public:
    UdpReceiver() noexcept = default;
    ~UdpReceiver();

    UdpReceiver(UdpReceiver&& other) noexcept;
    UdpReceiver& operator=(UdpReceiver&& other) noexcept;
    UdpReceiver(const UdpReceiver&) = delete;
    UdpReceiver& operator=(const UdpReceiver&) = delete;

    /**
     * @brief Bind 0.0.0.0:port for broadcast reception.
     *
     * @param port UDP port
     * @param[out] reason Failure detail
     * @return Error::Ok or Error::Io
     */
    Error bind(std::uint16_t port, std::string& reason);

    /**
     * @brief Block for the next datagram.
     *
     * @return Datagram text, or std::nullopt once the socket has failed or
     *         been closed
     */
    std::optional<std::string> next();

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept {
        return fd_ >= 0;
    }

private:
    int fd_ = -1;
};

/**
 * @brief Line-per-document source over an input stream, for replay.
 *
 * Blank lines are skipped. The stream must outlive the reader.
 */
class LineReader {
public:
    explicit LineReader(std::istream& input) noexcept : input_(&input) {}

    std::optional<std::string> next();

private:
    std::istream* input_;
};

} // namespace tempest

#endif // TEMPEST_RECEIVER_HPP
