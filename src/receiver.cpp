/**
 * @file receiver.cpp
 * @brief Sources of JSON documents: the hub's UDP broadcast and replay files.
 */

#include <tempest/log.hpp>
#include <tempest/receiver.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace tempest {

UdpReceiver::~UdpReceiver() {
    close();
}

UdpReceiver::UdpReceiver(UdpReceiver&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

UdpReceiver& UdpReceiver::operator=(UdpReceiver&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Error UdpReceiver::bind(std::uint16_t port, std::string& reason) {
    close();

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        reason = std::string("socket: ") + std::strerror(errno);
        return Error::Io;
    }

    // Other listeners on the same host may want the broadcast too
    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        reason = std::string("setsockopt: ") + std::strerror(errno);
        ::close(fd);
        return Error::Io;
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(port);
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        reason = std::string("bind: ") + std::strerror(errno);
        ::close(fd);
        return Error::Io;
    }

    fd_ = fd;
    return Error::Ok;
}

std::optional<std::string> UdpReceiver::next() {
    if (fd_ < 0) {
        return std::nullopt;
    }

    std::vector<char> buffer(MAX_DATAGRAM_BYTES);
    ssize_t received = ::recv(fd_, buffer.data(), buffer.size(), 0);
    if (received >= 0) {
        return std::string(buffer.data(), static_cast<std::size_t>(received));
    }
    if (errno == EINTR) {
        log_info("Receiver interrupted");
        return std::nullopt;
    }
    log_warn("Receiver terminated: socket error %s", std::strerror(errno));
    close();
    return std::nullopt;
}

void UdpReceiver::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::optional<std::string> LineReader::next() {
    std::string line;
    while (std::getline(*input_, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            return line;
        }
    }
    return std::nullopt;
}

} // namespace tempest
