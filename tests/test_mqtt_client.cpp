/**
 * @file test_mqtt_client.cpp
 * @brief Tests for MQTT delivery against a loopback MQTT 3.1.1 peer.
 */

#include <catch2/catch_test_macros.hpp>
#include <tempest/decoder.hpp>
#include <tempest/mqtt_client.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "test_support.hpp"

using namespace tempest;
using namespace tempest::test;
using namespace std::chrono_literals;

namespace {

struct Packet {
    std::uint8_t header = 0;
    std::string body;
};

std::uint16_t read_u16(const std::string& body, std::size_t at) {
    return static_cast<std::uint16_t>((static_cast<std::uint8_t>(body[at]) << 8) |
                                      static_cast<std::uint8_t>(body[at + 1]));
}

std::string read_string(const std::string& body, std::size_t& at) {
    std::uint16_t length = read_u16(body, at);
    std::string text = body.substr(at + 2, length);
    at += 2U + length;
    return text;
}

bool wait_until(const std::function<bool()>& condition) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

// Listening socket on 127.0.0.1 playing the broker side of one session
class LoopbackBroker {
public:
    LoopbackBroker() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listen_fd_ >= 0);

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        REQUIRE(::bind(listen_fd_, reinterpret_cast<const sockaddr*>(&address),
                       sizeof(address)) == 0);
        REQUIRE(::listen(listen_fd_, 1) == 0);

        socklen_t length = sizeof(address);
        REQUIRE(::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&address), &length) == 0);
        port_ = ntohs(address.sin_port);
    }

    ~LoopbackBroker() {
        if (session_fd_ >= 0) {
            ::close(session_fd_);
        }
        ::close(listen_fd_);
    }

    LoopbackBroker(const LoopbackBroker&) = delete;
    LoopbackBroker& operator=(const LoopbackBroker&) = delete;

    std::uint16_t port() const {
        return port_;
    }

    void accept_session() {
        session_fd_ = ::accept(listen_fd_, nullptr, nullptr);
        REQUIRE(session_fd_ >= 0);
        timeval timeout{5, 0};
        REQUIRE(::setsockopt(session_fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) == 0);
    }

    Packet read_packet() {
        Packet packet;
        packet.header = read_byte();

        std::size_t remaining = 0;
        std::size_t multiplier = 1;
        std::uint8_t digit = 0;
        do {
            digit = read_byte();
            remaining += (digit & 0x7FU) * multiplier;
            multiplier *= 128;
        } while ((digit & 0x80U) != 0);

        packet.body.resize(remaining);
        std::size_t filled = 0;
        while (filled < remaining) {
            ssize_t n = ::recv(session_fd_, &packet.body[filled], remaining - filled, 0);
            REQUIRE(n > 0);
            filled += static_cast<std::size_t>(n);
        }
        return packet;
    }

    void send_bytes(const std::string& bytes) {
        REQUIRE(::send(session_fd_, bytes.data(), bytes.size(), 0) ==
                static_cast<ssize_t>(bytes.size()));
    }

    void accept_connection() {
        send_bytes(std::string("\x20\x02\x00\x00", 4));
    }

    void acknowledge(std::uint16_t packet_id) {
        std::string puback("\x40\x02", 2);
        puback += static_cast<char>(packet_id >> 8);
        puback += static_cast<char>(packet_id & 0xFF);
        send_bytes(puback);
    }

private:
    std::uint8_t read_byte() {
        char byte = 0;
        REQUIRE(::recv(session_fd_, &byte, 1, 0) == 1);
        return static_cast<std::uint8_t>(byte);
    }

    int listen_fd_ = -1;
    int session_fd_ = -1;
    std::uint16_t port_ = 0;
};

std::uint16_t closed_port() {
    LoopbackBroker broker;
    return broker.port();
}

} // namespace

TEST_CASE("Broker parameters", "[mqtt]") {
    REQUIRE(MqttParams{"localhost"}.validate() == Error::Ok);
    REQUIRE(MqttParams{"localhost"}.port == 1883);
    REQUIRE(MqttParams{}.validate() == Error::InvalidArg);
    REQUIRE(MqttParams{"localhost", 0}.validate() == Error::InvalidArg);

    MqttClient client(MqttParams{});
    std::string reason;
    REQUIRE(client.connect(reason) == Error::InvalidArg);
    REQUIRE_FALSE(reason.empty());
}

TEST_CASE("Publishing without a session fails", "[mqtt]") {
    MqttClient client(MqttParams{"127.0.0.1"});
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.publish(Publication{"tempest/test", true, "1"}) == Error::Io);

    DecodeResult result = decode(sample_raw_rapid_wind());
    REQUIRE(result.ok());
    REQUIRE(client.publish_report(result.message(), StationParams{0.0}) == 0);
    REQUIRE(client.pending_count() == 0);
}

TEST_CASE("Unreachable broker", "[mqtt]") {
    MqttClient client(MqttParams{"127.0.0.1", closed_port()});
    std::string reason;
    REQUIRE(client.connect(reason) == Error::Io);
    REQUIRE(reason.rfind("127.0.0.1:", 0) == 0);
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.publish(Publication{"tempest/test", true, "1"}) == Error::Io);
}

TEST_CASE("Session with a loopback broker", "[mqtt]") {
    LoopbackBroker broker;
    MqttClient client(MqttParams{"127.0.0.1", broker.port(), "weather", "s3cret"});

    std::string reason;
    REQUIRE(client.connect(reason) == Error::Ok);
    broker.accept_session();

    Packet connect = broker.read_packet();
    REQUIRE(connect.header == 0x10);
    REQUIRE(connect.body.substr(0, 7) == std::string("\x00\x04MQTT\x04", 7));
    std::uint8_t flags = static_cast<std::uint8_t>(connect.body[7]);
    REQUIRE(flags == 0xC2); // user name, password, clean session
    REQUIRE(read_u16(connect.body, 8) == 15);
    std::size_t at = 10;
    REQUIRE(read_string(connect.body, at) == "tempest-exporter");
    REQUIRE(read_string(connect.body, at) == "weather");
    REQUIRE(read_string(connect.body, at) == "s3cret");

    broker.accept_connection();
    REQUIRE(wait_until([&] { return client.is_connected(); }));

    SECTION("rapid wind goes out retained at least once") {
        DecodeResult result = decode(sample_raw_rapid_wind());
        REQUIRE(result.ok());
        REQUIRE(client.publish_report(result.message(), StationParams{0.0}) == 3);

        Packet publish = broker.read_packet();
        REQUIRE(publish.header == 0x33); // PUBLISH, QoS 1, retain
        std::size_t offset = 0;
        REQUIRE(read_string(publish.body, offset) ==
                "tempest/instant_wind/speed_magnitude_m_per_s");
        std::uint16_t packet_id = read_u16(publish.body, offset);
        REQUIRE(publish.body.substr(offset + 2) == "2.3");
        broker.acknowledge(packet_id);

        for (int i = 0; i < 2; ++i) {
            Packet next = broker.read_packet();
            REQUIRE(next.header == 0x33);
            std::size_t next_offset = 0;
            read_string(next.body, next_offset);
            broker.acknowledge(read_u16(next.body, next_offset));
        }
        REQUIRE(wait_until([&] { return client.pending_count() == 0; }));
    }

    SECTION("unacknowledged publications are bounded") {
        for (std::size_t i = 0; i < MQTT_QUEUE_CAPACITY; ++i) {
            REQUIRE(client.publish(Publication{"tempest/test", false, std::to_string(i)}) ==
                    Error::Ok);
        }
        REQUIRE(client.pending_count() == MQTT_QUEUE_CAPACITY);
        REQUIRE(client.publish(Publication{"tempest/test", false, "overflow"}) == Error::Io);
        REQUIRE(client.dropped_count() == 1);
    }

    client.disconnect();
    REQUIRE_FALSE(client.is_connected());
}

TEST_CASE("Anonymous session", "[mqtt]") {
    LoopbackBroker broker;
    MqttClient client(MqttParams{"127.0.0.1", broker.port()});

    std::string reason;
    REQUIRE(client.connect(reason) == Error::Ok);
    broker.accept_session();

    Packet connect = broker.read_packet();
    REQUIRE(connect.header == 0x10);
    REQUIRE(static_cast<std::uint8_t>(connect.body[7]) == 0x02);
}
