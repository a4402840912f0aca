/**
 * @file metrics_server.hpp
 * @brief HTTP endpoint serving the Prometheus exposition and a health check.
 *
 * GET /metrics answers with Exporter::encode(), GET /healthz with "ok".
 * Requests are served from the HTTP library's own polling thread, so
 * encode() runs concurrently with handle_report() on the ingest thread.
 */

#ifndef TEMPEST_METRICS_SERVER_HPP
#define TEMPEST_METRICS_SERVER_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

struct MHD_Daemon;

namespace tempest {

class Exporter;

/// Status, content type and body of one HTTP answer
struct HttpReply {
    unsigned int status = 200;
    const char* content_type = "text/plain; charset=utf-8";
    std::string body;
};

/**
 * @brief Route one request.
 *
 * @param exporter Metric source for /metrics
 * @param method HTTP method; only GET and HEAD are served
 * @param path Request path without query string
 * @return 200 with the body, 404 for unknown paths, 405 for other methods
 */
HttpReply respond(const Exporter& exporter, std::string_view method, std::string_view path);

/**
 * @brief Listening HTTP server bound to 0.0.0.0.
 *
 * The exporter must outlive the server. Destruction stops the server.
 */
class MetricsServer {
public:
    explicit MetricsServer(const Exporter& exporter) noexcept : exporter_(&exporter) {}
    ~MetricsServer();

    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    /**
     * @brief Start serving on a TCP port.
     *
     * @param port TCP port; 0 picks an ephemeral port, see port()
     * @param[out] reason Failure detail
     * @return Error::Ok or Error::Io
     */
    Error start(std::uint16_t port, std::string& reason);

    void stop() noexcept;

    [[nodiscard]] bool is_running() const noexcept {
        return daemon_ != nullptr;
    }

    /// Port actually bound, 0 while stopped
    [[nodiscard]] std::uint16_t port() const noexcept {
        return port_;
    }

    [[nodiscard]] const Exporter& exporter() const noexcept {
        return *exporter_;
    }

private:
    const Exporter* exporter_;
    MHD_Daemon* daemon_ = nullptr;
    std::uint16_t port_ = 0;
};

} // namespace tempest

#endif // TEMPEST_METRICS_SERVER_HPP
