/**
 * @file metrics_server.cpp
 * @brief HTTP endpoint serving the Prometheus exposition and a health check.
 */

#include <tempest/exporter.hpp>
#include <tempest/log.hpp>
#include <tempest/metrics_server.hpp>

#include <microhttpd.h>

#include <cstddef>
#include <exception>

namespace tempest {

namespace {

MHD_Result handle_request(void* cls, MHD_Connection* connection, const char* url,
                          const char* method, const char* /*version*/,
                          const char* /*upload_data*/, std::size_t* /*upload_data_size*/,
                          void** /*request_state*/) {
    const auto* server = static_cast<const MetricsServer*>(cls);

    HttpReply reply;
    try {
        reply = respond(server->exporter(), method, url);
    } catch (const std::exception& e) {
        log_error("Metrics request for %s failed: %s", url, e.what());
        return MHD_NO;
    }

    MHD_Response* response = MHD_create_response_from_buffer(
        reply.body.size(), const_cast<char*>(reply.body.data()), MHD_RESPMEM_MUST_COPY);
    if (response == nullptr) {
        log_error("Metrics request for %s failed: cannot allocate response", url);
        return MHD_NO;
    }
    MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, reply.content_type);
    MHD_Result queued = MHD_queue_response(connection, reply.status, response);
    MHD_destroy_response(response);
    return queued;
}

} // namespace

HttpReply respond(const Exporter& exporter, std::string_view method, std::string_view path) {
    HttpReply reply;
    if (method != "GET" && method != "HEAD") {
        reply.status = MHD_HTTP_METHOD_NOT_ALLOWED;
        reply.body = "method not allowed";
        return reply;
    }

    if (path == "/metrics") {
        reply.body = exporter.encode();
    } else if (path == "/healthz") {
        reply.body = "ok";
    } else {
        reply.status = MHD_HTTP_NOT_FOUND;
        reply.body = "not found";
    }
    return reply;
}

MetricsServer::~MetricsServer() {
    stop();
}

Error MetricsServer::start(std::uint16_t port, std::string& reason) {
    stop();

    daemon_ = MHD_start_daemon(MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ERROR_LOG, port,
                               nullptr, nullptr, &handle_request, this, MHD_OPTION_END);
    if (daemon_ == nullptr) {
        reason = "cannot listen on TCP port " + std::to_string(port);
        return Error::Io;
    }

    const MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
    port_ = info != nullptr ? info->port : port;
    log_info("Serving metrics on TCP port %u", static_cast<unsigned>(port_));
    return Error::Ok;
}

void MetricsServer::stop() noexcept {
    if (daemon_ != nullptr) {
        log_info("Web server stopping");
        MHD_stop_daemon(daemon_);
        daemon_ = nullptr;
        port_ = 0;
    }
}

} // namespace tempest
