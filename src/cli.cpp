/**
 * @file cli.cpp
 * @brief tempest command line interface.
 *
 * Listens for the hub's UDP broadcast (or replays a file of JSON documents,
 * one per line) and decodes every message. The exported metrics are served
 * over HTTP, and each message's publications go to an MQTT broker when one
 * is configured; --publish also prints them.
 */

#include <tempest/tempest.hpp>

#include <signal.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <optional>
#include <string>

using namespace tempest;

namespace {

struct Options {
    StationParams station_params;
    bool have_elevation = false;
    LogLevel log_level = LogLevel::Info;
    std::uint16_t port = UDP_PORT;
    const char* input_path = nullptr;
    long dump_interval = 0;
    bool publish = false;
    std::uint16_t metrics_port = METRICS_PORT;
    MqttParams mqtt;
};

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

} // namespace

static void print_version() {
    std::printf("tempest %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nTempest weather station UDP decoder (v%s)\n", version());
    std::printf("=========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s --station-elevation <m> [options]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  --station-elevation <m>  Station elevation in meters (required, >= 0)\n");
    std::printf("  --log-level <level>      error, warn, info (default) or debug\n");
    std::printf("  --port <n>               UDP port to listen on (default %u)\n",
                static_cast<unsigned>(UDP_PORT));
    std::printf("  --input <file>           Replay JSON documents, one per line, instead of\n");
    std::printf("                           listening on UDP\n");
    std::printf("  --dump-interval <n>      Log the metric exposition every n messages\n");
    std::printf("  --publish                Print MQTT publications as '<topic> <payload>'\n");
    std::printf("  --metrics-port <n>       TCP port serving /metrics and /healthz (default %u)\n",
                static_cast<unsigned>(METRICS_PORT));
    std::printf("  --mqtt-broker <host>     Publish to this MQTT broker\n");
    std::printf("  --mqtt-port <n>          MQTT broker port (default %u)\n",
                static_cast<unsigned>(MQTT_PORT));
    std::printf("  --mqtt-username <name>   MQTT user name\n");
    std::printf("  --mqtt-password <secret> MQTT password\n");
    std::printf("  -h, --help               Show this help message\n");
    std::printf("  -v, --version            Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s --station-elevation 112\n", prog_name);
    std::printf("  %s --station-elevation 0 --input capture.jsonl --publish\n", prog_name);
    std::printf("  %s --station-elevation 112 --mqtt-broker localhost --metrics-port 9100\n\n",
                prog_name);
}

static bool parse_double(const char* text, double& value) {
    char* end = nullptr;
    errno = 0;
    value = std::strtod(text, &end);
    return errno == 0 && end != text && *end == '\0';
}

static bool parse_long(const char* text, long& value) {
    char* end = nullptr;
    errno = 0;
    value = std::strtol(text, &end, 10);
    return errno == 0 && end != text && *end == '\0';
}

static bool parse_port(const char* text, std::uint16_t& port) {
    long value = 0;
    if (!parse_long(text, value) || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

// Returns -1 to continue, otherwise the process exit code
static int parse_options(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "--publish") == 0) {
            options.publish = true;
            continue;
        }

        if (i + 1 >= argc) {
            std::fprintf(stderr, "Error: Unknown option or missing value: %s\n", arg);
            return 1;
        }
        const char* value = argv[++i];

        if (std::strcmp(arg, "--station-elevation") == 0) {
            if (!parse_double(value, options.station_params.elevation)) {
                std::fprintf(stderr, "Error: Invalid station elevation: %s\n", value);
                return 1;
            }
            options.have_elevation = true;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            if (parse_log_level(value, options.log_level) != Error::Ok) {
                std::fprintf(stderr, "Error: Invalid log level: %s\n", value);
                return 1;
            }
        } else if (std::strcmp(arg, "--port") == 0) {
            if (!parse_port(value, options.port)) {
                std::fprintf(stderr, "Error: port must be 1-65535\n");
                return 1;
            }
        } else if (std::strcmp(arg, "--metrics-port") == 0) {
            if (!parse_port(value, options.metrics_port)) {
                std::fprintf(stderr, "Error: metrics port must be 1-65535\n");
                return 1;
            }
        } else if (std::strcmp(arg, "--mqtt-broker") == 0) {
            options.mqtt.host = value;
        } else if (std::strcmp(arg, "--mqtt-port") == 0) {
            if (!parse_port(value, options.mqtt.port)) {
                std::fprintf(stderr, "Error: MQTT port must be 1-65535\n");
                return 1;
            }
        } else if (std::strcmp(arg, "--mqtt-username") == 0) {
            options.mqtt.username = value;
        } else if (std::strcmp(arg, "--mqtt-password") == 0) {
            options.mqtt.password = value;
        } else if (std::strcmp(arg, "--input") == 0) {
            options.input_path = value;
        } else if (std::strcmp(arg, "--dump-interval") == 0) {
            if (!parse_long(value, options.dump_interval) || options.dump_interval < 0) {
                std::fprintf(stderr, "Error: dump interval must be a non-negative integer\n");
                return 1;
            }
        } else {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            return 1;
        }
    }

    if (!options.have_elevation) {
        std::fprintf(stderr, "Error: --station-elevation is required\n");
        return 1;
    }
    if (options.station_params.validate() != Error::Ok) {
        std::fprintf(stderr, "Error: station elevation must be a finite, non-negative number\n");
        return 1;
    }
    if (options.mqtt.host.empty() &&
        (!options.mqtt.username.empty() || !options.mqtt.password.empty())) {
        std::fprintf(stderr, "Error: MQTT credentials given without --mqtt-broker\n");
        return 1;
    }
    return -1;
}

template <typename Source>
static int run(Source source, const Options& options) {
    DecodeStream<JsonReader<Source>> stream{JsonReader<Source>(std::move(source))};
    Exporter exporter(options.station_params);

    std::string reason;
    MetricsServer server(exporter);
    if (server.start(options.metrics_port, reason) != Error::Ok) {
        log_error("Cannot serve metrics: %s", reason.c_str());
        return 1;
    }

    std::optional<MqttClient> mqtt;
    if (!options.mqtt.host.empty()) {
        mqtt.emplace(options.mqtt);
        if (mqtt->connect(reason) != Error::Ok) {
            log_error("Cannot connect to MQTT broker: %s", reason.c_str());
            return 1;
        }
    }

    std::optional<Message> first = stream.next();
    if (!first) {
        log_error("Decoder stream never returned anything");
        return 1;
    }
    log_info("Tempest API is alive");

    std::uint64_t handled = 0;
    for (std::optional<Message> message = std::move(first); message; message = stream.next()) {
        log_debug("Decoded %s from %s", message_type_tag(*message),
                  std::visit([](const auto& m) { return m.serial_number.c_str(); }, *message));

        exporter.handle_report(*message);

        if (mqtt) {
            mqtt->publish_report(*message, options.station_params);
        }
        if (options.publish) {
            for (const Publication& publication :
                 render_publications(*message, options.station_params)) {
                std::printf("%s %s\n", publication.topic.c_str(), publication.payload.c_str());
            }
            std::fflush(stdout);
        }

        ++handled;
        if (options.dump_interval > 0 &&
            handled % static_cast<std::uint64_t>(options.dump_interval) == 0) {
            exporter.dump();
        }

        if (g_interrupted) {
            stream.stop();
        }
    }

    if (g_interrupted) {
        log_info("Shutdown initiated");
    } else {
        log_info("Message source exhausted");
    }
    log_info("Decoded %llu messages, dropped %llu undecodable and %llu unreadable",
             static_cast<unsigned long long>(stream.decoded_count()),
             static_cast<unsigned long long>(stream.dropped_count()),
             static_cast<unsigned long long>(stream.source().dropped_count()));
    exporter.dump();

    server.stop();
    if (mqtt) {
        if (mqtt->dropped_count() > 0) {
            log_warn("Dropped %llu MQTT publications on a full queue",
                     static_cast<unsigned long long>(mqtt->dropped_count()));
        }
        mqtt->disconnect();
    }
    log_info("Terminating");
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    Options options;
    int exit_code = parse_options(argc, argv, options);
    if (exit_code >= 0) {
        return exit_code;
    }
    set_log_level(options.log_level);

    // No SA_RESTART: a blocked receive returns so the pump can stop
    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    log_info("Starting Tempest exporter");

    if (options.input_path != nullptr) {
        std::ifstream input(options.input_path);
        if (!input) {
            std::fprintf(stderr, "Error: Cannot read input file: %s\n", options.input_path);
            return 1;
        }
        return run(LineReader(input), options);
    }

    UdpReceiver receiver;
    std::string reason;
    if (receiver.bind(options.port, reason) != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot listen on UDP port %u: %s\n",
                     static_cast<unsigned>(options.port), reason.c_str());
        return 1;
    }
    log_info("Listening on UDP port %u", static_cast<unsigned>(options.port));
    return run(std::move(receiver), options);
}
