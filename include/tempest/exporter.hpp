/**
 * @file exporter.hpp
 * @brief Metric cells fed by decoded messages, rendered as Prometheus text.
 *
 * handle_report() runs on the ingest thread; encode() may run concurrently
 * on any other thread. Each gauge is a Perishable cell: it is freshened for
 * a validity window whenever a message provides its value and is left out
 * of the rendering once that window has passed, so a scrape never exports a
 * reading the station has stopped sending.
 */

#ifndef TEMPEST_EXPORTER_HPP
#define TEMPEST_EXPORTER_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "messages.hpp"
#include "perishable.hpp"
#include "station.hpp"
#include "wind.hpp"

namespace tempest {

/**
 * @brief Named floating point gauge, safe to set and read concurrently.
 */
class Gauge {
public:
    Gauge(std::string name, std::string help)
        : name_(std::move(name)), help_(std::move(help)) {}

    void set(double value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    [[nodiscard]] double value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const std::string& name() const noexcept {
        return name_;
    }

    [[nodiscard]] const std::string& help() const noexcept {
        return help_;
    }

private:
    std::string name_;
    std::string help_;
    std::atomic<double> value_{0.0};
};

using GaugeCell = Perishable<Gauge>;

/**
 * @brief Messages received, counted per message kind. Never expires.
 */
class MessageCounter {
public:
    static constexpr std::size_t KINDS = std::variant_size_v<Message>;

    void inc(const Message& message) noexcept {
        counts_[message.index()].fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t count(std::size_t kind_index) const noexcept {
        return counts_[kind_index].load(std::memory_order_relaxed);
    }

private:
    std::array<std::atomic<std::uint64_t>, KINDS> counts_{};
};

/**
 * @brief Speed, direction and north/east velocity gauges of one wind.
 */
class WindMetrics {
public:
    WindMetrics(const std::string& name, const std::string& description);

    template <typename Rep, typename Period>
    void export_wind(const Wind& wind, std::chrono::duration<Rep, Period> valid_for) noexcept {
        speed_magnitude_.freshen(valid_for).set(wind.speed_magnitude());
        source_direction_.freshen(valid_for).set(wind.source_direction());
        Components velocity = wind.component_velocity();
        component_velocity_north_.freshen(valid_for).set(velocity.north);
        component_velocity_east_.freshen(valid_for).set(velocity.east);
    }

    void register_all(std::vector<const GaugeCell*>& registry) const;

private:
    GaugeCell speed_magnitude_;
    GaugeCell source_direction_;
    GaugeCell component_velocity_north_;
    GaugeCell component_velocity_east_;
};

/**
 * @brief Every exported metric.
 */
struct ExportedMetrics {
    ExportedMetrics();

    ExportedMetrics(const ExportedMetrics&) = delete;
    ExportedMetrics& operator=(const ExportedMetrics&) = delete;

    MessageCounter messages_received;

    WindMetrics instant_wind;

    GaugeCell observation_timestamp;
    WindMetrics observation_wind_lull;
    WindMetrics observation_wind_avg;
    WindMetrics observation_wind_gust;
    GaugeCell observation_station_pressure;
    GaugeCell observation_barometric_pressure;
    GaugeCell observation_temperature;
    GaugeCell observation_relative_humidity;
    GaugeCell observation_dew_point;
    GaugeCell observation_wet_bulb_temperature;
    GaugeCell observation_apparent_temperature;
    GaugeCell observation_illuminance;
    GaugeCell observation_uv_index;
    GaugeCell observation_irradiance;
    GaugeCell observation_rain_last_minute;
    GaugeCell observation_lightning_distance;
    GaugeCell observation_lightning_count;
    GaugeCell observation_battery;

    GaugeCell device_voltage;
    GaugeCell device_rssi;
    GaugeCell device_hub_rssi;
    GaugeCell device_uptime;
    GaugeCell device_sensor_failed;

    GaugeCell hub_rssi;
    GaugeCell hub_uptime;

    /// Gauges in rendering order
    std::vector<const GaugeCell*> gauges;
};

/**
 * @brief Routes decoded messages into ExportedMetrics.
 */
class Exporter {
public:
    explicit Exporter(StationParams station_params);

    /**
     * @brief Update the cells fed by one message.
     *
     * Only quantities the message actually carries are freshened; a
     * derived quantity that is unavailable leaves its cell to expire.
     */
    void handle_report(const Message& message);

    /**
     * @brief Render every fresh metric in Prometheus text format 0.0.4.
     */
    [[nodiscard]] std::string encode() const;

    /// Log the rendering at info level
    void dump() const;

    [[nodiscard]] const ExportedMetrics& metrics() const noexcept {
        return metrics_;
    }

private:
    ExportedMetrics metrics_;
    StationParams station_params_;
};

} // namespace tempest

#endif // TEMPEST_EXPORTER_HPP
