/**
 * @file perishable.hpp
 * @brief Value wrapper that expires unless periodically freshened.
 *
 * A Perishable pairs a payload with an expiry instant. The ingest path calls
 * freshen() each time new data arrives; the export path calls fresh() or
 * map() at arbitrary times and sees the payload only while it has not
 * expired. The expiry is stored as a lock-free atomic tick count so readers
 * never block on writers and never observe a torn instant. The payload
 * itself is not synchronized by this class: wrap types whose own mutation is
 * safe for concurrent readers (e.g. atomic gauges).
 */

#ifndef TEMPEST_PERISHABLE_HPP
#define TEMPEST_PERISHABLE_HPP

#include <atomic>
#include <chrono>
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

namespace tempest {

/**
 * @brief Payload plus atomic expiry.
 *
 * @tparam T Wrapped value type
 * @tparam Clock Clock providing now(); steady by default so wall-clock
 *         adjustments cannot revive or kill values
 */
template <typename T, typename Clock = std::chrono::steady_clock>
class Perishable {
public:
    using clock = Clock;
    using time_point = typename Clock::time_point;
    using duration = typename Clock::duration;

    static_assert(std::atomic<typename duration::rep>::is_always_lock_free,
                  "Perishable requires a lock-free expiry representation");

    /**
     * @brief Wrap a value; it starts out already expired.
     */
    template <typename... Args>
        requires std::constructible_from<T, Args...>
    explicit Perishable(Args&&... args)
        : value_(std::forward<Args>(args)...)
        , expiry_(time_point::min().time_since_epoch().count()) {}

    Perishable(const Perishable&) = delete;
    Perishable& operator=(const Perishable&) = delete;

    /**
     * @brief Push the expiry to now + valid_for.
     *
     * The expiry saturates at time_point::max() when now + valid_for is not
     * representable by the clock; a non-positive valid_for expires the value
     * immediately.
     *
     * @param valid_for How long the value stays fresh from now
     * @return The wrapped value, for immediate update
     */
    template <typename Rep, typename Period>
    T& freshen(std::chrono::duration<Rep, Period> valid_for) noexcept {
        const time_point now = Clock::now();
        time_point expiry = now;
        if (valid_for > std::chrono::duration<Rep, Period>::zero()) {
            using seconds_f = std::chrono::duration<long double>;
            const seconds_f headroom = seconds_f(time_point::max().time_since_epoch()) -
                                      seconds_f(now.time_since_epoch());
            if (seconds_f(valid_for) >= headroom) {
                expiry = time_point::max();
            } else {
                expiry = now + std::chrono::duration_cast<duration>(valid_for);
            }
        }
        expiry_.store(expiry.time_since_epoch().count(), std::memory_order_release);
        return value_;
    }

    /**
     * @brief Access the value if it has not expired.
     *
     * @return Pointer to the value while now < expiry, nullptr once stale
     */
    [[nodiscard]] const T* fresh() const noexcept {
        if (Clock::now() < expiry()) {
            return &value_;
        }
        return nullptr;
    }

    /**
     * @brief Apply f to the value if it has not expired.
     */
    template <typename F>
    auto map(F&& f) const -> std::optional<std::invoke_result_t<F, const T&>> {
        if (const T* value = fresh()) {
            return std::forward<F>(f)(*value);
        }
        return std::nullopt;
    }

    [[nodiscard]] time_point expiry() const noexcept {
        return time_point(duration(expiry_.load(std::memory_order_acquire)));
    }

    /// Unconditional access for registration and rendering of metadata
    [[nodiscard]] const T& get() const noexcept {
        return value_;
    }

private:
    T value_;
    std::atomic<typename duration::rep> expiry_;
};

} // namespace tempest

#endif // TEMPEST_PERISHABLE_HPP
