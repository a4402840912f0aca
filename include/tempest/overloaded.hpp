/**
 * @file overloaded.hpp
 * @brief Lambda overload set for exhaustive std::visit over message variants.
 */

#ifndef TEMPEST_OVERLOADED_HPP
#define TEMPEST_OVERLOADED_HPP

namespace tempest {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace tempest

#endif // TEMPEST_OVERLOADED_HPP
