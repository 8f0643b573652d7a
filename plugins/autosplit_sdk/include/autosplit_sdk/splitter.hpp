#pragma once

#include "autosplit_sdk/host_functions.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace autosplit_sdk {

// Splitter contract
//
// An autosplitter is any type T that
//   - can be constructed, either as T(HostFunctions&) or as T(). The
//     constructor is a good place to attach to the game, set initial
//     variables or change the tick rate. It is called once per load, not
//     once per run.
//   - has void update(HostFunctions&), called once per tick. Read memory,
//     compare against split conditions, issue the actions this tick needs.
//
// Failed reads are the splitter's business: return and try again next tick,
// or treat the value as unknown.
//
// Register the type with AUTOSPLIT_REGISTER_SPLITTER (register.hpp) so the
// module exports the entry points the host looks for.

// Optional base class for splitters that prefer virtual dispatch
class ISplitter {
public:
    virtual ~ISplitter() = default;

    virtual void update(HostFunctions& host) = 0;
};

template <typename T, typename = void>
struct has_update : std::false_type {};

template <typename T>
struct has_update<T, std::void_t<decltype(std::declval<T&>().update(std::declval<HostFunctions&>()))>>
    : std::true_type {};

template <typename T>
struct is_splitter
    : std::integral_constant<bool,
          has_update<T>::value &&
          (std::is_constructible<T, HostFunctions&>::value ||
           std::is_default_constructible<T>::value)> {};

// Construct a splitter, preferring the constructor that takes the host
template <typename T>
std::unique_ptr<T> make_splitter(HostFunctions& host) {
    static_assert(is_splitter<T>::value,
                  "Splitter types need update(HostFunctions&) and a T(HostFunctions&) or T() constructor");
    if constexpr (std::is_constructible<T, HostFunctions&>::value) {
        return std::make_unique<T>(host);
    } else {
        (void)host;
        return std::make_unique<T>();
    }
}

} // namespace autosplit_sdk
