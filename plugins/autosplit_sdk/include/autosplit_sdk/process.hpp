#pragma once

#include "autosplit/autosplit_api.hpp"
#include "autosplit_sdk/address.hpp"
#include "autosplit_sdk/read_result.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>

namespace autosplit_sdk {

// Process - A handle to one attached process
// Created by HostFunctions::attach() and detached when destroyed. Every read
// goes to the host and may fail on its own; a failed read leaves the handle
// usable for the next one. Reads after the target has exited fail, they do
// not crash.
class Process {
public:
    // Longest string read_cstr() will look at, terminator included
    static constexpr size_t MAX_CSTR_LEN = 255;

    Process(const AutosplitHostApi* host, uint64_t handle);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&& other) noexcept;
    Process& operator=(Process&& other) noexcept;

    // Read a single value of T from the process. T must be trivially
    // copyable (integers, floats, std::array of those, plain structs).
    // Exactly sizeof(T) bytes are requested in one host call.
    template <typename T>
    ReadResult<T> read(Address address) const {
        static_assert(std::is_trivially_copyable<T>::value,
                      "Process::read requires a trivially copyable type");
        uint8_t buf[sizeof(T)];
        ReadResult<void> result = read_into_buf(address, buf, sizeof(T));
        if (!result) {
            return result.error();
        }
        T value;
        std::memcpy(&value, buf, sizeof(T));
        return value;
    }

    // Read `len` bytes starting at `address` into `buf`. On failure the
    // contents of `buf` are unspecified.
    ReadResult<void> read_into_buf(Address address, uint8_t* buf, size_t len) const;

    // Read a NUL terminated string. Fails if the read fails or no
    // terminator is found within MAX_CSTR_LEN bytes.
    ReadResult<std::string> read_cstr(Address address) const;

    // Base address of a module (shared library / executable image) loaded
    // by the process
    std::optional<Address> module(const std::string& name) const;

    uint64_t handle() const { return m_handle; }

private:
    void detach();

    const AutosplitHostApi* m_host = nullptr;
    uint64_t m_handle = 0;
};

} // namespace autosplit_sdk
