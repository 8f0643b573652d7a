#include "autosplit_sdk/process.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace autosplit_sdk {

Process::Process(const AutosplitHostApi* host, uint64_t handle)
    : m_host(host), m_handle(handle) {}

Process::~Process() {
    detach();
}

Process::Process(Process&& other) noexcept
    : m_host(other.m_host), m_handle(other.m_handle) {
    other.m_host = nullptr;
    other.m_handle = 0;
}

Process& Process::operator=(Process&& other) noexcept {
    if (this != &other) {
        detach();
        m_host = std::exchange(other.m_host, nullptr);
        m_handle = std::exchange(other.m_handle, 0);
    }
    return *this;
}

void Process::detach() {
    if (m_host && m_handle != 0) {
        m_host->process_detach(m_host->context, m_handle);
    }
    m_host = nullptr;
    m_handle = 0;
}

ReadResult<void> Process::read_into_buf(Address address, uint8_t* buf, size_t len) const {
    if (len == 0) return {};
    if (!m_host || m_handle == 0 || !buf) {
        return MemoryReadError::FailedRead;
    }
    // The host primitive takes a 32-bit length
    if (len > std::numeric_limits<uint32_t>::max()) {
        return MemoryReadError::FailedRead;
    }

    uint32_t ok = m_host->process_read(m_host->context, m_handle, address.value(),
                                       buf, static_cast<uint32_t>(len));
    if (ok == 0) {
        return MemoryReadError::FailedRead;
    }
    return {};
}

ReadResult<std::string> Process::read_cstr(Address address) const {
    // Keep one byte spare so the buffer is always terminated
    char buf[MAX_CSTR_LEN + 1] = {};
    ReadResult<void> result = read_into_buf(address, reinterpret_cast<uint8_t*>(buf), MAX_CSTR_LEN);
    if (!result) {
        return result.error();
    }

    char* end = std::find(buf, buf + MAX_CSTR_LEN, '\0');
    if (end == buf + MAX_CSTR_LEN) {
        return MemoryReadError::FailedRead;
    }
    return std::string(buf, end);
}

std::optional<Address> Process::module(const std::string& name) const {
    if (!m_host || m_handle == 0) return std::nullopt;

    uint64_t base = m_host->process_get_module_address(
        m_host->context, m_handle, name.data(), static_cast<uint32_t>(name.size()));
    if (base == 0) {
        return std::nullopt;
    }
    return Address(base);
}

} // namespace autosplit_sdk
