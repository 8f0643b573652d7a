#pragma once

#include <optional>
#include <stdexcept>
#include <utility>

namespace autosplit_sdk {

// The only error a memory read reports. An unmapped range, a detached or
// exited process, a protected page and a host-side marshalling failure all
// collapse into this single kind.
enum class MemoryReadError {
    FailedRead
};

inline const char* memory_read_error_to_string(MemoryReadError error) {
    switch (error) {
        case MemoryReadError::FailedRead:   return "failed read";
        default:                            return "unknown";
    }
}

// Thrown when value() is called on a failed ReadResult
class BadReadResultAccess : public std::logic_error {
public:
    BadReadResultAccess() : std::logic_error("value() called on a failed memory read") {}
};

// ReadResult - Outcome of a memory read: a value of T or MemoryReadError
template <typename T>
class ReadResult {
public:
    ReadResult(T value) : m_value(std::move(value)) {}
    ReadResult(MemoryReadError error) : m_error(error) {}

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!m_value) throw BadReadResultAccess();
        return *m_value;
    }
    T& value() & {
        if (!m_value) throw BadReadResultAccess();
        return *m_value;
    }
    T&& value() && {
        if (!m_value) throw BadReadResultAccess();
        return std::move(*m_value);
    }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &value(); }

    template <typename U>
    T value_or(U&& fallback) const {
        return m_value ? *m_value : static_cast<T>(std::forward<U>(fallback));
    }

    // Only meaningful when !ok()
    MemoryReadError error() const { return m_error; }

    // Converts to std::optional, dropping the error
    std::optional<T> to_optional() const { return m_value; }

private:
    std::optional<T> m_value;
    MemoryReadError m_error = MemoryReadError::FailedRead;
};

// ReadResult<void> - Success or MemoryReadError, for reads into caller buffers
template <>
class ReadResult<void> {
public:
    ReadResult() = default;
    ReadResult(MemoryReadError error) : m_ok(false), m_error(error) {}

    bool ok() const { return m_ok; }
    explicit operator bool() const { return m_ok; }
    MemoryReadError error() const { return m_error; }

private:
    bool m_ok = true;
    MemoryReadError m_error = MemoryReadError::FailedRead;
};

} // namespace autosplit_sdk
