#pragma once

#include "autosplit/autosplit_api.hpp"
#include "autosplit_sdk/host_functions.hpp"
#include "autosplit_sdk/splitter.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>

namespace autosplit_sdk {

// DispatcherBase - Host binding and bookkeeping shared by every Dispatcher<T>
class DispatcherBase {
public:
    DispatcherBase() = default;
    ~DispatcherBase() = default;

    DispatcherBase(const DispatcherBase&) = delete;
    DispatcherBase& operator=(const DispatcherBase&) = delete;

    // Copy and validate the host's binding table. Rejects null or
    // incomplete tables and a different API version.
    bool bind(const AutosplitHostApi* host);
    void unbind();

    bool is_bound() const { return m_host.has_value(); }
    bool is_updating() const { return m_updating; }
    uint64_t get_tick_count() const { return m_tick_count; }

    HostFunctions* host() { return m_host ? &*m_host : nullptr; }

protected:
    // Log through the host when bound, stderr otherwise
    void log_error(const std::string& message) const;
    void report_exception(const char* stage, const std::exception& e) const;
    void report_unknown_exception(const char* stage) const;

    // Marks a tick as in progress for the lifetime of the guard
    class TickGuard {
    public:
        explicit TickGuard(bool& flag) : m_flag(flag) { m_flag = true; }
        ~TickGuard() { m_flag = false; }
        TickGuard(const TickGuard&) = delete;
        TickGuard& operator=(const TickGuard&) = delete;
    private:
        bool& m_flag;
    };

    AutosplitHostApi m_bindings{};
    std::optional<HostFunctions> m_host;
    bool m_updating = false;
    uint64_t m_tick_count = 0;
};

// Dispatcher - Owns the one live splitter of a loaded module
// Bridges the host's construct/update/destroy entry points to T. Ticks run
// one at a time; an update() reached from inside update() is refused.
// Exceptions thrown by T are logged and never reach the host.
template <typename T>
class Dispatcher : public DispatcherBase {
public:
    Dispatcher() = default;
    ~Dispatcher() { destroy(); }

    // Bind the host and construct the splitter. Fails if an instance is
    // already live, the bindings are unusable, or the constructor throws.
    bool construct(const AutosplitHostApi* host) {
        if (m_updating) {
            log_error("construct called while a tick is running; ignored");
            return false;
        }
        if (m_instance) {
            log_error("construct called while an autosplitter is already live");
            return false;
        }
        if (!bind(host)) {
            return false;
        }
        return construct_instance();
    }

    // Run one tick. Constructs the splitter first if the host skipped
    // construct after binding.
    void update() {
        if (!is_bound()) {
            log_error("update called before construct");
            return;
        }
        if (m_updating) {
            log_error("update re-entered while a tick is running; ignored");
            return;
        }
        if (!m_instance && !construct_instance()) {
            return;
        }

        TickGuard guard(m_updating);
        try {
            m_instance->update(*m_host);
        } catch (const std::exception& e) {
            report_exception("update", e);
        } catch (...) {
            report_unknown_exception("update");
        }
        ++m_tick_count;
    }

    // Drop the splitter (detaching anything it holds) and the bindings.
    // Refused while a tick is running, since the splitter is still in use.
    void destroy() {
        if (m_updating) {
            log_error("destroy called while a tick is running; ignored");
            return;
        }
        m_instance.reset();
        unbind();
    }

    bool has_instance() const { return m_instance != nullptr; }
    T* instance() { return m_instance.get(); }
    const T* instance() const { return m_instance.get(); }

private:
    bool construct_instance() {
        try {
            m_instance = make_splitter<T>(*m_host);
            return true;
        } catch (const std::exception& e) {
            report_exception("construct", e);
        } catch (...) {
            report_unknown_exception("construct");
        }
        m_instance.reset();
        return false;
    }

    std::unique_ptr<T> m_instance;
};

} // namespace autosplit_sdk
