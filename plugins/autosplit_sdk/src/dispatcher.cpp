#include "autosplit_sdk/dispatcher.hpp"
#include <iostream>

namespace autosplit_sdk {

bool DispatcherBase::bind(const AutosplitHostApi* host) {
    if (!host) {
        log_error("host bindings are null");
        return false;
    }
    if (host->api_version != AUTOSPLIT_API_VERSION) {
        log_error("host API version " + std::to_string(host->api_version) +
                  " does not match plugin API version " +
                  std::to_string(AUTOSPLIT_API_VERSION));
        return false;
    }
    if (!autosplit::is_complete(*host)) {
        log_error("host bindings are incomplete");
        return false;
    }

    m_host.reset();
    m_bindings = *host;
    m_host.emplace(m_bindings);
    m_tick_count = 0;
    return true;
}

void DispatcherBase::unbind() {
    m_host.reset();
    m_bindings = AutosplitHostApi{};
}

void DispatcherBase::log_error(const std::string& message) const {
    if (m_host) {
        m_host->logger().error(message);
    } else {
        std::cerr << "[Dispatcher] " << message << std::endl;
    }
}

void DispatcherBase::report_exception(const char* stage, const std::exception& e) const {
    log_error(std::string("exception in ") + stage + ": " + e.what());
}

void DispatcherBase::report_unknown_exception(const char* stage) const {
    log_error(std::string("unknown exception in ") + stage);
}

} // namespace autosplit_sdk
