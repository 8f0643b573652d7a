#include "application.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace autosplit {

Application::Application()
    : m_host(std::make_unique<SimulatedHost>()) {}

Application::~Application() {
    shutdown();
}

void Application::print_usage(const char* program_name) const {
    std::cout << "Usage: " << program_name << " [options] <config.json>\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help          Show this help\n"
              << "  -t, --ticks <n>     Override the configured tick count\n";
}

bool Application::parse_command_line(int argc, char* argv[], std::string& config_path) {
    config_path.clear();

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            m_help_requested = true;
            return false;
        }
        else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--ticks") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            char* end = nullptr;
            long long ticks = std::strtoll(argv[++i], &end, 10);
            if (!end || *end != '\0' || ticks < 0) {
                std::cerr << "Invalid tick count: " << argv[i] << "\n";
                return false;
            }
            m_tick_override = ticks;
        }
        else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
        else {
            config_path = arg;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return false;
    }
    return true;
}

bool Application::initialize(int argc, char* argv[]) {
    std::string config_path;
    if (!parse_command_line(argc, argv, config_path)) {
        m_running = false;
        return m_help_requested;  // --help is not an error
    }

    if (!m_config.load(config_path)) {
        return false;
    }
    if (m_tick_override >= 0) {
        m_config.set_tick_count(static_cast<uint32_t>(m_tick_override));
    }

    TickRateLimits limits;
    limits.min_rate = m_config.get_min_tick_rate();
    limits.max_rate = m_config.get_max_tick_rate();
    m_host->set_tick_rate_limits(limits);
    m_host->set_default_tick_rate(m_config.get_default_tick_rate());
    m_host->set_echo_messages(m_config.get_echo_plugin_messages());
    m_host->timer().set_splits(m_config.get_splits());

    if (!m_config.get_scenario_path().empty()) {
        if (!m_scenario.load(m_config.get_scenario_path(), m_host->processes())) {
            return false;
        }
    }
    std::cout << "[Application] " << m_host->processes().size() << " simulated process(es)" << std::endl;

    if (m_config.get_plugin_path().empty()) {
        std::cerr << "[Application] No plugin_path in " << config_path << std::endl;
        return false;
    }
    if (!m_loader.load(m_config.get_plugin_path())) {
        return false;
    }
    if (!m_loader.construct(m_host->api())) {
        return false;
    }

    m_running = true;
    return true;
}

void Application::run() {
    if (!m_running) return;

    uint32_t ticks = m_config.get_tick_count();
    std::cout << "[Application] Running " << ticks << " tick(s)" << std::endl;

    for (uint32_t i = 0; i < ticks; ++i) {
        m_loader.update();
    }

    print_summary();
    m_running = false;
}

void Application::print_summary() const {
    std::cout << "[Application] Ticks: " << m_loader.get_tick_count()
              << ", reads: " << m_host->get_read_count()
              << ", tick rate: " << m_host->get_tick_rate() << " Hz" << std::endl;
    std::cout << "[Application] Timer state: "
              << host_timer_state_to_string(m_host->timer().get_state()) << std::endl;

    for (const auto& record : m_host->get_action_log()) {
        std::cout << "  action " << host_action_to_string(record.action)
                  << " from " << host_timer_state_to_string(record.state_before)
                  << (record.applied ? "" : " (ignored)") << std::endl;
    }
    for (const auto& [key, value] : m_host->get_variables()) {
        std::cout << "  variable " << key << " = " << value << std::endl;
    }
}

void Application::shutdown() {
    m_loader.unload();
    m_running = false;
}

} // namespace autosplit
