#include "host_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace autosplit {

namespace fs = std::filesystem;

HostConfiguration::HostConfiguration() = default;

void HostConfiguration::set_tick_rate_bounds(double min_rate, double max_rate) {
    m_min_tick_rate = min_rate;
    m_max_tick_rate = max_rate;
}

bool HostConfiguration::load(const fs::path& path) {
    if (!fs::exists(path)) {
        std::cerr << "[HostConfiguration] Config file not found: " << path << std::endl;
        return false;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[HostConfiguration] Failed to open: " << path << std::endl;
            return false;
        }

        nlohmann::json json;
        file >> json;

        fs::path base_dir = path.parent_path();
        auto resolve = [&base_dir](const std::string& value) {
            fs::path p(value);
            return (p.is_relative() && !value.empty()) ? base_dir / p : p;
        };

        fs::path plugin_path = resolve(json.value("plugin_path", ""));
        fs::path scenario_path = resolve(json.value("scenario_path", ""));

        int64_t tick_count = json.value("tick_count", static_cast<int64_t>(m_tick_count));
        double default_rate = json.value("default_tick_rate", m_default_tick_rate);
        double min_rate = json.value("min_tick_rate", m_min_tick_rate);
        double max_rate = json.value("max_tick_rate", m_max_tick_rate);

        if (tick_count < 0) {
            std::cerr << "[HostConfiguration] tick_count must not be negative" << std::endl;
            return false;
        }
        if (min_rate <= 0.0 || max_rate < min_rate) {
            std::cerr << "[HostConfiguration] Invalid tick rate bounds: "
                      << min_rate << ".." << max_rate << std::endl;
            return false;
        }

        std::vector<std::string> splits;
        if (json.contains("splits") && json["splits"].is_array()) {
            for (const auto& name : json["splits"]) {
                if (name.is_string()) {
                    splits.push_back(name.get<std::string>());
                }
            }
        }

        m_plugin_path = plugin_path;
        m_scenario_path = scenario_path;
        m_tick_count = static_cast<uint32_t>(tick_count);
        m_default_tick_rate = default_rate;
        m_min_tick_rate = min_rate;
        m_max_tick_rate = max_rate;
        m_echo_plugin_messages = json.value("echo_plugin_messages", m_echo_plugin_messages);
        m_splits = splits;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[HostConfiguration] Error loading config: " << e.what() << std::endl;
        return false;
    }
}

bool HostConfiguration::save(const fs::path& path) const {
    try {
        nlohmann::json json;
        json["plugin_path"] = m_plugin_path.string();
        json["scenario_path"] = m_scenario_path.string();
        json["tick_count"] = m_tick_count;
        json["default_tick_rate"] = m_default_tick_rate;
        json["min_tick_rate"] = m_min_tick_rate;
        json["max_tick_rate"] = m_max_tick_rate;
        json["echo_plugin_messages"] = m_echo_plugin_messages;
        json["splits"] = m_splits;

        // Create parent directories if needed
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "[HostConfiguration] Failed to open for writing: " << path << std::endl;
            return false;
        }

        file << json.dump(4);
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[HostConfiguration] Error saving config: " << e.what() << std::endl;
        return false;
    }
}

} // namespace autosplit
