#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace autosplit {

// Runner settings, persisted as JSON
//
// {
//   "plugin_path": "plugins/libgame_splitter.so",
//   "scenario_path": "scenarios/game.json",
//   "tick_count": 120,
//   "default_tick_rate": 60.0,
//   "min_tick_rate": 1.0,
//   "max_tick_rate": 240.0,
//   "echo_plugin_messages": true,
//   "splits": ["Level 1", "Level 2", "Boss"]
// }
//
// Relative paths are resolved against the directory of the config file.
class HostConfiguration {
public:
    HostConfiguration();
    ~HostConfiguration() = default;

    // Load configuration from file. A missing file keeps the defaults and
    // fails; a malformed one fails and reports why.
    bool load(const std::filesystem::path& path);

    // Save configuration to file
    bool save(const std::filesystem::path& path) const;

    const std::filesystem::path& get_plugin_path() const { return m_plugin_path; }
    void set_plugin_path(const std::filesystem::path& path) { m_plugin_path = path; }

    const std::filesystem::path& get_scenario_path() const { return m_scenario_path; }
    void set_scenario_path(const std::filesystem::path& path) { m_scenario_path = path; }

    uint32_t get_tick_count() const { return m_tick_count; }
    void set_tick_count(uint32_t count) { m_tick_count = count; }

    double get_default_tick_rate() const { return m_default_tick_rate; }
    double get_min_tick_rate() const { return m_min_tick_rate; }
    double get_max_tick_rate() const { return m_max_tick_rate; }
    void set_tick_rate_bounds(double min_rate, double max_rate);

    bool get_echo_plugin_messages() const { return m_echo_plugin_messages; }
    void set_echo_plugin_messages(bool echo) { m_echo_plugin_messages = echo; }

    const std::vector<std::string>& get_splits() const { return m_splits; }
    void set_splits(const std::vector<std::string>& splits) { m_splits = splits; }

private:
    std::filesystem::path m_plugin_path;
    std::filesystem::path m_scenario_path;
    uint32_t m_tick_count = 60;
    double m_default_tick_rate = 60.0;
    double m_min_tick_rate = 1.0;
    double m_max_tick_rate = 240.0;
    bool m_echo_plugin_messages = true;
    std::vector<std::string> m_splits;
};

} // namespace autosplit
