#pragma once

#include "simulated_process.hpp"
#include <filesystem>
#include <string>

namespace autosplit {

// ScenarioFile - Loads simulated processes from a JSON description
//
// {
//   "processes": [
//     {
//       "name": "Game.exe", "pid": 1234, "alive": true,
//       "modules": [ { "name": "Game.exe", "base": "0x400000" } ],
//       "regions": [
//         { "base": "0xC0", "size": 64, "readable": true,
//           "values": [ { "address": "0xD1", "type": "u32", "value": 314 } ] },
//         { "base": "0x1000", "hex": "48656c6c6f00" },
//         { "base": "0x2000", "bytes": [1, 2, 3, 4], "readable": false }
//       ]
//     }
//   ]
// }
//
// Numbers may be JSON integers or "0x" prefixed strings. Region contents
// come from "bytes", "hex" or a zero-filled "size", then "values" are
// written on top in host byte order.
class ScenarioFile {
public:
    ScenarioFile() = default;
    ~ScenarioFile() = default;

    // Load processes into table (appending). Returns true on success.
    bool load(const std::filesystem::path& path, ProcessTable& table);

    // Same as load() for a JSON document held in memory
    bool load_from_string(const std::string& text, ProcessTable& table);

    const std::filesystem::path& get_path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace autosplit
