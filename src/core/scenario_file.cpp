#include "scenario_file.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

namespace autosplit {

namespace {

// Integer from a JSON number or a "0x..." / decimal string
uint64_t parse_number(const nlohmann::json& value, const char* what) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        int64_t n = value.get<int64_t>();
        if (n < 0) throw std::runtime_error(std::string(what) + " must not be negative");
        return static_cast<uint64_t>(n);
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        // stoull would accept "-1" and wrap it
        if (text.find('-') != std::string::npos) {
            throw std::runtime_error(std::string(what) + " must not be negative");
        }
        size_t consumed = 0;
        uint64_t n = std::stoull(text, &consumed, 0);
        if (consumed != text.size()) {
            throw std::runtime_error(std::string("invalid ") + what + ": " + text);
        }
        return n;
    }
    throw std::runtime_error(std::string(what) + " must be a number or a string");
}

std::vector<uint8_t> parse_hex(const std::string& text) {
    std::vector<uint8_t> bytes;
    int high = -1;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::runtime_error(std::string("invalid hex digit: ") + c);
        }
        int digit = std::isdigit(static_cast<unsigned char>(c))
            ? c - '0'
            : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        if (high < 0) {
            high = digit;
        } else {
            bytes.push_back(static_cast<uint8_t>((high << 4) | digit));
            high = -1;
        }
    }
    if (high >= 0) throw std::runtime_error("hex string has an odd number of digits");
    return bytes;
}

template <typename T>
void append_value(std::vector<uint8_t>& out, T value) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(&value);
    out.insert(out.end(), p, p + sizeof(T));
}

// JSON integer narrowed to T, rejecting anything T cannot hold
template <typename T>
T checked_integer(const nlohmann::json& value, const std::string& type) {
    if (!value.is_number_integer()) {
        throw std::runtime_error(type + " value must be an integer");
    }
    bool in_range;
    if (value.is_number_unsigned()) {
        in_range = value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    } else {
        int64_t n = value.get<int64_t>();
        in_range = n >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                   (n < 0 || static_cast<uint64_t>(n) <= static_cast<uint64_t>(std::numeric_limits<T>::max()));
    }
    if (!in_range) {
        throw std::runtime_error(type + " value out of range: " + value.dump());
    }
    return value.is_number_unsigned() ? static_cast<T>(value.get<uint64_t>())
                                      : static_cast<T>(value.get<int64_t>());
}

// Encode a typed value ("u8", "i32", "f64", ...) in host byte order
std::vector<uint8_t> encode_value(const std::string& type, const nlohmann::json& value) {
    std::vector<uint8_t> out;
    if (type == "u8")       append_value(out, checked_integer<uint8_t>(value, type));
    else if (type == "u16") append_value(out, checked_integer<uint16_t>(value, type));
    else if (type == "u32") append_value(out, checked_integer<uint32_t>(value, type));
    else if (type == "u64") append_value(out, checked_integer<uint64_t>(value, type));
    else if (type == "i8")  append_value(out, checked_integer<int8_t>(value, type));
    else if (type == "i16") append_value(out, checked_integer<int16_t>(value, type));
    else if (type == "i32") append_value(out, checked_integer<int32_t>(value, type));
    else if (type == "i64") append_value(out, checked_integer<int64_t>(value, type));
    else if (type == "f32") append_value<float>(out, value.get<float>());
    else if (type == "f64") append_value<double>(out, value.get<double>());
    else if (type == "cstr") {
        std::string text = value.get<std::string>();
        out.assign(text.begin(), text.end());
        out.push_back(0);
    }
    else throw std::runtime_error("unknown value type: " + type);
    return out;
}

void load_region(const nlohmann::json& j, SimulatedProcess& process) {
    uint64_t base = parse_number(j.at("base"), "region base");

    std::vector<uint8_t> bytes;
    if (j.contains("bytes")) {
        for (const auto& b : j["bytes"]) {
            uint64_t n = parse_number(b, "byte");
            if (n > 0xFF) throw std::runtime_error("byte value out of range");
            bytes.push_back(static_cast<uint8_t>(n));
        }
    } else if (j.contains("hex")) {
        bytes = parse_hex(j["hex"].get<std::string>());
    } else if (j.contains("size")) {
        bytes.assign(static_cast<size_t>(parse_number(j["size"], "region size")), 0);
    } else {
        throw std::runtime_error("region needs bytes, hex or size");
    }

    bool readable = j.value("readable", true);
    if (!process.add_region(base, std::move(bytes), readable)) {
        throw std::runtime_error("invalid region in " + process.get_name());
    }

    if (j.contains("values") && j["values"].is_array()) {
        for (const auto& v : j["values"]) {
            uint64_t address = parse_number(v.at("address"), "value address");
            std::vector<uint8_t> encoded = encode_value(v.value("type", "u32"), v.at("value"));
            if (!process.write(address, encoded.data(), encoded.size())) {
                throw std::runtime_error("value does not fit in its region in " + process.get_name());
            }
        }
    }
}

std::unique_ptr<SimulatedProcess> load_process(const nlohmann::json& j) {
    std::string name = j.at("name").get<std::string>();
    uint32_t pid = static_cast<uint32_t>(parse_number(j.value("pid", nlohmann::json(0)), "pid"));

    auto process = std::make_unique<SimulatedProcess>(name, pid);
    process->set_alive(j.value("alive", true));

    if (j.contains("modules") && j["modules"].is_array()) {
        for (const auto& m : j["modules"]) {
            process->add_module(m.at("name").get<std::string>(),
                                parse_number(m.at("base"), "module base"));
        }
    }

    if (j.contains("regions") && j["regions"].is_array()) {
        for (const auto& r : j["regions"]) {
            load_region(r, *process);
        }
    }

    return process;
}

} // anonymous namespace

bool ScenarioFile::load(const std::filesystem::path& path, ProcessTable& table) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ScenarioFile] Failed to open: " << path << std::endl;
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!load_from_string(text, table)) {
        std::cerr << "[ScenarioFile] Failed to load: " << path << std::endl;
        return false;
    }

    m_path = path;
    std::cout << "[ScenarioFile] Loaded: " << path << std::endl;
    return true;
}

bool ScenarioFile::load_from_string(const std::string& text, ProcessTable& table) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);

        // Parse everything before touching the table
        std::vector<std::unique_ptr<SimulatedProcess>> loaded;
        if (j.contains("processes") && j["processes"].is_array()) {
            for (const auto& p : j["processes"]) {
                loaded.push_back(load_process(p));
            }
        }

        for (auto& process : loaded) {
            table.add(std::move(process));
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[ScenarioFile] Invalid scenario: " << e.what() << std::endl;
        return false;
    }
}

} // namespace autosplit
