#include "simulated_process.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <utility>

namespace autosplit {

bool MemoryRegion::contains(uint64_t address, uint64_t len) const {
    if (address < base) return false;
    uint64_t offset = address - base;
    // Written to avoid overflow near the top of the address space
    return offset <= size() && len <= size() - offset;
}

SimulatedProcess::SimulatedProcess(std::string name, uint32_t pid)
    : m_name(std::move(name)), m_pid(pid) {}

bool SimulatedProcess::add_region(uint64_t base, std::vector<uint8_t> bytes, bool readable) {
    if (bytes.empty()) return false;
    if (base + (bytes.size() - 1) < base) {
        std::cerr << "[SimulatedProcess] Region at " << base << " wraps the address space" << std::endl;
        return false;
    }

    uint64_t last = base + (bytes.size() - 1);
    for (const auto& region : m_regions) {
        uint64_t region_last = region.base + (region.size() - 1);
        if (base <= region_last && region.base <= last) {
            std::cerr << "[SimulatedProcess] Region at " << base
                      << " overlaps an existing region in " << m_name << std::endl;
            return false;
        }
    }

    MemoryRegion region;
    region.base = base;
    region.bytes = std::move(bytes);
    region.readable = readable;
    m_regions.push_back(std::move(region));
    return true;
}

MemoryRegion* SimulatedProcess::find_region(uint64_t address, uint64_t len) {
    for (auto& region : m_regions) {
        if (region.contains(address, len)) return &region;
    }
    return nullptr;
}

const MemoryRegion* SimulatedProcess::find_region(uint64_t address, uint64_t len) const {
    for (const auto& region : m_regions) {
        if (region.contains(address, len)) return &region;
    }
    return nullptr;
}

bool SimulatedProcess::write(uint64_t address, const uint8_t* data, size_t len) {
    if (len == 0) return true;
    MemoryRegion* region = find_region(address, len);
    if (!region) return false;
    std::memcpy(region->bytes.data() + (address - region->base), data, len);
    return true;
}

bool SimulatedProcess::read(uint64_t address, uint8_t* out, size_t len) const {
    if (!m_alive) return false;
    if (len == 0) return true;

    const MemoryRegion* region = find_region(address, len);
    if (!region || !region->readable) return false;

    std::memcpy(out, region->bytes.data() + (address - region->base), len);
    return true;
}

void SimulatedProcess::add_module(const std::string& name, uint64_t base) {
    m_modules[name] = base;
}

uint64_t SimulatedProcess::get_module_address(const std::string& name) const {
    auto it = m_modules.find(name);
    return it != m_modules.end() ? it->second : 0;
}

SimulatedProcess* ProcessTable::add(std::unique_ptr<SimulatedProcess> process) {
    if (!process) return nullptr;
    process->m_id = m_next_id++;
    m_processes.push_back(std::move(process));
    return m_processes.back().get();
}

SimulatedProcess* ProcessTable::add(const std::string& name, uint32_t pid) {
    return add(std::make_unique<SimulatedProcess>(name, pid));
}

bool ProcessTable::remove(uint32_t pid) {
    auto it = std::find_if(m_processes.begin(), m_processes.end(),
        [pid](const std::unique_ptr<SimulatedProcess>& p) { return p->get_pid() == pid; });
    if (it == m_processes.end()) return false;
    m_processes.erase(it);
    return true;
}

std::vector<SimulatedProcess*> ProcessTable::find_by_name(const std::string& name) const {
    std::vector<SimulatedProcess*> result;
    for (const auto& process : m_processes) {
        if (process->is_alive() && process->get_name() == name) {
            result.push_back(process.get());
        }
    }
    return result;
}

SimulatedProcess* ProcessTable::find_unique(const std::string& name) const {
    auto matches = find_by_name(name);
    return matches.size() == 1 ? matches[0] : nullptr;
}

SimulatedProcess* ProcessTable::find_by_pid(uint32_t pid) const {
    for (const auto& process : m_processes) {
        if (process->get_pid() == pid) return process.get();
    }
    return nullptr;
}

SimulatedProcess* ProcessTable::find_by_id(uint64_t id) const {
    if (id == 0) return nullptr;
    for (const auto& process : m_processes) {
        if (process->get_id() == id) return process.get();
    }
    return nullptr;
}

} // namespace autosplit
