#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace autosplit {

// A contiguous block of memory in a simulated process
struct MemoryRegion {
    uint64_t base = 0;
    std::vector<uint8_t> bytes;
    bool readable = true;

    uint64_t size() const { return bytes.size(); }

    // True when [address, address + len) lies inside this region
    bool contains(uint64_t address, uint64_t len) const;
};

// SimulatedProcess - A process an autosplitter can attach to
// Its address space is whatever regions were declared; everything else is
// unmapped. Reads are all-or-nothing and never span two regions.
class SimulatedProcess {
public:
    SimulatedProcess(std::string name, uint32_t pid);
    ~SimulatedProcess() = default;

    const std::string& get_name() const { return m_name; }
    uint32_t get_pid() const { return m_pid; }

    // Identity assigned by ProcessTable; pids may repeat, ids never do.
    // 0 until the process is added to a table.
    uint64_t get_id() const { return m_id; }

    // An exited process keeps its regions but every read fails
    bool is_alive() const { return m_alive; }
    void set_alive(bool alive) { m_alive = alive; }

    // Regions must not overlap; returns false if the new one would
    bool add_region(uint64_t base, std::vector<uint8_t> bytes, bool readable = true);
    const std::vector<MemoryRegion>& get_regions() const { return m_regions; }

    // Overwrite bytes inside an existing region (the "game" changing state)
    bool write(uint64_t address, const uint8_t* data, size_t len);

    template <typename T>
    bool write_value(uint64_t address, const T& value) {
        return write(address, reinterpret_cast<const uint8_t*>(&value), sizeof(T));
    }

    // Copy [address, address + len) into out. Fails without touching out
    // if the process has exited or the range is not fully inside one
    // readable region.
    bool read(uint64_t address, uint8_t* out, size_t len) const;

    // Module table
    void add_module(const std::string& name, uint64_t base);
    uint64_t get_module_address(const std::string& name) const;  // 0 = not loaded

private:
    friend class ProcessTable;

    MemoryRegion* find_region(uint64_t address, uint64_t len);
    const MemoryRegion* find_region(uint64_t address, uint64_t len) const;

    std::string m_name;
    uint32_t m_pid;
    uint64_t m_id = 0;
    bool m_alive = true;
    std::vector<MemoryRegion> m_regions;
    std::unordered_map<std::string, uint64_t> m_modules;
};

// ProcessTable - The processes visible to the host
class ProcessTable {
public:
    ProcessTable() = default;

    // Takes ownership; returns the stored process
    SimulatedProcess* add(std::unique_ptr<SimulatedProcess> process);
    SimulatedProcess* add(const std::string& name, uint32_t pid);

    // Remove by pid (process disappeared entirely)
    bool remove(uint32_t pid);
    void clear() { m_processes.clear(); }

    // Live processes with this name
    std::vector<SimulatedProcess*> find_by_name(const std::string& name) const;

    // The single live process with this name, or nullptr if there are none
    // or several
    SimulatedProcess* find_unique(const std::string& name) const;

    SimulatedProcess* find_by_pid(uint32_t pid) const;

    // nullptr once the process has been removed
    SimulatedProcess* find_by_id(uint64_t id) const;

    size_t size() const { return m_processes.size(); }
    const std::vector<std::unique_ptr<SimulatedProcess>>& get_all() const { return m_processes; }

private:
    std::vector<std::unique_ptr<SimulatedProcess>> m_processes;
    uint64_t m_next_id = 1;
};

} // namespace autosplit
