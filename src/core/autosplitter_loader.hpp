#pragma once

#include "autosplit/autosplit_api.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace autosplit {

// Metadata read from a loaded autosplitter module
struct AutosplitterMetadata {
    std::string name;
    std::string version;
    std::string author;
    std::string description;
    uint32_t api_version = 0;
    std::filesystem::path path;
};

// AutosplitterLoader - Loads one autosplitter module and drives its entry points
// Resolves the fixed symbols, rejects modules built against another API
// version, then forwards construct/update/destroy. The module stays loaded
// until unload() or destruction.
class AutosplitterLoader {
public:
    AutosplitterLoader() = default;
    ~AutosplitterLoader();

    // Disable copy
    AutosplitterLoader(const AutosplitterLoader&) = delete;
    AutosplitterLoader& operator=(const AutosplitterLoader&) = delete;

    // Load a module and resolve its entry points
    bool load(const std::filesystem::path& path);

    // Destroy the instance (if any) and close the module
    void unload();

    bool is_loaded() const { return m_library != nullptr; }
    bool is_constructed() const { return m_constructed; }
    const AutosplitterMetadata& get_metadata() const { return m_metadata; }

    // Hand the bindings to the module and construct its splitter.
    // `host` must outlive the constructed instance.
    bool construct(const AutosplitHostApi* host);

    // One tick
    void update();

    // Tear down the splitter, keeping the module loaded
    void destroy();

    uint64_t get_tick_count() const { return m_tick_count; }

    // Get the shared library extension for this platform
    static const char* get_library_extension();

private:
    void* m_library = nullptr;
    AutosplitterMetadata m_metadata;

    AutosplitConstructFunc m_construct = nullptr;
    AutosplitUpdateFunc m_update = nullptr;
    AutosplitDestroyFunc m_destroy = nullptr;

    bool m_constructed = false;
    uint64_t m_tick_count = 0;
};

} // namespace autosplit
