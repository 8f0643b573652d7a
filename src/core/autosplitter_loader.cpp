#include "autosplitter_loader.hpp"

#include <iostream>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

namespace autosplit {

namespace {

// Open a module, reporting the loader's reason on failure
void* open_module(const std::filesystem::path& path) {
#ifdef _WIN32
    HMODULE module = LoadLibraryW(path.wstring().c_str());
    if (!module) {
        std::cerr << "[AutosplitterLoader] Failed to load " << path
                  << ": error " << GetLastError() << std::endl;
    }
    return reinterpret_cast<void*>(module);
#else
    void* module = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!module) {
        const char* reason = dlerror();
        std::cerr << "[AutosplitterLoader] Failed to load " << path
                  << ": " << (reason ? reason : "unknown error") << std::endl;
    }
    return module;
#endif
}

void close_module(void* module) {
    if (!module) return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(module));
#else
    dlclose(module);
#endif
}

// Resolve an entry point as its function pointer type
template <typename Func>
Func resolve(void* module, const char* name) {
#ifdef _WIN32
    return reinterpret_cast<Func>(GetProcAddress(static_cast<HMODULE>(module), name));
#else
    return reinterpret_cast<Func>(dlsym(module, name));
#endif
}

} // anonymous namespace

AutosplitterLoader::~AutosplitterLoader() {
    unload();
}

const char* AutosplitterLoader::get_library_extension() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

bool AutosplitterLoader::load(const std::filesystem::path& path) {
    unload();

    void* handle = open_module(path);
    if (!handle) {
        return false;
    }

    auto get_version = resolve<AutosplitApiVersionFunc>(handle, AUTOSPLIT_SYMBOL_API_VERSION);
    auto get_info = resolve<AutosplitInfoFunc>(handle, AUTOSPLIT_SYMBOL_INFO);
    auto construct = resolve<AutosplitConstructFunc>(handle, AUTOSPLIT_SYMBOL_CONSTRUCT);
    auto update = resolve<AutosplitUpdateFunc>(handle, AUTOSPLIT_SYMBOL_UPDATE);
    auto destroy = resolve<AutosplitDestroyFunc>(handle, AUTOSPLIT_SYMBOL_DESTROY);

    if (!get_version || !construct || !update || !destroy) {
        std::cerr << "[AutosplitterLoader] " << path
                  << " is not an autosplitter (missing entry points)" << std::endl;
        close_module(handle);
        return false;
    }

    uint32_t api_version = get_version();
    if (api_version != AUTOSPLIT_API_VERSION) {
        std::cerr << "[AutosplitterLoader] " << path << " uses API version " << api_version
                  << ", host supports " << AUTOSPLIT_API_VERSION << std::endl;
        close_module(handle);
        return false;
    }

    AutosplitterMetadata metadata;
    metadata.api_version = api_version;
    metadata.path = path;
    if (get_info) {
        AutosplitterInfo info = get_info();
        metadata.name = info.name ? info.name : "";
        metadata.version = info.version ? info.version : "";
        metadata.author = info.author ? info.author : "";
        metadata.description = info.description ? info.description : "";
    }
    if (metadata.name.empty()) {
        metadata.name = path.stem().string();
    }

    m_library = handle;
    m_metadata = std::move(metadata);
    m_construct = construct;
    m_update = update;
    m_destroy = destroy;
    m_tick_count = 0;

    std::cout << "[AutosplitterLoader] Loaded: " << m_metadata.name
              << " " << m_metadata.version << " (" << path.filename() << ")" << std::endl;
    return true;
}

void AutosplitterLoader::unload() {
    if (!m_library) return;

    destroy();
    close_module(m_library);

    m_library = nullptr;
    m_construct = nullptr;
    m_update = nullptr;
    m_destroy = nullptr;
    m_metadata = AutosplitterMetadata{};
}

bool AutosplitterLoader::construct(const AutosplitHostApi* host) {
    if (!m_library) {
        std::cerr << "[AutosplitterLoader] No autosplitter loaded" << std::endl;
        return false;
    }
    if (m_constructed) {
        std::cerr << "[AutosplitterLoader] " << m_metadata.name << " is already constructed" << std::endl;
        return false;
    }

    if (m_construct(host) == 0) {
        std::cerr << "[AutosplitterLoader] " << m_metadata.name << " failed to construct" << std::endl;
        return false;
    }

    m_constructed = true;
    m_tick_count = 0;
    return true;
}

void AutosplitterLoader::update() {
    if (!m_constructed) return;
    m_update();
    m_tick_count++;
}

void AutosplitterLoader::destroy() {
    if (!m_constructed) return;
    m_destroy();
    m_constructed = false;
}

} // namespace autosplit
