#pragma once

#include <cstdint>

// Shared library export macro
#ifdef _WIN32
    #define AUTOSPLIT_EXPORT __declspec(dllexport)
#else
    #define AUTOSPLIT_EXPORT __attribute__((visibility("default")))
#endif

#define AUTOSPLIT_API_VERSION 1

// Entry point names resolved by the host after loading a plugin module
#define AUTOSPLIT_SYMBOL_API_VERSION "autosplitter_api_version"
#define AUTOSPLIT_SYMBOL_INFO        "autosplitter_info"
#define AUTOSPLIT_SYMBOL_CONSTRUCT   "autosplitter_construct"
#define AUTOSPLIT_SYMBOL_UPDATE      "autosplitter_update"
#define AUTOSPLIT_SYMBOL_DESTROY     "autosplitter_destroy"

extern "C" {

// Information about an autosplitter module
struct AutosplitterInfo {
    const char* name;           // "Game.exe Any% Autosplitter"
    const char* version;        // "1.0.0"
    const char* author;         // Plugin author
    const char* description;    // Brief description
};

// Raw timer state values returned by timer_get_state
enum AutosplitRawTimerState : uint32_t {
    AUTOSPLIT_TIMER_NOT_RUNNING = 0,
    AUTOSPLIT_TIMER_RUNNING     = 1,
    AUTOSPLIT_TIMER_PAUSED      = 2,
    AUTOSPLIT_TIMER_ENDED       = 3
};

// Binding table provided by the host to a plugin module.
// Every function receives `context` as its first argument. Strings are passed
// as pointer + length and are not NUL terminated. Process handles are opaque;
// 0 means "no process".
struct AutosplitHostApi {
    uint32_t api_version;
    void* context;

    // Runtime
    void (*runtime_print_message)(void* ctx, const char* text, uint32_t len);
    void (*runtime_set_tick_rate)(void* ctx, double rate);

    // Processes
    uint64_t (*process_attach)(void* ctx, const char* name, uint32_t len);
    void (*process_detach)(void* ctx, uint64_t process);
    uint64_t (*process_get_module_address)(void* ctx, uint64_t process,
                                           const char* name, uint32_t len);
    // Returns non-zero when all `len` bytes were copied into `buf`
    uint32_t (*process_read)(void* ctx, uint64_t process, uint64_t address,
                             uint8_t* buf, uint32_t len);

    // Timer actions (fire and forget)
    void (*timer_start)(void* ctx);
    void (*timer_split)(void* ctx);
    void (*timer_skip_split)(void* ctx);
    void (*timer_undo_split)(void* ctx);
    void (*timer_reset)(void* ctx);
    void (*timer_pause_game_time)(void* ctx);
    void (*timer_resume_game_time)(void* ctx);

    // Timer configuration
    void (*timer_set_variable)(void* ctx, const char* key, uint32_t key_len,
                               const char* value, uint32_t value_len);
    void (*timer_set_game_time)(void* ctx, int64_t seconds, int32_t nanos);

    // Timer query (AutosplitRawTimerState)
    uint32_t (*timer_get_state)(void* ctx);
};

// Function pointer types for the fixed entry points every module exports
using AutosplitApiVersionFunc = uint32_t (*)();
using AutosplitInfoFunc = AutosplitterInfo (*)();
using AutosplitConstructFunc = int32_t (*)(const AutosplitHostApi* host);
using AutosplitUpdateFunc = void (*)();
using AutosplitDestroyFunc = void (*)();

} // extern "C"

namespace autosplit {

// True when every binding in the table is set
inline bool is_complete(const AutosplitHostApi& api) {
    return api.runtime_print_message && api.runtime_set_tick_rate &&
           api.process_attach && api.process_detach &&
           api.process_get_module_address && api.process_read &&
           api.timer_start && api.timer_split && api.timer_skip_split &&
           api.timer_undo_split && api.timer_reset &&
           api.timer_pause_game_time && api.timer_resume_game_time &&
           api.timer_set_variable && api.timer_set_game_time &&
           api.timer_get_state;
}

} // namespace autosplit
