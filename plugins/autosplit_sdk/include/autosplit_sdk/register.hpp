#pragma once

#include "autosplit/autosplit_api.hpp"
#include "autosplit_sdk/dispatcher.hpp"

// AUTOSPLIT_REGISTER_SPLITTER - Export the entry points the host calls
//
//     class MySplitter { ... };
//     AUTOSPLIT_REGISTER_SPLITTER(MySplitter, "My Game Autosplitter", "1.0.0",
//                                 "me", "Splits on level transitions");
//
// Use exactly once per module, at global scope. The module then owns a single
// Dispatcher<MySplitter> for as long as it stays loaded.
#define AUTOSPLIT_REGISTER_SPLITTER(Type, Name, Version, Author, Description)    \
    namespace {                                                                  \
    ::autosplit_sdk::Dispatcher<Type>& autosplit_module_dispatcher() {           \
        static ::autosplit_sdk::Dispatcher<Type> dispatcher;                     \
        return dispatcher;                                                       \
    }                                                                            \
    }                                                                            \
    extern "C" {                                                                 \
    AUTOSPLIT_EXPORT uint32_t autosplitter_api_version() {                       \
        return AUTOSPLIT_API_VERSION;                                            \
    }                                                                            \
    AUTOSPLIT_EXPORT AutosplitterInfo autosplitter_info() {                      \
        return {Name, Version, Author, Description};                             \
    }                                                                            \
    AUTOSPLIT_EXPORT int32_t autosplitter_construct(const AutosplitHostApi* host) { \
        return autosplit_module_dispatcher().construct(host) ? 1 : 0;            \
    }                                                                            \
    AUTOSPLIT_EXPORT void autosplitter_update() {                                \
        autosplit_module_dispatcher().update();                                  \
    }                                                                            \
    AUTOSPLIT_EXPORT void autosplitter_destroy() {                               \
        autosplit_module_dispatcher().destroy();                                 \
    }                                                                            \
    }
