#include "game_splitter.hpp"
#include "autosplit_sdk/register.hpp"

// ============================================================
// C interface implementation
// ============================================================

AUTOSPLIT_REGISTER_SPLITTER(game_splitter::GameSplitter,
                            "Game.exe Load Remover",
                            "1.0.0",
                            "Autosplit Team",
                            "Pauses game time during Game.exe loading screens.")
