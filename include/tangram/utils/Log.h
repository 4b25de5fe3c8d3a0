#pragma once

#include <SDL3/SDL_log.h>

namespace tangram {

// SDL log category for kernel diagnostics. Records are emitted at debug
// priority, so they stay silent until enabled with
// SDL_SetLogPriority(LOG_CATEGORY_GEOMETRY, SDL_LOG_PRIORITY_DEBUG).
// Redirect output with SDL_SetLogOutputFunction.
constexpr int LOG_CATEGORY_GEOMETRY = SDL_LOG_CATEGORY_CUSTOM;

}  // namespace tangram
