#pragma once

#include <cstdlib>

#include "utils/logger.hpp"

#if defined(__GNUC__) || defined(__clang__)
#define MINTER_BUILTIN_UNREACHABLE() __builtin_unreachable()
#else
#define MINTER_BUILTIN_UNREACHABLE() ((void)0)
#endif

// Макрос для недостижимых веток кода
#define UNREACHABLE(reason)                                                                        \
    do {                                                                                           \
        LOG_CRITICAL << "UNREACHABLE code reached: " << reason;                                    \
        std::abort();                                                                              \
        MINTER_BUILTIN_UNREACHABLE();                                                              \
    } while (0)
