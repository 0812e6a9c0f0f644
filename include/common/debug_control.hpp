#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace bitcoin_vm {
namespace debug {

/**
 * Debug and Profile Control
 * 
 * Environment variables:
 * - BITCOIN_VM_PROFILE: Enable/disable profiling output (timing measurements)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 * 
 * - BITCOIN_VM_DEBUG: Enable/disable debug output (trace rows, region layout,
 *   failing constraints)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag_enabled("BITCOIN_VM_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag_enabled("BITCOIN_VM_DEBUG");
    return cached;
}

} // namespace debug
} // namespace bitcoin_vm

// Profile printing (timing measurements)
#define BITCOIN_VM_PROFILE_ENABLED() (bitcoin_vm::debug::is_profile_enabled())

#define BITCOIN_VM_PROFILE_PRINT(...) \
    do { \
        if (bitcoin_vm::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define BITCOIN_VM_PROFILE_COUT(expr) \
    do { \
        if (bitcoin_vm::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define BITCOIN_VM_DEBUG_ENABLED() (bitcoin_vm::debug::is_debug_enabled())

#define BITCOIN_VM_DEBUG_PRINT(...) \
    do { \
        if (bitcoin_vm::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define BITCOIN_VM_DEBUG_COUT(expr) \
    do { \
        if (bitcoin_vm::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define BITCOIN_VM_DEBUG_FPRINTF(stream, ...) \
    do { \
        if (bitcoin_vm::debug::is_debug_enabled()) { \
            fprintf(stream, __VA_ARGS__); \
        } \
    } while(0)

// Wrap entire blocks that should only run when profiling/debugging
#define BITCOIN_VM_IF_PROFILE if (bitcoin_vm::debug::is_profile_enabled())
#define BITCOIN_VM_IF_DEBUG if (bitcoin_vm::debug::is_debug_enabled())
