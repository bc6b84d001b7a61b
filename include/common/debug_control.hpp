#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace groth16 {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - GROTH16_PROFILE: Enable/disable profiling output (pairing and decode timings)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - GROTH16_DEBUG: Enable/disable debug output (decoded points, prepared inputs)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * These only control diagnostics. Verification semantics are never read from
 * the environment; see VerifierConfig.
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag_enabled("GROTH16_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag_enabled("GROTH16_DEBUG");
    return cached;
}

} // namespace debug
} // namespace groth16

// Profile printing (timing measurements)
#define GROTH16_PROFILE_ENABLED() (groth16::debug::is_profile_enabled())

#define GROTH16_PROFILE_PRINT(...) \
    do { \
        if (groth16::debug::is_profile_enabled()) { \
            fprintf(stderr, __VA_ARGS__); \
        } \
    } while(0)

#define GROTH16_PROFILE_COUT(expr) \
    do { \
        if (groth16::debug::is_profile_enabled()) { \
            std::cerr << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define GROTH16_DEBUG_ENABLED() (groth16::debug::is_debug_enabled())

#define GROTH16_DEBUG_PRINT(...) \
    do { \
        if (groth16::debug::is_debug_enabled()) { \
            fprintf(stderr, __VA_ARGS__); \
        } \
    } while(0)

#define GROTH16_DEBUG_COUT(expr) \
    do { \
        if (groth16::debug::is_debug_enabled()) { \
            std::cerr << expr; \
        } \
    } while(0)

// Use this to wrap entire blocks of code that should only run when profiling/debugging
#define GROTH16_IF_PROFILE if (groth16::debug::is_profile_enabled())
#define GROTH16_IF_DEBUG if (groth16::debug::is_debug_enabled())
