/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for clipshare
 *
 * clipshare drives an X11 clipboard helper through a privileged
 * subprocess, so only Linux hosts are supported.
 */

#ifndef CLIPSHARE_PLATFORM_H
#define CLIPSHARE_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if defined(__linux__)
#define CLIPSHARE_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. clipshare only supports Linux."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef CLIPSHARE_BUILDING_SHARED
#define CLIPSHARE_API __attribute__((visibility("default")))
#else
#define CLIPSHARE_API
#endif

#endif // CLIPSHARE_PLATFORM_H
