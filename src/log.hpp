#pragma once

#include <iostream>

// ============================================================================
// Log Level Control System
// ============================================================================
#define NODEFS_LOG_SILENT  0  // No logs
#define NODEFS_LOG_ERROR   1  // Errors only
#define NODEFS_LOG_WARN    2  // Warnings + errors (reconnects)
#define NODEFS_LOG_INFO    3  // Info + warnings + errors (default)
#define NODEFS_LOG_VERBOSE 4  // Per-request details (URLs, byte counts)

// Override with -DNODEFS_LOG_LEVEL=<n> on the compiler command line
#ifndef NODEFS_LOG_LEVEL
#define NODEFS_LOG_LEVEL NODEFS_LOG_INFO
#endif

// Logging macros - automatically filtered by log level
#define LOG_VERBOSE(msg) do { if(NODEFS_LOG_LEVEL >= NODEFS_LOG_VERBOSE) { std::cout << msg << std::endl; } } while(0)
#define LOG_INFO(msg)    do { if(NODEFS_LOG_LEVEL >= NODEFS_LOG_INFO)    { std::cout << msg << std::endl; } } while(0)
#define LOG_WARN(msg)    do { if(NODEFS_LOG_LEVEL >= NODEFS_LOG_WARN)    { std::cerr << msg << std::endl; } } while(0)
#define LOG_ERROR(msg)   do { if(NODEFS_LOG_LEVEL >= NODEFS_LOG_ERROR)   { std::cerr << "[ERROR] " << msg << std::endl; } } while(0)

// Usage:
// - Messages carry a component tag: LOG_WARN("[reconnect] " << name << " lost");
// - Build with -DNODEFS_LOG_LEVEL=NODEFS_LOG_SILENT to suppress all output
// ============================================================================
