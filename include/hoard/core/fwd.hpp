#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hoard_core module

#include <cstdint>

namespace hoard_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

struct LoadError;
struct HotReloadError;
struct HandleError;
class BadResultAccess;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace hoard_core
