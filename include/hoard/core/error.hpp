#pragma once

/// @file error.hpp
/// @brief Error values and Result<T> for hoard
///
/// Every fallible hoard operation returns a Result. Errors carry a coarse
/// ErrorCode for branching, an optional structured kind (LoadError,
/// HotReloadError, HandleError), string context and an optional cause.

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace hoard_core {

// =============================================================================
// ErrorCode
// =============================================================================

enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    InvalidData,
    NotSupported,
    Disposed,
    Cancelled,
};

/// Number of ErrorCode values
inline constexpr std::size_t k_error_code_count = 10;

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::InvalidData: return "InvalidData";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::Disposed: return "Disposed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: break;
    }
    return "Unknown";
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Failure of a single asset load
struct LoadError {
    enum class Kind : std::uint8_t {
        FileNotFound,       // No file under the root for the path
        UnsupportedFormat,  // No loader for the extension and type
        ParseFailure,       // Loader rejected the bytes
        Cancelled,          // Every requester gave up
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static LoadError file_not_found(const std::string& path) {
        return LoadError{Kind::FileNotFound, "Asset file not found: " + path, path};
    }

    [[nodiscard]] static LoadError unsupported_format(const std::string& path, const std::string& type) {
        return LoadError{Kind::UnsupportedFormat, "No loader registered for '" + path + "' as " + type, path};
    }

    [[nodiscard]] static LoadError parse_failure(const std::string& path, const std::string& reason) {
        return LoadError{Kind::ParseFailure, "Failed to parse asset '" + path + "': " + reason, path};
    }

    [[nodiscard]] static LoadError cancelled(const std::string& path) {
        return LoadError{Kind::Cancelled, "Load cancelled: " + path, path};
    }
};

/// Watcher and reload failures
struct HotReloadError {
    enum class Kind : std::uint8_t {
        DirectoryNotFound,
        WatchError,
    };

    Kind kind;
    std::string message;
    std::string directory;

    [[nodiscard]] static HotReloadError directory_not_found(const std::string& dir) {
        return HotReloadError{Kind::DirectoryNotFound, "Directory not found: " + dir, dir};
    }

    [[nodiscard]] static HotReloadError watch_error(const std::string& reason) {
        return HotReloadError{Kind::WatchError, "Watch error: " + reason, {}};
    }
};

/// Misuse of an asset handle
struct HandleError {
    enum class Kind : std::uint8_t {
        Null,
        Released,
        Stale,  // Entry was evicted or unloaded
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static HandleError null() {
        return HandleError{Kind::Null, "Handle is null"};
    }

    [[nodiscard]] static HandleError released() {
        return HandleError{Kind::Released, "Handle was already released"};
    }

    [[nodiscard]] static HandleError stale() {
        return HandleError{Kind::Stale, "Handle is stale (entry no longer cached)"};
    }
};

// =============================================================================
// Error
// =============================================================================

class Error {
public:
    using Detail = std::variant<std::string, LoadError, HotReloadError, HandleError>;

    Error() : m_code(ErrorCode::Unknown), m_detail(std::string("Unknown error")) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_detail(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_detail(std::string(msg)) {}
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_detail(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_detail(std::string(msg)) {}

    Error(LoadError err) : m_code(code_for(err.kind)), m_detail(std::move(err)) {}
    Error(HotReloadError err) : m_code(code_for(err.kind)), m_detail(std::move(err)) {}
    Error(HandleError err) : m_code(code_for(err.kind)), m_detail(std::move(err)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] const std::string& message() const {
        return std::visit([](const auto& detail) -> const std::string& {
            if constexpr (std::is_same_v<std::decay_t<decltype(detail)>, std::string>) {
                return detail;
            } else {
                return detail.message;
            }
        }, m_detail);
    }

    /// True if the error carries structured kind T
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_detail);
    }

    /// Structured kind T, or nullptr
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_detail);
    }

    [[nodiscard]] const Detail& detail() const noexcept { return m_detail; }

    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

    Error& with_cause(Error cause) {
        m_cause = std::make_shared<const Error>(std::move(cause));
        return *this;
    }

    /// Error that led to this one, or nullptr
    [[nodiscard]] const Error* cause() const noexcept { return m_cause.get(); }

private:
    static ErrorCode code_for(LoadError::Kind kind) {
        switch (kind) {
            case LoadError::Kind::FileNotFound: return ErrorCode::NotFound;
            case LoadError::Kind::UnsupportedFormat: return ErrorCode::NotSupported;
            case LoadError::Kind::ParseFailure: return ErrorCode::ParseError;
            case LoadError::Kind::Cancelled: return ErrorCode::Cancelled;
        }
        return ErrorCode::Unknown;
    }

    static ErrorCode code_for(HotReloadError::Kind kind) {
        return kind == HotReloadError::Kind::DirectoryNotFound ? ErrorCode::NotFound : ErrorCode::IOError;
    }

    static ErrorCode code_for(HandleError::Kind kind) {
        return kind == HandleError::Kind::Null ? ErrorCode::InvalidArgument : ErrorCode::InvalidState;
    }

    ErrorCode m_code;
    Detail m_detail;
    std::map<std::string, std::string> m_context;
    std::shared_ptr<const Error> m_cause;
};

/// Thrown by Result::unwrap on an error result
class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(const Error& error)
        : std::runtime_error("unwrap on error result: " + error.message())
        , m_code(error.code()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

// =============================================================================
// Result<T>
// =============================================================================

/// Value or Error
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Undefined on an error result; see unwrap()
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T* operator->() { return &*m_value; }
    [[nodiscard]] const T* operator->() const { return &*m_value; }

    /// Undefined on an ok result
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T fallback) const {
        return m_value.has_value() ? *m_value : std::move(fallback);
    }

    /// Value, or throws BadResultAccess
    [[nodiscard]] T& unwrap() & {
        if (!m_value) {
            throw BadResultAccess(m_error);
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value) {
            throw BadResultAccess(m_error);
        }
        return std::move(*m_value);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_ok(true) {}
    Result(E error) : m_error(std::move(error)), m_ok(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_ok; }
    [[nodiscard]] bool is_err() const noexcept { return !m_ok; }
    explicit operator bool() const noexcept { return m_ok; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    void unwrap() const {
        if (!m_ok) {
            throw BadResultAccess(m_error);
        }
    }

private:
    E m_error;
    bool m_ok;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Utilities (error.cpp)
// =============================================================================

/// One line per error in the cause chain, outermost first
std::string build_error_chain(const Error& error);

/// Wrap an exception thrown by loader or third-party code
Error error_from_exception(const std::exception& ex, ErrorCode code = ErrorCode::Unknown);

namespace debug {

/// Count an error reported by the asset manager
void record_error(const Error& error);

std::uint64_t total_error_count();
std::uint64_t error_count(ErrorCode code);
void reset_error_stats();

/// "Total: N" followed by one line per non-zero code
std::string error_stats_summary();

} // namespace debug

} // namespace hoard_core
