//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! the Lox front-end. Every other component (lexer, parser, printer, CLI)
//! depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Front-end version constants
//! - **Compiler Options**: Global configuration set from the command line
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Alias for uniquely owned tree nodes
//!
//! ## Design Philosophy
//!
//! - **Collect, don't throw**: Front-end stages record errors and keep going;
//!   single fallible steps return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for every parent-owns-child edge of the AST

#ifndef LOX_COMMON_HPP
#define LOX_COMMON_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lox {

// ============================================================================
// Version Information
// ============================================================================

/// The front-end version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Compiler Configuration
// ============================================================================

/// Output format for front-end diagnostics.
enum class DiagnosticFormat {
    Text, ///< `[line N] Error: ...` lines (default)
    JSON  ///< One JSON object per diagnostic for tool integration
};

/// Global front-end configuration options.
///
/// Set once from command-line flags before any stage runs.
///
/// # Example
///
/// ```cpp
/// CompilerOptions::verbose = true;
/// CompilerOptions::diagnostic_format = DiagnosticFormat::JSON;
/// ```
struct CompilerOptions {
    /// Enable verbose/debug output to stderr.
    static inline bool verbose = false;

    /// Output format for diagnostics.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;
};

// ============================================================================
// Debug Macros
// ============================================================================

/// Outputs a debug message to stderr if verbose mode is enabled.
///
/// This macro is a no-op when `CompilerOptions::verbose` is false.
#define LOX_DEBUG(msg)                                                                             \
    do {                                                                                           \
        if (::lox::CompilerOptions::verbose) {                                                     \
            std::cerr << msg;                                                                      \
        }                                                                                          \
    } while (0)

/// Outputs a debug message with newline to stderr if verbose mode is enabled.
#define LOX_DEBUG_LN(msg)                                                                          \
    do {                                                                                           \
        if (::lox::CompilerOptions::verbose) {                                                     \
            std::cerr << msg << "\n";                                                              \
        }                                                                                          \
    } while (0)

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from the start of the text
/// - `length`: Length of the source element in bytes
///
/// Locations carry no file reference, so tokens and AST nodes stay valid
/// after the `Source` they were scanned from is gone.
struct SourceLocation {
    /// Line number (1-based).
    uint32_t line = 1;

    /// Column number (1-based).
    uint32_t column = 1;

    /// Byte offset from start of text (0-based).
    uint32_t offset = 0;

    /// Length of the source element in bytes.
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
///
/// `SourceSpan` represents a contiguous region of source code, typically
/// corresponding to a single token or AST node.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span.
    SourceLocation end;

    /// Merges two spans into one that covers both.
    ///
    /// The result spans from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = Source::from_file("script.lox");
/// if (is_ok(result)) {
///     const Source& source = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// Every AST edge is a `Box`: a node is owned by exactly one parent.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace lox

#endif // LOX_COMMON_HPP
