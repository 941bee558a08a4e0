//! # Common Definitions
//!
//! Vocabulary shared by the lexer, parser, generator and driver:
//!
//! - `VERSION`, printed by `bfq --version`
//! - `SourceLocation` / `SourceSpan`, attached to tokens, statements and
//!   diagnostics
//! - `Result<T, E>`, the return type of every stage that can fail
//! - `Box<T>`, the owning pointer that holds loop bodies in the AST
//!
//! Stages never throw at each other. A failed stage hands back the error half
//! of a `Result` and the driver decides how to report it.

#ifndef BFQ_COMMON_HPP
#define BFQ_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace bfq {

/// Compiler version, kept in step with `project(... VERSION)` in CMake.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Source Positions
// ============================================================================

/// One position in a loaded source file.
///
/// `line` and `column` start at 1, `offset` at 0. `length` is the number of
/// bytes the located element covers (the run length for a token). `file`
/// views the owning `Source`'s filename. Lines and columns past the range of
/// `uint32_t` saturate; `offset` is exact.
struct SourceLocation {
    std::string_view file;
    uint32_t line = 0;
    uint32_t column = 0;
    size_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// First and last position of a token, statement or block.
///
/// A default-constructed span has `line == 0` and means "no location".
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// From the start of `first` to the end of `last`.
    [[nodiscard]] static auto merge(const SourceSpan& first, const SourceSpan& last)
        -> SourceSpan {
        return SourceSpan{first.start, last.end};
    }
};

// ============================================================================
// Result
// ============================================================================

/// Success value or error, as a two-alternative variant.
///
/// ```cpp
/// auto parsed = parser.parse_program();
/// if (is_err(parsed)) {
///     return report(unwrap_err(parsed));
/// }
/// generate(unwrap(parsed));
/// ```
///
/// `T` and `E` must differ, otherwise the alternatives are ambiguous.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// The success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// The error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Sole owner of a heap node; loop bodies are held this way.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace bfq

#endif // BFQ_COMMON_HPP
