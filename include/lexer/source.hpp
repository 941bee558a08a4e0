//! # Source Text
//!
//! A loaded program together with a line index, so that any byte offset can
//! be turned into a `line:column` for diagnostics.
//!
//! ```cpp
//! auto source = Source::from_string(read_file(path), path);
//! SourceLocation loc = source.location(4); // line 1, column 5
//! std::string_view text = source.line(loc.line);
//! ```

#ifndef BFQ_LEXER_SOURCE_HPP
#define BFQ_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bfq::lexer {

/// Program text plus the byte offset at which every line begins.
///
/// Views handed out by `line()`, and the `file`
/// field of every `SourceLocation`, point into this object. They stay valid
/// while the `Source` is alive and has not been moved.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// 1-based line and column of a byte offset (binary search on the index).
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Text of a 1-based line without its line terminator.
    /// Empty if the line does not exist.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_;

    void build_line_index();
};

} // namespace bfq::lexer

#endif // BFQ_LEXER_SOURCE_HPP
