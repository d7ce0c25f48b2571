//! # Source Text
//!
//! Holds the text of one Lox script together with a line index so byte
//! offsets can be turned into line/column positions.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("script.lox");
//! if (is_err(result)) {
//!     LOX_LOG_ERROR("cli", unwrap_err(result));
//!     return;
//! }
//! const Source& source = unwrap(result);
//!
//! SourceLocation loc = source.location(4); // line 1, column 5
//! std::string_view first = source.line(1);
//! ```

#ifndef LOX_LEXER_SOURCE_HPP
#define LOX_LEXER_SOURCE_HPP

#include "lox/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lox::lexer {

/// A Lox script with O(log n) offset-to-line lookup.
///
/// # Memory Model
///
/// The source owns its content string. Views returned by `content()`,
/// `slice()` and `line()` are valid as long as the Source object exists.
/// Tokens copy their lexemes and do not depend on it.
class Source {
public:
    /// Constructs a source from a name and content, building the line index.
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns a substring from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the text of a line (1-based) without its line terminator.
    ///
    /// Returns an empty view if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Returns the total number of lines.
    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a script from disk.
    ///
    /// Returns an error string if the file cannot be read.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace lox::lexer

#endif // LOX_LEXER_SOURCE_HPP
