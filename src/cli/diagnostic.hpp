#pragma once

// Compiler diagnostics: error codes, the Diagnostic record and a renderer
// that prints it with the offending source line underneath.

#include "common.hpp"
#include "lexer/source.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace bfq::cli {

// ANSI escapes used by the renderer
struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// P = syntax, C = QBE generation, E = files and command line
namespace ErrorCodes {
constexpr const char* PARSE_UNEXPECTED_TOKEN = "P001";
constexpr const char* PARSE_END_OF_INPUT = "P002";
constexpr const char* PARSE_NESTING_TOO_DEEP = "P003";

constexpr const char* CODEGEN_ERROR = "C001";

constexpr const char* FILE_NOT_FOUND = "E001";
constexpr const char* IO_ERROR = "E002";
constexpr const char* USAGE_ERROR = "E003";
} // namespace ErrorCodes

// Every diagnostic is an error; notes and help lines hang off it.
struct Diagnostic {
    std::string code; // "P001"
    std::string message;
    std::optional<SourceSpan> primary_span; // unset for file and usage errors
    std::vector<std::string> notes;
    std::vector<std::string> help;
};

// Prints diagnostics as
//
//   error[P001]: unexpected token `]` (LoopClose)
//     --> prog.b:1:4
//        |
//      1 | +++]
//        |    ^
//        |
//     = note: this `]` has no matching `[`
//
// The snippet appears only when the attached source has the span's file.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    // Not owned; pass nullptr to detach.
    void set_source(const lexer::Source* source) {
        source_ = source;
    }

    void emit(const Diagnostic& diag);

    void error(const std::string& code, const std::string& message,
               const std::vector<std::string>& notes = {});

    void error(const std::string& code, const std::string& message, const SourceSpan& span,
               const std::vector<std::string>& notes = {});

    size_t error_count() const {
        return error_count_;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    const lexer::Source* source_ = nullptr;
    size_t error_count_ = 0;

    // `code` when colors are on, "" otherwise
    const char* paint(const char* code) const {
        return use_colors_ ? code : "";
    }

    void print_header(const Diagnostic& diag);
    void print_location(const SourceLocation& loc);
    void print_snippet(const SourceLocation& loc);
    void print_gutter(int width, bool trailing_space);
    void print_trailer(const char* label, const char* label_color,
                       const std::vector<std::string>& lines);

    std::optional<std::string_view> snippet_line(const SourceLocation& loc) const;
};

// stderr is a tty and TERM is set to something other than "dumb"
bool terminal_supports_colors();

// Shared emitter on stderr
DiagnosticEmitter& get_diagnostic_emitter();

} // namespace bfq::cli
