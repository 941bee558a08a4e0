#include "diagnostic.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

#include <unistd.h>

namespace bfq::cli {

namespace {

int digit_count(uint32_t value) {
    int digits = 1;
    while (value >= 10) {
        value /= 10;
        ++digits;
    }
    return digits;
}

} // namespace

bool terminal_supports_colors() {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out)
    : out_(out), use_colors_(&out == &std::cerr && terminal_supports_colors()) {}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    ++error_count_;

    print_header(diag);
    if (diag.primary_span) {
        print_location(diag.primary_span->start);
        print_snippet(diag.primary_span->start);
    }
    print_trailer("note", Colors::BrightCyan, diag.notes);
    print_trailer("help", Colors::BrightGreen, diag.help);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const std::vector<std::string>& notes) {
    emit(Diagnostic{.code = code,
                    .message = message,
                    .primary_span = std::nullopt,
                    .notes = notes,
                    .help = {}});
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const SourceSpan& span, const std::vector<std::string>& notes) {
    emit(Diagnostic{.code = code,
                    .message = message,
                    .primary_span = span,
                    .notes = notes,
                    .help = {}});
}

void DiagnosticEmitter::print_header(const Diagnostic& diag) {
    out_ << paint(Colors::Bold) << paint(Colors::BrightRed) << "error";
    if (!diag.code.empty()) {
        out_ << '[' << diag.code << ']';
    }
    out_ << paint(Colors::Reset) << paint(Colors::Bold) << ": " << diag.message
         << paint(Colors::Reset) << '\n';
}

void DiagnosticEmitter::print_location(const SourceLocation& loc) {
    out_ << paint(Colors::BrightBlue) << "  --> " << paint(Colors::Reset) << loc.file << ':'
         << loc.line << ':' << loc.column << '\n';
}

std::optional<std::string_view> DiagnosticEmitter::snippet_line(const SourceLocation& loc) const {
    if (source_ == nullptr || source_->filename() != loc.file) {
        return std::nullopt;
    }
    auto text = source_->line(loc.line);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

void DiagnosticEmitter::print_gutter(int width, bool trailing_space) {
    out_ << paint(Colors::BrightBlue) << std::setw(width) << "" << (trailing_space ? " | " : " |")
         << paint(Colors::Reset);
}

void DiagnosticEmitter::print_snippet(const SourceLocation& loc) {
    auto text = snippet_line(loc);
    if (!text) {
        return;
    }

    int width = std::max(digit_count(loc.line), 4);

    print_gutter(width, false);
    out_ << '\n';

    out_ << paint(Colors::BrightBlue) << std::setw(width) << loc.line << " | "
         << paint(Colors::Reset) << *text << '\n';

    // Carets under the run, kept inside the line
    size_t first = loc.column > 0 ? loc.column - 1 : 0;
    size_t carets = std::max<uint32_t>(loc.length, 1);
    if (first + carets > text->size() + 1) {
        carets = first < text->size() + 1 ? text->size() + 1 - first : 1;
    }

    print_gutter(width, true);
    out_ << std::string(first, ' ') << paint(Colors::BrightRed) << std::string(carets, '^')
         << paint(Colors::Reset) << '\n';

    print_gutter(width, false);
    out_ << '\n';
}

void DiagnosticEmitter::print_trailer(const char* label, const char* label_color,
                                      const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        out_ << paint(label_color) << "  = " << label << paint(Colors::Reset) << ": " << line
             << '\n';
    }
}

} // namespace bfq::cli
