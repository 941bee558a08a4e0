//! # Compile Command
//!
//! The single pipeline behind every `bfq <file>` invocation:
//!
//! ```text
//! read_file → Source → Lexer → Parser → QbeGen → stdout / -o file
//!                        │        │
//!                        │        └─ --emit=ast stops here
//!                        └─ --emit=tokens stops here
//! ```

#include "cmd_compile.hpp"

#include "cli/utils.hpp"
#include "cmd_debug.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <stdexcept>

namespace bfq::cli {

Diagnostic parse_error_to_diagnostic(const parser::ParseError& error) {
    Diagnostic diag;
    switch (error.kind) {
    case parser::ParseErrorKind::UnexpectedToken:
        diag.code = ErrorCodes::PARSE_UNEXPECTED_TOKEN;
        break;
    case parser::ParseErrorKind::EndOfInput:
        diag.code = ErrorCodes::PARSE_END_OF_INPUT;
        break;
    case parser::ParseErrorKind::NestingTooDeep:
        diag.code = ErrorCodes::PARSE_NESTING_TOO_DEEP;
        break;
    }
    diag.message = error.message;
    diag.primary_span = error.span;
    diag.notes = error.notes;
    if (error.kind == parser::ParseErrorKind::EndOfInput) {
        diag.help.emplace_back("add a matching `]`");
    }
    return diag;
}

static Diagnostic codegen_error_to_diagnostic(const codegen::CodegenError& error) {
    Diagnostic diag;
    diag.code = ErrorCodes::CODEGEN_ERROR;
    diag.message = error.message;
    if (error.span.start.line > 0) {
        diag.primary_span = error.span;
    }
    diag.notes = error.notes;
    return diag;
}

auto compile(const lexer::Source& source, EmitKind emit, const codegen::CodegenOptions& options)
    -> Result<std::string, std::vector<Diagnostic>> {
    lexer::Lexer lex(source);
    auto tokens = lex.tokenize();

    if (emit == EmitKind::Tokens) {
        return format_tokens(tokens);
    }

    parser::Parser parser(std::move(tokens));
    auto parsed = parser.parse_program();
    if (is_err(parsed)) {
        return std::vector<Diagnostic>{parse_error_to_diagnostic(unwrap_err(parsed))};
    }
    const auto& program = unwrap(parsed);

    if (emit == EmitKind::Ast) {
        return parser::print_ast(program);
    }

    codegen::QbeGen gen(options);
    auto generated = gen.generate(program);
    if (is_err(generated)) {
        std::vector<Diagnostic> diags;
        for (const auto& error : unwrap_err(generated)) {
            diags.push_back(codegen_error_to_diagnostic(error));
        }
        return diags;
    }

    return std::move(unwrap(generated));
}

int run_compile(const DriverOptions& options, std::ostream& out, DiagnosticEmitter& diag) {
    BFQ_LOG_INFO("driver", "Compiling " << options.input);

    std::string content;
    try {
        content = read_file(options.input);
    } catch (const std::runtime_error& e) {
        diag.error(ErrorCodes::FILE_NOT_FOUND, e.what());
        return 1;
    }

    auto source = lexer::Source::from_string(std::move(content), options.input);
    auto result = compile(source, options.emit, options.codegen);
    if (is_err(result)) {
        diag.set_source(&source);
        for (const auto& d : unwrap_err(result)) {
            diag.emit(d);
        }
        diag.set_source(nullptr);
        BFQ_LOG_DEBUG("driver", "Failed with " << unwrap_err(result).size() << " error(s)");
        return 1;
    }

    const auto& text = unwrap(result);
    if (options.output) {
        try {
            write_file(*options.output, text);
        } catch (const std::runtime_error& e) {
            diag.error(ErrorCodes::IO_ERROR, e.what());
            return 1;
        }
        BFQ_LOG_INFO("driver", "Wrote " << text.size() << " bytes to " << *options.output);
    } else {
        out << text;
        out.flush();
    }

    return 0;
}

} // namespace bfq::cli
