#pragma once

#include "cli/diagnostic.hpp"
#include "cli/driver.hpp"
#include "codegen/qbe_gen.hpp"
#include "common.hpp"
#include "lexer/source.hpp"
#include "parser/parser.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace bfq::cli {

// Runs lexer, parser and (for EmitKind::Qbe) the QBE generator over an
// in-memory source. Nothing is printed; failures come back as diagnostics
// ready for a DiagnosticEmitter.
auto compile(const lexer::Source& source, EmitKind emit,
             const codegen::CodegenOptions& options = {})
    -> Result<std::string, std::vector<Diagnostic>>;

// P001 for UnexpectedToken, P002 for EndOfInput
Diagnostic parse_error_to_diagnostic(const parser::ParseError& error);

// Reads options.input, compiles it and writes the result to options.output
// or `out`. Returns the process exit code.
int run_compile(const DriverOptions& options, std::ostream& out, DiagnosticEmitter& diag);

} // namespace bfq::cli
