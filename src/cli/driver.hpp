#pragma once

#include "codegen/qbe_gen.hpp"
#include "common.hpp"

#include <optional>
#include <string>

namespace bfq::cli {

// What the driver prints for a successfully processed file
enum class EmitKind {
    Qbe,    // QBE IL module (default)
    Tokens, // One token per line with line:column
    Ast,    // print_ast() tree
};

struct DriverOptions {
    std::string input;                 // Source path; empty if none was given
    std::optional<std::string> output; // -o <path>; stdout if unset
    EmitKind emit = EmitKind::Qbe;
    codegen::CodegenOptions codegen;
    bool show_help = false;
    bool show_version = false;
};

// Parses argv into DriverOptions. Logging flags are recognized and skipped;
// they are handled by log::parse_log_options. The error is a one-line
// description of the offending argument.
auto parse_args(int argc, char* argv[]) -> Result<DriverOptions, std::string>;

} // namespace bfq::cli

// Main compiler driver entry point
int bfq_main(int argc, char* argv[]);
