//! # CLI Entry Point
//!
//! Argument parsing and dispatch for the `bfq` command.
//!
//! ```text
//! bfq_main()
//!   ├─ log::parse_log_options → Logger::init
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ (no file)      → usage on stderr, exit 1
//!   └─ <file>         → run_compile()
//! ```

#include "commands/cmd_compile.hpp"
#include "common.hpp"
#include "diagnostic.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace bfq::cli {

namespace {

// Parses a positive integer option value such as the N in --tape-cells=N.
auto parse_count(std::string_view flag, std::string_view text) -> Result<uint32_t, std::string> {
    uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value == 0) {
        return std::string(flag) + " expects a positive integer, got '" + std::string(text) + "'";
    }
    return value;
}

auto parse_emit(std::string_view text) -> std::optional<EmitKind> {
    if (text == "qbe")
        return EmitKind::Qbe;
    if (text == "tokens")
        return EmitKind::Tokens;
    if (text == "ast")
        return EmitKind::Ast;
    return std::nullopt;
}

} // namespace

auto parse_args(int argc, char* argv[]) -> Result<DriverOptions, std::string> {
    DriverOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.show_version = true;
        } else if (arg.starts_with("--emit=")) {
            auto emit = parse_emit(arg.substr(7));
            if (!emit) {
                return "unknown --emit kind '" + std::string(arg.substr(7)) +
                       "' (expected qbe, tokens or ast)";
            }
            options.emit = *emit;
        } else if (arg == "-o") {
            if (i + 1 >= argc) {
                return std::string("-o expects a path");
            }
            options.output = argv[++i];
        } else if (arg.starts_with("--tape-cells=")) {
            auto cells = parse_count("--tape-cells", arg.substr(13));
            if (is_err(cells)) {
                return unwrap_err(cells);
            }
            options.codegen.tape_cells = unwrap(cells);
        } else if (arg.starts_with("--cell-stride=")) {
            auto stride = parse_count("--cell-stride", arg.substr(14));
            if (is_err(stride)) {
                return unwrap_err(stride);
            }
            options.codegen.cell_stride = unwrap(stride);
        } else if (arg == "--no-zero-tape") {
            options.codegen.zero_tape = false;
        } else if (log::is_log_option(arg)) {
            // Consumed by log::parse_log_options
        } else if (arg.starts_with("-")) {
            return "unknown option '" + std::string(arg) + "'";
        } else if (options.input.empty()) {
            options.input = std::string(arg);
        } else {
            return "unexpected extra argument '" + std::string(arg) + "'";
        }
    }

    return options;
}

/// Main entry point for the bfq compiler CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                        |
/// |------|------------------------------------------------|
/// | 0    | Success                                        |
/// | 1    | Usage, file, parse or code generation error    |
int bfq_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto& diag = get_diagnostic_emitter();

    auto parsed = parse_args(argc, argv);
    if (is_err(parsed)) {
        diag.error(ErrorCodes::USAGE_ERROR, unwrap_err(parsed),
                   std::vector<std::string>{"run `bfq --help` for usage"});
        return 1;
    }
    auto& options = unwrap(parsed);

    if (options.show_help) {
        print_usage(std::cout);
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.input.empty()) {
        print_usage(std::cerr);
        return 1;
    }

    int status = run_compile(options, std::cout, diag);
    log::Logger::instance().flush();
    return status;
}

} // namespace bfq::cli

int bfq_main(int argc, char* argv[]) {
    return bfq::cli::bfq_main(argc, argv);
}
