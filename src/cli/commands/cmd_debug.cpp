//! # Debug Views
//!
//! Text dumps used by `--emit=tokens`. The AST view is `parser::print_ast`.

#include "cmd_debug.hpp"

#include <sstream>

namespace bfq::cli {

std::string format_tokens(const std::vector<lexer::Token>& tokens) {
    std::ostringstream out;
    for (const auto& token : tokens) {
        out << token.span.start.line << ":" << token.span.start.column << "\t"
            << lexer::to_string(token) << "\n";
    }
    return out.str();
}

} // namespace bfq::cli
