#pragma once

#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace bfq::cli {

// Token dump behind --emit=tokens: "line:column<TAB>Kind(count)" per line
std::string format_tokens(const std::vector<lexer::Token>& tokens);

} // namespace bfq::cli
