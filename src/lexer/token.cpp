#include "lexer/token.hpp"

namespace bfq::lexer {

auto Token::is_run() const -> bool {
    switch (kind) {
    case TokenKind::MoveLeft:
    case TokenKind::MoveRight:
    case TokenKind::Increment:
    case TokenKind::Decrement:
        return true;
    default:
        return false;
    }
}

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::MoveLeft:
        return "MoveLeft";
    case TokenKind::MoveRight:
        return "MoveRight";
    case TokenKind::Increment:
        return "Increment";
    case TokenKind::Decrement:
        return "Decrement";
    case TokenKind::Read:
        return "Read";
    case TokenKind::Write:
        return "Write";
    case TokenKind::LoopOpen:
        return "LoopOpen";
    case TokenKind::LoopClose:
        return "LoopClose";
    }
    return "unknown";
}

auto token_kind_symbol(TokenKind kind) -> char {
    switch (kind) {
    case TokenKind::MoveLeft:
        return '<';
    case TokenKind::MoveRight:
        return '>';
    case TokenKind::Increment:
        return '+';
    case TokenKind::Decrement:
        return '-';
    case TokenKind::Read:
        return ',';
    case TokenKind::Write:
        return '.';
    case TokenKind::LoopOpen:
        return '[';
    case TokenKind::LoopClose:
        return ']';
    }
    return '?';
}

auto to_string(const Token& token) -> std::string {
    std::string out(token_kind_to_string(token.kind));
    if (token.is_run()) {
        out += "(" + std::to_string(token.count) + ")";
    }
    return out;
}

auto operator<<(std::ostream& os, const Token& token) -> std::ostream& {
    return os << to_string(token);
}

} // namespace bfq::lexer
