#include "lexer/lexer.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace bfq::lexer {

auto is_command_char(char c) -> bool {
    switch (c) {
    case '<':
    case '>':
    case '+':
    case '-':
    case ',':
    case '.':
    case '[':
    case ']':
        return true;
    default:
        return false;
    }
}

Lexer::Lexer(const Source& source, uint32_t max_run)
    : source_(source), max_run_(std::max<uint32_t>(max_run, 1)) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

void Lexer::skip_commentary() {
    while (!is_at_end() && !is_command_char(peek())) {
        ++pos_;
    }
}

void Lexer::consume_run(char c) {
    while (!is_at_end() && peek() == c && pos_ - token_start_ < max_run_) {
        ++pos_;
    }
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ - 1);
    auto length = static_cast<uint32_t>(pos_ - token_start_);
    start_loc.length = length;
    end_loc.length = length;

    return Token{.kind = kind, .count = length, .span = {start_loc, end_loc}};
}

// ============================================================================
// Tokens
// ============================================================================

auto Lexer::next_token() -> std::optional<Token> {
    skip_commentary();
    if (is_at_end()) {
        return std::nullopt;
    }

    token_start_ = pos_;
    char c = advance();

    switch (c) {
    case '<':
        consume_run(c);
        return make_token(TokenKind::MoveLeft);
    case '>':
        consume_run(c);
        return make_token(TokenKind::MoveRight);
    case '+':
        consume_run(c);
        return make_token(TokenKind::Increment);
    case '-':
        consume_run(c);
        return make_token(TokenKind::Decrement);
    case ',':
        return make_token(TokenKind::Read);
    case '.':
        return make_token(TokenKind::Write);
    case '[':
        return make_token(TokenKind::LoopOpen);
    default: // ']', the only command character left
        return make_token(TokenKind::LoopClose);
    }
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (auto token = next_token()) {
        BFQ_LOG_TRACE("lexer", to_string(*token) << " at " << token->span.start.line << ":"
                                                  << token->span.start.column);
        tokens.push_back(*token);
    }

    BFQ_LOG_DEBUG("lexer", "Lexed " << source_.length() << " bytes of " << source_.filename()
                                    << " into " << tokens.size() << " tokens");
    return tokens;
}

} // namespace bfq::lexer
