#include "Lexer.hpp"

#include <cctype>
#include <print>

#include "Util.hpp"

[[nodiscard]] static auto is_identifier_character(const char c) -> bool
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] static auto token_kind_try_from_character(const char character) -> std::optional<Interpreter::TokenKind>
{
    static_assert(
      std::to_underlying(Interpreter::TokenKind::Count) == 11,
      "Exhastive handling of all enum variants for TokenKind is required."
    );

    switch (character) {
        case '(':
            return Interpreter::TokenKind::LeftParen;
        case ')':
            return Interpreter::TokenKind::RightParen;
        case ',':
            return Interpreter::TokenKind::Comma;
        case '{':
            return Interpreter::TokenKind::LeftCurly;
        case '}':
            return Interpreter::TokenKind::RightCurly;
        default: {
            std::println(stderr, "[ERROR] (lexer) Unexpected single character token {}", character);
            return std::nullopt;
        }
    }
}

namespace Interpreter
{

auto Lexer::lex(const std::string_view source) -> std::optional<std::vector<Token>>
{
    std::vector<Token> result = {};
    Lexer              lexer(source);

    lexer.skip_whitespace_and_comments();
    while (lexer.has_more()) {
        result.push_back(TRY(lexer.next_token()));
        lexer.skip_whitespace_and_comments();
    }

    return result;
}

Lexer::Lexer(const std::string_view source)
  : source { source }
{}

auto Lexer::single_character_token(const std::string_view character) -> std::optional<Token>
{
    const auto kind = TRY(token_kind_try_from_character(character[0]));

    const auto token =
      Token { .lexeme = source.substr(cursor, 1), .kind = kind, .span = Span { .start = cursor, .end = cursor + 1 } };

    advance();
    return token;
}

auto Lexer::keyword_or_identifier() -> std::optional<Token>
{
    const auto start_idx = cursor;
    while (const auto peeked = peek()) {
        if (!is_identifier_character((*peeked)[0])) { break; }
        advance();
    }

    if (cursor == start_idx) { return report_error("unexpected character `{}`", source[cursor]); }

    const auto lexeme = source.substr(start_idx, cursor - start_idx);
    return Token {
        .lexeme = lexeme,
        .kind   = Token::is_keyword(lexeme) ? TokenKind::Keyword : TokenKind::Identifier,
        .span   = Span { .start = start_idx, .end = cursor },
    };
}

auto Lexer::string_literal() -> std::optional<Token>
{
    assert((*peek())[0] == '"' && "expected \"");
    const auto quote_idx = cursor;
    advance();

    const auto start_idx = cursor;
    while (true) {
        const auto peeked = peek();
        if (!peeked || (*peeked)[0] == '\n') { return report_error("unterminated string literal at offset {}", quote_idx); }
        if ((*peeked)[0] == '"') { break; }
        advance();
    }

    const auto end_idx = cursor;
    advance();

    return Token { .lexeme = source.substr(start_idx, end_idx - start_idx),
                   .kind   = TokenKind::StringLiteral,
                   .span   = Span { .start = quote_idx, .end = cursor } };
}

auto Lexer::number() -> std::optional<Token>
{
    assert(std::isdigit(static_cast<unsigned char>((*peek())[0])) && "expected number");

    const auto start_idx = cursor;
    while (const auto peeked = peek()) {
        if (std::isdigit(static_cast<unsigned char>((*peeked)[0])) == 0) { break; }
        advance();
    }

    return Token { .lexeme = source.substr(start_idx, cursor - start_idx),
                   .kind   = TokenKind::Number,
                   .span   = Span { .start = start_idx, .end = cursor } };
}

auto Lexer::colon() -> std::optional<Token>
{
    assert((*peek())[0] == ':' && "expected \":\"");
    const auto start_idx = cursor;
    advance();

    if (const auto peeked = peek(); peeked && (*peeked)[0] == ':') {
        advance();
        return Token { .lexeme = source.substr(start_idx, cursor - start_idx),
                       .kind   = TokenKind::ColonColon,
                       .span   = Span { .start = start_idx, .end = cursor } };
    }

    return report_error("expected `::`");
}

auto Lexer::dotdot() -> std::optional<Token>
{
    assert((*peek())[0] == '.' && "expected \".\"");
    const auto start_idx = cursor;
    advance();

    if (const auto peeked = peek(); peeked && (*peeked)[0] == '.') {
        advance();
        return Token { .lexeme = source.substr(start_idx, cursor - start_idx),
                       .kind   = TokenKind::DotDot,
                       .span   = Span { .start = start_idx, .end = cursor } };
    }

    return report_error("expected `..`");
}

auto Lexer::has_more() const -> bool { return cursor < source.size(); }

auto Lexer::next_token() -> std::optional<Token>
{
    const auto next_character = TRY(peek());

    if (std::isdigit(static_cast<unsigned char>(next_character[0])) != 0) { return number(); }

    switch (next_character[0]) {
        case ',':
        case '{':
        case '}':
        case '(':
        case ')': {
            return single_character_token(next_character);
        }
        case ':': {
            return colon();
        }
        case '.': {
            return dotdot();
        }
        case '"': {
            return string_literal();
        }
        default: {
            return keyword_or_identifier();
        }
    }
}

auto Lexer::peek(const std::size_t offset) const -> std::optional<std::string_view>
{
    if (cursor + offset >= source.size()) { return std::nullopt; }

    return source.substr(cursor + offset, 1);
}

void Lexer::advance(const std::size_t amount) { cursor += amount; }

void Lexer::skip_whitespace_and_comments()
{
    while (const auto peeked = peek()) {
        const auto c = (*peeked)[0];
        if (c == '#') {
            while (const auto commented = peek()) {
                if ((*commented)[0] == '\n') { break; }
                advance();
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c)) == 0) { break; }
        advance();
    }
}

template<typename... Args>
auto Lexer::report_error(std::format_string<Args...> fmt, Args&&... args) const -> std::nullopt_t
{
    std::println(
      stderr,
      "[ERROR] (lexer) line {}: {}",
      Span { .start = cursor, .end = cursor }.line_in(source),
      std::format(fmt, std::forward<Args>(args)...)
    );
    return std::nullopt;
}

} // namespace Interpreter
