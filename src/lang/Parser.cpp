#include "Parser.hpp"

#include <print>

#include "Util.hpp"

namespace Interpreter
{

auto Parser::parse(const std::vector<Token>& tokens, const std::string_view source) -> std::optional<Ast>
{
    Parser parser(tokens, source);

    std::size_t statement_id = 0;
    while (parser.has_more()) {
        auto statement = TRY(parser.expression_statement());
        statement.id   = statement_id++;
        parser.ast.statements.push_back(statement);
    }

    return parser.ast;
}

auto Parser::expression_statement() -> std::optional<Statement>
{
    const auto expr = TRY(expression());
    return Statement { .kind = expr.id, .span = expr.span, .id = 0 };
}

auto Parser::expression() -> std::optional<Expression>
{
    const auto current_token = TRY(peek());
    if (current_token.kind == TokenKind::Keyword && current_token.lexeme == "for") { return for_loop(); }

    return primary_expression();
}

auto Parser::primary_expression() -> std::optional<Expression>
{
    const auto maybe_token = peek();
    if (!maybe_token) {
        std::println(stderr, "[ERROR] (parser) Expected primary expression but ran out of tokens");
        return std::nullopt;
    }

    const auto token = *maybe_token;
    switch (token.kind) {
        case TokenKind::Identifier: {
            const auto following = peek(1);
            if (following && following->kind == TokenKind::LeftParen) { return call_expression(); }
            if (following && following->kind == TokenKind::ColonColon) { return constant_definition(); }

            (void)TRY(consume_then_match(TokenKind::Identifier));
            return ast.emplace_expression(Variable { .name = token }, token.span, expression_id++);
        }
        case TokenKind::StringLiteral: {
            return string_literal();
        }
        case TokenKind::Number: {
            return number();
        }
        default: {
            return report_error(token.span, "unexpected {} `{}`", token.kind, token.lexeme);
        }
    }
}

auto Parser::string_literal() -> std::optional<Expression>
{
    const auto token = TRY(consume_then_match(TokenKind::StringLiteral));
    return ast.emplace_expression(StringLiteral { .literal = token }, token.span, expression_id++);
}

auto Parser::number() -> std::optional<Expression>
{
    const auto token = TRY(consume_then_match(TokenKind::Number));
    return ast.emplace_expression(Number { .number = token }, token.span, expression_id++);
}

auto Parser::call_expression() -> std::optional<Expression>
{
    const auto callee = TRY(identifier());
    (void)TRY(consume_then_match(TokenKind::LeftParen));
    const auto arguments = TRY(call_expression_arguments());

    auto end_span = callee.span;
    if (!arguments.empty()) { end_span = ast.expression_by_id(arguments.back()).span; }

    return ast.emplace_expression(
      Call { .identifier = callee, .arguments = arguments }, Span::join(callee.span, end_span), expression_id++
    );
}

// Parses `arg, arg, ...)` once the opening parenthesis has been consumed.
auto Parser::call_expression_arguments() -> std::optional<std::vector<ExpressionId>>
{
    std::vector<ExpressionId> result = {};
    bool expect_argument             = true;
    while (true) {
        const auto token = peek();
        if (!token) {
            std::println(stderr, "[ERROR] (parser) Expected `)` but ran out of tokens");
            return std::nullopt;
        }

        if (token->kind == TokenKind::RightParen) {
            (void)TRY(consume_then_match(TokenKind::RightParen));
            break;
        }

        if (!expect_argument) {
            (void)TRY(consume_then_match(TokenKind::Comma));
            expect_argument = true;
            continue;
        }

        const auto expr = TRY(primary_expression());
        result.push_back(expr.id);
        expect_argument = false;
    }

    return result;
}

auto Parser::constant_definition() -> std::optional<Expression>
{
    const auto name = TRY(identifier());

    (void)TRY(consume_then_match(TokenKind::ColonColon));

    const auto value = TRY(primary_expression());

    return ast.emplace_expression(
      Constant {
        .name  = name,
        .value = value.id,
      },
      Span::join(name.span, value.span),
      expression_id++
    );
}

auto Parser::for_loop() -> std::optional<Expression>
{
    const auto for_token = TRY(consume_then_match(TokenKind::Keyword));
    assert(for_token.lexeme == "for" && "unreachable");

    const auto range_expression = TRY(range());

    (void)TRY(consume_then_match(TokenKind::LeftCurly));

    std::vector<ExpressionId> body;
    while (true) {
        const auto token = peek();
        if (!token) {
            std::println(stderr, "[ERROR] (parser) Expected `}}` to close the `for` body but ran out of tokens");
            return std::nullopt;
        }

        if (token->kind == TokenKind::RightCurly) { break; }

        const auto expr = TRY(expression());
        body.push_back(expr.id);
    }

    const auto right_curly = TRY(consume_then_match(TokenKind::RightCurly));

    return ast.emplace_expression(
      For {
        .range = range_expression.id,
        .body  = body,
      },
      Span::join(for_token.span, right_curly.span),
      expression_id++
    );
}

auto Parser::range() -> std::optional<Expression>
{
    const auto start_range = TRY(consume_then_match(TokenKind::Number));
    (void)TRY(consume_then_match(TokenKind::DotDot));
    const auto end_range = TRY(consume_then_match(TokenKind::Number));

    return ast.emplace_expression(
      Range {
        .start = start_range,
        .end   = end_range,
      },
      Span::join(start_range.span, end_range.span),
      expression_id++
    );
}

auto Parser::identifier() -> std::optional<Token> { return consume_then_match(TokenKind::Identifier); }

auto Parser::consume_then_match(TokenKind expected) -> std::optional<Token>
{
    const auto maybe_token = next();
    if (!maybe_token) {
        std::println(stderr, "[ERROR] (parser) Expected {} but ran out of tokens", expected);
        return std::nullopt;
    }

    const auto token = *maybe_token;
    if (token.kind != expected) {
        return report_error(token.span, "expected {} but got {} `{}`", expected, token.kind, token.lexeme);
    }

    return token;
}

auto Parser::has_more() const -> bool { return cursor < tokens.size(); }

auto Parser::peek(const std::size_t offset) const -> std::optional<Token>
{
    if (cursor + offset < tokens.size()) { return tokens[cursor + offset]; }

    return std::nullopt;
}

auto Parser::next() -> std::optional<Token>
{
    if (has_more()) { return tokens[cursor++]; }

    return std::nullopt;
}

template<typename... Args>
auto Parser::report_error(const Span& span, std::format_string<Args...> fmt, Args&&... args) const -> std::nullopt_t
{
    std::println(
      stderr, "[ERROR] (parser) line {}: {}", span.line_in(source), std::format(fmt, std::forward<Args>(args)...)
    );
    return std::nullopt;
}

Parser::Parser(const std::vector<Token>& tokens, const std::string_view source)
  : tokens { tokens },
    source { source }
{}

} // namespace Interpreter
