#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "Ast.hpp"
#include "Token.hpp"

namespace Interpreter
{

class [[nodiscard]] Parser final
{
  public:
    [[nodiscard]] static auto parse(const std::vector<Token>& tokens, std::string_view source = {})
      -> std::optional<Ast>;

  private:
    explicit Parser(const std::vector<Token>& tokens, std::string_view source);

    [[nodiscard]] auto expression_statement() -> std::optional<Statement>;

    [[nodiscard]] auto expression() -> std::optional<Expression>;
    [[nodiscard]] auto primary_expression() -> std::optional<Expression>;
    [[nodiscard]] auto string_literal() -> std::optional<Expression>;
    [[nodiscard]] auto number() -> std::optional<Expression>;
    [[nodiscard]] auto call_expression() -> std::optional<Expression>;
    [[nodiscard]] auto call_expression_arguments() -> std::optional<std::vector<ExpressionId>>;
    [[nodiscard]] auto constant_definition() -> std::optional<Expression>;
    [[nodiscard]] auto for_loop() -> std::optional<Expression>;
    [[nodiscard]] auto range() -> std::optional<Expression>;

    [[nodiscard]] auto identifier() -> std::optional<Token>;

    [[nodiscard]] auto consume_then_match(TokenKind expected) -> std::optional<Token>;

    [[nodiscard]] auto has_more() const -> bool;
    [[nodiscard]] auto peek(const std::size_t offset = 0) const -> std::optional<Token>;
    [[nodiscard]] auto next() -> std::optional<Token>;

    template<typename... Args>
    auto report_error(const Span& span, std::format_string<Args...> fmt, Args&&... args) const -> std::nullopt_t;

  private:
    std::vector<Token> tokens;
    std::string_view   source;
    std::size_t        cursor = 0;

    Ast         ast           = {};
    std::size_t expression_id = 0;
};

} // namespace Interpreter
