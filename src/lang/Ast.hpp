#pragma once

#include <format>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "Span.hpp"
#include "Token.hpp"

namespace Interpreter
{

using ExpressionId  = std::size_t;
using StatementKind = std::variant<ExpressionId>;

struct [[nodiscard]] Call final
{
    Token                     identifier;
    std::vector<ExpressionId> arguments;
};

struct [[nodiscard]] StringLiteral final
{
    Token literal;
};

struct [[nodiscard]] Number final
{
    Token number;
};

struct [[nodiscard]] Variable final
{
    Token name;
};

// `name :: value`
struct [[nodiscard]] Constant final
{
    Token        name;
    ExpressionId value;
};

// `start..end`, end excluded
struct [[nodiscard]] Range final
{
    Token start;
    Token end;
};

struct [[nodiscard]] For final
{
    ExpressionId              range;
    std::vector<ExpressionId> body;
};

using ExpressionKind = std::variant<Call, StringLiteral, Number, Variable, Constant, Range, For>;

struct [[nodiscard]] Expression final
{
    ExpressionKind kind;
    Span           span;
    std::size_t    id;
};

struct [[nodiscard]] Statement final
{
    StatementKind kind;
    Span          span;
    std::size_t   id;
};

struct [[nodiscard]] Ast final
{
    std::vector<Statement>  statements;
    std::vector<Expression> expressions;

    [[nodiscard]] auto expression_by_id(const std::size_t id) const -> const Expression& { return expressions[id]; }

    template<typename... Args>
    auto emplace_expression(Args&&... args) -> Expression&
    {
        return expressions.emplace_back(std::forward<Args>(args)...);
    }
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::Statement>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Statement& statement, auto& ctx) const
    {
        static_assert(
          std::variant_size_v<Interpreter::StatementKind> == 1,
          "Exhaustive handling of all variants for StatementKind is required."
        );
        return std::format_to(
          ctx.out(),
          "Statement {{ kind = ExpressionId {{ id = {} }}, span = {}, id = {} }}",
          std::get<Interpreter::ExpressionId>(statement.kind),
          statement.span,
          statement.id
        );
    }
};

template<>
struct std::formatter<Interpreter::ExpressionKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::ExpressionKind& kind, auto& ctx) const
    {
        const auto join_expressions = [](const auto& arguments) -> std::string {
            std::stringstream ss;
            for (std::size_t i = 0; i < arguments.size(); ++i) {
                ss << std::format("ExpressionId(#{})", arguments[i]);
                if (i != arguments.size() - 1) { ss << ", "; }
            }
            return ss.str();
        };

        static_assert(
          std::variant_size_v<Interpreter::ExpressionKind> == 7,
          "Exhaustive handling of all variants for ExpressionKind is required."
        );
        const auto result = std::visit(
          [&](const auto& value) -> std::string {
              using Type = std::decay_t<decltype(value)>;
              if constexpr (std::is_same_v<Type, Interpreter::Call>) {
                  return std::format(
                    "Call {{ identifier = {}, arguments = {} }}", value.identifier, join_expressions(value.arguments)
                  );
              } else if constexpr (std::is_same_v<Type, Interpreter::StringLiteral>) {
                  return std::format("StringLiteral {{ literal = {} }}", value.literal.lexeme);
              } else if constexpr (std::is_same_v<Type, Interpreter::Number>) {
                  return std::format("Number {{ number = {} }}", value.number.lexeme);
              } else if constexpr (std::is_same_v<Type, Interpreter::Variable>) {
                  return std::format("Variable {{ name = {} }}", value.name.lexeme);
              } else if constexpr (std::is_same_v<Type, Interpreter::Constant>) {
                  return std::format("Constant {{ name = {}, value = ExpressionId(#{}) }}", value.name.lexeme, value.value);
              } else if constexpr (std::is_same_v<Type, Interpreter::Range>) {
                  return std::format("Range {{ start = {}, end = {} }}", value.start.lexeme, value.end.lexeme);
              } else if constexpr (std::is_same_v<Type, Interpreter::For>) {
                  return std::format(
                    "For {{ range = ExpressionId(#{}), body = {} }}", value.range, join_expressions(value.body)
                  );
              } else {
                  static_assert(false, "Unhandled ExpressionKind variant alternative");
              }
          },
          kind
        );

        return std::format_to(ctx.out(), "{}", result);
    }
};

template<>
struct std::formatter<Interpreter::Expression>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Expression& expression, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "Expression {{ kind = {}, span = {}, id = {} }}", expression.kind, expression.span, expression.id
        );
    }
};
