#include <optional>
#include <string_view>
#include <variant>

#include <gtest/gtest.h>

#include "lang/Lexer.hpp"
#include "lang/Parser.hpp"

using namespace Interpreter;

namespace
{

[[nodiscard]] auto parse_source(const std::string_view source) -> std::optional<Ast>
{
    const auto tokens = Lexer::lex(source);
    if (!tokens) { return std::nullopt; }
    return Parser::parse(*tokens, source);
}

[[nodiscard]] auto statement_expression(const Ast& ast, const std::size_t idx) -> const Expression&
{
    return ast.expression_by_id(std::get<ExpressionId>(ast.statements.at(idx).kind));
}

} // namespace

TEST(ParserTest, CallExpressionArguments)
{
    const auto ast = parse_source(R"(spawn_process("P1", 0, 5, 1))");
    ASSERT_TRUE(ast.has_value());
    ASSERT_EQ(ast->statements.size(), 1UZ);

    const auto& expression = statement_expression(*ast, 0);
    const auto* call       = std::get_if<Call>(&expression.kind);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->identifier.lexeme, "spawn_process");
    ASSERT_EQ(call->arguments.size(), 4UZ);

    EXPECT_TRUE(std::holds_alternative<StringLiteral>(ast->expression_by_id(call->arguments[0]).kind));
    EXPECT_TRUE(std::holds_alternative<Number>(ast->expression_by_id(call->arguments[3]).kind));
}

TEST(ParserTest, CallWithoutArguments)
{
    const auto ast = parse_source("spawn_random_process()");
    ASSERT_TRUE(ast.has_value());

    const auto* call = std::get_if<Call>(&statement_expression(*ast, 0).kind);
    ASSERT_NE(call, nullptr);
    EXPECT_TRUE(call->arguments.empty());
}

TEST(ParserTest, BareIdentifierArgumentIsVariable)
{
    const auto ast = parse_source("schedule_policy(sjf)");
    ASSERT_TRUE(ast.has_value());

    const auto* call = std::get_if<Call>(&statement_expression(*ast, 0).kind);
    ASSERT_NE(call, nullptr);
    ASSERT_EQ(call->arguments.size(), 1UZ);

    const auto* variable = std::get_if<Variable>(&ast->expression_by_id(call->arguments[0]).kind);
    ASSERT_NE(variable, nullptr);
    EXPECT_EQ(variable->name.lexeme, "sjf");
}

TEST(ParserTest, ConstantDefinition)
{
    const auto ast = parse_source("quantum :: 2");
    ASSERT_TRUE(ast.has_value());

    const auto* constant = std::get_if<Constant>(&statement_expression(*ast, 0).kind);
    ASSERT_NE(constant, nullptr);
    EXPECT_EQ(constant->name.lexeme, "quantum");

    const auto* value = std::get_if<Number>(&ast->expression_by_id(constant->value).kind);
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->number.lexeme, "2");
}

TEST(ParserTest, ForLoopWithBody)
{
    const auto ast = parse_source("for 0..3 {\n    spawn_random_process()\n    spawn_process(\"X\", 1, 2, 3)\n}\nquantum :: 1");
    ASSERT_TRUE(ast.has_value());
    ASSERT_EQ(ast->statements.size(), 2UZ);

    const auto* loop = std::get_if<For>(&statement_expression(*ast, 0).kind);
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->body.size(), 2UZ);

    const auto* range = std::get_if<Range>(&ast->expression_by_id(loop->range).kind);
    ASSERT_NE(range, nullptr);
    EXPECT_EQ(range->start.lexeme, "0");
    EXPECT_EQ(range->end.lexeme, "3");

    EXPECT_TRUE(std::holds_alternative<Constant>(statement_expression(*ast, 1).kind));
}

TEST(ParserTest, ExpressionIdsIndexTheExpressionTable)
{
    const auto ast = parse_source("spawn_process(\"A\", 0, 1, 0)\nspawn_process(\"B\", 0, 1, 0)");
    ASSERT_TRUE(ast.has_value());

    for (std::size_t idx = 0; idx < ast->expressions.size(); ++idx) { EXPECT_EQ(ast->expressions[idx].id, idx); }
}

TEST(ParserTest, MalformedInputFails)
{
    EXPECT_FALSE(parse_source("spawn_process(\"P1\", 0 5, 1)").has_value());
    EXPECT_FALSE(parse_source("spawn_process(\"P1\", 0, 5, 1").has_value());
    EXPECT_FALSE(parse_source("for 0..3 { spawn_random_process()").has_value());
    EXPECT_FALSE(parse_source("for x..3 { }").has_value());
    EXPECT_FALSE(parse_source("quantum ::").has_value());
    EXPECT_FALSE(parse_source(")").has_value());
}
