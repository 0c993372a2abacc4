#pragma once

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <format>
#include <memory>
#include <print>
#include <ranges>
#include <string>
#include <utility>
#include <variant>

#include "Lexer.hpp"
#include "Parser.hpp"
#include "scheduling/Scheduler.hpp"
#include "Util.hpp"

namespace Interpreter
{

struct [[nodiscard]] Value final
{
    using ValueType = std::variant<std::string_view, std::size_t, std::monostate>;

    Value()
      : value { std::monostate {} }
    {}

    explicit Value(const std::string_view string)
      : value { string }
    {}

    explicit Value(const std::size_t number)
      : value { number }
    {}

    [[nodiscard]] constexpr auto is_string() const -> bool { return std::holds_alternative<std::string_view>(value); }

    [[nodiscard]] constexpr auto as_string() const -> std::string_view
    {
        return Util::get<std::string_view>(value).value();
    }

    template<std::invocable Callback>
    [[nodiscard]] constexpr auto as_string_or(Callback callback) const -> std::optional<std::string_view>
    {
        return is_string() ? as_string() : callback();
    }

    [[nodiscard]] constexpr auto is_number() const -> bool { return std::holds_alternative<std::size_t>(value); }

    [[nodiscard]] constexpr auto as_number() const -> std::size_t { return Util::get<std::size_t>(value).value(); }

    template<std::invocable Callback>
    [[nodiscard]] constexpr auto as_number_or(Callback callback) const -> std::optional<std::size_t>
    {
        return is_number() ? as_number() : callback();
    }

    [[nodiscard]] constexpr auto is_monostate() const -> bool { return std::holds_alternative<std::monostate>(value); }

  private:
    ValueType value;
};

// Evaluates a batch script against `Sim`, which exposes the fields of Scheduling::Batch.
template<typename Sim>
class [[nodiscard]] Interpreter final
{
  public:
    [[nodiscard]] static auto eval(const std::string_view file_content, const std::shared_ptr<Sim>& sim) -> bool
    {
        const auto tokens = Lexer::lex(file_content);
        if (!tokens) { return false; }

#ifdef DEBUG
        std::println("- Tokens -");
        for (const auto& [idx, token] : std::views::zip(std::views::iota(0), *tokens)) {
            std::println("#{}: {}", idx, token);
        }
#endif

        const auto ast = Parser::parse(*tokens, file_content);
        if (!ast) { return false; }

#ifdef DEBUG
        std::println("- Statements -");
        for (const auto& [idx, statement] : std::views::zip(std::views::iota(0), ast->statements)) {
            std::println("#{}: {}", idx, statement);
        }

        std::println("- Expressions -");
        for (const auto& [idx, expression] : std::views::zip(std::views::iota(0), ast->expressions)) {
            std::println("#{}: {}", idx, expression);
        }
#endif

        Interpreter interpreter(sim, *ast, file_content);
        return interpreter.evaluate_ast().has_value();
    }

  private:
    [[nodiscard]] auto evaluate_ast() -> std::optional<bool>
    {
        for (const auto& statement : ast.statements) { (void)TRY(evaluate_statement(statement)); }
        return true;
    }

    [[nodiscard]] auto evaluate_statement(const Statement& statement) -> std::optional<bool>
    {
        const auto expression_visitor = [this](const ExpressionId& expr_id) -> std::optional<bool> {
            (void)TRY(evaluate_expression(ast.expression_by_id(expr_id)));
            return true;
        };

        const auto visitor = Util::make_visitor(expression_visitor);
        return std::visit(visitor, statement.kind);
    }

    [[nodiscard]] auto evaluate_expression(const Expression& expression) -> std::optional<Value>
    {
        static_assert(
          std::variant_size_v<ExpressionKind> == 7,
          "Exhaustive handling for all variants for ExpressionKind is required"
        );
        const auto call_expression_visitor = [&](const Call& call_expression) -> std::optional<Value> {
            const auto& [name, arguments] = call_expression;
            if (!is_builtin(name)) {
                report_error(expression.span, "unknown function `{}`", name.lexeme);
                return report_note("available functions are: spawn_process, spawn_random_process, schedule_policy");
            }

            return builtin_handler(name.lexeme, expression.span, arguments);
        };

        const auto string_literal_visitor = [](const StringLiteral& string_literal) -> std::optional<Value> {
            return Value(string_literal.literal.lexeme);
        };

        const auto number_visitor = [](const Number& number) -> std::optional<Value> {
            const auto parsed_number = TRY(Util::parse_number(number.number.lexeme));
            return Value(parsed_number);
        };

        const auto variable_visitor = [](const Variable& variable) -> std::optional<Value> {
            return Value(variable.name.lexeme);
        };

        const auto constant_visitor = [&](const Constant& constant) -> std::optional<Value> {
            return evaluate_constant(constant, expression.span);
        };

        const auto range_visitor = [&](const Range& range) -> std::optional<Value> {
            return report_error(expression.span, "range `{}..{}` is only valid in a `for` loop", range.start.lexeme, range.end.lexeme);
        };

        const auto for_visitor = [this](const For& four) -> std::optional<Value> {
            return evaluate_for_expression(four);
        };

        const auto visitor = Util::make_visitor(
          call_expression_visitor,
          string_literal_visitor,
          number_visitor,
          variable_visitor,
          constant_visitor,
          range_visitor,
          for_visitor
        );

        return std::visit(visitor, expression.kind);
    }

    [[nodiscard]] auto evaluate_constant(const Constant& constant, const Span& span) -> std::optional<Value>
    {
        const auto name        = constant.name.lexeme;
        const auto value_expr  = ast.expression_by_id(constant.value);
        const auto maybe_value = Util::get<Number>(value_expr.kind);
        if (!maybe_value) { return report_error(span, "constant `{}` expects a number", name); }

        const auto value = TRY(Util::parse_number(maybe_value->number.lexeme));

        if (name == "quantum") {
            sim->options.quantum = static_cast<std::int64_t>(value);
        } else if (name == "corrected") {
            sim->options.compatibility =
              value != 0 ? Scheduling::Compatibility::Corrected : Scheduling::Compatibility::Reference;
        } else if (name == "max_processes") {
            sim->max_processes = value;
        } else if (name == "max_arrival_time") {
            sim->max_arrival_time = value;
        } else if (name == "max_burst_duration") {
            sim->max_burst_duration = value;
        } else if (name == "max_priority") {
            sim->max_priority = value;
        } else {
            report_error(span, "invalid constant for current simulation: {}", name);
            return report_note(
              "available constants are: quantum, corrected, max_processes, max_arrival_time, max_burst_duration, "
              "max_priority"
            );
        }

        return Value();
    }

    [[nodiscard]] auto evaluate_for_expression(const For& four) -> std::optional<Value>
    {
        const auto range = TRY(Util::get<Range>(ast.expression_by_id(four.range).kind));
        const auto start = TRY(Util::parse_number(range.start.lexeme));
        const auto end   = TRY(Util::parse_number(range.end.lexeme));

        for (std::size_t i = start; i < end; ++i) {
            for (const auto& expr_id : four.body) { (void)TRY(evaluate_expression(ast.expression_by_id(expr_id))); }
        }

        return Value();
    }

    [[nodiscard]] constexpr static auto is_builtin(const Token& token) -> bool
    {
        constexpr static std::string_view builtins[] = { "spawn_process", "spawn_random_process", "schedule_policy" };
        return std::ranges::contains(builtins, token.lexeme);
    }

    [[nodiscard]] auto spawn_process_builtin(const Span& span, const std::vector<Expression>& arguments)
      -> std::optional<Value>
    {
        constexpr static auto NAME = "spawn_process";
        constexpr static auto ARGC = 4;
        if (arguments.size() != ARGC) { return report_function_call_mismatched_argc(span, NAME, ARGC, arguments.size()); }

        std::size_t argument_count = 0;

        const auto name_value = TRY(evaluate_expression(arguments[argument_count++]));
        const auto name       = TRY(name_value.as_string_or([&] -> std::optional<std::string_view> {
            return report_error(
              span, "mismatched type for argument #{} of builtin `{}`: expected type `string`", argument_count - 1, NAME
            );
        }));

        const auto expect_number = [&](const std::string_view what) -> std::optional<std::int64_t> {
            const auto value  = TRY(evaluate_expression(arguments[argument_count++]));
            const auto number = TRY(value.as_number_or([&] -> std::optional<std::size_t> {
                return report_error(
                  span,
                  "mismatched type for argument #{} ({}) of builtin `{}`: expected type `int`",
                  argument_count - 1,
                  what,
                  NAME
                );
            }));
            return static_cast<std::int64_t>(number);
        };

        const auto arrival  = TRY(expect_number("arrival"));
        const auto burst    = TRY(expect_number("burst"));
        const auto priority = TRY(expect_number("priority"));

        sim->emplace_process(std::string { name }, arrival, burst, priority);

        return Value();
    }

    [[nodiscard]] auto spawn_random_process_builtin(const Span& span, const std::vector<Expression>& arguments)
      -> std::optional<Value>
    {
        constexpr static auto NAME = "spawn_random_process";
        constexpr static auto ARGC = 0;
        if (arguments.size() != ARGC) { return report_function_call_mismatched_argc(span, NAME, ARGC, arguments.size()); }

        if (sim->random_spawned >= sim->max_processes) {
            report_error(span, "cannot spawn more than {} random processes", sim->max_processes);
            return report_note("raise the limit with `max_processes :: <count>`");
        }

        const auto name_taken = [&](const std::string& name) {
            return std::ranges::any_of(sim->processes, [&](const auto& process) { return process.name == name; });
        };

        auto name = std::string {};
        do {
            name = std::format("P{}", ++sim->random_suffix);
        } while (name_taken(name));

        const auto arrival  = Util::random_natural(0, sim->max_arrival_time);
        const auto burst    = Util::random_natural(1, sim->max_burst_duration);
        const auto priority = Util::random_natural(0, sim->max_priority);

        ++sim->random_spawned;
        sim->emplace_process(
          std::move(name),
          static_cast<std::int64_t>(arrival),
          static_cast<std::int64_t>(burst),
          static_cast<std::int64_t>(priority)
        );

        return Value();
    }

    [[nodiscard]] auto schedule_policy_builtin(const Span& span, const std::vector<Expression>& arguments)
      -> std::optional<Value>
    {
        constexpr static auto NAME = "schedule_policy";
        constexpr static auto ARGC = 1;
        if (arguments.size() != ARGC) { return report_function_call_mismatched_argc(span, NAME, ARGC, arguments.size()); }

        const auto policy_value = TRY(evaluate_expression(arguments.front()));
        const auto policy_name  = TRY(policy_value.as_string_or([&] -> std::optional<std::string_view> {
            return report_error(span, "mismatched type for argument #0 of builtin `{}`: expected a policy name", NAME);
        }));

        sim->schedule_policy = TRY(Scheduling::schedule_policy_try_from_str(policy_name));

        return Value();
    }

    [[nodiscard]] auto builtin_handler(
      const std::string_view            name,
      const Span&                       span,
      const std::vector<ExpressionId>& arguments
    ) -> std::optional<Value>
    {
        const auto arguments_exprs = materialize_expressions(arguments);

        if (name == "spawn_process") { return spawn_process_builtin(span, arguments_exprs); }
        if (name == "spawn_random_process") { return spawn_random_process_builtin(span, arguments_exprs); }
        if (name == "schedule_policy") { return schedule_policy_builtin(span, arguments_exprs); }

        assert(false && "unreachable");
        return Value();
    }

    auto report_function_call_mismatched_argc(
      const Span&            span,
      const std::string_view name,
      const std::size_t      expected,
      const std::size_t      got
    ) const -> std::nullopt_t
    {
        return report_error(
          span, "failed to interpret call to builtin `{}`: expected {} arguments, {} were provided", name, expected, got
        );
    }

    template<typename... Args>
    auto report_error(const Span& span, std::format_string<Args...> fmt, Args&&... args) const -> std::nullopt_t
    {
        std::println(
          stderr,
          "[ERROR] (interpreter) line {}: {}",
          span.line_in(source),
          std::format(fmt, std::forward<Args>(args)...)
        );
        return std::nullopt;
    }

    static auto report_note(const std::string_view message) -> std::nullopt_t
    {
        std::println(stderr, "[NOTE] (interpreter) {}", message);
        return std::nullopt;
    }

    [[nodiscard]] auto materialize_expressions(const std::vector<ExpressionId>& expr_ids) const
      -> std::vector<Expression>
    {
        return std::views::transform(
                 expr_ids, [this](const auto& expr_id) -> Expression { return ast.expression_by_id(expr_id); }
               )
               | std::ranges::to<std::vector>();
    }

    explicit Interpreter(const std::shared_ptr<Sim>& sim, Ast ast, const std::string_view source)
      : sim { sim },
        ast { std::move(ast) },
        source { source }
    {}

    std::shared_ptr<Sim> sim;
    Ast                  ast;
    std::string_view     source;
};

} // namespace Interpreter
