#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "loglens/expr/Expression.hpp"

namespace LogLens
{
    namespace Expr
    {
        /// Runtime value of an expression: null, boolean, number or string.
        using Value = std::variant<std::monostate, bool, double, std::string>;

        /// Truthiness: null/false are false, numbers when non-zero, strings when non-empty.
        bool isTruthy(const Value &value) noexcept;

        /// Text form of a value ("null", "true", "3", "2.5", or the string itself).
        std::string toDisplayString(const Value &value);

        /**
         * CompiledExpression
         *
         * Immutable parsed form of one expression. Cheap to copy (shared AST)
         * and safe to evaluate from several threads.
         */
        class CompiledExpression
        {
        public:
            struct Node;

            CompiledExpression(std::shared_ptr<const Node> root, std::string source);

            /// Evaluate against an event; throws Core::EvaluationError on type errors.
            Value evaluate(const Core::Event &event) const;

            const std::string &source() const noexcept { return m_source; }

        private:
            std::shared_ptr<const Node> m_root;
            std::string                 m_source;
        };

        /**
         * ExpressionEngine
         *
         * Restricted expression language over a single event. Nothing but the
         * event's fields is reachable, and there is no assignment, loop or
         * user-defined function.
         *
         * Grammar (lowest to highest precedence):
         *   or / ||
         *   and / &&
         *   not / !
         *   == != < <= > >= in, not in
         *   + -
         *   * / %
         *   unary -
         *   literals, fields, calls, (expr), (a, b), [a, b]
         *
         * Fields: level, source, message, timestamp (epoch seconds),
         * metadata.a.b and metadata['key'], each optionally prefixed with "event.".
         *
         * Functions: contains, startswith, endswith, lower, upper, len,
         * exists, number, abs, str, coalesce.
         *
         * Example:
         *   event.level in ('ERROR', 'CRITICAL') and not contains(message, 'healthcheck')
         */
        class ExpressionEngine : public IExpressionCompiler
        {
        public:
            ExpressionEngine() = default;

            /// Parse an expression; throws Core::ConfigurationError on syntax errors.
            CompiledExpression compile(std::string_view expression) const;

            EventPredicate compilePredicate(std::string_view expression) const override;

            /// Null keys raise Core::EvaluationError; other values use their display text.
            GroupKeyExtractor compileGroupKey(std::string_view expression) const override;

            /// Non-numeric results raise Core::EvaluationError.
            ValueExtractor compileValue(std::string_view expression) const override;
        };

    } // namespace Expr
} // namespace LogLens
