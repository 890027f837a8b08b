#pragma once

#include <string>

#include "ast.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "parser.hpp"

namespace veq {

// Разобранное уравнение y = f(x, t).
// Строится один раз из строки и затем многократно вычисляется.
// Неизменяемо: один экземпляр можно вычислять из нескольких потоков без блокировок.
class Expression {
public:
    Expression(std::string text, NodePtr root);

    Expression(Expression&&) noexcept = default;
    Expression& operator=(Expression&&) noexcept = default;
    Expression(const Expression&) = delete;
    Expression& operator=(const Expression&) = delete;

    // Значение выражения в точке (x, t). Никогда не бросает исключений.
    double evaluate(double x, double t) const noexcept;

    double evaluate(const Bindings& bindings) const noexcept;

    const std::string& text() const { return source; }
    const Node& root() const { return *tree; }

private:
    std::string source;
    NodePtr tree;
};

// Полный цикл построения выражения:
// 1. Токенизация (Tokenizer)
// 2. Парсинг (Parser) -> построение AST
// Выбрасывает LexError или ParseError (оба наследуют SyntaxError).
Expression parse(const std::string& text, const ParserOptions& options = {});

} // namespace veq
