#pragma once

#include "ast.hpp"

namespace veq {

// Значения переменных для одного вычисления.
// Принадлежат вызывающему коду (циклу отрисовки), а не выражению.
struct Bindings {
    double x = 0.0;
    double t = 0.0;
};

// Рекурсивно вычисляет значение поддерева.
// Чистая функция: не бросает исключений и не имеет общего изменяемого состояния.
// Ошибки области определения возвращаются как NaN, полюса — как ±Infinity.
double evaluate(const Node& node, const Bindings& bindings) noexcept;

// Применение бинарной операции по правилам IEEE-754
double applyOperator(BinaryOperator op, double left, double right) noexcept;

// Применение встроенной функции к аргументу
double applyFunction(Function function, double argument) noexcept;

} // namespace veq
