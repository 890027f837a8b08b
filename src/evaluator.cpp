#include "evaluator.hpp"

#include <cmath>
#include <limits>
#include <numbers>

namespace veq {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Округление до ближайшего целого, половины — к четному (2.5 -> 2, 3.5 -> 4).
// Не зависит от текущего режима округления FPU.
double roundHalfEven(double value) {
    double rounded = std::round(value);
    if (std::abs(value - std::trunc(value)) == 0.5) {
        rounded = 2.0 * std::round(value / 2.0);
    }
    return rounded;
}

double sign(double value) {
    if (std::isnan(value)) {
        return value;
    }
    if (value < 0.0) {
        return -1.0;
    }
    if (value > 0.0) {
        return 1.0;
    }
    return 0.0;
}

// Обход дерева: по одной перегрузке на каждый вид узла
struct Evaluator {
    const Bindings& bindings;

    double operator()(const Literal& node) const { return node.value; }

    double operator()(const VariableRef& node) const {
        return node.name == Variable::X ? bindings.x : bindings.t;
    }

    double operator()(const UnaryOp& node) const {
        double operand = std::visit(*this, node.operand->value);
        switch (node.op) {
        case UnaryOperator::Neg:
            return -operand;
        }
        return kNaN;
    }

    double operator()(const BinaryOp& node) const {
        double left = std::visit(*this, node.left->value);
        double right = std::visit(*this, node.right->value);
        return applyOperator(node.op, left, right);
    }

    double operator()(const Call& node) const {
        return applyFunction(node.function, std::visit(*this, node.argument->value));
    }
};

} // namespace

double evaluate(const Node& node, const Bindings& bindings) noexcept {
    return std::visit(Evaluator{bindings}, node.value);
}

double applyOperator(BinaryOperator op, double left, double right) noexcept {
    switch (op) {
    case BinaryOperator::Add:
        return left + right;
    case BinaryOperator::Sub:
        return left - right;
    case BinaryOperator::Mul:
        return left * right;
    case BinaryOperator::Div:
        // Деление на ноль дает ±inf или NaN для 0/0
        return left / right;
    case BinaryOperator::Pow:
        // Отрицательное основание с дробным показателем дает NaN
        return std::pow(left, right);
    case BinaryOperator::Mod:
        // Остаток со знаком делимого; x % 0 = NaN
        return std::fmod(left, right);
    }
    return kNaN;
}

double applyFunction(Function function, double argument) noexcept {
    switch (function) {
    // Тригонометрические функции
    case Function::Sin:
        return std::sin(argument);
    case Function::Cos:
        return std::cos(argument);
    case Function::Tan:
        return std::tan(argument);

    // Обратные тригонометрические функции (вне [-1;1] дают NaN)
    case Function::Asin:
        return std::asin(argument);
    case Function::Acos:
        return std::acos(argument);
    case Function::Atan:
        return std::atan(argument);

    // Гиперболические функции
    case Function::Sinh:
        return std::sinh(argument);
    case Function::Cosh:
        return std::cosh(argument);
    case Function::Tanh:
        return std::tanh(argument);
    case Function::Asinh:
        return std::asinh(argument);
    case Function::Acosh:
        return std::acosh(argument);
    case Function::Atanh:
        return std::atanh(argument);

    // Перевод градусов в радианы и обратно
    case Function::Rad:
        return argument * std::numbers::pi / 180.0;
    case Function::Deg:
        return argument * 180.0 / std::numbers::pi;

    case Function::Log:
        // Натуральный логарифм определен только для положительных чисел
        return argument > 0.0 ? std::log(argument) : kNaN;
    case Function::Abs:
        return std::fabs(argument);
    case Function::Round:
        return roundHalfEven(argument);
    case Function::Sign:
        return sign(argument);
    }
    return kNaN;
}

} // namespace veq
