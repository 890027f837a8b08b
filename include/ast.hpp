#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace veq {

struct Node;

// Узлы дерева неизменяемы после построения
using NodePtr = std::unique_ptr<const Node>;

// Переменные, которые подставляются при каждом вычислении
enum class Variable { X, T };

enum class UnaryOperator { Neg };

enum class BinaryOperator { Add, Sub, Mul, Div, Pow, Mod };

// Встроенные функции одного аргумента
enum class Function {
    Sin, Cos, Tan,
    Asin, Acos, Atan,
    Sinh, Cosh, Tanh,
    Asinh, Acosh, Atanh,
    Rad, Deg,
    Log, Abs, Round, Sign
};

// Числовая константа. Константы pi, e, g тоже превращаются в Literal при разборе
struct Literal {
    double value;
};

struct VariableRef {
    Variable name;
};

struct UnaryOp {
    UnaryOperator op;
    NodePtr operand;
};

struct BinaryOp {
    BinaryOperator op;
    NodePtr left;  // Левый операнд
    NodePtr right; // Правый операнд
};

struct Call {
    Function function;
    NodePtr argument;
};

// Узел абстрактного синтаксического дерева (AST).
// Закрытый набор вариантов: вычислитель обязан обработать каждый из них.
struct Node {
    std::variant<Literal, VariableRef, UnaryOp, BinaryOp, Call> value;
    std::size_t height; // Высота поддерева, у листа равна 1
};

// --- Построение узлов (высота вычисляется автоматически) ---

NodePtr makeLiteral(double value);
NodePtr makeVariable(Variable name);
NodePtr makeUnary(UnaryOperator op, NodePtr operand);
NodePtr makeBinary(BinaryOperator op, NodePtr left, NodePtr right);
NodePtr makeCall(Function function, NodePtr argument);

// --- Таблицы ключевых слов ---

std::optional<Variable> lookupVariable(std::string_view name);

// Значение именованной константы (pi, e, g)
std::optional<double> lookupConstant(std::string_view name);

std::optional<Function> lookupFunction(std::string_view name);

std::string_view functionName(Function function);

// Все допустимые идентификаторы: переменные, константы и имена функций
const std::vector<std::string_view>& keywords();

// Текстовое представление дерева в полностью скобочной записи, например "(-(x ^ 2))"
std::string toString(const Node& node);

} // namespace veq
