#include "ast.hpp"

#include <algorithm>
#include <array>
#include <numbers>
#include <sstream>

namespace veq {

namespace {

// Ускорение свободного падения, константа g
constexpr double kGravity = 9.81;

struct FunctionEntry {
    std::string_view name;
    Function function;
};

// Допустимые математические функции
constexpr std::array<FunctionEntry, 18> kFunctions = {{
    {"sin", Function::Sin},     {"cos", Function::Cos},     {"tan", Function::Tan},
    {"asin", Function::Asin},   {"acos", Function::Acos},   {"atan", Function::Atan},
    {"sinh", Function::Sinh},   {"cosh", Function::Cosh},   {"tanh", Function::Tanh},
    {"asinh", Function::Asinh}, {"acosh", Function::Acosh}, {"atanh", Function::Atanh},
    {"rad", Function::Rad},     {"deg", Function::Deg},     {"log", Function::Log},
    {"abs", Function::Abs},     {"round", Function::Round}, {"sign", Function::Sign},
}};

char operatorSymbol(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Add: return '+';
    case BinaryOperator::Sub: return '-';
    case BinaryOperator::Mul: return '*';
    case BinaryOperator::Div: return '/';
    case BinaryOperator::Pow: return '^';
    case BinaryOperator::Mod: return '%';
    }
    return '?';
}

// Печать узлов в полностью скобочной записи
struct Printer {
    std::ostringstream& out;

    void operator()(const Literal& node) const { out << node.value; }

    void operator()(const VariableRef& node) const {
        out << (node.name == Variable::X ? 'x' : 't');
    }

    void operator()(const UnaryOp& node) const {
        out << "(-";
        std::visit(*this, node.operand->value);
        out << ')';
    }

    void operator()(const BinaryOp& node) const {
        out << '(';
        std::visit(*this, node.left->value);
        out << ' ' << operatorSymbol(node.op) << ' ';
        std::visit(*this, node.right->value);
        out << ')';
    }

    void operator()(const Call& node) const {
        out << functionName(node.function) << '(';
        std::visit(*this, node.argument->value);
        out << ')';
    }
};

} // namespace

NodePtr makeLiteral(double value) {
    return std::make_unique<Node>(Node{Literal{value}, 1});
}

NodePtr makeVariable(Variable name) {
    return std::make_unique<Node>(Node{VariableRef{name}, 1});
}

NodePtr makeUnary(UnaryOperator op, NodePtr operand) {
    std::size_t height = operand->height + 1;
    return std::make_unique<Node>(Node{UnaryOp{op, std::move(operand)}, height});
}

NodePtr makeBinary(BinaryOperator op, NodePtr left, NodePtr right) {
    std::size_t height = std::max(left->height, right->height) + 1;
    return std::make_unique<Node>(Node{BinaryOp{op, std::move(left), std::move(right)}, height});
}

NodePtr makeCall(Function function, NodePtr argument) {
    std::size_t height = argument->height + 1;
    return std::make_unique<Node>(Node{Call{function, std::move(argument)}, height});
}

std::optional<Variable> lookupVariable(std::string_view name) {
    if (name == "x") {
        return Variable::X;
    }
    if (name == "t") {
        return Variable::T;
    }
    return std::nullopt;
}

std::optional<double> lookupConstant(std::string_view name) {
    if (name == "pi") {
        return std::numbers::pi;
    }
    if (name == "e") {
        return std::numbers::e;
    }
    if (name == "g") {
        return kGravity;
    }
    return std::nullopt;
}

std::optional<Function> lookupFunction(std::string_view name) {
    for (const auto& entry : kFunctions) {
        if (entry.name == name) {
            return entry.function;
        }
    }
    return std::nullopt;
}

std::string_view functionName(Function function) {
    for (const auto& entry : kFunctions) {
        if (entry.function == function) {
            return entry.name;
        }
    }
    return "?";
}

const std::vector<std::string_view>& keywords() {
    static const std::vector<std::string_view> words = [] {
        std::vector<std::string_view> result = {"x", "t", "pi", "e", "g"};
        for (const auto& entry : kFunctions) {
            result.push_back(entry.name);
        }
        return result;
    }();
    return words;
}

std::string toString(const Node& node) {
    std::ostringstream out;
    std::visit(Printer{out}, node.value);
    return out.str();
}

} // namespace veq
