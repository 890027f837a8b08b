#include "expression.hpp"

#include "tokenizer.hpp"

namespace veq {

Expression::Expression(std::string text, NodePtr root)
    : source(std::move(text)), tree(std::move(root)) {}

double Expression::evaluate(double x, double t) const noexcept {
    return veq::evaluate(*tree, Bindings{x, t});
}

double Expression::evaluate(const Bindings& bindings) const noexcept {
    return veq::evaluate(*tree, bindings);
}

Expression parse(const std::string& text, const ParserOptions& options) {
    // Этап 1: Лексический анализ
    Tokenizer tokenizer(text);
    auto tokens = tokenizer.tokenize();

    // Этап 2: Синтаксический анализ
    Parser parser(std::move(tokens), options);
    auto root = parser.parse();

    return Expression(text, std::move(root));
}

} // namespace veq
