#include "parser.hpp"

#include <utility>

#include "errors.hpp"

namespace veq {

Parser::Parser(std::vector<Token> tokens, ParserOptions options)
    : tokens(std::move(tokens)), options(options) {}

Parser::DepthGuard::DepthGuard(Parser& parser) : parser(parser) {
    if (++parser.depth > parser.options.maxDepth) {
        --parser.depth;
        parser.fail(parser.peek(), "expression too deeply nested");
    }
}

Parser::DepthGuard::~DepthGuard() {
    --parser.depth;
}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
NodePtr Parser::parse() {
    auto exprNode = parseExpression();
    if (!isAtEnd()) {
        if (peek().type == TokenType::RParen) {
            fail(peek(), "unexpected ')'");
        }
        fail(peek(), "unexpected token", "end of expression");
    }
    return exprNode;
}

const Token& Parser::peek() const {
    return tokens[current];
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

bool Parser::matchOperator(char op) {
    const Token& token = peek();
    if (token.type == TokenType::Operator && token.text[0] == op) {
        ++current;
        return true;
    }
    return false;
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& errorMessage,
                             const std::string& expected) {
    if (match(type)) {
        return tokens[current - 1];
    }
    fail(peek(), errorMessage, expected);
}

NodePtr Parser::checkHeight(NodePtr node) const {
    if (node->height > options.maxHeight) {
        fail(peek(), "expression too complex");
    }
    return node;
}

void Parser::fail(const Token& token, const std::string& message,
                  const std::string& expected) const {
    std::string found = token.type == TokenType::End ? "end of expression" : token.text;
    throw ParseError(token.position, message, expected, found);
}

// Грамматика: Expression -> Term { ("+" | "-") Term }
NodePtr Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        if (matchOperator('+')) {
            auto right = parseTerm();
            node = checkHeight(makeBinary(BinaryOperator::Add, std::move(node), std::move(right)));
        } else if (matchOperator('-')) {
            auto right = parseTerm();
            node = checkHeight(makeBinary(BinaryOperator::Sub, std::move(node), std::move(right)));
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Term -> Unary { ("*" | "/" | "%") Unary }
NodePtr Parser::parseTerm() {
    auto node = parseUnary();
    while (true) {
        BinaryOperator op;
        if (matchOperator('*')) {
            op = BinaryOperator::Mul;
        } else if (matchOperator('/')) {
            op = BinaryOperator::Div;
        } else if (matchOperator('%')) {
            op = BinaryOperator::Mod;
        } else {
            break;
        }
        auto right = parseUnary();
        node = checkHeight(makeBinary(op, std::move(node), std::move(right)));
    }
    return node;
}

// Грамматика: Unary -> "-" Unary | Power
// Унарный минус применяется ко всей степени: -x^2 = -(x^2)
NodePtr Parser::parseUnary() {
    DepthGuard guard(*this);
    if (matchOperator('-')) {
        return checkHeight(makeUnary(UnaryOperator::Neg, parseUnary()));
    }
    return parsePower();
}

// Грамматика: Power -> Primary [ "^" Unary ]
// Правая ассоциативность: 2^3^2 = 2^(3^2); показатель может начинаться с минуса: 2^-x
NodePtr Parser::parsePower() {
    auto base = parsePrimary();
    if (matchOperator('^')) {
        auto exponent = parseUnary();
        return checkHeight(makeBinary(BinaryOperator::Pow, std::move(base), std::move(exponent)));
    }
    return base;
}

// Грамматика: Primary -> Number | Identifier | Function "(" Expression ")" | "(" Expression ")"
NodePtr Parser::parsePrimary() {
    // Число
    if (match(TokenType::Number)) {
        return makeLiteral(tokens[current - 1].numericValue);
    }

    // Переменная, константа или вызов функции
    if (match(TokenType::Identifier)) {
        return parseIdentifier(tokens[current - 1]);
    }

    // Группировка скобками
    if (match(TokenType::LParen)) {
        auto node = parseExpression();
        consume(TokenType::RParen, "expected ')'", ")");
        return node;
    }

    const Token& token = peek();
    if (token.type == TokenType::RParen) {
        fail(token, "unexpected ')'", "operand");
    }
    if (token.type == TokenType::End) {
        fail(token, "unexpected end of expression", "operand");
    }
    fail(token, "unexpected token", "operand");
}

// Разбор идентификатора: переменные x и t, константы pi, e, g и вызовы функций.
// Константы сразу подставляются как числа.
NodePtr Parser::parseIdentifier(const Token& token) {
    if (auto variable = lookupVariable(token.text)) {
        return makeVariable(*variable);
    }
    if (auto constant = lookupConstant(token.text)) {
        return makeLiteral(*constant);
    }
    if (auto function = lookupFunction(token.text)) {
        consume(TokenType::LParen, "expected '(' after function name", "(");
        auto argument = parseExpression();
        consume(TokenType::RParen, "expected ')'", ")");
        return checkHeight(makeCall(*function, std::move(argument)));
    }
    fail(token, "unknown identifier", "identifier");
}

} // namespace veq
