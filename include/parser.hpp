#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace veq {

// Ограничения парсера
struct ParserOptions {
    // Максимальная вложенность: скобки, аргументы функций, цепочки '-' и '^'.
    // Счетчик увеличивается при каждом входе в правило unary.
    std::size_t maxDepth = 256;

    // Максимальная высота построенного дерева (длинные цепочки вида 1+1+...+1)
    std::size_t maxHeight = 4096;
};

// Класс синтаксического анализатора (парсера)
// Строит Абстрактное Синтаксическое Дерево (AST) из списка токенов.
// Реализует алгоритм рекурсивного спуска с одним токеном предпросмотра.
//
// Грамматика (от низкого приоритета к высокому):
//   expr    := term (('+'|'-') term)*
//   term    := unary (('*'|'/'|'%') unary)*
//   unary   := '-' unary | power
//   power   := primary ('^' unary)?
//   primary := NUMBER | CONST | VAR | FUNCTION '(' expr ')' | '(' expr ')'
class Parser {
public:
    explicit Parser(std::vector<Token> tokens, ParserOptions options = {});

    // Основной метод запуска парсинга
    // Возвращает указатель на корневой узел AST
    // Выбрасывает ParseError при первой же синтаксической ошибке
    NodePtr parse();

private:
    const std::vector<Token> tokens; // Список токенов
    const ParserOptions options;
    std::size_t current = 0; // Индекс текущего токена
    std::size_t depth = 0;   // Текущая глубина рекурсии

    // Счетчик глубины на время разбора одного уровня вложенности
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& parser);
        ~DepthGuard();

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser;
    };

    const Token& peek() const;
    bool isAtEnd() const;

    // Если текущий токен — оператор op, сдвигает указатель и возвращает true
    bool matchOperator(char op);

    // Проверяет тип текущего токена и сдвигает указатель
    bool match(TokenType type);

    // Ожидает токен определенного типа, иначе выбрасывает ParseError
    const Token& consume(TokenType type, const std::string& errorMessage,
                         const std::string& expected);

    // Проверяет высоту нового узла
    NodePtr checkHeight(NodePtr node) const;

    [[noreturn]] void fail(const Token& token, const std::string& message,
                           const std::string& expected = {}) const;

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---
    NodePtr parseExpression();
    NodePtr parseTerm();
    NodePtr parseUnary();
    NodePtr parsePower();
    NodePtr parsePrimary();
    NodePtr parseIdentifier(const Token& token);
};

} // namespace veq
