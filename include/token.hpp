#pragma once

#include <cstddef>
#include <string>

namespace veq {

// Типы лексем
enum class TokenType {
    Number,     // Числовой литерал
    Identifier, // Переменная, константа или имя функции
    Operator,   // Один из символов + - * / ^ %
    LParen,     // (
    RParen,     // )
    End         // Конец входной строки
};

// Лексема: тип, числовое значение (только для Number), исходный текст и позиция
struct Token {
    TokenType type;
    double numericValue;
    std::string text;
    std::size_t position; // Номер столбца (с нуля) для диагностики
};

} // namespace veq
