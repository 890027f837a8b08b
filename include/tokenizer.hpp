#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace veq {

// Класс лексического анализатора (лексера)
// Преобразует входную строку с уравнением в последовательность токенов.
// Игнорирует пробельные символы.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Возвращает вектор токенов, заканчивающийся токеном End
    // Выбрасывает LexError при обнаружении неизвестного символа
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    char advance();
    void skipWhitespace();

    // Считывает число (целое или с плавающей точкой, без экспоненты)
    Token makeNumber();

    // Считывает идентификатор. Слитная последовательность букв делится на
    // ключевые слова ("pix" -> "pi", "x"), только если она раскладывается на них
    // целиком. Иначе вся последовательность становится одним идентификатором,
    // и его отвергнет парсер.
    Token makeIdentifier();
};

} // namespace veq
