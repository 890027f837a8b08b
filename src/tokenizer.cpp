#include "tokenizer.hpp"

#include <cctype>
#include <cstdlib>
#include <string_view>
#include <vector>

#include "ast.hpp"
#include "errors.hpp"

namespace veq {

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        switch (ch) {
        // Односимвольные операторы
        case '+':
        case '-':
        case '*':
        case '/':
        case '^':
        case '%':
            tokens.push_back({TokenType::Operator, 0.0, std::string(1, ch), index});
            advance();
            break;
        case '(':
            tokens.push_back({TokenType::LParen, 0.0, "(", index});
            advance();
            break;
        case ')':
            tokens.push_back({TokenType::RParen, 0.0, ")", index});
            advance();
            break;
        default:
            // Многосимвольные токены (числа и идентификаторы)
            if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '.') {
                tokens.push_back(makeNumber());
            } else if (std::isalpha(static_cast<unsigned char>(ch))) {
                tokens.push_back(makeIdentifier());
            } else {
                throw LexError(index, ch);
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0.0, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

// Пропуск всех незначащих символов
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

// Разбор числового литерала
// Поддерживает целые числа и числа с плавающей точкой ("2", "2.5", ".5", "2.")
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    bool hasDot = false;
    bool hasDigit = false;
    while (!isAtEnd()) {
        char ch = peek();
        if (ch == '.') {
            if (hasDot) {
                break; // Вторая точка — конец числа
            }
            hasDot = true;
            advance();
        } else if (std::isdigit(static_cast<unsigned char>(ch))) {
            hasDigit = true;
            advance();
        } else {
            break;
        }
    }

    // Одиночная точка числом не является
    if (!hasDigit) {
        throw LexError(start, '.');
    }

    std::string text = source.substr(start, index - start);
    // strtod не бросает исключений: слишком длинный литерал становится +inf
    double value = std::strtod(text.c_str(), nullptr);
    return {TokenType::Number, value, text, start};
}

// Разбор идентификатора (переменная, константа или функция)
// Преобразует текст в нижний регистр для нечувствительности к регистру
Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    std::size_t end = start;
    while (end < source.size() && std::isalpha(static_cast<unsigned char>(source[end]))) {
        ++end;
    }

    std::string word = source.substr(start, end - start);
    // Приведение к нижнему регистру
    for (char& ch : word) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    // splittable[i]: остаток word[i..] целиком раскладывается на ключевые слова
    std::vector<bool> splittable(word.size() + 1, false);
    splittable[word.size()] = true;
    for (std::size_t i = word.size(); i-- > 0;) {
        std::string_view rest = std::string_view(word).substr(i);
        for (std::string_view keyword : keywords()) {
            if (rest.starts_with(keyword) && splittable[i + keyword.size()]) {
                splittable[i] = true;
                break;
            }
        }
    }

    // Слитное слово ("pix", "sinx") делится, только если разбор покрывает его полностью.
    // Иначе ("exp", "tau") оно остается одним идентификатором.
    std::size_t length = word.size();
    if (splittable[0]) {
        std::size_t bestLength = 0;
        for (std::string_view keyword : keywords()) {
            if (keyword.size() > bestLength && std::string_view(word).starts_with(keyword) &&
                splittable[keyword.size()]) {
                bestLength = keyword.size();
            }
        }
        length = bestLength;
    }

    index = start + length;
    return {TokenType::Identifier, 0.0, word.substr(0, length), start};
}

} // namespace veq
