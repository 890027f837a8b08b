#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace veq {

// Базовая ошибка разбора выражения: хранит столбец, на котором она возникла
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(std::size_t position, const std::string& message)
        : std::runtime_error(message), pos(position) {}

    std::size_t position() const noexcept { return pos; }

private:
    std::size_t pos;
};

// Недопустимый символ во входной строке
class LexError final : public SyntaxError {
public:
    LexError(std::size_t position, char character);

    char character() const noexcept { return ch; }

private:
    char ch;
};

// Некорректная последовательность лексем
class ParseError final : public SyntaxError {
public:
    ParseError(std::size_t position, const std::string& message,
               std::string expected = {}, std::string found = {})
        : SyntaxError(position, message),
          expectedText(std::move(expected)),
          foundText(std::move(found)) {}

    // Что ожидалось (может быть пустым)
    const std::string& expected() const noexcept { return expectedText; }

    // Что встретилось на самом деле ("end of expression" для конца строки)
    const std::string& found() const noexcept { return foundText; }

private:
    std::string expectedText;
    std::string foundText;
};

// Формирует многострочное сообщение: текст ошибки, исходная строка и
// указатель '^' под столбцом ошибки
std::string formatDiagnostic(const std::string& source, const SyntaxError& error);

} // namespace veq
