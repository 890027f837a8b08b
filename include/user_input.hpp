#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "sampler.hpp"

// Ошибка в аргументах командной строки (программа завершается с кодом 2)
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Параметры запуска veq
struct CommandLineOptions {
    std::string equation;
    veq::Interval domain{-1.0, 1.0};
    veq::Interval range{-1.0, 1.0};
    std::size_t samples = 900;
    double time = 0.0;      // Значение t для первого кадра
    std::size_t frames = 1;
    double fps = 30.0;      // Шаг t между кадрами равен 1 / fps
    int precision = 2;
    std::size_t threads = 0; // 0 — по числу аппаратных потоков
    std::optional<std::filesystem::path> output;
    bool debug = false;
    bool help = false;
};

// Безопасный парсинг положительного целого числа из строки
std::size_t parseNumber(const std::string& value);

// Парсинг вещественного числа; вся строка должна быть числом
double parseReal(const std::string& value);

// Точность вывода: неотрицательное целое
int parsePrecision(const std::string& value);

// Парсинг отрезка в формате "[a, b]"
veq::Interval parseInterval(const std::string& value);

// Разбор аргументов командной строки.
// Выбрасывает UsageError при неизвестной опции или некорректном значении.
CommandLineOptions parseCommandLine(int argc, const char* const* argv);

// Текст справки
std::string usage();
