#include "user_input.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>
#include <string>

#include "thread_pool.hpp"

namespace {

// Формат отрезка: "[a, b]"
const std::regex kIntervalPattern(R"(^\[(-?\d+\.?\d*),\s*(-?\d+\.?\d*)\])");

// Удаление пробелов по краям
std::string trim(std::string value) {
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    return value;
}

} // namespace

// Безопасный парсинг числа из строки
std::size_t parseNumber(const std::string& value) {
    std::string input = trim(value);
    bool allDigits = !input.empty() && std::all_of(input.begin(), input.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!allDigits) {
        throw UsageError("Некорректное числовое значение: '" + value + "'");
    }

    std::size_t result = 0;
    try {
        result = std::stoull(input);
    }
    catch (const std::out_of_range&) {
        throw UsageError("Слишком большое число: '" + value + "'");
    }
    if (result == 0) {
        throw UsageError("Число должно быть положительным");
    }
    return result;
}

double parseReal(const std::string& value) {
    std::string input = trim(value);
    std::size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(input, &consumed);
    }
    catch (const std::exception&) {
        throw UsageError("Некорректное вещественное число: '" + value + "'");
    }
    if (consumed != input.size() || !std::isfinite(result)) {
        throw UsageError("Некорректное вещественное число: '" + value + "'");
    }
    return result;
}

int parsePrecision(const std::string& value) {
    std::string input = trim(value);
    std::size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(input, &consumed);
    }
    catch (const std::exception&) {
        throw UsageError("Некорректная точность: '" + value + "'");
    }
    if (consumed != input.size()) {
        throw UsageError("Некорректная точность: '" + value + "'");
    }
    if (result < 0) {
        throw UsageError("Минимальная точность — ноль");
    }
    return result;
}

veq::Interval parseInterval(const std::string& value) {
    std::smatch match;
    std::string input = trim(value);
    if (!std::regex_match(input, match, kIntervalPattern)) {
        throw UsageError("Некорректный формат отрезка: '" + value + "' (ожидается [a, b])");
    }

    veq::Interval interval{std::stod(match[1].str()), std::stod(match[2].str())};
    if (!(interval.lower < interval.upper)) {
        throw UsageError("Нижняя граница отрезка должна быть меньше верхней: '" + value + "'");
    }
    return interval;
}

CommandLineOptions parseCommandLine(int argc, const char* const* argv) {
    CommandLineOptions options;
    bool positionalOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string argument = argv[i];

        // Значение опции — следующий аргумент
        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw UsageError("Опция " + argument + " требует значения");
            }
            return argv[++i];
        };

        auto setEquation = [&]() {
            if (!options.equation.empty()) {
                throw UsageError("Лишний аргумент: '" + argument + "'");
            }
            options.equation = argument;
        };

        if (positionalOnly) {
            setEquation();
        }
        else if (argument == "--") {
            positionalOnly = true;
        }
        else if (argument == "-h" || argument == "--help") {
            options.help = true;
        }
        else if (argument == "--debug") {
            options.debug = true;
        }
        else if (argument == "-d" || argument == "--domain") {
            options.domain = parseInterval(nextValue());
        }
        else if (argument == "-r" || argument == "--range") {
            options.range = parseInterval(nextValue());
        }
        else if (argument == "-n" || argument == "--samples") {
            options.samples = parseNumber(nextValue());
        }
        else if (argument == "-t" || argument == "--time") {
            options.time = parseReal(nextValue());
        }
        else if (argument == "--frames") {
            options.frames = parseNumber(nextValue());
        }
        else if (argument == "--fps") {
            options.fps = parseReal(nextValue());
            if (options.fps <= 0.0) {
                throw UsageError("Частота кадров должна быть положительной");
            }
        }
        else if (argument == "-p" || argument == "--precision") {
            options.precision = parsePrecision(nextValue());
        }
        else if (argument == "-j" || argument == "--threads") {
            options.threads = parseNumber(nextValue());
            if (options.threads > veq::ThreadPool::kMaxThreads) {
                throw UsageError("Слишком много потоков (максимум " +
                                 std::to_string(veq::ThreadPool::kMaxThreads) + ")");
            }
        }
        else if (argument == "-o" || argument == "--output") {
            std::string path = trim(nextValue());
            if (path.empty()) {
                throw UsageError("Пустое название файла");
            }
            options.output = std::filesystem::path(path);
        }
        else if (argument.rfind("--", 0) == 0) {
            throw UsageError("Неизвестная опция: " + argument);
        }
        else {
            // Уравнение может начинаться с минуса: veq "-x^2"
            setEquation();
        }
    }

    if (!options.help && options.equation.empty()) {
        throw UsageError("Не задано уравнение");
    }
    return options;
}

std::string usage() {
    std::ostringstream out;
    out << "Использование: veq <уравнение> [опции]\n"
        << "\n"
        << "  -d, --domain \"[a, b]\"  отрезок по x (по умолчанию [-1, 1])\n"
        << "  -r, --range \"[a, b]\"   видимый отрезок по y (по умолчанию [-1, 1])\n"
        << "  -n, --samples N        количество точек (по умолчанию 900)\n"
        << "  -t, --time T           значение t (по умолчанию 0)\n"
        << "      --frames N         количество кадров (по умолчанию 1)\n"
        << "      --fps F            кадров в секунду для шага t (по умолчанию 30)\n"
        << "  -p, --precision N      знаков после запятой (по умолчанию 2)\n"
        << "  -j, --threads N        количество потоков, до " << veq::ThreadPool::kMaxThreads
        << " (по умолчанию — все ядра)\n"
        << "  -o, --output FILE      записать точки в CSV файл\n"
        << "      --debug            отладочный вывод\n"
        << "  -h, --help             эта справка\n"
        << "\n"
        << "Переменные: x, t. Константы: pi, e, g.\n"
        << "Функции: sin cos tan asin acos atan sinh cosh tanh asinh acosh atanh\n"
        << "         rad deg log abs round sign\n"
        << "Операторы: + - * / % ^ и скобки.\n";
    return out.str();
}
