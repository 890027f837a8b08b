#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "console.hpp"
#include "csv_writer.hpp"
#include "expression.hpp"
#include "sampler.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"

namespace {

// Вывод сводки по кадру: число точек, отрезков и пропусков
void printFrameSummary(const veq::Frame& frame) {
    std::size_t skipped = 0;
    for (const auto& sample : frame.samples) {
        if (!sample.drawable) {
            ++skipped;
        }
    }
    auto lines = veq::Sampler::polylines(frame);
    logInfo("кадр " + std::to_string(frame.index) + " (t = " + std::to_string(frame.t) + "): " +
            std::to_string(frame.samples.size()) + " точек, " + std::to_string(lines.size()) +
            " ломаных, пропущено " + std::to_string(skipped));
    if (lines.empty()) {
        logWarning("в кадре " + std::to_string(frame.index) + " график не попадает в видимую область");
    }
}

int run(const CommandLineOptions& options) {
    // 1. Разбор уравнения. Ошибка разбора — ошибка пользователя, вычислять нечего.
    std::optional<veq::Expression> expression;
    try {
        expression.emplace(veq::parse(options.equation));
    }
    catch (const veq::SyntaxError& ex) {
        logError("не удалось разобрать уравнение");
        std::cerr << Color::RED << veq::formatDiagnostic(options.equation, ex) << Color::RESET
            << "\n";
        return 1;
    }
    if (isDebugLogging()) {
        logDebug("дерево выражения: " + veq::toString(expression->root()));
    }

    std::size_t threadCount = options.threads != 0 ? options.threads : veq::ThreadPool::hardwareThreads();

    if (options.output) {
        printHeader();
        std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Уравнение:     " << Color::YELLOW << "f(x, t) = " << expression->text()
            << Color::RESET << "\n";
        std::cout << "  Отрезок x:     " << Color::CYAN << "[" << options.domain.lower << ", "
            << options.domain.upper << "]" << Color::RESET << "\n";
        std::cout << "  Отрезок y:     " << Color::CYAN << "[" << options.range.lower << ", "
            << options.range.upper << "]" << Color::RESET << "\n";
        std::cout << "  Точек:         " << Color::CYAN << options.samples << Color::RESET << "\n";
        std::cout << "  Кадров:        " << Color::CYAN << options.frames << Color::RESET << "\n";
        std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n";
        std::cout << "  Выходной файл: " << Color::YELLOW << *options.output << Color::RESET << "\n\n";
    }

    // 2. Выборка значений по кадрам
    veq::ThreadPool pool(threadCount);
    veq::SamplerSettings settings{options.domain, options.range, options.samples};
    veq::Sampler sampler(*expression, settings, &pool);

    std::optional<veq::CsvWriter> writer;
    if (options.output) {
        writer.emplace(*options.output, options.precision);
    } else {
        veq::CsvWriter::writeHeader(std::cout);
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (std::size_t k = 0; k < options.frames; ++k) {
        double t = options.time + static_cast<double>(k) / options.fps;
        veq::Frame frame = sampler.sample(t, k);
        if (writer) {
            writer->writeFrame(frame);
            printFrameSummary(frame);
        } else {
            veq::CsvWriter::writeFrame(std::cout, frame, options.precision);
        }
    }
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start);

    if (writer) {
        std::cout << "\n" << Color::BOLD << "Время вычисления: " << Color::RESET << duration.count()
            << " мс\n";
        std::cout << Color::GREEN << "Результаты сохранены в: " << writer->target() << Color::RESET
            << "\n\n";
    } else {
        logDebug("время вычисления: " + std::to_string(duration.count()) + " мс");
    }
    return 0;
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    CommandLineOptions options;
    try {
        options = parseCommandLine(argc, argv);
    }
    catch (const UsageError& ex) {
        logError(ex.what());
        std::cerr << "\n" << usage();
        return 2;
    }

    if (options.help) {
        std::cout << usage();
        return 0;
    }

    setDebugLogging(options.debug);

    try {
        return run(options);
    }
    catch (const std::exception& ex) {
        logError(ex.what());
        return 1;
    }
}
