#include "csv_writer.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace veq {

CsvWriter::CsvWriter(std::filesystem::path targetPath, int precision)
    : path(std::move(targetPath)), precision(precision) {
    initialize();
}

// Инициализация файла (запись заголовка)
void CsvWriter::initialize() const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    writeHeader(stream);
}

void CsvWriter::writeFrame(const Frame& frame) const {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    writeFrame(stream, frame, precision);
    if (!stream) {
        throw std::runtime_error("Ошибка записи в файл: " + path.string());
    }
}

void CsvWriter::writeHeader(std::ostream& stream) {
    stream << "frame,t,x,y,segment\n";
}

void CsvWriter::writeFrame(std::ostream& stream, const Frame& frame, int precision) {
    auto flags = stream.flags();
    auto oldPrecision = stream.precision();

    // t и x пишутся без потерь, чтобы соседние точки не сливались;
    // точность вывода относится только к y
    constexpr int kExactDigits = std::numeric_limits<double>::max_digits10;

    for (const auto& sample : frame.samples) {
        stream << std::defaultfloat << std::setprecision(kExactDigits);
        stream << frame.index << ',' << frame.t << ',' << sample.x << ',';
        // Значение пишется только для точек, попавших в ломаную
        if (sample.drawable) {
            stream << std::fixed << std::setprecision(precision) << sample.y;
        }
        stream << ',' << sample.segment << '\n';
    }

    stream.flags(flags);
    stream.precision(oldPrecision);
}

} // namespace veq
