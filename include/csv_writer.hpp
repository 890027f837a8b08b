#pragma once

#include <filesystem>
#include <ostream>

#include "sampler.hpp"

namespace veq {

// Класс для записи точек выборки в формате CSV.
// Формат: frame,t,x,y,segment. Для пропущенных точек y пуст, а segment = -1.
// t и x записываются с полной точностью double, precision задает число
// знаков после запятой только для y.
class CsvWriter {
public:
    // Конструктор открывает файл для записи (перезаписывая его) и пишет заголовок
    CsvWriter(std::filesystem::path targetPath, int precision);

    // Дописывает в файл все точки кадра
    void writeFrame(const Frame& frame) const;

    // Запись в произвольный поток (используется и для вывода в stdout)
    static void writeHeader(std::ostream& stream);
    static void writeFrame(std::ostream& stream, const Frame& frame, int precision);

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path; // Путь к выходному файлу
    int precision;              // Знаков после запятой

    void initialize() const;
};

} // namespace veq
