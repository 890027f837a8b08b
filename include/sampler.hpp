#pragma once

#include <cstddef>
#include <vector>

#include "expression.hpp"
#include "thread_pool.hpp"

namespace veq {

// Числовой отрезок [lower, upper]
struct Interval {
    double lower;
    double upper;

    double width() const { return upper - lower; }
    double center() const { return (lower + upper) / 2.0; }
};

// Одна точка выборки
struct Sample {
    double x;
    double y;
    bool drawable; // Конечное значение в пределах видимой области
    int segment;   // Номер отрезка ломаной, -1 для пропущенных точек
};

// Все точки одного кадра для заданного t
struct Frame {
    std::size_t index;
    double t;
    std::vector<Sample> samples;
    std::size_t segmentCount;
};

struct Point {
    double x;
    double y;
};

using Polyline = std::vector<Point>;

struct SamplerSettings {
    Interval domain{-1.0, 1.0}; // Видимый отрезок по x
    Interval range{-1.0, 1.0};  // Видимый отрезок по y
    std::size_t samples = 900;  // Количество точек (по одной на пиксель)
};

// Выборка значений выражения по видимому отрезку.
// Ломаная разрывается на NaN, бесконечностях и значениях, далеко
// выходящих за видимую область (больше четырех ее высот от центра).
class Sampler {
public:
    // Выборка хранит ссылку на expression: выражение должно жить дольше нее.
    // pool может быть nullptr — тогда вычисление идет в текущем потоке
    Sampler(const Expression& expression, SamplerSettings settings, ThreadPool* pool = nullptr);
    Sampler(Expression&& expression, SamplerSettings settings, ThreadPool* pool = nullptr) = delete;

    // Вычисляет все точки кадра при заданном t
    Frame sample(double t, std::size_t frameIndex = 0) const;

    // Разбивает кадр на ломаные; отрезки из одной точки отбрасываются
    static std::vector<Polyline> polylines(const Frame& frame);

    const SamplerSettings& settings() const { return config; }

private:
    const Expression& expression;
    const SamplerSettings config;
    ThreadPool* pool;

    // Минимальный размер порции точек для одной задачи пула
    static constexpr std::size_t kMinChunkSize = 64;

    void evaluateRange(std::vector<Sample>& samples, std::size_t begin, std::size_t end,
                       double t) const;

    bool isDrawable(double y) const;
};

} // namespace veq
