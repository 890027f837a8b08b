#include "sampler.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>
#include <string>

#include "console.hpp"

namespace veq {

Sampler::Sampler(const Expression& expression, SamplerSettings settings, ThreadPool* pool)
    : expression(expression), config(settings), pool(pool) {
    if (config.samples == 0) {
        throw std::runtime_error("Количество точек должно быть положительным");
    }
    if (!(config.domain.lower < config.domain.upper) || !(config.range.lower < config.range.upper)) {
        throw std::runtime_error("Нижняя граница отрезка должна быть меньше верхней");
    }
}

Frame Sampler::sample(double t, std::size_t frameIndex) const {
    Frame frame{frameIndex, t, std::vector<Sample>(config.samples), 0};

    if (pool == nullptr || pool->size() <= 1) {
        evaluateRange(frame.samples, 0, config.samples, t);
    } else {
        // Делим точки на порции; каждая задача пишет только в свой диапазон вектора
        std::size_t chunkSize = std::max(kMinChunkSize, config.samples / (pool->size() * 4) + 1);
        std::vector<std::future<void>> futures;
        futures.reserve(config.samples / chunkSize + 1);
        for (std::size_t begin = 0; begin < config.samples; begin += chunkSize) {
            std::size_t end = std::min(begin + chunkSize, config.samples);
            futures.push_back(pool->enqueue([this, &frame, begin, end, t]() {
                evaluateRange(frame.samples, begin, end, t);
            }));
        }
        for (auto& future : futures) {
            future.get();
        }
        logDebug("кадр " + std::to_string(frameIndex) + ": " + std::to_string(futures.size()) +
                 " задач по " + std::to_string(chunkSize) + " точек");
    }

    // Последовательная разметка отрезков ломаной
    bool previousDrawable = false;
    for (auto& sample : frame.samples) {
        sample.drawable = isDrawable(sample.y);
        if (sample.drawable) {
            if (!previousDrawable) {
                ++frame.segmentCount;
            }
            sample.segment = static_cast<int>(frame.segmentCount) - 1;
        } else {
            sample.segment = -1;
        }
        previousDrawable = sample.drawable;
    }
    return frame;
}

std::vector<Polyline> Sampler::polylines(const Frame& frame) {
    std::vector<Polyline> result;
    Polyline current;
    auto flush = [&]() {
        if (current.size() >= 2) {
            result.push_back(std::move(current));
        }
        current.clear();
    };

    for (const auto& sample : frame.samples) {
        if (!sample.drawable) {
            flush();
            continue;
        }
        current.push_back({sample.x, sample.y});
    }
    flush();
    return result;
}

void Sampler::evaluateRange(std::vector<Sample>& samples, std::size_t begin, std::size_t end,
                            double t) const {
    const double dx = config.domain.width() / static_cast<double>(config.samples);
    for (std::size_t i = begin; i < end; ++i) {
        double x = config.domain.lower + dx * static_cast<double>(i);
        samples[i].x = x;
        samples[i].y = expression.evaluate(x, t);
    }
}

bool Sampler::isDrawable(double y) const {
    if (!std::isfinite(y)) {
        return false;
    }
    return std::abs(y - config.range.center()) <= 4.0 * config.range.width();
}

} // namespace veq
