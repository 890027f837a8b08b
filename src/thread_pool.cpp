#include "thread_pool.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace veq {

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = 1;
    }
    if (threadCount > kMaxThreads) {
        throw std::runtime_error("Слишком много потоков: " + std::to_string(threadCount) +
                                 " (максимум " + std::to_string(kMaxThreads) + ")");
    }

    workers.reserve(threadCount);
    try {
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back([this]() { workerLoop(); });
        }
    }
    catch (...) {
        // Деструктор не вызывается для недостроенного объекта:
        // уже запущенные потоки нужно остановить здесь, иначе std::terminate
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

// Останавливает и присоединяет все запущенные потоки
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }

    // Будим все потоки; оставшиеся в очереди задачи будут выполнены до выхода
    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t ThreadPool::hardwareThreads() {
    std::size_t count = std::thread::hardware_concurrency();
    if (count == 0) {
        count = 2; // Резервное значение
    }
    return std::min(count, kMaxThreads);
}

// Логика работы отдельного потока
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            condition.wait(lock, [this]() { return stop || !tasks.empty(); });

            // Если нужно остановиться и задач больше нет — выходим
            if (stop && tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
        }

        // Выполняем задачу вне блокировки мьютекса
        task();
    }
}

} // namespace veq
