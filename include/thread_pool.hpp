#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace veq {

// Пул потоков для параллельного вычисления выборок.
// Позволяет не создавать потоки заново для каждого кадра.
class ThreadPool {
public:
    // Верхняя граница числа рабочих потоков
    static constexpr std::size_t kMaxThreads = 256;

    // threadCount == 0 трактуется как один поток.
    // Выбрасывает std::runtime_error, если threadCount > kMaxThreads или поток
    // не удалось создать; в этом случае уже запущенные потоки останавливаются.
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавляет новую задачу в очередь.
    // Возвращает std::future для получения результата выполнения
    // (исключение задачи будет переброшено из future::get()).
    template <class Func>
    auto enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    // Количество рабочих потоков
    std::size_t size() const { return workers.size(); }

    // Число аппаратных потоков (не больше kMaxThreads), либо 2, если его не удалось определить
    static std::size_t hardwareThreads();

private:
    std::vector<std::thread> workers;        // Рабочие потоки
    std::queue<std::function<void()>> tasks; // Очередь задач

    std::mutex mutex;                  // Защищает очередь и флаг остановки
    std::condition_variable condition; // Уведомление потоков о новых задачах
    bool stop = false;                 // Флаг остановки пула

    // Основной цикл рабочего потока
    void workerLoop();

    void shutdown();
};

template <class Func>
inline auto ThreadPool::enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Return = std::invoke_result_t<Func>;

    // packaged_task хранит результат (или исключение) для future
    auto task = std::make_shared<std::packaged_task<Return()>>(std::forward<Func>(func));

    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    condition.notify_one(); // Будим один из спящих потоков
    return result;
}

} // namespace veq
