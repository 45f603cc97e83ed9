#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace depgraph {

// Пул фиксированного размера с ограниченной очередью:
// submit() блокируется, пока очередь заполнена.
class ThreadPool {
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> q;
    std::mutex m;
    std::condition_variable cv_job;   // появилась задача / stop
    std::condition_variable cv_space; // освободилось место в очереди
    std::condition_variable cv_idle;  // очередь пуста и никто не работает
    std::size_t capacity;
    std::size_t active = 0;
    std::atomic<std::size_t> failed {0};
    bool stop = false;

   public:
    // n == 0: hardware_concurrency(); capacity == 0: 2 * n
    explicit ThreadPool(unsigned n, std::size_t capacity = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(std::function<void()> fn);
    // барьер: ждёт опустошения очереди и завершения всех задач
    void wait_idle();

    unsigned size() const { return static_cast<unsigned>(workers.size()); }
    std::size_t queue_capacity() const { return capacity; }
    std::size_t failures() const { return failed.load(); }
};

} // namespace depgraph
