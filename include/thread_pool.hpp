#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace lc {
    class ThreadPool {
    public:
        ThreadPool(size_t threads = std::thread::hardware_concurrency()) : stop(false) {
            if (threads == 0) threads = 1;
            for(size_t i = 0; i < threads; ++i)
                workers.emplace_back([this] {
                    for(;;) {
                        std::function<void()> task;
                        {
                            std::unique_lock<std::mutex> lock(this->queue_mutex);
                            this->condition.wait(lock, [this]{ return this->stop || !this->tasks.empty(); });
                            if(this->stop && this->tasks.empty()) return;
                            task = std::move(this->tasks.front());
                            this->tasks.pop();
                        }
                        task();
                    }
                });
        }
        ~ThreadPool() {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                stop = true;
            }
            condition.notify_all();
            for(std::thread &worker: workers) worker.join();
        }
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        // Exceptions thrown by f surface from future::get()
        template<class F>
        auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            std::future<R> result = task->get_future();
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                tasks.emplace([task]() { (*task)(); });
            }
            condition.notify_one();
            return result;
        }
    private:
        std::vector<std::thread> workers;
        std::queue<std::function<void()>> tasks;
        std::mutex queue_mutex;
        std::condition_variable condition;
        bool stop;
    };
}
