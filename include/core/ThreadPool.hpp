#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace core {

/**
 * @brief Fixed-size worker pool for transfer tasks.
 *
 * The copy engine offloads blocking reads to one; the transfer session runs
 * its copy task next to the progress drain task on another. Tasks run in
 * FIFO order. Queued tasks still run after shutdown() is called.
 */
class ThreadPool {
public:
    /**
     * @param num_threads Number of workers (0 is raised to 1)
     */
    explicit ThreadPool(size_t num_threads = 2);

    /// Runs what is queued, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable and get a future for its result.
     *
     * Exceptions thrown by the callable end up in the future. A stopped
     * pool returns a future holding std::runtime_error.
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();

        if (!enqueue([task]() { (*task)(); })) {
            std::promise<R> rejected;
            rejected.set_exception(std::make_exception_ptr(
                std::runtime_error("ThreadPool is stopped")));
            return rejected.get_future();
        }
        return result;
    }

    /**
     * @brief Fire-and-forget. The task must not throw.
     * @return false if the pool is stopped and the task was dropped
     */
    bool submit_detached(std::function<void()> task) {
        return enqueue(std::move(task));
    }

    void shutdown();

private:
    bool enqueue(std::function<void()> task);
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
};

} // namespace core
