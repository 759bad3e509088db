#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>

namespace inbetween::core {

// Worker pool used for image decoding fan-out.
// Jobs submitted while the pool is not running, or from a worker thread,
// execute inline on the calling thread so that a caller blocked on a
// future can never starve the pool.
struct JobSystem {
    // If num_threads is 0, uses hardware_concurrency - 1
    static void init(int num_threads = 0);
    static void shutdown();

    static bool is_running();

    static void submit(std::function<void()> job);

    template<typename F, typename R = std::invoke_result_t<F>>
    static std::future<R> submit_with_result(F&& func);

    // Wait for all submitted jobs to complete
    static void wait_all();

    // Callback receives (start_index, end_index)
    static void parallel_for(size_t count, std::function<void(size_t, size_t)> callback);

    static int thread_count();
    static bool is_worker_thread();
};

template<typename F, typename R>
std::future<R> JobSystem::submit_with_result(F&& func) {
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
    auto future = task->get_future();
    submit([task]() { (*task)(); });
    return future;
}

} // namespace inbetween::core
