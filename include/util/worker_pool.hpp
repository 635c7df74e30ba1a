#pragma once

#include <condition_variable>
#include <cstddef>
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

namespace batchsync {

// Fixed-size pool of worker threads draining a FIFO of tasks. The destructor
// finishes every queued task before joining.
class WorkerPool {
  public:
    explicit WorkerPool(std::size_t threads);
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    ~WorkerPool();

    template <class F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    std::size_t Size() const { return workers_.size(); }

  private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
};

template <class F>
auto WorkerPool::Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> res = task->get_future();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_)
            throw std::runtime_error("Submit on stopped WorkerPool");
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

} // namespace batchsync
