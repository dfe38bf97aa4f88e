#include "common/worker_pool.hpp"

#include <asio/post.hpp>
#include <future>
#include <memory>
#include <vector>

WorkerPool::WorkerPool(size_t threads)
    : threads_(threads == 0 ? 1 : threads), pool_(threads_) {}

WorkerPool::~WorkerPool() {
    pool_.join();
}

void WorkerPool::run_batch(size_t count, const std::function<void(size_t)>& task) {
    std::vector<std::future<void>> pending;
    pending.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto job = std::make_shared<std::packaged_task<void()>>([&task, i]() { task(i); });
        pending.push_back(job->get_future());
        asio::post(pool_, [job]() { (*job)(); });
    }

    // Every task borrows `task`, so all of them must finish before we return or throw.
    for (auto& f : pending) {
        f.wait();
    }
    for (auto& f : pending) {
        f.get();
    }
}
