#ifndef FRAGXFER_WORKER_POOL_HPP
#define FRAGXFER_WORKER_POOL_HPP

#include <asio/thread_pool.hpp>
#include <cstddef>
#include <functional>

// Fixed set of worker threads that run one batch of index-addressed tasks at a time.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Runs task(0) .. task(count - 1) on the workers and waits for all of them.
     *
     * Tasks report results through slots they own; if any task throws, the
     * exception of the lowest index is rethrown after every task finished.
     */
    void run_batch(size_t count, const std::function<void(size_t)>& task);

    size_t threads() const { return threads_; }

private:
    size_t threads_;
    asio::thread_pool pool_;
};

#endif // FRAGXFER_WORKER_POOL_HPP
