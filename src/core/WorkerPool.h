#pragma once

#include "SynchronizedQueue.h"
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace SandSim {

/**
 * @brief Fixed set of worker threads running batches of independent jobs.
 *
 * runBatch() is a barrier: it returns only after every job of the batch has
 * finished. With one thread (or fewer) jobs run inline on the caller, which
 * keeps single-threaded runs free of any synchronization.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t threadCount() const { return threadCount_; }

    /**
     * @brief Run all jobs and wait for them.
     * If any job throws, the remaining jobs still run and the first
     * exception is rethrown here once the batch is done.
     */
    void runBatch(std::vector<Job>& jobs);

private:
    void workerLoop();
    void finishJob(std::exception_ptr error);

    size_t threadCount_;
    std::vector<std::thread> threads_;
    SynchronizedQueue<Job> queue_;

    std::mutex batchMutex_;
    std::condition_variable batchDone_;
    size_t pending_ = 0;
    std::exception_ptr firstError_;
};

} // namespace SandSim
