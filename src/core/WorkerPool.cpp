#include "WorkerPool.h"
#include "LoggingChannels.h"

namespace SandSim {

WorkerPool::WorkerPool(size_t threadCount) : threadCount_(threadCount < 1 ? 1 : threadCount)
{
    if (threadCount_ > 1) {
        threads_.reserve(threadCount_);
        for (size_t i = 0; i < threadCount_; ++i) {
            threads_.emplace_back([this] { workerLoop(); });
        }
    }
    LoggingChannels::scheduler()->debug("WorkerPool started with {} thread(s)", threadCount_);
}

WorkerPool::~WorkerPool()
{
    queue_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::runBatch(std::vector<Job>& jobs)
{
    if (jobs.empty()) {
        return;
    }

    if (threads_.empty()) {
        std::exception_ptr error;
        for (auto& job : jobs) {
            try {
                job();
            }
            catch (...) {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
        if (error) {
            std::rethrow_exception(error);
        }
        return;
    }

    {
        std::unique_lock lock(batchMutex_);
        pending_ = jobs.size();
        firstError_ = nullptr;
    }

    for (auto& job : jobs) {
        queue_.push(std::move(job));
    }

    std::exception_ptr error;
    {
        std::unique_lock lock(batchMutex_);
        batchDone_.wait(lock, [this] { return pending_ == 0; });
        error = firstError_;
        firstError_ = nullptr;
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

void WorkerPool::workerLoop()
{
    while (auto job = queue_.pop()) {
        std::exception_ptr error;
        try {
            (*job)();
        }
        catch (...) {
            error = std::current_exception();
        }
        finishJob(error);
    }
}

void WorkerPool::finishJob(std::exception_ptr error)
{
    bool done = false;
    {
        std::unique_lock lock(batchMutex_);
        if (error && !firstError_) {
            firstError_ = error;
        }
        done = --pending_ == 0;
    }
    if (done) {
        batchDone_.notify_all();
    }
}

} // namespace SandSim
