#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ib::concurrency {

// Fixed-size worker pool. Tasks run in submission order on whichever worker is free.
class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads, std::string name = "pool");

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Runs everything already queued, then joins the workers.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
