#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ib::concurrency;
using namespace ib::log;

ThreadPool::ThreadPool(const unsigned int nThreads, std::string name)
    : name_(std::move(name)) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        stopFlag.store(true);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::logic_error("ThreadPool '" + name_ + "' is stopped");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;
            try {
                (*task)();
            } catch (const std::exception& e) {
                Registry::inkbridge()->error("[ThreadPool:{}] Task failed: {}", name_, e.what());
            }
        }
    });
}
