#include "runtime/main_loop.hpp"

#include <utility>

namespace asyncpath {

MainLoop::~MainLoop() { workers_.clear(); }

void MainLoop::post(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        pending_.push_back(std::move(task));
    }
    ready_.notify_one();
}

std::size_t MainLoop::run_pending() {
    std::deque<std::function<void()>> tasks;
    {
        std::lock_guard lock(mutex_);
        tasks.swap(pending_);
    }

    for (auto &task : tasks) {
        task();
    }

    reap_finished_workers();
    return tasks.size();
}

bool MainLoop::run_until(const std::function<bool()> &done, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        run_pending();
        if (done()) {
            return true;
        }

        std::unique_lock lock(mutex_);
        if (!ready_.wait_until(lock, deadline, [this] { return !pending_.empty(); })) {
            lock.unlock();
            run_pending();
            return done();
        }
    }
}

std::size_t MainLoop::active_workers() const noexcept { return workers_.size(); }

void MainLoop::start_worker(std::function<void()> body) {
    auto finished = std::make_shared<std::atomic<bool>>(false);

    workers_.push_back(Worker{
        .finished = finished,
        .thread = std::jthread([body = std::move(body), finished]() {
            body();
            finished->store(true);
        }),
    });
}

void MainLoop::reap_finished_workers() {
    workers_.remove_if([](const Worker &worker) { return worker.finished->load(); });
}

} // namespace asyncpath
