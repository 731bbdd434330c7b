#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <expected>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace asyncpath {

struct WorkerError {
    std::string message;
};

template <typename T>
using WorkerResult = std::expected<T, WorkerError>;

// Runs blocking work on one thread per request and hands results back to the
// thread that drains the loop.
class MainLoop {
  public:
    MainLoop() = default;
    ~MainLoop();

    MainLoop(const MainLoop &) = delete;
    MainLoop &operator=(const MainLoop &) = delete;

    // Thread-safe.
    void post(std::function<void()> task);

    std::size_t run_pending();
    bool run_until(const std::function<bool()> &done, std::chrono::milliseconds timeout);

    // `work` runs on a new thread; `done` receives its value, or the message
    // of the exception it threw, on the draining thread.
    template <typename Work, typename Done>
    void spawn(Work work, Done done) {
        start_worker([this, work = std::move(work), done = std::move(done)]() mutable {
            auto result = run_guarded(work);
            post([done = std::move(done), result = std::move(result)]() mutable { done(std::move(result)); });
        });
    }

    [[nodiscard]] std::size_t active_workers() const noexcept;

  private:
    struct Worker {
        std::shared_ptr<std::atomic<bool>> finished;
        std::jthread thread;
    };

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::function<void()>> pending_;
    std::list<Worker> workers_;

    void start_worker(std::function<void()> body);
    void reap_finished_workers();

    template <typename Work>
    [[nodiscard]] static WorkerResult<std::invoke_result_t<Work &>> run_guarded(Work &work) {
        try {
            return WorkerResult<std::invoke_result_t<Work &>>(std::in_place, work());
        } catch (const std::exception &error) {
            return std::unexpected(WorkerError{error.what()});
        }
    }
};

} // namespace asyncpath
