#pragma once

#include <QString>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace sl {

// Fixed set of worker threads draining one bounded FIFO queue.
//
// Tasks carry an optional deadline; a task dequeued after its deadline is
// skipped and its `onExpired` runs instead. The pool never blocks a
// submitter: a full queue rejects the task.
class TaskPool {
public:
    using Clock = std::chrono::steady_clock;

    TaskPool(QString name, int workers, int queueLimit);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    // Returns false if the pool is stopping or the queue is full.
    bool submit(std::function<void()> work, std::function<void()> onExpired = {},
                std::optional<Clock::time_point> deadline = std::nullopt);

    // Runs `work` on the pool and returns a future for its result, or
    // nullopt when the task was rejected. An expired task's future holds a
    // std::future_error (broken_promise).
    template <typename T>
    std::optional<std::future<T>> run(std::function<T()> work,
                                      std::optional<Clock::time_point> deadline = std::nullopt)
    {
        auto promise = std::make_shared<std::promise<T>>();
        std::future<T> future = promise->get_future();
        const bool accepted = submit(
            [promise, work = std::move(work)]() {
                try {
                    promise->set_value(work());
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            },
            [promise]() {
                promise->set_exception(std::make_exception_ptr(
                    std::future_error(std::future_errc::broken_promise)));
            },
            deadline);
        if (!accepted) {
            return std::nullopt;
        }
        return future;
    }

    void stop();

    int workerCount() const { return static_cast<int>(m_threads.size()); }
    int queueLimit() const { return m_queueLimit; }
    int queueDepth() const;

    struct Counters {
        int64_t submitted = 0;
        int64_t completed = 0;
        int64_t rejected = 0;
        int64_t expired = 0;
    };
    Counters counters() const;

private:
    struct Task {
        std::function<void()> work;
        std::function<void()> onExpired;
        std::optional<Clock::time_point> deadline;
    };

    void workerLoop();

    QString m_name;
    const int m_queueLimit;
    std::vector<std::thread> m_threads;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_queue;
    bool m_stop = false;

    std::atomic<int64_t> m_submitted{0};
    std::atomic<int64_t> m_completed{0};
    std::atomic<int64_t> m_rejected{0};
    std::atomic<int64_t> m_expired{0};
};

} // namespace sl
