#include "core/shared/task_pool.h"

#include "core/shared/logging.h"

#include <algorithm>

namespace sl {

TaskPool::TaskPool(QString name, int workers, int queueLimit)
    : m_name(std::move(name))
    , m_queueLimit(std::max(queueLimit, 1))
{
    const int count = std::max(workers, 1);
    m_threads.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_threads.emplace_back([this]() { workerLoop(); });
    }
    LOG_DEBUG(slCore, "TaskPool %s: %d worker(s), queue limit %d",
              qPrintable(m_name), count, m_queueLimit);
}

TaskPool::~TaskPool()
{
    stop();
}

bool TaskPool::submit(std::function<void()> work, std::function<void()> onExpired,
                      std::optional<Clock::time_point> deadline)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop || static_cast<int>(m_queue.size()) >= m_queueLimit) {
            m_rejected.fetch_add(1);
            return false;
        }
        m_queue.push_back(Task{std::move(work), std::move(onExpired), deadline});
        m_submitted.fetch_add(1);
    }
    m_cv.notify_one();
    return true;
}

void TaskPool::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop) {
            return;
        }
        m_stop = true;
    }
    m_cv.notify_all();

    for (std::thread& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void TaskPool::workerLoop()
{
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stop || !m_queue.empty(); });
            if (m_stop && m_queue.empty()) {
                return;
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }

        if (task.deadline && Clock::now() > task.deadline.value()) {
            m_expired.fetch_add(1);
            if (task.onExpired) {
                task.onExpired();
            }
            continue;
        }

        task.work();
        m_completed.fetch_add(1);
    }
}

int TaskPool::queueDepth() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_queue.size());
}

TaskPool::Counters TaskPool::counters() const
{
    return {m_submitted.load(), m_completed.load(), m_rejected.load(), m_expired.load()};
}

} // namespace sl
