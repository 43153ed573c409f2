#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>

namespace ndcapture
{

// Host task queue as seen by the export scheduler: the scheduler yields by
// posting its next batch, and the host runs it on a later turn.
class TaskExecutor
{
   public:
    virtual ~TaskExecutor() = default;

    virtual void post(std::function<void()> task) = 0;
};

// Lock-free SPSC (Single-Producer Single-Consumer) ring buffer of tasks.
// The producer side may be the consumer thread itself (a task posting its
// continuation), which is how the export scheduler uses it.
class TaskQueue final : public TaskExecutor
{
   public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit TaskQueue(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity < 2 ? 2 : capacity), buffer_(new Slot[capacity_])
    {
    }

    ~TaskQueue() override { delete[] buffer_; }

    TaskQueue(const TaskQueue&)            = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Producer side: enqueue a task. Returns false if the queue is full.
    bool push(std::function<void()> task)
    {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = (head + 1) % capacity_;

        if (next == tail_.load(std::memory_order_acquire))
        {
            return false;   // Full
        }

        buffer_[head].task = std::move(task);
        head_.store(next, std::memory_order_release);
        return true;
    }

    void post(std::function<void()> task) override
    {
        if (!push(std::move(task)))
        {
            throw std::runtime_error("Task queue full");
        }
    }

    // Consumer side: dequeue a task. Returns false if the queue is empty.
    bool pop(std::function<void()>& out)
    {
        const size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire))
        {
            return false;   // Empty
        }

        out = std::move(buffer_[tail].task);
        tail_.store((tail + 1) % capacity_, std::memory_order_release);
        return true;
    }

    // Consumer side: run exactly one task (one "turn" of the host loop).
    bool run_one()
    {
        std::function<void()> task;
        if (!pop(task))
            return false;
        if (task)
            task();
        ++executed_;
        return true;
    }

    // Consumer side: run tasks until the queue is empty, including tasks
    // posted while draining. `max_tasks` = 0 means unbounded.
    size_t drain(size_t max_tasks = 0)
    {
        size_t count = 0;
        while ((max_tasks == 0 || count < max_tasks) && run_one())
        {
            ++count;
        }
        return count;
    }

    bool empty() const
    {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    size_t   capacity() const { return capacity_; }
    uint64_t executed() const { return executed_; }

   private:
    struct Slot
    {
        std::function<void()> task;
    };

    const size_t capacity_;
    Slot*        buffer_;
    uint64_t     executed_ = 0;   // Consumer side only

    // Cache-line aligned to avoid false sharing
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

}   // namespace ndcapture
