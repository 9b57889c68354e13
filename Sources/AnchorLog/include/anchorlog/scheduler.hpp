#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace anchorlog {

// ============================================================================
// Scheduler interface - execution context for the async storage façade
// ============================================================================

struct scheduler {
    virtual ~scheduler() = default;

    // Run `fn` on this scheduler's execution context. Callable from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // False once the scheduler has stopped accepting work.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Immediate scheduler - runs work synchronously on the calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

// ============================================================================
// Serial worker scheduler - one dedicated thread, FIFO order
// ============================================================================
//
// Work posted here runs strictly one item at a time, which gives the
// sequential per-instance pipeline the orchestrator expects.

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    // Drains queued work before joining.
    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop() {
        for (;;) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
                if (queue_.empty()) {
                    return;   // stopped and drained
                }
                fn = std::move(queue_.front());
                queue_.pop();
            }
            if (fn) fn();
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

inline shared_scheduler make_default_scheduler() {
    return std::make_shared<immediate_scheduler>();
}

} // namespace anchorlog
