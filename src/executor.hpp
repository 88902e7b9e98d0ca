#pragma once
#include "tool_registry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace evoloop {

using Job = std::function<std::string()>;

struct SlotOutcome {
    bool timed_out = false;
    std::string result;
    std::exception_ptr error;
};

// A job that was given up on. It may still be running.
struct TaskHandle {
    std::string name;
    CancelToken cancel;
    std::shared_ptr<std::atomic_bool> finished;
};

// Keeps the handles of abandoned jobs so nothing leaks unnoticed.
class TaskTracker {
public:
    void track(TaskHandle h);
    size_t outstanding();
    void cancel_all();
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    std::mutex mu_;
    std::vector<TaskHandle> handles_;
    void prune_locked();
};

// Runs one job on a fresh single-use thread. On timeout the cancel token is
// set, the thread is detached and handed to the tracker.
SlotOutcome run_in_slot(Job job, std::chrono::milliseconds timeout,
                        CancelToken cancel, TaskTracker& tracker,
                        const std::string& name);

// Single long-lived worker for stateful tools. Session state survives between
// calls; a timeout tears the worker down and the next call starts a new one.
class StickyLane {
public:
    explicit StickyLane(TaskTracker& tracker) : tracker_(tracker) {}
    ~StickyLane();

    StickyLane(const StickyLane&) = delete;
    StickyLane& operator=(const StickyLane&) = delete;

    SlotOutcome run(Job job, std::chrono::milliseconds timeout,
                    CancelToken cancel, const std::string& name);

    // Abandon the current worker and drop anything queued on it.
    void reset();

    bool has_worker() const { return worker_ != nullptr; }
    int generation() const { return generation_; }

private:
    struct Worker {
        std::mutex mu;
        std::condition_variable cv;
        std::deque<std::shared_ptr<std::packaged_task<std::string()>>> queue;
        bool stop = false;
        std::shared_ptr<std::atomic_bool> finished = std::make_shared<std::atomic_bool>(false);
        std::thread thread;
    };

    TaskTracker& tracker_;
    std::shared_ptr<Worker> worker_;
    CancelToken current_cancel_;
    int generation_ = 0;

    static void worker_loop(std::shared_ptr<Worker> w);
    Worker& ensure_worker();
};

} // namespace evoloop
