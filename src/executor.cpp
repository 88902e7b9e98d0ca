#include "executor.hpp"
#include <algorithm>
#include <iostream>

namespace evoloop {

// ── TaskTracker ──────────────────────────────────────────────────────

void TaskTracker::track(TaskHandle h) {
    std::lock_guard<std::mutex> lock(mu_);
    handles_.push_back(std::move(h));
}

void TaskTracker::prune_locked() {
    handles_.erase(std::remove_if(handles_.begin(), handles_.end(), [](const TaskHandle& h) {
        return !h.finished || h.finished->load();
    }), handles_.end());
}

size_t TaskTracker::outstanding() {
    std::lock_guard<std::mutex> lock(mu_);
    prune_locked();
    return handles_.size();
}

void TaskTracker::cancel_all() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& h : handles_) {
        if (h.cancel) h.cancel->store(true);
    }
}

bool TaskTracker::wait_idle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (outstanding() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

// ── Single-use slot ──────────────────────────────────────────────────

static void collect(std::future<std::string>& fut, SlotOutcome& out) {
    try {
        out.result = fut.get();
    } catch (const std::exception&) {
        out.error = std::current_exception();
    }
}

SlotOutcome run_in_slot(Job job, std::chrono::milliseconds timeout,
                        CancelToken cancel, TaskTracker& tracker,
                        const std::string& name) {
    auto finished = std::make_shared<std::atomic_bool>(false);
    auto task = std::make_shared<std::packaged_task<std::string()>>(std::move(job));
    auto fut = task->get_future();

    std::thread th([task, finished]() {
        (*task)();
        finished->store(true);
    });

    SlotOutcome out;
    if (fut.wait_for(timeout) == std::future_status::ready) {
        th.join();
        collect(fut, out);
        return out;
    }

    if (cancel) cancel->store(true);
    th.detach();
    tracker.track(TaskHandle{name, cancel, finished});
    out.timed_out = true;
    return out;
}

// ── StickyLane ───────────────────────────────────────────────────────

void StickyLane::worker_loop(std::shared_ptr<Worker> w) {
    for (;;) {
        std::shared_ptr<std::packaged_task<std::string()>> task;
        {
            std::unique_lock<std::mutex> lock(w->mu);
            w->cv.wait(lock, [&] { return w->stop || !w->queue.empty(); });
            if (w->stop) break;
            task = std::move(w->queue.front());
            w->queue.pop_front();
        }
        (*task)();
    }
    w->finished->store(true);
}

StickyLane::Worker& StickyLane::ensure_worker() {
    if (!worker_) {
        worker_ = std::make_shared<Worker>();
        worker_->thread = std::thread(&StickyLane::worker_loop, worker_);
        generation_++;
    }
    return *worker_;
}

SlotOutcome StickyLane::run(Job job, std::chrono::milliseconds timeout,
                            CancelToken cancel, const std::string& name) {
    auto task = std::make_shared<std::packaged_task<std::string()>>(std::move(job));
    auto fut = task->get_future();

    Worker& w = ensure_worker();
    {
        std::lock_guard<std::mutex> lock(w.mu);
        w.queue.push_back(task);
    }
    current_cancel_ = cancel;
    w.cv.notify_one();

    SlotOutcome out;
    if (fut.wait_for(timeout) == std::future_status::ready) {
        current_cancel_.reset();
        collect(fut, out);
        return out;
    }

    std::cerr << "[tools] Stateful tool '" << name << "' timed out, resetting sticky lane\n";
    if (cancel) cancel->store(true);
    reset();
    out.timed_out = true;
    return out;
}

void StickyLane::reset() {
    if (!worker_) return;
    {
        std::lock_guard<std::mutex> lock(worker_->mu);
        worker_->stop = true;
        worker_->queue.clear();
    }
    worker_->cv.notify_all();
    if (worker_->thread.joinable()) worker_->thread.detach();
    tracker_.track(TaskHandle{"sticky-lane", current_cancel_, worker_->finished});
    current_cancel_.reset();
    worker_.reset();
}

StickyLane::~StickyLane() {
    if (!worker_) return;
    {
        std::lock_guard<std::mutex> lock(worker_->mu);
        worker_->stop = true;
        worker_->queue.clear();
    }
    worker_->cv.notify_all();
    if (worker_->thread.joinable()) worker_->thread.join();
}

} // namespace evoloop
