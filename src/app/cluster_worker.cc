/**
 * @file cluster_worker.cc
 * @brief 聚类工作线程
 * @details 职责：
 * 1. 任务消费：从队列取出项目ID，调用 ClusterEngine 同步执行。
 * 2. 结果保存：记录每个项目最近一次 RunResult 并通知回调。
 * 3. 取消：未开始的任务直接出队，运行中的任务交给引擎在簇之间停止。
 */

#include "app/cluster_worker.h"
#include <algorithm>
#include <iostream>

ClusterWorker::ClusterWorker(ClusterEngine* engine, RunMonitor* monitor)
    : engine_(engine)
    , monitor_(monitor)
    , running_(false)
    , cancel_current_(false)
{
}

ClusterWorker::~ClusterWorker() {
    stop();
}

void ClusterWorker::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&ClusterWorker::thread_loop, this);
}

void ClusterWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
        // 正在运行的任务在下一个簇之前结束
        if (current_task_ >= 0) {
            cancel_current_ = true;
        }
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ClusterWorker::push_task(int64_t collection_id) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (std::find(task_queue_.begin(), task_queue_.end(), collection_id) != task_queue_.end()) {
        return false;
    }
    task_queue_.push_back(collection_id);
    lock.unlock();
    queue_cv_.notify_one();
    return true;
}

bool ClusterWorker::cancel(int64_t collection_id) {
    bool dequeued = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        auto it = std::find(task_queue_.begin(), task_queue_.end(), collection_id);
        if (it != task_queue_.end()) {
            task_queue_.erase(it);
            dequeued = true;
        } else if (current_task_ == collection_id) {
            cancel_current_ = true;
            std::cout << "[ClusterWorker] Cancellation requested for running collection "
                      << collection_id << std::endl;
            return true;
        }
    }

    if (dequeued) {
        RunResult result;
        result.collection_id = collection_id;
        result.state = RunState::Cancelled;
        result.diagnostic = "cancelled before start";
        publish(result);
        idle_cv_.notify_all();
        return true;
    }
    return engine_->cancel(collection_id);
}

void ClusterWorker::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return (task_queue_.empty() && current_task_ < 0) || !running_;
    });
}

std::optional<RunResult> ClusterWorker::latest_result(int64_t collection_id) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    auto it = results_.find(collection_id);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

void ClusterWorker::publish(const RunResult& result) {
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        results_[result.collection_id] = result;
    }
    if (completion_cb_) {
        completion_cb_(result);
    }
}

void ClusterWorker::thread_loop() {
    while (running_) {
        int64_t collection_id;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !running_; });

            if (!running_) break;

            collection_id = task_queue_.front();
            task_queue_.pop_front();
            current_task_ = collection_id;
            cancel_current_ = false;
        }

        RunResult result = engine_->run(collection_id, monitor_, &cancel_current_);
        std::cout << "[ClusterWorker] Collection " << collection_id << " finished: "
                  << run_state_name(result.state) << std::endl;
        publish(result);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            current_task_ = -1;
        }
        idle_cv_.notify_all();
    }
}
