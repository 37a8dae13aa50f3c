/**
 * @file cluster_worker.h
 * @brief 聚类工作线程
 * @details 在独立线程上依次执行排队的项目聚类任务，调用方线程不被阻塞。
 */

#ifndef CLUSTER_WORKER_H
#define CLUSTER_WORKER_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include "app/cluster_engine.h"
#include "app/run_monitor.h"

class ClusterWorker {
public:
    using CompletionCallback = std::function<void(const RunResult& result)>;

    ClusterWorker(ClusterEngine* engine, RunMonitor* monitor);
    ~ClusterWorker();

    void start();
    void stop();

    // 排队一个项目；已在队列中时返回 false
    bool push_task(int64_t collection_id);

    /**
     * @brief 取消项目
     * @details 尚未开始的任务直接出队并记为 Cancelled；已出队的当前任务
     *          置位取消标志，由引擎在下一个检查点结束。
     * @return 找到对应任务返回 true
     */
    bool cancel(int64_t collection_id);

    // 阻塞直到队列为空且当前没有任务在运行
    void wait_idle();

    // 项目最近一次运行结果
    std::optional<RunResult> latest_result(int64_t collection_id);

    void set_completion_callback(CompletionCallback cb) { completion_cb_ = std::move(cb); }

private:
    void thread_loop();
    void publish(const RunResult& result);

    ClusterEngine* engine_;
    RunMonitor* monitor_;

    std::thread thread_;
    std::atomic<bool> running_;

    std::deque<int64_t> task_queue_;
    int64_t current_task_ = -1;         // -1 表示空闲
    std::atomic<bool> cancel_current_;  // 当前任务的取消请求，出队后到引擎登记前也有效
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::map<int64_t, RunResult> results_;
    std::mutex result_mutex_;

    CompletionCallback completion_cb_;
};

#endif // CLUSTER_WORKER_H
