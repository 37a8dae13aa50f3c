/**
 * @file run_monitor.h
 * @brief 聚类运行监控
 * @details 记录一次运行的状态迁移和各阶段计数，供界面或自动化读取：
 * 1. 状态: Idle -> Loading -> Clustering -> ScoringClustering -> ScoringFaces
 *    -> SelectingRepresentatives -> Persisting -> Done / Failed / Cancelled。
 * 2. 计数: 加载 / 跳过的观测数、簇数、噪声数、各回退级别的代表人脸数。
 * 计数使用原子变量，可以在其它线程随时 snapshot()。
 */

#ifndef RUN_MONITOR_H
#define RUN_MONITOR_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>
#include "service/representative_selector.h"

enum class RunState {
    Idle,
    Loading,
    Clustering,
    ScoringClustering,
    ScoringFaces,
    SelectingRepresentatives,
    Persisting,
    Done,
    Failed,
    Cancelled
};

const char* run_state_name(RunState state);

// Done / Failed / Cancelled
bool is_terminal(RunState state);

struct RunStats {
    int64_t collection_id = -1;
    RunState state = RunState::Idle;
    int observations_loaded = 0;
    int observations_skipped = 0;
    int clusters_found = 0;
    int noise_count = 0;
    int clusters_processed = 0;
    int faces_scored = 0;
    int unreadable_crops = 0;
    int level_counts[4] = {0, 0, 0, 0};     // 回退级别 1-4 选出的代表人脸数
    double elapsed_ms = 0.0;
};

class RunMonitor {
public:
    using StateCallback = std::function<void(int64_t collection_id, RunState state)>;
    // done / total: 已处理簇数 / 总簇数
    using ProgressCallback = std::function<void(int64_t collection_id, int done, int total)>;

    RunMonitor();

    void set_state_callback(StateCallback cb) { state_cb_ = std::move(cb); }
    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    // 新一次运行开始，清零全部计数
    void begin_run(int64_t collection_id);

    void mark_state(RunState state);
    void mark_loaded(int loaded, int skipped);
    void mark_clusters(int clusters, int noise);
    void mark_face_scored(bool unreadable);
    void mark_representative(service::SelectionLevel level);
    void mark_cluster_done(int total);

    RunState state() const { return static_cast<RunState>(state_.load()); }

    RunStats snapshot() const;

private:
    std::atomic<int64_t> collection_id_{-1};
    std::atomic<int> state_{static_cast<int>(RunState::Idle)};
    std::atomic<int> loaded_{0};
    std::atomic<int> skipped_{0};
    std::atomic<int> clusters_{0};
    std::atomic<int> noise_{0};
    std::atomic<int> processed_{0};
    std::atomic<int> faces_scored_{0};
    std::atomic<int> unreadable_{0};
    std::atomic<int> level_counts_[4];

    std::atomic<int64_t> start_ns_{0};
    std::atomic<int64_t> end_ns_{0};

    StateCallback state_cb_;
    ProgressCallback progress_cb_;
};

#endif // RUN_MONITOR_H
