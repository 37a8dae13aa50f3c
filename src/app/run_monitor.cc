/**
 * @file run_monitor.cc
 * @brief 聚类运行监控实现
 * @details 职责：
 * 1. 状态迁移：记录当前状态并通知回调。
 * 2. 阶段计数：原子累加，线程安全。
 * 3. 耗时统计：begin_run 到进入终止状态之间的毫秒数。
 */

#include "app/run_monitor.h"

namespace {

int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::Idle: return "Idle";
        case RunState::Loading: return "Loading";
        case RunState::Clustering: return "Clustering";
        case RunState::ScoringClustering: return "ScoringClustering";
        case RunState::ScoringFaces: return "ScoringFaces";
        case RunState::SelectingRepresentatives: return "SelectingRepresentatives";
        case RunState::Persisting: return "Persisting";
        case RunState::Done: return "Done";
        case RunState::Failed: return "Failed";
        case RunState::Cancelled: return "Cancelled";
    }
    return "Idle";
}

bool is_terminal(RunState state) {
    return state == RunState::Done || state == RunState::Failed || state == RunState::Cancelled;
}

RunMonitor::RunMonitor() {
    for (auto& c : level_counts_) {
        c.store(0);
    }
}

void RunMonitor::begin_run(int64_t collection_id) {
    collection_id_ = collection_id;
    state_ = static_cast<int>(RunState::Idle);
    loaded_ = 0;
    skipped_ = 0;
    clusters_ = 0;
    noise_ = 0;
    processed_ = 0;
    faces_scored_ = 0;
    unreadable_ = 0;
    for (auto& c : level_counts_) {
        c.store(0);
    }
    start_ns_ = now_ns();
    end_ns_ = 0;
}

void RunMonitor::mark_state(RunState state) {
    state_ = static_cast<int>(state);
    if (is_terminal(state)) {
        end_ns_ = now_ns();
    }
    if (state_cb_) {
        state_cb_(collection_id_.load(), state);
    }
}

void RunMonitor::mark_loaded(int loaded, int skipped) {
    loaded_ = loaded;
    skipped_ = skipped;
}

void RunMonitor::mark_clusters(int clusters, int noise) {
    clusters_ = clusters;
    noise_ = noise;
}

void RunMonitor::mark_face_scored(bool unreadable) {
    faces_scored_.fetch_add(1, std::memory_order_relaxed);
    if (unreadable) {
        unreadable_.fetch_add(1, std::memory_order_relaxed);
    }
}

void RunMonitor::mark_representative(service::SelectionLevel level) {
    int idx = static_cast<int>(level) - 1;
    if (idx >= 0 && idx < 4) {
        level_counts_[idx].fetch_add(1, std::memory_order_relaxed);
    }
}

void RunMonitor::mark_cluster_done(int total) {
    int done = processed_.fetch_add(1) + 1;
    if (progress_cb_) {
        progress_cb_(collection_id_.load(), done, total);
    }
}

RunStats RunMonitor::snapshot() const {
    RunStats s;
    s.collection_id = collection_id_.load();
    s.state = state();
    s.observations_loaded = loaded_.load();
    s.observations_skipped = skipped_.load();
    s.clusters_found = clusters_.load();
    s.noise_count = noise_.load();
    s.clusters_processed = processed_.load();
    s.faces_scored = faces_scored_.load();
    s.unreadable_crops = unreadable_.load();
    for (int i = 0; i < 4; ++i) {
        s.level_counts[i] = level_counts_[i].load();
    }

    int64_t start = start_ns_.load();
    int64_t end = end_ns_.load();
    if (start > 0) {
        int64_t stop = end > 0 ? end : now_ns();
        s.elapsed_ms = (stop - start) / 1e6;
    }
    return s;
}
