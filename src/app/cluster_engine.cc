/**
 * @file cluster_engine.cc
 * @brief 人脸聚类引擎实现
 * @details 职责：
 * 1. 项目互斥：同一项目在进程内同时只允许一次运行。
 * 2. 快照加载：一次性读入内存，运行期间不再访问 face_observations。
 * 3. 聚类与评估：DBSCAN + 聚类质量评估，原始标签重映射为稳定键。
 * 4. 代表人脸：逐簇画质评估，按回退策略链选择。
 * 5. 持久化：单事务整体替换，失败 / 取消时不写入任何数据。
 */

#include "app/cluster_engine.h"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include "core/dbscan.h"
#include "database/cluster_dao.h"
#include "database/database_manager.h"
#include "database/face_observation_dao.h"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::DatabaseUnavailable: return "DatabaseUnavailable";
        case ErrorCode::LoadFailed: return "LoadFailed";
        case ErrorCode::InvalidSettings: return "InvalidSettings";
        case ErrorCode::ClusteringFailed: return "ClusteringFailed";
        case ErrorCode::PersistFailed: return "PersistFailed";
        case ErrorCode::CollectionBusy: return "CollectionBusy";
    }
    return "None";
}

// ==================== ActiveRun ====================

namespace {

// 进程级运行注册表: 项目ID -> 取消标志
struct RunRegistry {
    std::mutex mutex;
    std::map<int64_t, std::shared_ptr<std::atomic<bool>>> active;
};

RunRegistry& run_registry() {
    static RunRegistry registry;
    return registry;
}

} // namespace

ClusterEngine::ActiveRun::ActiveRun(int64_t collection_id, const std::atomic<bool>* cancel_request)
    : collection_id_(collection_id)
    , cancel_request_(cancel_request)
{
    RunRegistry& registry = run_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    if (registry.active.count(collection_id_) == 0) {
        flag_ = std::make_shared<std::atomic<bool>>(false);
        registry.active[collection_id_] = flag_;
    }
}

ClusterEngine::ActiveRun::~ActiveRun() {
    if (!flag_) return;
    RunRegistry& registry = run_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.active.erase(collection_id_);
}

bool ClusterEngine::ActiveRun::cancelled() const {
    if (!flag_) return false;
    return flag_->load() || (cancel_request_ && cancel_request_->load());
}

// ==================== ClusterEngine ====================

ClusterEngine::ClusterEngine(const service::EngineSettings& settings)
    : settings_(settings)
    , face_analyzer_(settings.face_quality)
    , cluster_analyzer_(settings.cluster_quality)
    , selector_(settings.selection)
{
}

bool ClusterEngine::cancel(int64_t collection_id) {
    RunRegistry& registry = run_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    auto it = registry.active.find(collection_id);
    if (it == registry.active.end()) return false;
    it->second->store(true);
    std::cout << "[ClusterEngine] Cancellation requested for collection " << collection_id << std::endl;
    return true;
}

bool ClusterEngine::is_running(int64_t collection_id) const {
    RunRegistry& registry = run_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    return registry.active.count(collection_id) > 0;
}

RunResult ClusterEngine::finish(RunResult& result, RunMonitor& monitor, RunState state,
                                ErrorCode error, const std::string& diagnostic) {
    result.state = state;
    result.error = error;
    result.diagnostic = diagnostic;

    if (state == RunState::Failed) {
        std::cerr << "[ClusterEngine] Run failed for collection " << result.collection_id
                  << " (" << error_code_name(error) << "): " << diagnostic << std::endl;
    } else if (state == RunState::Cancelled) {
        std::cout << "[ClusterEngine] Run cancelled for collection " << result.collection_id
                  << ", previous clusters kept" << std::endl;
    }

    monitor.mark_state(state);
    result.stats = monitor.snapshot();
    return result;
}

bool ClusterEngine::load_snapshot(int64_t collection_id, std::vector<db::FaceObservation>& out,
                                  int& out_skipped, std::string& out_error) {
    db::FaceObservationDao dao;
    std::vector<db::FaceObservation> rows;
    if (!dao.get_observations(collection_id, rows, out_skipped)) {
        out_error = "failed to read observations: " + db::DatabaseManager::instance().last_error();
        return false;
    }

    // 主流维度: 出现次数最多者，次数相同取先出现者
    std::vector<std::pair<size_t, int>> dim_counts;
    for (const auto& o : rows) {
        bool found = false;
        for (auto& dc : dim_counts) {
            if (dc.first == o.embedding.size()) {
                dc.second++;
                found = true;
                break;
            }
        }
        if (!found) dim_counts.push_back({o.embedding.size(), 1});
    }
    size_t dominant = 0;
    int best = 0;
    for (const auto& dc : dim_counts) {
        if (dc.second > best) {
            best = dc.second;
            dominant = dc.first;
        }
    }

    out.clear();
    out.reserve(rows.size());
    for (auto& o : rows) {
        if (o.embedding.size() != dominant) {
            std::cerr << "[ClusterEngine] Skipping observation " << o.id << ": embedding dim "
                      << o.embedding.size() << " != " << dominant << std::endl;
            out_skipped++;
            continue;
        }
        out.push_back(std::move(o));
    }
    return true;
}

FaceQualityMetrics ClusterEngine::score_face(const db::FaceObservation& obs,
                                             std::set<std::string>& unreadable_images,
                                             RunMonitor& monitor) {
    if (obs.source_image_path.empty() || unreadable_images.count(obs.source_image_path) > 0) {
        monitor.mark_face_scored(true);
        return face_analyzer_.default_metrics(obs.confidence);
    }

    FaceQualityMetrics m = face_analyzer_.analyze(obs.source_image_path, obs.bbox, obs.confidence);
    if (!m.analyzed) {
        // 边框无效不代表图片坏了，只缓存图片读取失败的情况
        if (!m.image_loaded) {
            unreadable_images.insert(obs.source_image_path);
        }
        monitor.mark_face_scored(true);
        return m;
    }
    monitor.mark_face_scored(false);
    return m;
}

RunResult ClusterEngine::run(int64_t collection_id, RunMonitor* external_monitor,
                             const std::atomic<bool>* cancel_request) {
    RunResult result;
    result.collection_id = collection_id;

    ActiveRun active(collection_id, cancel_request);
    if (!active.acquired()) {
        result.state = RunState::Failed;
        result.error = ErrorCode::CollectionBusy;
        result.diagnostic = "another run is in progress for this collection";
        std::cerr << "[ClusterEngine] Collection " << collection_id << " is busy, run rejected" << std::endl;
        return result;
    }

    RunMonitor local_monitor;
    RunMonitor& monitor = external_monitor ? *external_monitor : local_monitor;
    monitor.begin_run(collection_id);

    if (active.cancelled()) {
        return finish(result, monitor, RunState::Cancelled, ErrorCode::None, "cancelled before start");
    }

    // ---------- Loading ----------
    monitor.mark_state(RunState::Loading);

    std::string error;
    if (!settings_.validate(error)) {
        return finish(result, monitor, RunState::Failed, ErrorCode::InvalidSettings, error);
    }
    if (!db::DatabaseManager::instance().is_open()) {
        return finish(result, monitor, RunState::Failed, ErrorCode::DatabaseUnavailable, "database is not open");
    }

    std::vector<db::FaceObservation> snapshot;
    int skipped = 0;
    if (!load_snapshot(collection_id, snapshot, skipped, error)) {
        return finish(result, monitor, RunState::Failed, ErrorCode::LoadFailed, error);
    }
    monitor.mark_loaded(static_cast<int>(snapshot.size()), skipped);

    std::cout << "[ClusterEngine] Collection " << collection_id << ": loaded "
              << snapshot.size() << " observations";
    if (skipped > 0) {
        std::cout << " (" << skipped << " skipped: malformed embedding)";
    }
    std::cout << std::endl;

    if (active.cancelled()) {
        return finish(result, monitor, RunState::Cancelled, ErrorCode::None, "cancelled after loading");
    }

    const DistanceMetric metric = settings_.clustering.metric;
    result.params = settings_.resolve_clustering_params(collection_id, static_cast<int>(snapshot.size()));

    // 向量移出快照，候选人脸通过指针引用
    std::vector<std::vector<float>> points;
    std::vector<int64_t> ids;
    points.reserve(snapshot.size());
    ids.reserve(snapshot.size());
    for (auto& o : snapshot) {
        points.push_back(std::move(o.embedding));
        ids.push_back(o.id);
    }

    // ---------- Clustering ----------
    // 空快照同样经过各阶段，得到零个簇
    monitor.mark_state(RunState::Clustering);
    std::vector<int> labels;
    if (!points.empty()) {
        std::cout << "[ClusterEngine] DBSCAN eps=" << result.params.eps
                  << " min_samples=" << result.params.min_samples
                  << " metric=" << distance_metric_name(metric)
                  << " (" << result.params.source << ")" << std::endl;

        Dbscan dbscan(result.params.eps, result.params.min_samples, metric);
        if (dbscan.fit(points, labels) != 0) {
            return finish(result, monitor, RunState::Failed, ErrorCode::ClusteringFailed,
                          "clustering failed: " + dbscan.last_error());
        }
    }

    // ---------- ScoringClustering ----------
    monitor.mark_state(RunState::ScoringClustering);
    result.quality = cluster_analyzer_.analyze(points, labels, metric);
    monitor.mark_clusters(result.quality.cluster_count, result.quality.noise_count);

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(3)
            << result.quality.cluster_count << " clusters, "
            << result.quality.noise_count << " noise (" << result.quality.noise_ratio * 100.0f << "%), "
            << "silhouette " << result.quality.silhouette_score
            << ", davies-bouldin " << result.quality.davies_bouldin_index
            << ", quality " << result.quality.overall_quality
            << " (" << cluster_quality_label_name(result.quality.quality_label) << ")";
    std::cout << "[ClusterEngine] " << summary.str() << std::endl;
    for (const auto& s : result.quality.tuning_suggestions) {
        std::cout << "[ClusterEngine]   - " << s << std::endl;
    }

    // 原始标签 -> 稳定键，同一簇的成员按 id 升序
    std::map<int, std::string> keys = remapper_.remap(labels, ids);
    std::map<std::string, std::pair<int, std::vector<int>>> groups;
    for (size_t row = 0; row < labels.size(); ++row) {
        if (labels[row] < 0) continue;
        auto& g = groups[keys[labels[row]]];
        g.first = labels[row];
        g.second.push_back(static_cast<int>(row));
    }

    // ---------- ScoringFaces / SelectingRepresentatives ----------
    std::set<std::string> unreadable_images;
    const int total = static_cast<int>(groups.size());
    int level_counts[4] = {0, 0, 0, 0};

    for (const auto& g : groups) {
        if (active.cancelled()) {
            return finish(result, monitor, RunState::Cancelled, ErrorCode::None,
                          "cancelled during representative selection");
        }

        const std::string& key = g.first;
        const int raw_label = g.second.first;
        const std::vector<int>& rows = g.second.second;

        monitor.mark_state(RunState::ScoringFaces);
        service::SelectionContext ctx;
        ctx.metric = metric;
        for (int row : rows) {
            const db::FaceObservation& obs = snapshot[row];
            service::SelectionCandidate c;
            c.face_id = obs.id;
            c.embedding = &points[row];
            c.bbox = obs.bbox;
            c.confidence = obs.confidence;
            c.quality = score_face(obs, unreadable_images, monitor);
            ctx.members.push_back(c);
        }

        monitor.mark_state(RunState::SelectingRepresentatives);
        ctx.centroid = compute_centroid(points, rows);
        std::optional<service::Representative> rep = selector_.select(ctx);
        if (!rep) {
            return finish(result, monitor, RunState::Failed, ErrorCode::ClusteringFailed,
                          "no representative for cluster " + key);
        }
        monitor.mark_representative(rep->level);
        level_counts[static_cast<int>(rep->level) - 1]++;

        db::ClusterRecord record;
        record.collection_id = collection_id;
        record.cluster_key = key;
        std::set<std::string> photos;
        int photos_without_path = 0;
        for (int row : rows) {
            record.member_ids.push_back(snapshot[row].id);
            if (snapshot[row].source_image_path.empty()) {
                photos_without_path++;
            } else {
                photos.insert(snapshot[row].source_image_path);
            }
        }
        record.photo_count = static_cast<int>(photos.size()) + photos_without_path;
        record.centroid = ctx.centroid;
        record.representative_id = rep->face_id;
        record.selection_level = static_cast<int>(rep->level);
        record.representative_quality = rep->quality;

        const PerClusterMetrics& pc = result.quality.per_cluster[raw_label];
        record.silhouette = pc.silhouette;
        record.compactness = pc.compactness;
        record.separation = pc.separation;
        result.quality_by_key[key] = pc;
        result.clusters.push_back(record);

        monitor.mark_cluster_done(total);
    }

    if (active.cancelled()) {
        return finish(result, monitor, RunState::Cancelled, ErrorCode::None, "cancelled before persisting");
    }

    // ---------- Persisting ----------
    monitor.mark_state(RunState::Persisting);

    db::ClusterRunRecord run;
    run.collection_id = collection_id;
    run.finished_at = std::time(nullptr);
    run.eps = result.params.eps;
    run.min_samples = result.params.min_samples;
    run.param_source = result.params.source;
    run.observations_loaded = static_cast<int>(snapshot.size());
    run.observations_skipped = skipped;
    run.cluster_count = result.quality.cluster_count;
    run.noise_count = result.quality.noise_count;
    run.noise_ratio = result.quality.noise_ratio;
    run.silhouette = result.quality.silhouette_score;
    run.davies_bouldin = result.quality.davies_bouldin_index;
    run.compactness = result.quality.avg_cluster_compactness;
    run.separation = result.quality.avg_cluster_separation;
    run.overall_quality = result.quality.overall_quality;
    run.quality_label = cluster_quality_label_name(result.quality.quality_label);
    run.suggestions = result.quality.tuning_suggestions;
    for (int i = 0; i < 4; ++i) {
        run.level_counts[i] = level_counts[i];
    }

    db::ClusterDao dao;
    if (!dao.replace_clusters(collection_id, result.clusters, run)) {
        return finish(result, monitor, RunState::Failed, ErrorCode::PersistFailed,
                      "transaction failed: " + dao.last_error());
    }

    std::cout << "[ClusterEngine] Collection " << collection_id << " done: "
              << result.clusters.size() << " clusters saved (representatives by level: "
              << level_counts[0] << "/" << level_counts[1] << "/"
              << level_counts[2] << "/" << level_counts[3] << ")" << std::endl;

    return finish(result, monitor, RunState::Done, ErrorCode::None, "");
}
