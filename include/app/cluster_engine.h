/**
 * @file cluster_engine.h
 * @brief 人脸聚类引擎 - 一次运行的完整流程
 * @details 加载观测 -> DBSCAN 聚类 -> 聚类质量评估 -> 逐簇画质评估与代表人脸选择
 *          -> 单事务整体替换旧结果。
 *          同一项目在整个进程内同一时刻只允许一次运行 (与数据库连接同为进程级)，
 *          不论由哪个 ClusterEngine 实例发起；失败或取消时旧结果保持不变。
 */

#ifndef CLUSTER_ENGINE_H
#define CLUSTER_ENGINE_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "app/run_monitor.h"
#include "core/clustering_quality_analyzer.h"
#include "core/face_quality_analyzer.h"
#include "database/database_types.h"
#include "service/engine_settings.h"
#include "service/label_remapper.h"
#include "service/representative_selector.h"

enum class ErrorCode {
    None,
    DatabaseUnavailable,
    LoadFailed,
    InvalidSettings,
    ClusteringFailed,
    PersistFailed,
    CollectionBusy
};

const char* error_code_name(ErrorCode code);

/**
 * @brief 一次运行的结果
 */
struct RunResult {
    int64_t collection_id = -1;
    RunState state = RunState::Idle;            // Done / Failed / Cancelled
    ErrorCode error = ErrorCode::None;
    std::string diagnostic;

    service::ResolvedParams params;
    ClusterQualityMetrics quality;
    std::map<std::string, PerClusterMetrics> quality_by_key;   // 稳定键 -> 单簇指标
    std::vector<db::ClusterRecord> clusters;                   // 按稳定键排序 (Done 时才会写入数据库)
    RunStats stats;

    bool ok() const { return state == RunState::Done; }
};

class ClusterEngine {
public:
    explicit ClusterEngine(const service::EngineSettings& settings = service::EngineSettings());

    /**
     * @brief 在调用线程上同步执行一次运行
     * @param collection_id 项目ID
     * @param monitor 可选的外部监控器 (可在其它线程读取进度)
     * @param cancel_request 可选的外部取消标志，运行登记之前置位同样生效
     * @return 终止状态及诊断信息
     */
    RunResult run(int64_t collection_id, RunMonitor* monitor = nullptr,
                  const std::atomic<bool>* cancel_request = nullptr);

    // 请求取消正在进行的运行 (在簇与簇之间生效)，该项目没有运行时返回 false
    bool cancel(int64_t collection_id);

    bool is_running(int64_t collection_id) const;

    const service::EngineSettings& settings() const { return settings_; }

private:
    // 运行期间登记在进程级注册表中，析构时注销
    class ActiveRun {
    public:
        ActiveRun(int64_t collection_id, const std::atomic<bool>* cancel_request);
        ~ActiveRun();
        ActiveRun(const ActiveRun&) = delete;
        ActiveRun& operator=(const ActiveRun&) = delete;
        bool acquired() const { return flag_ != nullptr; }
        bool cancelled() const;
    private:
        int64_t collection_id_;
        const std::atomic<bool>* cancel_request_;
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    // 加载项目快照，过滤与主流维度不一致的向量
    bool load_snapshot(int64_t collection_id, std::vector<db::FaceObservation>& out,
                       int& out_skipped, std::string& out_error);

    // 评估单个成员画质；同一张原图读取失败后本次运行不再重试
    FaceQualityMetrics score_face(const db::FaceObservation& obs,
                                  std::set<std::string>& unreadable_images,
                                  RunMonitor& monitor);

    RunResult finish(RunResult& result, RunMonitor& monitor, RunState state,
                     ErrorCode error, const std::string& diagnostic);

    service::EngineSettings settings_;
    FaceQualityAnalyzer face_analyzer_;
    ClusteringQualityAnalyzer cluster_analyzer_;
    service::RepresentativeSelector selector_;
    service::LabelRemapper remapper_;
};

#endif // CLUSTER_ENGINE_H
