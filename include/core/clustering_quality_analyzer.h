/**
 * @file clustering_quality_analyzer.h
 * @brief 聚类结果质量评估
 * @details 输入 N 个特征向量及其簇标签 (-1 为噪声)，输出轮廓系数、
 *          Davies-Bouldin 指数、紧致度、分离度、噪声比例、综合质量分
 *          以及参数调优建议。退化输入 (全部噪声、只有一个簇) 返回哨兵值，不抛异常。
 */

#ifndef _CLUSTERING_QUALITY_ANALYZER_H_
#define _CLUSTERING_QUALITY_ANALYZER_H_

#include <map>
#include <string>
#include <vector>
#include "config.h"
#include "core/vector_math.h"

enum class ClusterQualityLabel {
    Excellent,
    Good,
    Fair,
    Poor,
    InsufficientClusters,   // 只有一个簇，轮廓系数 / DB 指数无定义
    InsufficientData        // 没有簇或数据不足
};

const char* cluster_quality_label_name(ClusterQualityLabel label);

// 噪声比例分档: < 15% 可接受, 15-30% 中等, > 30% 需关注
enum class NoiseLevel {
    Acceptable,
    Moderate,
    Concerning
};

const char* noise_level_name(NoiseLevel level);

/**
 * @brief 单个簇的内聚 / 分离指标
 */
struct PerClusterMetrics {
    int size = 0;
    float silhouette = 0.0f;    // 成员轮廓系数均值
    float compactness = 0.0f;   // 成员到质心的平均距离
    float separation = 0.0f;    // 到最近的其它簇质心的距离 (只有一个簇时为 0)
};

struct ClusterQualityMetrics {
    float silhouette_score = 0.0f;
    float davies_bouldin_index = Config::ClusterQuality::DB_UNDEFINED;
    float avg_cluster_compactness = 0.0f;
    float avg_cluster_separation = 0.0f;
    int face_count = 0;
    int cluster_count = 0;
    int noise_count = 0;
    float noise_ratio = 1.0f;
    float overall_quality = 0.0f;
    ClusterQualityLabel quality_label = ClusterQualityLabel::InsufficientData;
    std::vector<int> cluster_sizes;                     // 按簇标签升序
    std::map<int, PerClusterMetrics> per_cluster;       // 原始簇标签 -> 指标
    std::vector<std::string> tuning_suggestions;
};

struct ClusterQualityWeights {
    float silhouette = Config::ClusterQuality::WEIGHT_SILHOUETTE;
    float davies_bouldin = Config::ClusterQuality::WEIGHT_DAVIES_BOULDIN;
    float noise = Config::ClusterQuality::WEIGHT_NOISE;
    float compactness = Config::ClusterQuality::WEIGHT_COMPACTNESS;

    float sum() const { return silhouette + davies_bouldin + noise + compactness; }
};

struct ClusterQualityConfig {
    float silhouette_excellent = Config::ClusterQuality::SILHOUETTE_EXCELLENT;
    float silhouette_good = Config::ClusterQuality::SILHOUETTE_GOOD;
    float silhouette_fair = Config::ClusterQuality::SILHOUETTE_FAIR;

    float db_excellent = Config::ClusterQuality::DB_EXCELLENT;
    float db_good = Config::ClusterQuality::DB_GOOD;
    float db_fair = Config::ClusterQuality::DB_FAIR;
    float db_cap = Config::ClusterQuality::DB_CAP;

    float noise_acceptable = Config::ClusterQuality::NOISE_ACCEPTABLE;
    float noise_concerning = Config::ClusterQuality::NOISE_CONCERNING;
    float noise_overcluster = Config::ClusterQuality::NOISE_OVERCLUSTER;
    float overcluster_cluster_ratio = Config::ClusterQuality::OVERCLUSTER_CLUSTER_RATIO;
    float singleton_ratio = Config::ClusterQuality::SINGLETON_RATIO;
    int near_singleton_size = Config::ClusterQuality::NEAR_SINGLETON_SIZE;
    float large_cluster_factor = Config::ClusterQuality::LARGE_CLUSTER_FACTOR;

    float minimal_quality_factor = Config::ClusterQuality::MINIMAL_QUALITY_FACTOR;
    float compactness_cap = Config::ClusterQuality::COMPACTNESS_CAP;

    float label_excellent = Config::ClusterQuality::LABEL_EXCELLENT;
    float label_good = Config::ClusterQuality::LABEL_GOOD;
    float label_fair = Config::ClusterQuality::LABEL_FAIR;

    ClusterQualityWeights weights;
};

class ClusteringQualityAnalyzer {
public:
    static constexpr int NOISE_LABEL = -1;

    explicit ClusteringQualityAnalyzer(const ClusterQualityConfig& config = ClusterQualityConfig());

    /**
     * @brief 评估一次聚类结果
     * @param embeddings N 个特征向量
     * @param labels N 个簇标签，NOISE_LABEL 表示噪声
     * @param metric 距离度量 (轮廓系数、紧致度、分离度使用)
     * @return 质量指标，含调优建议
     */
    ClusterQualityMetrics analyze(const std::vector<std::vector<float>>& embeddings,
                                  const std::vector<int>& labels,
                                  DistanceMetric metric) const;

    // 基于已有指标生成调优建议 (只给建议，不修改任何参数)
    std::vector<std::string> tuning_suggestions(const ClusterQualityMetrics& metrics) const;

    float overall_quality(float silhouette, float davies_bouldin,
                          float noise_ratio, float compactness) const;

    ClusterQualityLabel label_for(float overall_quality) const;
    ClusterQualityLabel silhouette_band(float silhouette) const;
    ClusterQualityLabel davies_bouldin_band(float davies_bouldin) const;
    NoiseLevel noise_level(float noise_ratio) const;

    const ClusterQualityWeights& weights() const { return config_.weights; }
    const ClusterQualityConfig& config() const { return config_; }

private:
    ClusterQualityMetrics insufficient_data(int face_count) const;

    ClusterQualityConfig config_;
};

#endif // _CLUSTERING_QUALITY_ANALYZER_H_
