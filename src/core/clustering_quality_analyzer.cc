/**
 * @file clustering_quality_analyzer.cc
 * @brief 聚类质量评估实现
 * @details 职责：
 * 1. 统计簇数量、簇大小、噪声比例。
 * 2. 计算轮廓系数 (按给定度量)、Davies-Bouldin 指数 (欧氏距离，标准定义)。
 * 3. 计算紧致度 (成员到质心平均距离) 与分离度 (质心两两平均距离)。
 * 4. 加权得到 0-100 综合分，并按规则生成调优建议。
 */

#include "core/clustering_quality_analyzer.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace {

// 余弦度量下输入已归一化，距离为 1 - dot
float pair_distance(const std::vector<float>& a, const std::vector<float>& b, DistanceMetric metric) {
    if (metric == DistanceMetric::Cosine) {
        double dot = 0.0;
        for (size_t d = 0; d < a.size(); ++d) {
            dot += static_cast<double>(a[d]) * b[d];
        }
        double dist = 1.0 - dot;
        return dist < 0.0 ? 0.0f : static_cast<float>(dist);
    }
    return euclidean_distance(a, b);
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_percent(double ratio) {
    return format_fixed(ratio * 100.0, 1) + "%";
}

} // namespace

const char* cluster_quality_label_name(ClusterQualityLabel label) {
    switch (label) {
        case ClusterQualityLabel::Excellent: return "Excellent";
        case ClusterQualityLabel::Good: return "Good";
        case ClusterQualityLabel::Fair: return "Fair";
        case ClusterQualityLabel::Poor: return "Poor";
        case ClusterQualityLabel::InsufficientClusters: return "Insufficient Clusters";
        case ClusterQualityLabel::InsufficientData: return "Insufficient Data";
    }
    return "Insufficient Data";
}

const char* noise_level_name(NoiseLevel level) {
    switch (level) {
        case NoiseLevel::Acceptable: return "acceptable";
        case NoiseLevel::Moderate: return "moderate";
        case NoiseLevel::Concerning: return "concerning";
    }
    return "concerning";
}

ClusteringQualityAnalyzer::ClusteringQualityAnalyzer(const ClusterQualityConfig& config)
    : config_(config)
{
    ClusterQualityWeights& w = config_.weights;
    float total = w.sum();
    if (!(total > 0.0f) || w.silhouette < 0 || w.davies_bouldin < 0 || w.noise < 0 || w.compactness < 0) {
        std::cerr << "[ClusteringQualityAnalyzer] Invalid weight set, using defaults" << std::endl;
        w = ClusterQualityWeights();
        total = w.sum();
    }
    if (std::fabs(total - 1.0f) > 1e-6f) {
        if (std::fabs(total - 1.0f) > 1e-3f) {
            std::cerr << "[ClusteringQualityAnalyzer] Weights sum to " << total << ", normalizing" << std::endl;
        }
        w.silhouette /= total;
        w.davies_bouldin /= total;
        w.noise /= total;
        w.compactness = 1.0f - (w.silhouette + w.davies_bouldin + w.noise);
    }
}

ClusterQualityMetrics ClusteringQualityAnalyzer::analyze(const std::vector<std::vector<float>>& embeddings,
                                                         const std::vector<int>& labels,
                                                         DistanceMetric metric) const {
    if (embeddings.size() != labels.size()) {
        std::cerr << "[ClusteringQualityAnalyzer] Embeddings and labels size mismatch: "
                  << embeddings.size() << " vs " << labels.size() << std::endl;
        return insufficient_data(static_cast<int>(labels.size()));
    }

    const int face_count = static_cast<int>(labels.size());
    if (face_count == 0) {
        return insufficient_data(0);
    }

    // 1. 按簇分组 (map 保证簇标签升序)
    std::map<int, std::vector<int>> groups;
    int noise_count = 0;
    for (int i = 0; i < face_count; ++i) {
        if (labels[i] < 0) {
            noise_count++;
        } else {
            groups[labels[i]].push_back(i);
        }
    }
    if (groups.empty()) {
        return insufficient_data(face_count);
    }

    // 2. 校验非噪声向量
    const size_t dim = embeddings[groups.begin()->second.front()].size();
    for (const auto& g : groups) {
        for (int idx : g.second) {
            if (dim == 0 || embeddings[idx].size() != dim || !is_finite_vector(embeddings[idx])) {
                std::cerr << "[ClusteringQualityAnalyzer] Invalid embedding at row " << idx << std::endl;
                return insufficient_data(face_count);
            }
        }
    }

    ClusterQualityMetrics m;
    m.face_count = face_count;
    m.noise_count = noise_count;
    m.noise_ratio = static_cast<float>(noise_count) / face_count;
    m.cluster_count = static_cast<int>(groups.size());

    const int k = m.cluster_count;
    std::vector<int> cluster_labels;
    std::vector<std::vector<float>> centroids;
    cluster_labels.reserve(k);
    centroids.reserve(k);
    for (const auto& g : groups) {
        cluster_labels.push_back(g.first);
        centroids.push_back(compute_centroid(embeddings, g.second));
        m.cluster_sizes.push_back(static_cast<int>(g.second.size()));

        PerClusterMetrics pc;
        pc.size = static_cast<int>(g.second.size());
        m.per_cluster[g.first] = pc;
    }

    // 3. 紧致度: 成员到质心平均距离 (单成员簇不参与平均)
    double compact_sum = 0.0;
    int compact_n = 0;
    for (int c = 0; c < k; ++c) {
        const std::vector<int>& members = groups[cluster_labels[c]];
        if (members.size() < 2) continue;
        double sum = 0.0;
        for (int idx : members) {
            sum += vector_distance(embeddings[idx], centroids[c], metric);
        }
        float compactness = static_cast<float>(sum / members.size());
        m.per_cluster[cluster_labels[c]].compactness = compactness;
        compact_sum += compactness;
        compact_n++;
    }
    m.avg_cluster_compactness = compact_n > 0 ? static_cast<float>(compact_sum / compact_n) : 0.0f;

    if (k < 2) {
        // 只有一个簇: 轮廓系数与 DB 指数无定义，仅按噪声比例打折评分
        float noise_norm = std::max(0.0f, 100.0f - m.noise_ratio / config_.noise_concerning * 100.0f);
        m.silhouette_score = 0.0f;
        m.davies_bouldin_index = Config::ClusterQuality::DB_UNDEFINED;
        m.avg_cluster_separation = 0.0f;
        m.overall_quality = noise_norm * config_.minimal_quality_factor;
        m.quality_label = ClusterQualityLabel::InsufficientClusters;
        m.tuning_suggestions = tuning_suggestions(m);
        return m;
    }

    // 4. 轮廓系数: 非噪声点之间两两距离，按簇累加
    std::vector<int> point_rows;
    std::vector<int> point_cluster;
    for (int c = 0; c < k; ++c) {
        for (int idx : groups[cluster_labels[c]]) {
            point_rows.push_back(idx);
            point_cluster.push_back(c);
        }
    }
    const size_t n = point_rows.size();

    std::vector<std::vector<float>> points;
    points.reserve(n);
    for (int idx : point_rows) {
        points.push_back(embeddings[idx]);
        if (metric == DistanceMetric::Cosine) {
            normalize(points.back());
        }
    }

    std::vector<std::vector<double>> dist_sums(n, std::vector<double>(k, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            double d = pair_distance(points[i], points[j], metric);
            dist_sums[i][point_cluster[j]] += d;
            dist_sums[j][point_cluster[i]] += d;
        }
    }

    std::vector<double> cluster_sil_sum(k, 0.0);
    double sil_total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const int own = point_cluster[i];
        const int own_size = m.cluster_sizes[own];
        double s = 0.0;
        if (own_size > 1) {
            double a = dist_sums[i][own] / (own_size - 1);
            double b = std::numeric_limits<double>::max();
            for (int c = 0; c < k; ++c) {
                if (c == own) continue;
                b = std::min(b, dist_sums[i][c] / m.cluster_sizes[c]);
            }
            double denom = std::max(a, b);
            s = denom > 0.0 ? (b - a) / denom : 0.0;
        }
        sil_total += s;
        cluster_sil_sum[own] += s;
    }
    m.silhouette_score = static_cast<float>(sil_total / n);
    for (int c = 0; c < k; ++c) {
        m.per_cluster[cluster_labels[c]].silhouette =
            static_cast<float>(cluster_sil_sum[c] / m.cluster_sizes[c]);
    }

    // 5. Davies-Bouldin (欧氏距离)
    std::vector<double> scatter(k, 0.0);
    for (int c = 0; c < k; ++c) {
        const std::vector<int>& members = groups[cluster_labels[c]];
        double sum = 0.0;
        for (int idx : members) {
            sum += euclidean_distance(embeddings[idx], centroids[c]);
        }
        scatter[c] = sum / members.size();
    }
    double db_sum = 0.0;
    for (int c = 0; c < k; ++c) {
        double worst = 0.0;
        for (int o = 0; o < k; ++o) {
            if (o == c) continue;
            double sep = euclidean_distance(centroids[c], centroids[o]);
            if (sep <= 0.0) continue; // 质心重合，按 0 处理
            worst = std::max(worst, (scatter[c] + scatter[o]) / sep);
        }
        db_sum += worst;
    }
    m.davies_bouldin_index = static_cast<float>(db_sum / k);

    // 6. 分离度: 质心两两平均距离，单簇取最近质心
    double sep_sum = 0.0;
    int sep_n = 0;
    std::vector<double> nearest(k, std::numeric_limits<double>::max());
    for (int c = 0; c < k; ++c) {
        for (int o = c + 1; o < k; ++o) {
            double d = vector_distance(centroids[c], centroids[o], metric);
            sep_sum += d;
            sep_n++;
            nearest[c] = std::min(nearest[c], d);
            nearest[o] = std::min(nearest[o], d);
        }
    }
    m.avg_cluster_separation = static_cast<float>(sep_sum / sep_n);
    for (int c = 0; c < k; ++c) {
        m.per_cluster[cluster_labels[c]].separation = static_cast<float>(nearest[c]);
    }

    m.overall_quality = overall_quality(m.silhouette_score, m.davies_bouldin_index,
                                        m.noise_ratio, m.avg_cluster_compactness);
    m.quality_label = label_for(m.overall_quality);
    m.tuning_suggestions = tuning_suggestions(m);
    return m;
}

float ClusteringQualityAnalyzer::overall_quality(float silhouette, float davies_bouldin,
                                                 float noise_ratio, float compactness) const {
    // 各项先映射到 0-100
    float silhouette_norm = (silhouette + 1.0f) / 2.0f * 100.0f;
    float db_norm = std::max(0.0f, 100.0f - davies_bouldin / config_.db_cap * 100.0f);
    float noise_norm = std::max(0.0f, 100.0f - noise_ratio / config_.noise_concerning * 100.0f);

    // 固定上限线性映射，紧致度越大分数越低
    float compactness_cap = config_.compactness_cap > 0.0f ? config_.compactness_cap : 1.0f;
    float compactness_norm = std::max(0.0f, 100.0f - compactness / compactness_cap * 100.0f);

    const ClusterQualityWeights& w = config_.weights;
    float overall = silhouette_norm * w.silhouette +
                    db_norm * w.davies_bouldin +
                    noise_norm * w.noise +
                    compactness_norm * w.compactness;
    return std::max(0.0f, std::min(100.0f, overall));
}

ClusterQualityLabel ClusteringQualityAnalyzer::label_for(float overall_quality) const {
    if (overall_quality >= config_.label_excellent) return ClusterQualityLabel::Excellent;
    if (overall_quality >= config_.label_good) return ClusterQualityLabel::Good;
    if (overall_quality >= config_.label_fair) return ClusterQualityLabel::Fair;
    return ClusterQualityLabel::Poor;
}

ClusterQualityLabel ClusteringQualityAnalyzer::silhouette_band(float silhouette) const {
    if (silhouette > config_.silhouette_excellent) return ClusterQualityLabel::Excellent;
    if (silhouette >= config_.silhouette_good) return ClusterQualityLabel::Good;
    if (silhouette >= config_.silhouette_fair) return ClusterQualityLabel::Fair;
    return ClusterQualityLabel::Poor;
}

ClusterQualityLabel ClusteringQualityAnalyzer::davies_bouldin_band(float davies_bouldin) const {
    if (davies_bouldin < config_.db_excellent) return ClusterQualityLabel::Excellent;
    if (davies_bouldin <= config_.db_good) return ClusterQualityLabel::Good;
    if (davies_bouldin <= config_.db_fair) return ClusterQualityLabel::Fair;
    return ClusterQualityLabel::Poor;
}

NoiseLevel ClusteringQualityAnalyzer::noise_level(float noise_ratio) const {
    if (noise_ratio < config_.noise_acceptable) return NoiseLevel::Acceptable;
    if (noise_ratio <= config_.noise_concerning) return NoiseLevel::Moderate;
    return NoiseLevel::Concerning;
}

std::vector<std::string> ClusteringQualityAnalyzer::tuning_suggestions(const ClusterQualityMetrics& metrics) const {
    std::vector<std::string> suggestions;

    if (metrics.quality_label == ClusterQualityLabel::InsufficientData) {
        suggestions.push_back(
            "Insufficient data: no clusters were found among " + std::to_string(metrics.face_count) +
            " faces. Add more faces, or try increasing eps / decreasing min_samples.");
        return suggestions;
    }

    const bool undefined_stats = metrics.quality_label == ClusterQualityLabel::InsufficientClusters;

    if (undefined_stats) {
        suggestions.push_back(
            "Only " + std::to_string(metrics.cluster_count) + " cluster found: silhouette and "
            "Davies-Bouldin are undefined. If several people are present, try decreasing eps to split them.");
    } else {
        if (metrics.silhouette_score < config_.silhouette_fair) {
            suggestions.push_back(
                "Low silhouette score (" + format_fixed(metrics.silhouette_score, 3) + "): "
                "Consider increasing eps to merge similar clusters, or decreasing eps to split overlapping clusters.");
        }
        if (metrics.davies_bouldin_index > config_.db_fair) {
            suggestions.push_back(
                "High Davies-Bouldin index (" + format_fixed(metrics.davies_bouldin_index, 3) + "): "
                "Clusters are too similar. Try increasing eps to merge them, or adjusting min_samples.");
        }
    }

    // 噪声比例
    int near_singletons = 0;
    int singletons = 0;
    for (int size : metrics.cluster_sizes) {
        if (size <= config_.near_singleton_size) near_singletons++;
        if (size == 1) singletons++;
    }
    const bool many_small = metrics.cluster_count > 0 &&
                            near_singletons > metrics.cluster_count * config_.singleton_ratio;

    if (metrics.noise_ratio > config_.noise_concerning) {
        suggestions.push_back(
            "High noise ratio (" + format_percent(metrics.noise_ratio) + "): "
            "Too many unassigned faces. Try relaxing eps (larger) or min_samples (smaller) to include more faces in clusters.");
    } else if (metrics.noise_ratio < config_.noise_overcluster &&
               (metrics.cluster_count > metrics.face_count * config_.overcluster_cluster_ratio || many_small)) {
        suggestions.push_back(
            "Very low noise ratio (" + format_percent(metrics.noise_ratio) + ") but many small clusters: "
            "Might be over-clustering. Try increasing eps or min_samples to merge similar clusters.");
    }

    // 簇大小分布
    if (!metrics.cluster_sizes.empty()) {
        int max_size = *std::max_element(metrics.cluster_sizes.begin(), metrics.cluster_sizes.end());
        double avg_size = 0.0;
        for (int size : metrics.cluster_sizes) avg_size += size;
        avg_size /= metrics.cluster_sizes.size();

        if (max_size > avg_size * config_.large_cluster_factor) {
            suggestions.push_back(
                "One very large cluster (size " + std::to_string(max_size) + " vs avg " +
                format_fixed(avg_size, 1) + "): May indicate under-clustering. Try decreasing eps to split large clusters.");
        }

        if (many_small) {
            suggestions.push_back(
                "Many singleton clusters (" + std::to_string(near_singletons) + "/" +
                std::to_string(metrics.cluster_count) + " with <= " + std::to_string(config_.near_singleton_size) +
                " faces, " + std::to_string(singletons) + " single): "
                "Try increasing min_samples to require larger clusters.");
        }
    }

    // 单簇轮廓系数
    if (!undefined_stats) {
        int poor_clusters = 0;
        for (const auto& kv : metrics.per_cluster) {
            if (kv.second.silhouette < config_.silhouette_fair) poor_clusters++;
        }
        if (poor_clusters > 0) {
            suggestions.push_back(
                std::to_string(poor_clusters) + " clusters have poor silhouette scores: "
                "These clusters may need manual review or re-clustering.");
        }
    }

    if (suggestions.empty()) {
        suggestions.push_back("Clustering quality looks good! No tuning needed.");
    }
    return suggestions;
}

ClusterQualityMetrics ClusteringQualityAnalyzer::insufficient_data(int face_count) const {
    ClusterQualityMetrics m;
    m.face_count = face_count;
    m.cluster_count = 0;
    m.noise_count = face_count;
    m.noise_ratio = 1.0f;
    m.silhouette_score = 0.0f;
    m.davies_bouldin_index = Config::ClusterQuality::DB_UNDEFINED;
    m.overall_quality = 0.0f;
    m.quality_label = ClusterQualityLabel::InsufficientData;
    m.tuning_suggestions = tuning_suggestions(m);
    return m;
}
