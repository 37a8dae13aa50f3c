/**
 * @file dbscan.h
 * @brief 基于密度的聚类 (DBSCAN)
 * @details 对人脸特征向量做无监督聚类，标签 -1 表示噪声。
 *          对相同输入顺序和参数结果完全确定。
 */

#ifndef _DBSCAN_H_
#define _DBSCAN_H_

#include <vector>
#include <string>
#include "core/vector_math.h"

class Dbscan {
public:
    static constexpr int NOISE = -1;

    /**
     * @brief 构造函数
     * @param eps 邻域半径 (同簇最大距离)
     * @param min_samples 核心点所需的邻域点数 (含自身)
     * @param metric 距离度量
     */
    Dbscan(float eps, int min_samples, DistanceMetric metric = DistanceMetric::Cosine);

    /**
     * @brief 执行聚类
     * @param points N 个等长特征向量
     * @param out_labels 输出: 每个点的簇编号 (0 起)，噪声为 NOISE
     * @return 0 成功, -1 失败 (输入含 NaN/Inf、余弦度量下的零向量或维度不一致)
     */
    int fit(const std::vector<std::vector<float>>& points, std::vector<int>& out_labels);

    // 最近一次失败原因
    const std::string& last_error() const { return last_error_; }

    // 上一次 fit 得到的簇数量
    int cluster_count() const { return cluster_count_; }

private:
    bool validate(const std::vector<std::vector<float>>& points);
    bool build_neighbors(const std::vector<std::vector<float>>& points);

    float eps_;
    int min_samples_;
    DistanceMetric metric_;

    std::vector<std::vector<int>> neighbors_;
    int cluster_count_ = 0;
    std::string last_error_;
};

#endif // _DBSCAN_H_
