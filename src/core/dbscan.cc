/**
 * @file dbscan.cc
 * @brief DBSCAN 聚类实现
 * @details
 * 1. 校验输入：维度一致、全部为有限值、余弦度量下无零向量。
 * 2. 预计算每个点的 eps 邻域 (含自身)。
 * 3. 按输入顺序扩展核心点，边界点归属第一个到达它的簇。
 */

#include "core/dbscan.h"
#include <cmath>
#include <algorithm>
#include <deque>
#include <sstream>

Dbscan::Dbscan(float eps, int min_samples, DistanceMetric metric)
    : eps_(eps)
    , min_samples_(min_samples)
    , metric_(metric)
{
}

bool Dbscan::validate(const std::vector<std::vector<float>>& points) {
    const size_t dim = points[0].size();
    for (size_t i = 0; i < points.size(); ++i) {
        std::ostringstream oss;
        if (points[i].size() != dim || dim == 0) {
            oss << "dimension mismatch at row " << i << " (" << points[i].size() << " vs " << dim << ")";
            last_error_ = oss.str();
            return false;
        }
        if (!is_finite_vector(points[i])) {
            oss << "non-finite value in row " << i;
            last_error_ = oss.str();
            return false;
        }
        if (metric_ == DistanceMetric::Cosine && l2_norm(points[i]) <= 1e-12f) {
            oss << "zero-norm vector in row " << i << " (cosine distance undefined)";
            last_error_ = oss.str();
            return false;
        }
    }
    return true;
}

bool Dbscan::build_neighbors(const std::vector<std::vector<float>>& points) {
    const size_t n = points.size();
    neighbors_.assign(n, std::vector<int>());

    // 余弦度量先归一化，距离退化为 1 - dot
    std::vector<std::vector<float>> normalized;
    const std::vector<std::vector<float>>* data = &points;
    if (metric_ == DistanceMetric::Cosine) {
        normalized = points;
        for (auto& v : normalized) {
            normalize(v);
        }
        data = &normalized;
    }

    for (size_t i = 0; i < n; ++i) {
        neighbors_[i].push_back(static_cast<int>(i));
        for (size_t j = i + 1; j < n; ++j) {
            float dist;
            if (metric_ == DistanceMetric::Cosine) {
                double dot = 0.0;
                const auto& a = (*data)[i];
                const auto& b = (*data)[j];
                for (size_t d = 0; d < a.size(); ++d) {
                    dot += static_cast<double>(a[d]) * b[d];
                }
                dist = static_cast<float>(1.0 - dot);
            } else {
                dist = euclidean_distance((*data)[i], (*data)[j]);
            }

            if (!std::isfinite(dist)) {
                std::ostringstream oss;
                oss << "non-finite distance between rows " << i << " and " << j;
                last_error_ = oss.str();
                return false;
            }

            if (dist <= eps_) {
                neighbors_[i].push_back(static_cast<int>(j));
                neighbors_[j].push_back(static_cast<int>(i));
            }
        }
    }

    // 保证邻域按下标升序，扩展顺序与输入顺序一致
    for (auto& list : neighbors_) {
        std::sort(list.begin(), list.end());
    }
    return true;
}

int Dbscan::fit(const std::vector<std::vector<float>>& points, std::vector<int>& out_labels) {
    last_error_.clear();
    cluster_count_ = 0;
    out_labels.assign(points.size(), NOISE);

    if (points.empty()) {
        return 0;
    }

    if (!(eps_ > 0.0f) || min_samples_ < 1) {
        last_error_ = "invalid parameters";
        return -1;
    }

    if (!validate(points) || !build_neighbors(points)) {
        return -1;
    }

    const size_t n = points.size();
    std::vector<bool> visited(n, false);

    for (size_t i = 0; i < n; ++i) {
        if (visited[i]) continue;
        if (static_cast<int>(neighbors_[i].size()) < min_samples_) continue;

        // 新簇，从核心点 i 开始广度扩展
        const int cluster_id = cluster_count_++;
        std::deque<int> queue;
        queue.push_back(static_cast<int>(i));
        visited[i] = true;
        out_labels[i] = cluster_id;

        while (!queue.empty()) {
            int p = queue.front();
            queue.pop_front();

            if (static_cast<int>(neighbors_[p].size()) < min_samples_) {
                continue; // 边界点不继续扩展
            }

            for (int q : neighbors_[p]) {
                if (out_labels[q] == NOISE) {
                    out_labels[q] = cluster_id;
                }
                if (!visited[q]) {
                    visited[q] = true;
                    queue.push_back(q);
                }
            }
        }
    }

    return 0;
}
