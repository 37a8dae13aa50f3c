/**
 * @file vector_math.cc
 * @brief 特征向量基础运算实现
 */

#include "core/vector_math.h"
#include <cmath>

const char* distance_metric_name(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::Cosine: return "cosine";
        case DistanceMetric::Euclidean: return "euclidean";
    }
    return "unknown";
}

bool parse_distance_metric(const std::string& text, DistanceMetric& out_metric) {
    if (text == "cosine") {
        out_metric = DistanceMetric::Cosine;
        return true;
    }
    if (text == "euclidean") {
        out_metric = DistanceMetric::Euclidean;
        return true;
    }
    return false;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

float euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - b[i];
        sum += d * d;
    }
    return static_cast<float>(std::sqrt(sum));
}

float vector_distance(const std::vector<float>& a, const std::vector<float>& b, DistanceMetric metric) {
    if (metric == DistanceMetric::Cosine) {
        // 浮点误差可能让结果略小于 0
        float d = 1.0f - cosine_similarity(a, b);
        return d < 0.0f ? 0.0f : d;
    }
    return euclidean_distance(a, b);
}

float l2_norm(const std::vector<float>& v) {
    double sq_sum = 0.0;
    for (float x : v) {
        sq_sum += static_cast<double>(x) * x;
    }
    return static_cast<float>(std::sqrt(sq_sum));
}

void normalize(std::vector<float>& v) {
    float norm = l2_norm(v);
    if (norm > 1e-6) {
        for (float& x : v) {
            x /= norm;
        }
    }
}

bool is_finite_vector(const std::vector<float>& v) {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

std::vector<float> compute_centroid(const std::vector<std::vector<float>>& vectors,
                                    const std::vector<int>& indices) {
    if (indices.empty()) return {};

    const size_t dim = vectors[indices[0]].size();
    std::vector<double> sum(dim, 0.0);
    for (int idx : indices) {
        const auto& v = vectors[idx];
        if (v.size() != dim) return {};
        for (size_t d = 0; d < dim; ++d) {
            sum[d] += v[d];
        }
    }

    std::vector<float> centroid(dim);
    for (size_t d = 0; d < dim; ++d) {
        centroid[d] = static_cast<float>(sum[d] / indices.size());
    }
    return centroid;
}
