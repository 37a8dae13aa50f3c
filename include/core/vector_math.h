/**
 * @file vector_math.h
 * @brief 特征向量基础运算 (距离、归一化、质心)
 */

#ifndef _VECTOR_MATH_H_
#define _VECTOR_MATH_H_

#include <vector>
#include <string>

/**
 * @brief 距离度量
 */
enum class DistanceMetric {
    Cosine,     // 1 - cos(a, b), 范围 [0, 2]
    Euclidean
};

const char* distance_metric_name(DistanceMetric metric);

// 解析 "cosine" / "euclidean"，无法识别时返回 false
bool parse_distance_metric(const std::string& text, DistanceMetric& out_metric);

// 余弦相似度 (不要求输入已归一化)，维度不一致或零向量返回 0
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

float euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

// 按度量计算距离
float vector_distance(const std::vector<float>& a, const std::vector<float>& b, DistanceMetric metric);

// L2 范数
float l2_norm(const std::vector<float>& v);

// 原地归一化，范数过小时保持不变
void normalize(std::vector<float>& v);

// 所有分量均为有限值
bool is_finite_vector(const std::vector<float>& v);

/**
 * @brief 计算一组向量的质心 (算术平均)
 * @param vectors 全部向量
 * @param indices 参与计算的下标
 * @return 质心；indices 为空或维度不一致时返回空向量
 */
std::vector<float> compute_centroid(const std::vector<std::vector<float>>& vectors,
                                    const std::vector<int>& indices);

#endif // _VECTOR_MATH_H_
