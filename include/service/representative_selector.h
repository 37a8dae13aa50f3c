/**
 * @file representative_selector.h
 * @brief 代表人脸选择 - 按级别依次回退的策略链
 * @details 级别从上到下尝试，第一个给出结果的级别胜出：
 *          1. 画质加权 (画质达标者中按 0.7 画质 + 0.3 质心接近度取最高)
 *          2. 基础门限 (置信度与尺寸达标者中取最接近质心者)
 *          3. 仅质心 (不看画质，取最接近质心者)
 *          4. 首个成员
 */

#ifndef REPRESENTATIVE_SELECTOR_H
#define REPRESENTATIVE_SELECTOR_H

#include <optional>
#include <vector>
#include "config.h"
#include "core/face_quality_analyzer.h"
#include "core/vector_math.h"
#include "database/database_types.h"

namespace service {

enum class SelectionLevel {
    None = 0,
    QualityWeighted = 1,
    BasicThreshold = 2,
    CentroidOnly = 3,
    FirstMember = 4
};

const char* selection_level_name(SelectionLevel level);

struct SelectionConfig {
    float quality_threshold = Config::Selection::QUALITY_THRESHOLD;
    float weight_quality = Config::Selection::WEIGHT_QUALITY;
    float weight_proximity = Config::Selection::WEIGHT_PROXIMITY;
    float basic_min_confidence = Config::Selection::BASIC_MIN_CONFIDENCE;
    float basic_min_face_px = Config::Selection::BASIC_MIN_FACE_PX;
};

// 簇成员 (embedding 指向运行期间不可变的快照)
struct SelectionCandidate {
    int64_t face_id = -1;
    const std::vector<float>* embedding = nullptr;
    db::BoundingBox bbox;
    float confidence = 0.0f;
    FaceQualityMetrics quality;
};

struct SelectionContext {
    std::vector<SelectionCandidate> members;    // 成员顺序即 "首个成员" 的定义
    std::vector<float> centroid;                // 质心计算失败时为空
    DistanceMetric metric = DistanceMetric::Cosine;
};

struct Representative {
    int64_t face_id = -1;
    SelectionLevel level = SelectionLevel::None;
    float quality = 0.0f;           // 代表人脸的综合画质
    float combined_score = 0.0f;    // 仅一级且候选数 > 1 时有效
};

class RepresentativeSelector {
public:
    // 单个级别: 在 *this 上调用，拷贝后的对象不引用原对象
    using Strategy = std::optional<Representative> (RepresentativeSelector::*)(const SelectionContext&) const;

    explicit RepresentativeSelector(const SelectionConfig& config = SelectionConfig());

    // 依次执行策略链，成员为空时返回 std::nullopt
    std::optional<Representative> select(const SelectionContext& ctx) const;

    // 各级别单独调用
    std::optional<Representative> select_quality_weighted(const SelectionContext& ctx) const;
    std::optional<Representative> select_basic_threshold(const SelectionContext& ctx) const;
    std::optional<Representative> select_centroid_only(const SelectionContext& ctx) const;
    std::optional<Representative> select_first_member(const SelectionContext& ctx) const;

    const SelectionConfig& config() const { return config_; }

private:
    // 质心有效: 非空、全部为有限值、与成员维度一致
    bool centroid_usable(const SelectionContext& ctx) const;
    float distance_to_centroid(const SelectionContext& ctx, const SelectionCandidate& c) const;

    SelectionConfig config_;
    std::vector<Strategy> strategies_;
};

} // namespace service

#endif // REPRESENTATIVE_SELECTOR_H
