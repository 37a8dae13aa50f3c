/**
 * @file representative_selector.cc
 * @brief 代表人脸选择实现
 */

#include "service/representative_selector.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace service {

const char* selection_level_name(SelectionLevel level) {
    switch (level) {
        case SelectionLevel::None: return "none";
        case SelectionLevel::QualityWeighted: return "quality_weighted";
        case SelectionLevel::BasicThreshold: return "basic_threshold";
        case SelectionLevel::CentroidOnly: return "centroid_only";
        case SelectionLevel::FirstMember: return "first_member";
    }
    return "none";
}

RepresentativeSelector::RepresentativeSelector(const SelectionConfig& config)
    : config_(config)
{
    strategies_ = {
        &RepresentativeSelector::select_quality_weighted,
        &RepresentativeSelector::select_basic_threshold,
        &RepresentativeSelector::select_centroid_only,
        &RepresentativeSelector::select_first_member,
    };
}

std::optional<Representative> RepresentativeSelector::select(const SelectionContext& ctx) const {
    for (Strategy strategy : strategies_) {
        std::optional<Representative> rep = (this->*strategy)(ctx);
        if (rep) return rep;
    }
    return std::nullopt;
}

bool RepresentativeSelector::centroid_usable(const SelectionContext& ctx) const {
    if (ctx.centroid.empty() || !is_finite_vector(ctx.centroid)) return false;
    if (ctx.metric == DistanceMetric::Cosine && l2_norm(ctx.centroid) <= 1e-12f) return false;
    for (const auto& c : ctx.members) {
        if (!c.embedding || c.embedding->size() != ctx.centroid.size()) return false;
    }
    return true;
}

float RepresentativeSelector::distance_to_centroid(const SelectionContext& ctx, const SelectionCandidate& c) const {
    return vector_distance(*c.embedding, ctx.centroid, ctx.metric);
}

std::optional<Representative> RepresentativeSelector::select_quality_weighted(const SelectionContext& ctx) const {
    std::vector<const SelectionCandidate*> qualified;
    for (const auto& c : ctx.members) {
        if (c.quality.overall_quality >= config_.quality_threshold) {
            qualified.push_back(&c);
        }
    }
    if (qualified.empty()) return std::nullopt;

    // 只有一个候选时直接选中，不计算组合分
    if (qualified.size() == 1) {
        Representative rep;
        rep.face_id = qualified[0]->face_id;
        rep.level = SelectionLevel::QualityWeighted;
        rep.quality = qualified[0]->quality.overall_quality;
        return rep;
    }

    // 质心接近度: 候选之间 min-max 归一化, 距离越小越接近 1
    std::vector<float> proximity(qualified.size(), 1.0f);
    if (centroid_usable(ctx)) {
        std::vector<float> dist(qualified.size());
        for (size_t i = 0; i < qualified.size(); ++i) {
            dist[i] = distance_to_centroid(ctx, *qualified[i]);
        }
        float min_d = *std::min_element(dist.begin(), dist.end());
        float max_d = *std::max_element(dist.begin(), dist.end());
        float range = max_d - min_d;
        if (std::isfinite(range) && range > 1e-9f) {
            for (size_t i = 0; i < qualified.size(); ++i) {
                proximity[i] = (max_d - dist[i]) / range;
            }
        }
    }

    int best = -1;
    float best_score = -std::numeric_limits<float>::max();
    for (size_t i = 0; i < qualified.size(); ++i) {
        float normalized_quality = qualified[i]->quality.overall_quality / 100.0f;
        float score = config_.weight_quality * normalized_quality + config_.weight_proximity * proximity[i];
        if (score > best_score) {
            best_score = score;
            best = static_cast<int>(i);
        }
    }

    Representative rep;
    rep.face_id = qualified[best]->face_id;
    rep.level = SelectionLevel::QualityWeighted;
    rep.quality = qualified[best]->quality.overall_quality;
    rep.combined_score = best_score;
    return rep;
}

std::optional<Representative> RepresentativeSelector::select_basic_threshold(const SelectionContext& ctx) const {
    if (!centroid_usable(ctx)) return std::nullopt;

    const SelectionCandidate* best = nullptr;
    float best_dist = std::numeric_limits<float>::max();
    for (const auto& c : ctx.members) {
        float min_side = std::min(c.bbox.width, c.bbox.height);
        if (c.confidence < config_.basic_min_confidence || min_side < config_.basic_min_face_px) {
            continue;
        }
        float d = distance_to_centroid(ctx, c);
        if (d < best_dist) {
            best_dist = d;
            best = &c;
        }
    }
    if (!best) return std::nullopt;

    Representative rep;
    rep.face_id = best->face_id;
    rep.level = SelectionLevel::BasicThreshold;
    rep.quality = best->quality.overall_quality;
    return rep;
}

std::optional<Representative> RepresentativeSelector::select_centroid_only(const SelectionContext& ctx) const {
    // 单成员簇的 "质心" 就是它自己，视为退化
    if (ctx.members.size() < 2 || !centroid_usable(ctx)) return std::nullopt;

    const SelectionCandidate* best = nullptr;
    float best_dist = std::numeric_limits<float>::max();
    for (const auto& c : ctx.members) {
        float d = distance_to_centroid(ctx, c);
        if (d < best_dist) {
            best_dist = d;
            best = &c;
        }
    }
    if (!best) return std::nullopt;

    Representative rep;
    rep.face_id = best->face_id;
    rep.level = SelectionLevel::CentroidOnly;
    rep.quality = best->quality.overall_quality;
    return rep;
}

std::optional<Representative> RepresentativeSelector::select_first_member(const SelectionContext& ctx) const {
    if (ctx.members.empty()) return std::nullopt;

    Representative rep;
    rep.face_id = ctx.members.front().face_id;
    rep.level = SelectionLevel::FirstMember;
    rep.quality = ctx.members.front().quality.overall_quality;
    return rep;
}

} // namespace service
