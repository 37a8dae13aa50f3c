/**
 * @file face_quality_analyzer.h
 * @brief 人脸画质评估 - 清晰度 / 光照 / 尺寸 / 宽高比 / 置信度综合打分
 * @details 用于代表人脸选择。任何输入都不会抛出异常：
 *          图像读取失败、边框无效等情况返回 overall_quality = 0 的默认结果。
 */

#ifndef _FACE_QUALITY_ANALYZER_H_
#define _FACE_QUALITY_ANALYZER_H_

#include <string>
#include <opencv2/core/core.hpp>
#include "config.h"
#include "database/database_types.h"

/**
 * @brief 画质等级
 */
enum class QualityLabel {
    Excellent,
    Good,
    Fair,
    Poor
};

const char* quality_label_name(QualityLabel label);

/**
 * @brief 单张人脸的画质评估结果
 */
struct FaceQualityMetrics {
    float blur_score = 0.0f;        // Laplacian 方差, 越大越清晰 (未归一化)
    float lighting_score = 0.0f;    // 0-100
    float size_score = 0.0f;        // 0-100
    float aspect_ratio = 0.0f;      // 宽 / 高
    float confidence = 0.0f;        // 检测置信度 0-1
    float overall_quality = 0.0f;   // 0-100 加权综合分
    QualityLabel quality_label = QualityLabel::Poor;
    bool is_good_quality = false;   // overall_quality >= 门限
    bool analyzed = false;          // false 表示走了失败默认值
    bool image_loaded = false;      // 原图已成功解码 (边框无效时仍可能为 true)
};

/**
 * @brief 综合评分权重 (构造时归一化，总和恒为 1.0)
 */
struct FaceQualityWeights {
    float blur = Config::FaceQuality::WEIGHT_BLUR;
    float lighting = Config::FaceQuality::WEIGHT_LIGHTING;
    float size = Config::FaceQuality::WEIGHT_SIZE;
    float aspect = Config::FaceQuality::WEIGHT_ASPECT;
    float confidence = Config::FaceQuality::WEIGHT_CONFIDENCE;

    float sum() const { return blur + lighting + size + aspect + confidence; }
};

/**
 * @brief 画质评估参数，默认值见 Config::FaceQuality
 */
struct FaceQualityConfig {
    // 清晰度
    float blur_very_blurry = Config::FaceQuality::BLUR_VERY_BLURRY;
    float blur_good = Config::FaceQuality::BLUR_GOOD;
    float blur_excellent = Config::FaceQuality::BLUR_EXCELLENT;

    // 光照
    float brightness_low = Config::FaceQuality::BRIGHTNESS_LOW;
    float brightness_high = Config::FaceQuality::BRIGHTNESS_HIGH;
    float contrast_min = Config::FaceQuality::CONTRAST_MIN;
    float contrast_full = Config::FaceQuality::CONTRAST_FULL;
    int clip_dark = Config::FaceQuality::CLIP_DARK;
    int clip_bright = Config::FaceQuality::CLIP_BRIGHT;
    float clip_ratio_max = Config::FaceQuality::CLIP_RATIO_MAX;
    float clip_penalty = Config::FaceQuality::CLIP_PENALTY;
    float lighting_min = Config::FaceQuality::LIGHTING_MIN;
    float lighting_max = Config::FaceQuality::LIGHTING_MAX;
    float lighting_w_brightness = Config::FaceQuality::LIGHTING_W_BRIGHTNESS;
    float lighting_w_contrast = Config::FaceQuality::LIGHTING_W_CONTRAST;
    float lighting_w_exposure = Config::FaceQuality::LIGHTING_W_EXPOSURE;

    // 尺寸: 面积占比分段点及对应分数 (分段线性, 单调递增)
    float size_ratio_breaks[4] = {Config::FaceQuality::SIZE_RATIO_BREAKS[0], Config::FaceQuality::SIZE_RATIO_BREAKS[1],
                                  Config::FaceQuality::SIZE_RATIO_BREAKS[2], Config::FaceQuality::SIZE_RATIO_BREAKS[3]};
    float size_score_breaks[4] = {Config::FaceQuality::SIZE_SCORE_BREAKS[0], Config::FaceQuality::SIZE_SCORE_BREAKS[1],
                                  Config::FaceQuality::SIZE_SCORE_BREAKS[2], Config::FaceQuality::SIZE_SCORE_BREAKS[3]};
    float size_tail_slope = Config::FaceQuality::SIZE_TAIL_SLOPE;  // 超过最后分段点后的斜率, 封顶 100
    float size_adequate = Config::FaceQuality::SIZE_ADEQUATE;

    // 宽高比
    float aspect_min = Config::FaceQuality::ASPECT_MIN;
    float aspect_max = Config::FaceQuality::ASPECT_MAX;
    float aspect_opt_min = Config::FaceQuality::ASPECT_OPT_MIN;
    float aspect_opt_max = Config::FaceQuality::ASPECT_OPT_MAX;
    float aspect_acceptable_score = Config::FaceQuality::ASPECT_ACCEPTABLE_SCORE;

    // 等级与门限
    float label_excellent = Config::FaceQuality::LABEL_EXCELLENT;
    float label_good = Config::FaceQuality::LABEL_GOOD;
    float label_fair = Config::FaceQuality::LABEL_FAIR;
    float good_quality_threshold = Config::FaceQuality::GOOD_QUALITY;

    FaceQualityWeights weights;
};

class FaceQualityAnalyzer {
public:
    explicit FaceQualityAnalyzer(const FaceQualityConfig& config = FaceQualityConfig());

    /**
     * @brief 评估原图中一个人脸框的画质
     * @param image_path 原图路径
     * @param bbox 人脸框 (像素)
     * @param confidence 检测置信度
     * @return 评估结果；失败时返回默认结果并打印诊断信息
     */
    FaceQualityMetrics analyze(const std::string& image_path,
                               const db::BoundingBox& bbox,
                               float confidence) const;

    // 已解码图像版本 (BGR 或灰度)
    FaceQualityMetrics analyze_image(const cv::Mat& image,
                                     const db::BoundingBox& bbox,
                                     float confidence) const;

    // 子评分 (输入为灰度人脸区域)
    float blur_score(const cv::Mat& gray_face) const;
    float lighting_score(const cv::Mat& gray_face) const;
    float size_score(float face_w, float face_h, int img_w, int img_h) const;

    // 各分量归一化到 0-100
    float normalize_blur(float blur) const;
    float normalize_aspect(float aspect_ratio) const;

    float overall_quality(float blur, float lighting, float size,
                          float aspect_ratio, float confidence) const;

    QualityLabel label_for(float overall_quality) const;

    // 分数是否落在可接受区间
    bool blur_passes(float blur) const { return blur >= config_.blur_good; }
    bool lighting_acceptable(float lighting) const;
    bool size_adequate(float size) const { return size >= config_.size_adequate; }
    bool aspect_valid(float aspect_ratio) const;

    FaceQualityMetrics default_metrics(float confidence) const;

    const FaceQualityWeights& weights() const { return config_.weights; }
    const FaceQualityConfig& config() const { return config_; }

private:
    FaceQualityConfig config_;
};

#endif // _FACE_QUALITY_ANALYZER_H_
