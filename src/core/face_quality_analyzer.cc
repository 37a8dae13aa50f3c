/**
 * @file face_quality_analyzer.cc
 * @brief 人脸画质评估实现
 * @details 职责：
 * 1. 读取原图并按人脸框裁剪 (框越界时裁到图像范围内)。
 * 2. 清晰度：灰度图 Laplacian 方差。
 * 3. 光照：平均亮度 + 对比度 (标准差) + 曝光裁剪比例。
 * 4. 尺寸：人脸面积占整图比例的分段线性映射。
 * 5. 综合分：各分量归一化到 0-100 后加权求和。
 */

#include "core/face_quality_analyzer.h"
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

const char* quality_label_name(QualityLabel label) {
    switch (label) {
        case QualityLabel::Excellent: return "Excellent";
        case QualityLabel::Good: return "Good";
        case QualityLabel::Fair: return "Fair";
        case QualityLabel::Poor: return "Poor";
    }
    return "Poor";
}

FaceQualityAnalyzer::FaceQualityAnalyzer(const FaceQualityConfig& config)
    : config_(config)
{
    FaceQualityWeights& w = config_.weights;
    float total = w.sum();
    if (!(total > 0.0f) || w.blur < 0 || w.lighting < 0 || w.size < 0 || w.aspect < 0 || w.confidence < 0) {
        std::cerr << "[FaceQualityAnalyzer] Invalid weight set, using defaults" << std::endl;
        w = FaceQualityWeights();
        total = w.sum();
    }
    if (std::fabs(total - 1.0f) > 1e-6f) {
        if (std::fabs(total - 1.0f) > 1e-3f) {
            std::cerr << "[FaceQualityAnalyzer] Weights sum to " << total << ", normalizing" << std::endl;
        }
        w.blur /= total;
        w.lighting /= total;
        w.size /= total;
        w.aspect /= total;
        // 最后一项取余量, 保证总和精确为 1
        w.confidence = 1.0f - (w.blur + w.lighting + w.size + w.aspect);
    }
}

FaceQualityMetrics FaceQualityAnalyzer::analyze(const std::string& image_path,
                                                const db::BoundingBox& bbox,
                                                float confidence) const {
    if (image_path.empty()) {
        std::cerr << "[FaceQualityAnalyzer] Empty image path" << std::endl;
        return default_metrics(confidence);
    }

    try {
        cv::Mat img = cv::imread(image_path, cv::IMREAD_COLOR);
        if (img.empty()) {
            std::cerr << "[FaceQualityAnalyzer] Failed to load image: " << image_path << std::endl;
            return default_metrics(confidence);
        }
        FaceQualityMetrics m = analyze_image(img, bbox, confidence);
        m.image_loaded = true;
        return m;
    } catch (const cv::Exception& e) {
        std::cerr << "[FaceQualityAnalyzer] OpenCV error for " << image_path << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[FaceQualityAnalyzer] Error analyzing " << image_path << ": " << e.what() << std::endl;
    }
    return default_metrics(confidence);
}

FaceQualityMetrics FaceQualityAnalyzer::analyze_image(const cv::Mat& image,
                                                      const db::BoundingBox& bbox,
                                                      float confidence) const {
    if (image.empty()) {
        return default_metrics(confidence);
    }
    if (!std::isfinite(bbox.x) || !std::isfinite(bbox.y) ||
        !std::isfinite(bbox.width) || !std::isfinite(bbox.height) ||
        bbox.width <= 0.0f || bbox.height <= 0.0f) {
        std::cerr << "[FaceQualityAnalyzer] Invalid bbox: (" << bbox.x << ", " << bbox.y << ", "
                  << bbox.width << ", " << bbox.height << ")" << std::endl;
        return default_metrics(confidence);
    }

    try {
        // 边框与图像求交，完全落在图像外时没有可评估的人脸
        const int img_w = image.cols;
        const int img_h = image.rows;
        cv::Rect crop = cv::Rect(cvRound(bbox.x), cvRound(bbox.y), cvRound(bbox.width), cvRound(bbox.height)) &
                        cv::Rect(0, 0, img_w, img_h);
        if (crop.empty()) {
            std::cerr << "[FaceQualityAnalyzer] Face box outside image: (" << bbox.x << ", " << bbox.y << ", "
                      << bbox.width << ", " << bbox.height << ") vs " << img_w << "x" << img_h << std::endl;
            return default_metrics(confidence);
        }
        const int w = crop.width;
        const int h = crop.height;

        cv::Mat face = image(crop);
        cv::Mat gray;
        if (face.channels() == 3) {
            cv::cvtColor(face, gray, cv::COLOR_BGR2GRAY);
        } else if (face.channels() == 4) {
            cv::cvtColor(face, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = face.clone();
        }
        if (gray.depth() != CV_8U) {
            gray.convertTo(gray, CV_8U);
        }

        float conf = std::isfinite(confidence) ? std::max(0.0f, std::min(1.0f, confidence)) : 0.0f;

        FaceQualityMetrics m;
        m.blur_score = blur_score(gray);
        m.lighting_score = lighting_score(gray);
        m.size_score = size_score(static_cast<float>(w), static_cast<float>(h), img_w, img_h);
        m.aspect_ratio = static_cast<float>(w) / static_cast<float>(h);
        m.confidence = conf;
        m.overall_quality = overall_quality(m.blur_score, m.lighting_score, m.size_score, m.aspect_ratio, conf);
        m.quality_label = label_for(m.overall_quality);
        m.is_good_quality = m.overall_quality >= config_.good_quality_threshold;
        m.analyzed = true;
        return m;
    } catch (const cv::Exception& e) {
        std::cerr << "[FaceQualityAnalyzer] OpenCV error: " << e.what() << std::endl;
    }
    return default_metrics(confidence);
}

float FaceQualityAnalyzer::blur_score(const cv::Mat& gray_face) const {
    if (gray_face.empty()) return 0.0f;

    cv::Mat laplacian;
    cv::Laplacian(gray_face, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);

    double variance = stddev.val[0] * stddev.val[0];
    return static_cast<float>(variance);
}

float FaceQualityAnalyzer::lighting_score(const cv::Mat& gray_face) const {
    if (gray_face.empty()) return 0.0f;

    cv::Scalar mean, stddev;
    cv::meanStdDev(gray_face, mean, stddev);
    const double brightness = mean.val[0];
    const double contrast = stddev.val[0];

    // 曝光裁剪比例
    cv::Mat hist;
    int histSize = 256;
    float range[] = {0, 256};
    const float* histRange = {range};
    cv::calcHist(&gray_face, 1, 0, cv::Mat(), hist, 1, &histSize, &histRange);

    const double total_pixels = static_cast<double>(gray_face.total());
    double clipped = 0.0;
    for (int i = 0; i < config_.clip_dark && i < 256; i++) {
        clipped += hist.at<float>(i);
    }
    for (int i = std::max(0, config_.clip_bright + 1); i < 256; i++) {
        clipped += hist.at<float>(i);
    }
    const double clip_ratio = clipped / total_pixels;

    // 亮度: 理想窗口内满分, 两侧线性下降
    double brightness_score;
    if (brightness >= config_.brightness_low && brightness <= config_.brightness_high) {
        brightness_score = 100.0;
    } else if (brightness < config_.brightness_low) {
        brightness_score = std::max(0.0, brightness / config_.brightness_low * 100.0);
    } else {
        brightness_score = std::max(0.0, (255.0 - brightness) / (255.0 - config_.brightness_high) * 100.0);
    }

    // 对比度
    double contrast_score = std::min(100.0, contrast / config_.contrast_full * 100.0);

    // 曝光: 裁剪超过允许比例的部分按系数扣分
    double excess = std::max(0.0, clip_ratio - config_.clip_ratio_max);
    double exposure_score = std::max(0.0, 100.0 - excess * config_.clip_penalty);

    double score = brightness_score * config_.lighting_w_brightness +
                   contrast_score * config_.lighting_w_contrast +
                   exposure_score * config_.lighting_w_exposure;
    return static_cast<float>(std::max(0.0, std::min(100.0, score)));
}

float FaceQualityAnalyzer::size_score(float face_w, float face_h, int img_w, int img_h) const {
    const double img_area = static_cast<double>(img_w) * img_h;
    if (img_area <= 0.0 || face_w <= 0.0f || face_h <= 0.0f) return 0.0f;

    const double ratio = static_cast<double>(face_w) * face_h / img_area;

    double prev_ratio = 0.0;
    double prev_score = 0.0;
    for (int i = 0; i < 4; ++i) {
        const double r = config_.size_ratio_breaks[i];
        const double s = config_.size_score_breaks[i];
        if (ratio < r) {
            return static_cast<float>(prev_score + (ratio - prev_ratio) / (r - prev_ratio) * (s - prev_score));
        }
        prev_ratio = r;
        prev_score = s;
    }
    double tail = std::min(100.0 - prev_score, (ratio - prev_ratio) * config_.size_tail_slope);
    return static_cast<float>(std::min(100.0, prev_score + tail));
}

float FaceQualityAnalyzer::normalize_blur(float blur) const {
    if (!(blur > 0.0f) || !(config_.blur_excellent > 0.0f)) return 0.0f;
    return std::min(100.0f, blur / config_.blur_excellent * 100.0f);
}

float FaceQualityAnalyzer::normalize_aspect(float aspect_ratio) const {
    if (aspect_ratio >= config_.aspect_opt_min && aspect_ratio <= config_.aspect_opt_max) {
        return 100.0f;
    }
    if (aspect_valid(aspect_ratio)) {
        return config_.aspect_acceptable_score;
    }
    return 0.0f;
}

float FaceQualityAnalyzer::overall_quality(float blur, float lighting, float size,
                                           float aspect_ratio, float confidence) const {
    const FaceQualityWeights& w = config_.weights;
    float conf = std::max(0.0f, std::min(1.0f, confidence));
    float overall = normalize_blur(blur) * w.blur +
                    std::max(0.0f, std::min(100.0f, lighting)) * w.lighting +
                    std::max(0.0f, std::min(100.0f, size)) * w.size +
                    normalize_aspect(aspect_ratio) * w.aspect +
                    conf * 100.0f * w.confidence;
    return std::max(0.0f, std::min(100.0f, overall));
}

QualityLabel FaceQualityAnalyzer::label_for(float overall_quality) const {
    if (overall_quality >= config_.label_excellent) return QualityLabel::Excellent;
    if (overall_quality >= config_.label_good) return QualityLabel::Good;
    if (overall_quality >= config_.label_fair) return QualityLabel::Fair;
    return QualityLabel::Poor;
}

bool FaceQualityAnalyzer::lighting_acceptable(float lighting) const {
    return lighting >= config_.lighting_min && lighting <= config_.lighting_max;
}

bool FaceQualityAnalyzer::aspect_valid(float aspect_ratio) const {
    return aspect_ratio >= config_.aspect_min && aspect_ratio <= config_.aspect_max;
}

FaceQualityMetrics FaceQualityAnalyzer::default_metrics(float confidence) const {
    FaceQualityMetrics m;
    m.confidence = std::isfinite(confidence) ? confidence : 0.0f;
    m.overall_quality = 0.0f;
    m.quality_label = QualityLabel::Poor;
    m.is_good_quality = false;
    m.analyzed = false;
    return m;
}
