/**
 * @file config.h
 * @brief 全局配置常量 - 集中管理所有可调参数
 * @author CL
 * @date 2025-12-04
 *
 * 配置分类：
 * - [固定] 系统常量，不可通过配置文件修改
 * - [默认] 可配置项的默认值，运行时从 service::EngineSettings 读取
 *
 * 使用方法：
 *   #include "config.h"
 *   float eps = Config::Clustering::EPS;  // 默认值
 *   float w = Config::FaceQuality::WEIGHT_BLUR;
 */

#pragma once

namespace Config {

// ==================== 路径配置 [固定] ====================
namespace Path {
    constexpr const char* DATABASE = "./data.db";
    constexpr const char* SETTINGS = "./cluster_engine.conf";
}

// ==================== 聚类参数 [默认] ====================
namespace Clustering {
    constexpr float EPS = 0.42f;                   // DBSCAN 邻域半径 (余弦距离)
    constexpr int MIN_SAMPLES = 3;                 // 成簇最少样本数 (含自身)
    constexpr float EPS_MIN = 0.05f;               // eps 合法范围
    constexpr float EPS_MAX = 1.0f;
    constexpr int MIN_SAMPLES_MIN = 1;             // min_samples 合法范围
    constexpr int MIN_SAMPLES_MAX = 50;
    constexpr const char* KEY_PREFIX = "face_";    // 聚类键前缀 face_000, face_001 ...
}

// ==================== 自适应聚类参数 [固定] ====================
// 按数据集规模选择 eps / min_samples
namespace Adaptive {
    constexpr int TINY_MAX = 50;
    constexpr float TINY_EPS = 0.42f;
    constexpr int TINY_MIN_SAMPLES = 2;

    constexpr int SMALL_MAX = 200;
    constexpr float SMALL_EPS = 0.38f;
    constexpr int SMALL_MIN_SAMPLES = 2;

    constexpr int MEDIUM_MAX = 1000;
    constexpr float MEDIUM_EPS = 0.35f;
    constexpr int MEDIUM_MIN_SAMPLES = 2;

    constexpr int LARGE_MAX = 5000;
    constexpr float LARGE_EPS = 0.32f;
    constexpr int LARGE_MIN_SAMPLES = 3;

    constexpr float XLARGE_EPS = 0.30f;
    constexpr int XLARGE_MIN_SAMPLES = 3;
}

// ==================== 人脸画质评估 [默认] ====================
namespace FaceQuality {
    // 清晰度 (Laplacian 方差)
    constexpr float BLUR_VERY_BLURRY = 50.0f;      // < 50 严重模糊
    constexpr float BLUR_GOOD = 100.0f;            // >= 100 清晰 (通过)
    constexpr float BLUR_EXCELLENT = 500.0f;       // > 500 非常清晰, 也是归一化上限

    // 光照
    constexpr float BRIGHTNESS_LOW = 80.0f;        // 理想亮度窗口 80-170
    constexpr float BRIGHTNESS_HIGH = 170.0f;
    constexpr float CONTRAST_MIN = 30.0f;          // 标准差 > 30 视为对比度合格
    constexpr float CONTRAST_FULL = 50.0f;         // 标准差达到 50 时对比度满分
    constexpr int CLIP_DARK = 10;                  // 灰度 < 10 视为欠曝裁剪
    constexpr int CLIP_BRIGHT = 245;               // 灰度 > 245 视为过曝裁剪
    constexpr float CLIP_RATIO_MAX = 0.05f;        // 裁剪像素 > 5% 开始明显扣分
    constexpr float CLIP_PENALTY = 200.0f;         // 裁剪比例惩罚系数
    constexpr float LIGHTING_MIN = 40.0f;          // 可接受光照分区间 40-90
    constexpr float LIGHTING_MAX = 90.0f;
    constexpr float LIGHTING_W_BRIGHTNESS = 0.4f;
    constexpr float LIGHTING_W_CONTRAST = 0.3f;
    constexpr float LIGHTING_W_EXPOSURE = 0.3f;

    // 尺寸 (人脸面积占比): 分段点 -> 分数, 最后一段之后按斜率增长, 封顶 100
    constexpr float SIZE_RATIO_BREAKS[4] = {0.01f, 0.02f, 0.05f, 0.20f};
    constexpr float SIZE_SCORE_BREAKS[4] = {20.0f, 40.0f, 70.0f, 90.0f};
    constexpr float SIZE_TAIL_SLOPE = 50.0f;
    constexpr float SIZE_ADEQUATE = 40.0f;         // >= 40 分 (约 2% 面积) 视为足够大

    // 宽高比
    constexpr float ASPECT_MIN = 0.5f;             // 正常人脸 0.5-1.6
    constexpr float ASPECT_MAX = 1.6f;
    constexpr float ASPECT_OPT_MIN = 0.8f;         // 最优 0.8-1.2
    constexpr float ASPECT_OPT_MAX = 1.2f;
    constexpr float ASPECT_ACCEPTABLE_SCORE = 70.0f;

    // 综合评分权重 (总和必须为 1.0)
    constexpr float WEIGHT_BLUR = 0.30f;
    constexpr float WEIGHT_LIGHTING = 0.25f;
    constexpr float WEIGHT_SIZE = 0.20f;
    constexpr float WEIGHT_ASPECT = 0.10f;
    constexpr float WEIGHT_CONFIDENCE = 0.15f;

    // 等级划分
    constexpr float LABEL_EXCELLENT = 80.0f;
    constexpr float LABEL_GOOD = 60.0f;
    constexpr float LABEL_FAIR = 40.0f;
    constexpr float GOOD_QUALITY = 60.0f;          // is_good_quality 阈值
}

// ==================== 聚类质量评估 [默认] ====================
namespace ClusterQuality {
    constexpr float SILHOUETTE_EXCELLENT = 0.7f;
    constexpr float SILHOUETTE_GOOD = 0.5f;
    constexpr float SILHOUETTE_FAIR = 0.25f;

    constexpr float DB_EXCELLENT = 0.5f;           // Davies-Bouldin 越小越好
    constexpr float DB_GOOD = 1.0f;
    constexpr float DB_FAIR = 1.5f;
    constexpr float DB_CAP = 3.0f;                 // 归一化: 0 -> 100, 3.0 -> 0
    constexpr float DB_UNDEFINED = 999.0f;         // 少于 2 个簇时的哨兵值

    constexpr float NOISE_ACCEPTABLE = 0.15f;
    constexpr float NOISE_CONCERNING = 0.30f;      // 也是噪声归一化上限
    constexpr float NOISE_OVERCLUSTER = 0.05f;     // 低于 5% 且小簇过多 -> 过度分簇
    constexpr float OVERCLUSTER_CLUSTER_RATIO = 0.3f;  // 簇数 > 0.3 * 人脸数
    constexpr float SINGLETON_RATIO = 0.3f;        // 单例(近单例)簇占比 > 30%
    constexpr int NEAR_SINGLETON_SIZE = 2;         // 成员数 <= 2 视为近单例
    constexpr float LARGE_CLUSTER_FACTOR = 10.0f;  // 最大簇 > 10 倍平均 -> 欠分簇

    constexpr float WEIGHT_SILHOUETTE = 0.40f;
    constexpr float WEIGHT_DAVIES_BOULDIN = 0.30f;
    constexpr float WEIGHT_NOISE = 0.20f;
    constexpr float WEIGHT_COMPACTNESS = 0.10f;

    constexpr float MINIMAL_QUALITY_FACTOR = 0.3f; // 单簇时仅按噪声比例打折评分
    constexpr float COMPACTNESS_CAP = 1.0f;        // 归一化: 0 -> 100, 达到上限 -> 0

    constexpr float LABEL_EXCELLENT = 80.0f;
    constexpr float LABEL_GOOD = 60.0f;
    constexpr float LABEL_FAIR = 40.0f;
}

// ==================== 代表人脸选择 [默认] ====================
namespace Selection {
    constexpr float QUALITY_THRESHOLD = 60.0f;     // 一级: 综合画质门限
    constexpr float WEIGHT_QUALITY = 0.70f;        // 一级: 画质权重
    constexpr float WEIGHT_PROXIMITY = 0.30f;      // 一级: 质心接近度权重
    constexpr float BASIC_MIN_CONFIDENCE = 0.6f;   // 二级: 检测置信度门限
    constexpr float BASIC_MIN_FACE_PX = 20.0f;     // 二级: 人脸最短边 (像素)
}

} // namespace Config
