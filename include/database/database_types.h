#ifndef DATABASE_TYPES_H
#define DATABASE_TYPES_H

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace db {

/**
 * @brief 人脸边框 (像素坐标)
 */
struct BoundingBox {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

/**
 * @brief 人脸观测 (由检测模块写入，本引擎只读)
 */
struct FaceObservation {
    int64_t id = -1;                // 主键
    int64_t collection_id = -1;     // 所属项目
    std::string source_image_path;  // 原图路径
    std::string crop_path;          // 人脸裁剪图路径
    BoundingBox bbox;               // 原图中的人脸框
    float confidence = 0.0f;        // 检测置信度 [0,1]
    std::vector<float> embedding;   // 特征向量 (通常 512 维)
};

/**
 * @brief 聚类结果 (每次运行整体替换)
 */
struct ClusterRecord {
    int64_t collection_id = -1;
    std::string cluster_key;            // face_000 ...
    std::vector<int64_t> member_ids;    // 成员 FaceObservation id (不含噪声)
    int photo_count = 0;                // 成员覆盖的不同原图数量
    std::vector<float> centroid;        // 成员平均向量
    int64_t representative_id = -1;     // 代表人脸
    int selection_level = 0;            // 代表人脸选择所用的回退级别 1-4
    float representative_quality = 0.0f;
    // 聚类质量快照
    float silhouette = 0.0f;
    float compactness = 0.0f;
    float separation = 0.0f;
};

/**
 * @brief 单次聚类运行的审计记录
 */
struct ClusterRunRecord {
    int64_t run_id = -1;
    int64_t collection_id = -1;
    std::time_t finished_at = 0;
    float eps = 0.0f;
    int min_samples = 0;
    std::string param_source;           // default / adaptive:<category> / override
    int observations_loaded = 0;
    int observations_skipped = 0;
    int cluster_count = 0;
    int noise_count = 0;
    float noise_ratio = 0.0f;
    float silhouette = 0.0f;
    float davies_bouldin = 0.0f;
    float compactness = 0.0f;
    float separation = 0.0f;
    float overall_quality = 0.0f;
    std::string quality_label;
    std::vector<std::string> suggestions;
    int level_counts[4] = {0, 0, 0, 0}; // 各回退级别选出的代表人脸数
};

} // namespace db

#endif // DATABASE_TYPES_H
