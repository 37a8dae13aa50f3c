/**
 * @file engine_settings.h
 * @brief 聚类引擎运行参数 - 默认值来自 Config::，可由配置文件覆盖
 * @details 配置文件格式 (key = value，# 或 ; 开头为注释)：
 *
 *   eps = 0.40
 *   min_samples = 3
 *   distance_metric = cosine
 *   adaptive_params = true
 *   quality_threshold = 60
 *   face.weight.blur = 0.30
 *   face.lighting.weight.brightness = 0.40
 *   face.size_ratio_break.0 = 0.01     # 0-3, 与 face.size_score_break.N 对应
 *   cluster.weight.silhouette = 0.40
 *   cluster.compactness_cap = 1.0
 *   collection.7.eps = 0.35          # 单个项目覆盖
 *   collection.7.min_samples = 2
 */

#ifndef ENGINE_SETTINGS_H
#define ENGINE_SETTINGS_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "config.h"
#include "core/clustering_quality_analyzer.h"
#include "core/face_quality_analyzer.h"
#include "core/vector_math.h"
#include "service/representative_selector.h"

namespace service {

struct ClusteringParams {
    float eps = Config::Clustering::EPS;
    int min_samples = Config::Clustering::MIN_SAMPLES;
    DistanceMetric metric = DistanceMetric::Cosine;
    bool adaptive = false;      // 按数据集规模自动选择 eps / min_samples
};

// 单个项目的参数覆盖，未设置的项沿用全局值
struct CollectionOverride {
    std::optional<float> eps;
    std::optional<int> min_samples;
};

// 本次运行实际使用的聚类参数
struct ResolvedParams {
    float eps = Config::Clustering::EPS;
    int min_samples = Config::Clustering::MIN_SAMPLES;
    std::string source = "default";     // default / adaptive:<category> / override
};

struct EngineSettings {
    ClusteringParams clustering;
    FaceQualityConfig face_quality;
    ClusterQualityConfig cluster_quality;
    SelectionConfig selection;
    std::map<int64_t, CollectionOverride> overrides;

    /**
     * @brief 检查参数合法性
     * @param out_error 输出: 第一个不合法项的说明
     * @return 合法返回 true
     */
    bool validate(std::string& out_error) const;

    /**
     * @brief 决定某个项目本次运行的 eps / min_samples
     * @details 优先级: 项目覆盖 > 自适应 (adaptive = true 时) > 全局值
     */
    ResolvedParams resolve_clustering_params(int64_t collection_id, int face_count) const;
};

// 按数据集规模给出推荐参数 (tiny/small/medium/large/xlarge)
ResolvedParams adaptive_params(int face_count);

class SettingsLoader {
public:
    /**
     * @brief 从文件加载，文件中没有出现的项保持原值
     * @return 文件无法打开返回 false (settings 不变)
     */
    bool load_file(const std::string& path, EngineSettings& settings);

    // 从字符串加载 (测试用)
    void load_string(const std::string& text, EngineSettings& settings);

    // 最近一次加载中无法识别或格式错误的项数
    int warning_count() const { return warnings_; }

private:
    void parse_line(const std::string& raw_line, std::map<std::string, std::string>& values);
    void apply(const std::map<std::string, std::string>& values, EngineSettings& settings);

    bool apply_override(const std::string& key, const std::string& value, EngineSettings& settings);

    bool parse_float(const std::string& key, const std::string& value, float& out);
    bool parse_int(const std::string& key, const std::string& value, int& out);
    bool parse_bool(const std::string& key, const std::string& value, bool& out);

    static std::string trim(const std::string& str);

    int warnings_ = 0;
};

} // namespace service

#endif // ENGINE_SETTINGS_H
