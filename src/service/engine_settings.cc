/**
 * @file engine_settings.cc
 * @brief 运行参数加载、校验与自适应选择
 */

#include "service/engine_settings.h"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace service {

namespace {

bool weights_sum_to_one(double sum) {
    return std::fabs(sum - 1.0) <= 1e-6;
}

std::string format_sum(double sum) {
    std::ostringstream oss;
    oss.precision(8);
    oss << sum;
    return oss.str();
}

} // namespace

// ==================== EngineSettings ====================

bool EngineSettings::validate(std::string& out_error) const {
    if (!(clustering.eps >= Config::Clustering::EPS_MIN && clustering.eps <= Config::Clustering::EPS_MAX)) {
        out_error = "eps out of range: " + std::to_string(clustering.eps);
        return false;
    }
    if (clustering.min_samples < Config::Clustering::MIN_SAMPLES_MIN ||
        clustering.min_samples > Config::Clustering::MIN_SAMPLES_MAX) {
        out_error = "min_samples out of range: " + std::to_string(clustering.min_samples);
        return false;
    }
    for (const auto& kv : overrides) {
        if (kv.second.eps && !(*kv.second.eps >= Config::Clustering::EPS_MIN &&
                               *kv.second.eps <= Config::Clustering::EPS_MAX)) {
            out_error = "collection " + std::to_string(kv.first) + " eps out of range";
            return false;
        }
        if (kv.second.min_samples && (*kv.second.min_samples < Config::Clustering::MIN_SAMPLES_MIN ||
                                      *kv.second.min_samples > Config::Clustering::MIN_SAMPLES_MAX)) {
            out_error = "collection " + std::to_string(kv.first) + " min_samples out of range";
            return false;
        }
    }

    const FaceQualityWeights& fw = face_quality.weights;
    double face_sum = static_cast<double>(fw.blur) + fw.lighting + fw.size + fw.aspect + fw.confidence;
    if (!weights_sum_to_one(face_sum)) {
        out_error = "face quality weights sum to " + format_sum(face_sum) + ", expected 1.0";
        return false;
    }

    const ClusterQualityWeights& cw = cluster_quality.weights;
    double cluster_sum = static_cast<double>(cw.silhouette) + cw.davies_bouldin + cw.noise + cw.compactness;
    if (!weights_sum_to_one(cluster_sum)) {
        out_error = "cluster quality weights sum to " + format_sum(cluster_sum) + ", expected 1.0";
        return false;
    }

    double selection_sum = static_cast<double>(selection.weight_quality) + selection.weight_proximity;
    if (!weights_sum_to_one(selection_sum)) {
        out_error = "selection weights sum to " + format_sum(selection_sum) + ", expected 1.0";
        return false;
    }

    if (selection.quality_threshold < 0.0f || selection.quality_threshold > 100.0f) {
        out_error = "quality_threshold out of range: " + std::to_string(selection.quality_threshold);
        return false;
    }
    if (!(face_quality.label_fair <= face_quality.label_good &&
          face_quality.label_good <= face_quality.label_excellent)) {
        out_error = "face quality label thresholds are not ascending";
        return false;
    }
    if (!(cluster_quality.db_cap > 0.0f) || !(cluster_quality.noise_concerning > 0.0f) ||
        !(cluster_quality.compactness_cap > 0.0f)) {
        out_error = "cluster quality normalisation caps must be positive";
        return false;
    }
    if (!(cluster_quality.label_fair <= cluster_quality.label_good &&
          cluster_quality.label_good <= cluster_quality.label_excellent)) {
        out_error = "cluster quality label thresholds are not ascending";
        return false;
    }
    if (!(cluster_quality.minimal_quality_factor >= 0.0f && cluster_quality.minimal_quality_factor <= 1.0f)) {
        out_error = "minimal_quality_factor out of range: " + std::to_string(cluster_quality.minimal_quality_factor);
        return false;
    }

    double lighting_sum = static_cast<double>(face_quality.lighting_w_brightness) +
                          face_quality.lighting_w_contrast + face_quality.lighting_w_exposure;
    if (!weights_sum_to_one(lighting_sum)) {
        out_error = "lighting weights sum to " + format_sum(lighting_sum) + ", expected 1.0";
        return false;
    }

    // 尺寸分段: 占比严格递增且在 (0, 1] 内，分数不减且在 [0, 100] 内
    const float* ratios = face_quality.size_ratio_breaks;
    const float* scores = face_quality.size_score_breaks;
    for (int i = 0; i < 4; ++i) {
        bool ratio_ok = ratios[i] > 0.0f && ratios[i] <= 1.0f && (i == 0 || ratios[i] > ratios[i - 1]);
        bool score_ok = scores[i] >= 0.0f && scores[i] <= 100.0f && (i == 0 || scores[i] >= scores[i - 1]);
        if (!ratio_ok || !score_ok) {
            out_error = "size breakpoints must be ascending (index " + std::to_string(i) + ")";
            return false;
        }
    }
    if (!(face_quality.size_tail_slope >= 0.0f)) {
        out_error = "size_tail_slope must not be negative";
        return false;
    }
    if (!(face_quality.aspect_acceptable_score >= 0.0f && face_quality.aspect_acceptable_score <= 100.0f)) {
        out_error = "aspect_acceptable_score out of range: " + std::to_string(face_quality.aspect_acceptable_score);
        return false;
    }
    return true;
}

ResolvedParams adaptive_params(int face_count) {
    ResolvedParams p;
    if (face_count <= Config::Adaptive::TINY_MAX) {
        p.eps = Config::Adaptive::TINY_EPS;
        p.min_samples = Config::Adaptive::TINY_MIN_SAMPLES;
        p.source = "adaptive:tiny";
    } else if (face_count <= Config::Adaptive::SMALL_MAX) {
        p.eps = Config::Adaptive::SMALL_EPS;
        p.min_samples = Config::Adaptive::SMALL_MIN_SAMPLES;
        p.source = "adaptive:small";
    } else if (face_count <= Config::Adaptive::MEDIUM_MAX) {
        p.eps = Config::Adaptive::MEDIUM_EPS;
        p.min_samples = Config::Adaptive::MEDIUM_MIN_SAMPLES;
        p.source = "adaptive:medium";
    } else if (face_count <= Config::Adaptive::LARGE_MAX) {
        p.eps = Config::Adaptive::LARGE_EPS;
        p.min_samples = Config::Adaptive::LARGE_MIN_SAMPLES;
        p.source = "adaptive:large";
    } else {
        p.eps = Config::Adaptive::XLARGE_EPS;
        p.min_samples = Config::Adaptive::XLARGE_MIN_SAMPLES;
        p.source = "adaptive:xlarge";
    }
    return p;
}

ResolvedParams EngineSettings::resolve_clustering_params(int64_t collection_id, int face_count) const {
    ResolvedParams base;
    if (clustering.adaptive) {
        base = adaptive_params(face_count);
    } else {
        base.eps = clustering.eps;
        base.min_samples = clustering.min_samples;
        base.source = "default";
    }

    auto it = overrides.find(collection_id);
    if (it != overrides.end() && (it->second.eps || it->second.min_samples)) {
        if (it->second.eps) base.eps = *it->second.eps;
        if (it->second.min_samples) base.min_samples = *it->second.min_samples;
        base.source = "override";
    }
    return base;
}

// ==================== SettingsLoader ====================

std::string SettingsLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool SettingsLoader::load_file(const std::string& path, EngineSettings& settings) {
    warnings_ = 0;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Settings] Could not open config file: " << path << ", using defaults" << std::endl;
        return false;
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(file, line)) {
        parse_line(line, values);
    }
    apply(values, settings);

    std::cout << "[Settings] Loaded " << values.size() << " entries from " << path;
    if (warnings_ > 0) {
        std::cout << " (" << warnings_ << " ignored)";
    }
    std::cout << std::endl;
    return true;
}

void SettingsLoader::load_string(const std::string& text, EngineSettings& settings) {
    warnings_ = 0;
    std::map<std::string, std::string> values;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        parse_line(line, values);
    }
    apply(values, settings);
}

void SettingsLoader::parse_line(const std::string& raw_line, std::map<std::string, std::string>& values) {
    std::string line = trim(raw_line);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    // 行尾注释
    size_t hash = line.find('#');
    if (hash != std::string::npos) {
        line = trim(line.substr(0, hash));
    }

    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        std::cerr << "[Settings] Warning: Ignoring malformed line: " << line << std::endl;
        warnings_++;
        return;
    }
    std::string key = trim(line.substr(0, pos));
    std::string value = trim(line.substr(pos + 1));
    if (key.empty()) {
        std::cerr << "[Settings] Warning: Ignoring line without key: " << line << std::endl;
        warnings_++;
        return;
    }
    values[key] = value;
}

bool SettingsLoader::parse_float(const std::string& key, const std::string& value, float& out) {
    try {
        size_t used = 0;
        float v = std::stof(value, &used);
        if (used != value.size() || !std::isfinite(v)) {
            throw std::invalid_argument(value);
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        std::cerr << "[Settings] Warning: Invalid float value for " << key << ": " << value << std::endl;
        warnings_++;
    }
    return false;
}

bool SettingsLoader::parse_int(const std::string& key, const std::string& value, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        std::cerr << "[Settings] Warning: Invalid integer value for " << key << ": " << value << std::endl;
        warnings_++;
    }
    return false;
}

bool SettingsLoader::parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    std::cerr << "[Settings] Warning: Invalid boolean value for " << key << ": " << value << std::endl;
    warnings_++;
    return false;
}

bool SettingsLoader::apply_override(const std::string& key, const std::string& value, EngineSettings& settings) {
    // collection.<id>.eps / collection.<id>.min_samples
    const std::string prefix = "collection.";
    if (key.compare(0, prefix.size(), prefix) != 0) return false;

    size_t dot = key.find('.', prefix.size());
    if (dot == std::string::npos) return false;

    std::string id_text = key.substr(prefix.size(), dot - prefix.size());
    std::string field = key.substr(dot + 1);
    int64_t collection_id = 0;
    try {
        size_t used = 0;
        collection_id = std::stoll(id_text, &used);
        if (used != id_text.size()) return false;
    } catch (const std::exception&) {
        return false;
    }

    if (field == "eps") {
        float eps;
        if (parse_float(key, value, eps)) settings.overrides[collection_id].eps = eps;
        return true;
    }
    if (field == "min_samples") {
        int min_samples;
        if (parse_int(key, value, min_samples)) settings.overrides[collection_id].min_samples = min_samples;
        return true;
    }
    return false;
}

void SettingsLoader::apply(const std::map<std::string, std::string>& values, EngineSettings& settings) {
    FaceQualityConfig& fq = settings.face_quality;
    ClusterQualityConfig& cq = settings.cluster_quality;
    SelectionConfig& sel = settings.selection;

    const std::map<std::string, float*> floats = {
        {"eps", &settings.clustering.eps},
        {"quality_threshold", &sel.quality_threshold},

        {"face.blur_very_blurry", &fq.blur_very_blurry},
        {"face.blur_good", &fq.blur_good},
        {"face.blur_excellent", &fq.blur_excellent},
        {"face.brightness_low", &fq.brightness_low},
        {"face.brightness_high", &fq.brightness_high},
        {"face.contrast_min", &fq.contrast_min},
        {"face.contrast_full", &fq.contrast_full},
        {"face.clip_ratio_max", &fq.clip_ratio_max},
        {"face.clip_penalty", &fq.clip_penalty},
        {"face.lighting_min", &fq.lighting_min},
        {"face.lighting_max", &fq.lighting_max},
        {"face.lighting.weight.brightness", &fq.lighting_w_brightness},
        {"face.lighting.weight.contrast", &fq.lighting_w_contrast},
        {"face.lighting.weight.exposure", &fq.lighting_w_exposure},
        {"face.size_ratio_break.0", &fq.size_ratio_breaks[0]},
        {"face.size_ratio_break.1", &fq.size_ratio_breaks[1]},
        {"face.size_ratio_break.2", &fq.size_ratio_breaks[2]},
        {"face.size_ratio_break.3", &fq.size_ratio_breaks[3]},
        {"face.size_score_break.0", &fq.size_score_breaks[0]},
        {"face.size_score_break.1", &fq.size_score_breaks[1]},
        {"face.size_score_break.2", &fq.size_score_breaks[2]},
        {"face.size_score_break.3", &fq.size_score_breaks[3]},
        {"face.size_tail_slope", &fq.size_tail_slope},
        {"face.size_adequate", &fq.size_adequate},
        {"face.aspect_min", &fq.aspect_min},
        {"face.aspect_max", &fq.aspect_max},
        {"face.aspect_opt_min", &fq.aspect_opt_min},
        {"face.aspect_opt_max", &fq.aspect_opt_max},
        {"face.aspect_acceptable_score", &fq.aspect_acceptable_score},
        {"face.label_excellent", &fq.label_excellent},
        {"face.label_good", &fq.label_good},
        {"face.label_fair", &fq.label_fair},
        {"face.good_quality_threshold", &fq.good_quality_threshold},
        {"face.weight.blur", &fq.weights.blur},
        {"face.weight.lighting", &fq.weights.lighting},
        {"face.weight.size", &fq.weights.size},
        {"face.weight.aspect", &fq.weights.aspect},
        {"face.weight.confidence", &fq.weights.confidence},

        {"cluster.silhouette_excellent", &cq.silhouette_excellent},
        {"cluster.silhouette_good", &cq.silhouette_good},
        {"cluster.silhouette_fair", &cq.silhouette_fair},
        {"cluster.db_excellent", &cq.db_excellent},
        {"cluster.db_good", &cq.db_good},
        {"cluster.db_fair", &cq.db_fair},
        {"cluster.db_cap", &cq.db_cap},
        {"cluster.noise_acceptable", &cq.noise_acceptable},
        {"cluster.noise_concerning", &cq.noise_concerning},
        {"cluster.noise_overcluster", &cq.noise_overcluster},
        {"cluster.singleton_ratio", &cq.singleton_ratio},
        {"cluster.large_cluster_factor", &cq.large_cluster_factor},
        {"cluster.overcluster_cluster_ratio", &cq.overcluster_cluster_ratio},
        {"cluster.minimal_quality_factor", &cq.minimal_quality_factor},
        {"cluster.compactness_cap", &cq.compactness_cap},
        {"cluster.label_excellent", &cq.label_excellent},
        {"cluster.label_good", &cq.label_good},
        {"cluster.label_fair", &cq.label_fair},
        {"cluster.weight.silhouette", &cq.weights.silhouette},
        {"cluster.weight.davies_bouldin", &cq.weights.davies_bouldin},
        {"cluster.weight.noise", &cq.weights.noise},
        {"cluster.weight.compactness", &cq.weights.compactness},

        {"selection.quality_threshold", &sel.quality_threshold},
        {"selection.weight_quality", &sel.weight_quality},
        {"selection.weight_proximity", &sel.weight_proximity},
        {"selection.basic_min_confidence", &sel.basic_min_confidence},
        {"selection.basic_min_face_px", &sel.basic_min_face_px},
    };

    const std::map<std::string, int*> ints = {
        {"min_samples", &settings.clustering.min_samples},
        {"face.clip_dark", &fq.clip_dark},
        {"face.clip_bright", &fq.clip_bright},
        {"cluster.near_singleton_size", &cq.near_singleton_size},
    };

    for (const auto& kv : values) {
        const std::string& key = kv.first;
        const std::string& value = kv.second;

        auto f = floats.find(key);
        if (f != floats.end()) {
            parse_float(key, value, *f->second);
            continue;
        }
        auto i = ints.find(key);
        if (i != ints.end()) {
            parse_int(key, value, *i->second);
            continue;
        }
        if (key == "adaptive_params") {
            parse_bool(key, value, settings.clustering.adaptive);
            continue;
        }
        if (key == "distance_metric") {
            if (!parse_distance_metric(value, settings.clustering.metric)) {
                std::cerr << "[Settings] Warning: Unknown distance metric: " << value << std::endl;
                warnings_++;
            }
            continue;
        }
        if (apply_override(key, value, settings)) {
            continue;
        }

        std::cerr << "[Settings] Warning: Unknown key: " << key << std::endl;
        warnings_++;
    }
}

} // namespace service
