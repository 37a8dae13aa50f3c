#include <gtest/gtest.h>
#include "service/engine_settings.h"

using service::EngineSettings;
using service::ResolvedParams;
using service::SettingsLoader;

TEST(EngineSettingsTest, DefaultsAreValid) {
    EngineSettings settings;
    std::string error;
    EXPECT_TRUE(settings.validate(error)) << error;
    EXPECT_FLOAT_EQ(settings.clustering.eps, 0.42f);
    EXPECT_EQ(settings.clustering.min_samples, 3);
    EXPECT_EQ(settings.clustering.metric, DistanceMetric::Cosine);
    EXPECT_FALSE(settings.clustering.adaptive);
}

TEST(EngineSettingsTest, RejectsOutOfRangeClusteringParams) {
    std::string error;
    EngineSettings settings;
    settings.clustering.eps = 0.0f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("eps"), std::string::npos);

    settings = EngineSettings();
    settings.clustering.min_samples = 0;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("min_samples"), std::string::npos);

    settings = EngineSettings();
    settings.overrides[4].eps = 3.0f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("collection 4"), std::string::npos);
}

TEST(EngineSettingsTest, RejectsWeightsNotSummingToOne) {
    std::string error;
    EngineSettings settings;
    settings.face_quality.weights.blur = 0.5f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("face quality weights"), std::string::npos);

    settings = EngineSettings();
    settings.cluster_quality.weights.noise = 0.0f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("cluster quality weights"), std::string::npos);

    settings = EngineSettings();
    settings.selection.weight_proximity = 0.5f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("selection weights"), std::string::npos);
}

TEST(EngineSettingsTest, RejectsBadThresholds) {
    std::string error;
    EngineSettings settings;
    settings.selection.quality_threshold = 120.0f;
    EXPECT_FALSE(settings.validate(error));

    settings = EngineSettings();
    settings.face_quality.label_good = 90.0f;
    EXPECT_FALSE(settings.validate(error));
}

TEST(EngineSettingsTest, RejectsBadScoringShapes) {
    std::string error;
    EngineSettings settings;
    settings.face_quality.lighting_w_exposure = 0.5f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("lighting weights"), std::string::npos);

    settings = EngineSettings();
    settings.face_quality.size_ratio_breaks[2] = 0.015f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("size breakpoints"), std::string::npos);

    settings = EngineSettings();
    settings.face_quality.size_score_breaks[3] = 120.0f;
    EXPECT_FALSE(settings.validate(error));

    settings = EngineSettings();
    settings.cluster_quality.label_good = 85.0f;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_NE(error.find("cluster quality label"), std::string::npos);

    settings = EngineSettings();
    settings.cluster_quality.compactness_cap = 0.0f;
    EXPECT_FALSE(settings.validate(error));

    settings = EngineSettings();
    settings.cluster_quality.minimal_quality_factor = 1.5f;
    EXPECT_FALSE(settings.validate(error));
}

TEST(EngineSettingsTest, AdaptiveParamsBySize) {
    EXPECT_EQ(service::adaptive_params(30).source, "adaptive:tiny");
    EXPECT_EQ(service::adaptive_params(50).source, "adaptive:tiny");
    EXPECT_EQ(service::adaptive_params(100).source, "adaptive:small");
    EXPECT_EQ(service::adaptive_params(500).source, "adaptive:medium");
    EXPECT_EQ(service::adaptive_params(2000).source, "adaptive:large");

    ResolvedParams xl = service::adaptive_params(10000);
    EXPECT_EQ(xl.source, "adaptive:xlarge");
    EXPECT_FLOAT_EQ(xl.eps, 0.30f);
    EXPECT_EQ(xl.min_samples, 3);
}

TEST(EngineSettingsTest, ResolveParamsPriority) {
    EngineSettings settings;
    ResolvedParams p = settings.resolve_clustering_params(1, 100);
    EXPECT_EQ(p.source, "default");
    EXPECT_FLOAT_EQ(p.eps, 0.42f);

    settings.clustering.adaptive = true;
    p = settings.resolve_clustering_params(1, 100);
    EXPECT_EQ(p.source, "adaptive:small");
    EXPECT_FLOAT_EQ(p.eps, 0.38f);
    EXPECT_EQ(p.min_samples, 2);

    // 只覆盖 min_samples 时 eps 沿用自适应值
    settings.overrides[7].min_samples = 5;
    p = settings.resolve_clustering_params(7, 100);
    EXPECT_EQ(p.source, "override");
    EXPECT_FLOAT_EQ(p.eps, 0.38f);
    EXPECT_EQ(p.min_samples, 5);

    // 其它项目不受影响
    EXPECT_EQ(settings.resolve_clustering_params(8, 100).source, "adaptive:small");
}

TEST(SettingsLoaderTest, LoadsKeysAndOverrides) {
    const std::string text =
        "# clustering\n"
        "eps = 0.35\n"
        "min_samples = 4   # inline comment\n"
        "distance_metric = euclidean\n"
        "adaptive_params = yes\n"
        "; another comment style\n"
        "\n"
        "quality_threshold = 55\n"
        "face.weight.blur = 0.25\n"
        "face.weight.lighting = 0.30\n"
        "cluster.near_singleton_size = 3\n"
        "selection.basic_min_face_px = 32\n"
        "collection.12.eps = 0.3\n"
        "collection.12.min_samples = 2\n";

    EngineSettings settings;
    SettingsLoader loader;
    loader.load_string(text, settings);

    EXPECT_EQ(loader.warning_count(), 0);
    EXPECT_FLOAT_EQ(settings.clustering.eps, 0.35f);
    EXPECT_EQ(settings.clustering.min_samples, 4);
    EXPECT_EQ(settings.clustering.metric, DistanceMetric::Euclidean);
    EXPECT_TRUE(settings.clustering.adaptive);
    EXPECT_FLOAT_EQ(settings.selection.quality_threshold, 55.0f);
    EXPECT_FLOAT_EQ(settings.face_quality.weights.blur, 0.25f);
    EXPECT_FLOAT_EQ(settings.face_quality.weights.lighting, 0.30f);
    EXPECT_EQ(settings.cluster_quality.near_singleton_size, 3);
    EXPECT_FLOAT_EQ(settings.selection.basic_min_face_px, 32.0f);

    ASSERT_EQ(settings.overrides.count(12), 1u);
    EXPECT_FLOAT_EQ(*settings.overrides[12].eps, 0.3f);
    EXPECT_EQ(*settings.overrides[12].min_samples, 2);

    std::string error;
    EXPECT_TRUE(settings.validate(error)) << error;
}

TEST(SettingsLoaderTest, LoadsEveryScoringThreshold) {
    const std::string text =
        "face.lighting.weight.brightness = 0.5\n"
        "face.lighting.weight.contrast = 0.25\n"
        "face.lighting.weight.exposure = 0.25\n"
        "face.size_ratio_break.0 = 0.005\n"
        "face.size_score_break.3 = 95\n"
        "face.size_tail_slope = 40\n"
        "face.aspect_acceptable_score = 60\n"
        "cluster.overcluster_cluster_ratio = 0.4\n"
        "cluster.minimal_quality_factor = 0.5\n"
        "cluster.compactness_cap = 2\n"
        "cluster.label_excellent = 85\n"
        "cluster.label_good = 65\n"
        "cluster.label_fair = 45\n";

    EngineSettings settings;
    SettingsLoader loader;
    loader.load_string(text, settings);

    EXPECT_EQ(loader.warning_count(), 0);
    EXPECT_FLOAT_EQ(settings.face_quality.lighting_w_brightness, 0.5f);
    EXPECT_FLOAT_EQ(settings.face_quality.lighting_w_exposure, 0.25f);
    EXPECT_FLOAT_EQ(settings.face_quality.size_ratio_breaks[0], 0.005f);
    EXPECT_FLOAT_EQ(settings.face_quality.size_ratio_breaks[1], 0.02f);
    EXPECT_FLOAT_EQ(settings.face_quality.size_score_breaks[3], 95.0f);
    EXPECT_FLOAT_EQ(settings.face_quality.size_tail_slope, 40.0f);
    EXPECT_FLOAT_EQ(settings.face_quality.aspect_acceptable_score, 60.0f);
    EXPECT_FLOAT_EQ(settings.cluster_quality.overcluster_cluster_ratio, 0.4f);
    EXPECT_FLOAT_EQ(settings.cluster_quality.minimal_quality_factor, 0.5f);
    EXPECT_FLOAT_EQ(settings.cluster_quality.compactness_cap, 2.0f);
    EXPECT_FLOAT_EQ(settings.cluster_quality.label_excellent, 85.0f);
    EXPECT_FLOAT_EQ(settings.cluster_quality.label_fair, 45.0f);

    std::string error;
    EXPECT_TRUE(settings.validate(error)) << error;
}

TEST(SettingsLoaderTest, BadValuesKeepPreviousSettings) {
    const std::string text =
        "eps = abc\n"
        "min_samples = 3.5\n"
        "adaptive_params = maybe\n"
        "distance_metric = manhattan\n"
        "no_equals_sign\n"
        "unknown.key = 1\n"
        "collection.x.eps = 0.3\n";

    EngineSettings settings;
    SettingsLoader loader;
    loader.load_string(text, settings);

    EXPECT_EQ(loader.warning_count(), 7);
    EXPECT_FLOAT_EQ(settings.clustering.eps, 0.42f);
    EXPECT_EQ(settings.clustering.min_samples, 3);
    EXPECT_FALSE(settings.clustering.adaptive);
    EXPECT_EQ(settings.clustering.metric, DistanceMetric::Cosine);
    EXPECT_TRUE(settings.overrides.empty());
}

TEST(SettingsLoaderTest, MissingFile) {
    EngineSettings settings;
    SettingsLoader loader;
    EXPECT_FALSE(loader.load_file("/nonexistent/cluster_engine.conf", settings));
    EXPECT_FLOAT_EQ(settings.clustering.eps, 0.42f);
}
