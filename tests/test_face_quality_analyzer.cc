#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <opencv2/core.hpp>
#include "core/face_quality_analyzer.h"

class FaceQualityAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 4 像素棋盘格: 清晰、对比度高、亮度居中
        sharp_image = cv::Mat(200, 200, CV_8UC1);
        for (int r = 0; r < sharp_image.rows; ++r) {
            for (int c = 0; c < sharp_image.cols; ++c) {
                sharp_image.at<uchar>(r, c) = ((r / 4 + c / 4) % 2 == 0) ? 60 : 200;
            }
        }
        dark_flat_image = cv::Mat(200, 200, CV_8UC1, cv::Scalar(20));
        mid_flat_image = cv::Mat(200, 200, CV_8UC1, cv::Scalar(128));
        white_image = cv::Mat(200, 200, CV_8UC1, cv::Scalar(255));

        face_box.x = 40;
        face_box.y = 40;
        face_box.width = 120;
        face_box.height = 120;
    }

    FaceQualityAnalyzer analyzer;
    cv::Mat sharp_image;
    cv::Mat dark_flat_image;
    cv::Mat mid_flat_image;
    cv::Mat white_image;
    db::BoundingBox face_box;
};

TEST_F(FaceQualityAnalyzerTest, SharpWellLitFaceIsExcellent) {
    FaceQualityMetrics m = analyzer.analyze_image(sharp_image, face_box, 0.95f);

    EXPECT_TRUE(m.analyzed);
    EXPECT_GT(m.blur_score, 500.0f);
    EXPECT_NEAR(m.lighting_score, 100.0f, 0.5f);
    EXPECT_NEAR(m.size_score, 98.0f, 0.1f);
    EXPECT_FLOAT_EQ(m.aspect_ratio, 1.0f);
    EXPECT_NEAR(m.overall_quality, 98.85f, 0.2f);
    EXPECT_EQ(m.quality_label, QualityLabel::Excellent);
    EXPECT_TRUE(m.is_good_quality);
}

TEST_F(FaceQualityAnalyzerTest, ColorImageIsAccepted) {
    cv::Mat bgr;
    cv::Mat channels[] = {sharp_image, sharp_image, sharp_image};
    cv::merge(channels, 3, bgr);

    FaceQualityMetrics m = analyzer.analyze_image(bgr, face_box, 0.95f);
    EXPECT_TRUE(m.analyzed);
    EXPECT_EQ(m.quality_label, QualityLabel::Excellent);
}

TEST_F(FaceQualityAnalyzerTest, FlatDarkFaceIsNotGoodQuality) {
    FaceQualityMetrics m = analyzer.analyze_image(dark_flat_image, face_box, 0.95f);

    EXPECT_TRUE(m.analyzed);
    EXPECT_FLOAT_EQ(m.blur_score, 0.0f);
    // 亮度 25 * 0.4 + 对比度 0 + 曝光 100 * 0.3
    EXPECT_NEAR(m.lighting_score, 40.0f, 0.01f);
    EXPECT_LT(m.overall_quality, 60.0f);
    EXPECT_FALSE(m.is_good_quality);
}

TEST_F(FaceQualityAnalyzerTest, LightingScoreComponents) {
    EXPECT_NEAR(analyzer.lighting_score(mid_flat_image), 70.0f, 0.01f);
    // 全部过曝: 亮度、对比度、曝光都为 0
    EXPECT_NEAR(analyzer.lighting_score(white_image), 0.0f, 0.01f);
    EXPECT_FLOAT_EQ(analyzer.lighting_score(cv::Mat()), 0.0f);
}

TEST_F(FaceQualityAnalyzerTest, BlurScoreIsZeroOnFlatImage) {
    EXPECT_FLOAT_EQ(analyzer.blur_score(mid_flat_image), 0.0f);
    EXPECT_GT(analyzer.blur_score(sharp_image), analyzer.blur_score(mid_flat_image));
}

TEST_F(FaceQualityAnalyzerTest, SizeScoreIsPiecewiseLinear) {
    // 面积占比 0.005 / 0.01 / 0.035 / 0.20 / 0.50
    EXPECT_NEAR(analyzer.size_score(10, 50, 100, 1000), 10.0f, 1e-3f);
    EXPECT_NEAR(analyzer.size_score(10, 100, 100, 1000), 20.0f, 1e-3f);
    EXPECT_NEAR(analyzer.size_score(35, 100, 100, 1000), 55.0f, 1e-3f);
    EXPECT_NEAR(analyzer.size_score(200, 100, 100, 1000), 90.0f, 1e-3f);
    EXPECT_NEAR(analyzer.size_score(500, 100, 100, 1000), 100.0f, 1e-3f);
    EXPECT_FLOAT_EQ(analyzer.size_score(10, 10, 0, 0), 0.0f);
}

TEST_F(FaceQualityAnalyzerTest, Normalization) {
    EXPECT_FLOAT_EQ(analyzer.normalize_blur(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(analyzer.normalize_blur(250.0f), 50.0f);
    EXPECT_FLOAT_EQ(analyzer.normalize_blur(1000.0f), 100.0f);

    EXPECT_FLOAT_EQ(analyzer.normalize_aspect(1.0f), 100.0f);
    EXPECT_FLOAT_EQ(analyzer.normalize_aspect(1.4f), 70.0f);
    EXPECT_FLOAT_EQ(analyzer.normalize_aspect(0.5f), 70.0f);
    EXPECT_FLOAT_EQ(analyzer.normalize_aspect(2.0f), 0.0f);
}

TEST_F(FaceQualityAnalyzerTest, OverallQualityBounds) {
    EXPECT_NEAR(analyzer.overall_quality(500.0f, 100.0f, 100.0f, 1.0f, 1.0f), 100.0f, 1e-3f);
    EXPECT_FLOAT_EQ(analyzer.overall_quality(0.0f, 0.0f, 0.0f, 0.0f, 0.0f), 0.0f);
    // 超出范围的置信度被截断
    EXPECT_NEAR(analyzer.overall_quality(500.0f, 100.0f, 100.0f, 1.0f, 3.0f), 100.0f, 1e-3f);
}

TEST_F(FaceQualityAnalyzerTest, LabelThresholds) {
    EXPECT_EQ(analyzer.label_for(80.0f), QualityLabel::Excellent);
    EXPECT_EQ(analyzer.label_for(79.9f), QualityLabel::Good);
    EXPECT_EQ(analyzer.label_for(60.0f), QualityLabel::Good);
    EXPECT_EQ(analyzer.label_for(40.0f), QualityLabel::Fair);
    EXPECT_EQ(analyzer.label_for(39.9f), QualityLabel::Poor);
    EXPECT_STREQ(quality_label_name(QualityLabel::Fair), "Fair");
}

TEST_F(FaceQualityAnalyzerTest, AcceptanceChecks) {
    EXPECT_TRUE(analyzer.blur_passes(100.0f));
    EXPECT_FALSE(analyzer.blur_passes(99.0f));
    EXPECT_TRUE(analyzer.lighting_acceptable(60.0f));
    EXPECT_FALSE(analyzer.lighting_acceptable(95.0f));
    EXPECT_TRUE(analyzer.size_adequate(40.0f));
    EXPECT_TRUE(analyzer.aspect_valid(1.6f));
    EXPECT_FALSE(analyzer.aspect_valid(1.7f));
}

TEST_F(FaceQualityAnalyzerTest, MissingImageReturnsDefault) {
    FaceQualityMetrics m = analyzer.analyze("/nonexistent/dir/photo.jpg", face_box, 0.8f);

    EXPECT_FALSE(m.analyzed);
    EXPECT_FLOAT_EQ(m.overall_quality, 0.0f);
    EXPECT_EQ(m.quality_label, QualityLabel::Poor);
    EXPECT_FALSE(m.is_good_quality);
    EXPECT_FLOAT_EQ(m.confidence, 0.8f);

    m = analyzer.analyze("", face_box, 0.8f);
    EXPECT_FALSE(m.analyzed);
}

TEST_F(FaceQualityAnalyzerTest, InvalidBoxReturnsDefault) {
    db::BoundingBox empty_box;
    empty_box.width = 0;
    empty_box.height = 50;
    EXPECT_FALSE(analyzer.analyze_image(sharp_image, empty_box, 0.9f).analyzed);

    db::BoundingBox negative_box = face_box;
    negative_box.height = -10;
    EXPECT_FALSE(analyzer.analyze_image(sharp_image, negative_box, 0.9f).analyzed);

    EXPECT_FALSE(analyzer.analyze_image(cv::Mat(), face_box, 0.9f).analyzed);
}

TEST_F(FaceQualityAnalyzerTest, BoxIsClampedToImage) {
    db::BoundingBox overflow = face_box;
    overflow.x = 150;
    overflow.y = 150;
    FaceQualityMetrics m = analyzer.analyze_image(sharp_image, overflow, 0.9f);

    EXPECT_TRUE(m.analyzed);
    EXPECT_FLOAT_EQ(m.aspect_ratio, 1.0f);   // 裁剪后 50x50
}

TEST_F(FaceQualityAnalyzerTest, BoxOutsideImageGivesDefaults) {
    db::BoundingBox outside = face_box;
    outside.x = 500;
    FaceQualityMetrics m = analyzer.analyze_image(sharp_image, outside, 0.9f);
    EXPECT_FALSE(m.analyzed);
    EXPECT_FLOAT_EQ(m.overall_quality, 0.0f);
    EXPECT_EQ(m.quality_label, QualityLabel::Poor);

    // 左上方越界，右下角恰好贴在图像边上
    outside = face_box;
    outside.x = -120;
    outside.y = -120;
    m = analyzer.analyze_image(sharp_image, outside, 0.9f);
    EXPECT_FALSE(m.analyzed);

    // 部分重叠仍然评估重叠区域
    outside.x = -100;
    outside.y = -100;
    m = analyzer.analyze_image(sharp_image, outside, 0.9f);
    EXPECT_TRUE(m.analyzed);
    EXPECT_FLOAT_EQ(m.aspect_ratio, 1.0f);   // 20x20
}

TEST_F(FaceQualityAnalyzerTest, CorruptedImageFileGivesDefaults) {
    const std::string path = ::testing::TempDir() + "face_quality_corrupted.jpg";
    {
        std::ofstream out(path, std::ios::binary);
        ASSERT_TRUE(out.is_open());
        out << "not a jpeg at all\x01\x02\x03";
    }

    FaceQualityMetrics m = analyzer.analyze(path, face_box, 0.8f);
    EXPECT_FALSE(m.analyzed);
    EXPECT_FALSE(m.image_loaded);
    EXPECT_FLOAT_EQ(m.overall_quality, 0.0f);
    EXPECT_EQ(m.quality_label, QualityLabel::Poor);
    EXPECT_FALSE(m.is_good_quality);
    std::remove(path.c_str());
}

TEST_F(FaceQualityAnalyzerTest, LightingWeightsComeFromConfig) {
    FaceQualityConfig config;
    config.lighting_w_brightness = 1.0f;
    config.lighting_w_contrast = 0.0f;
    config.lighting_w_exposure = 0.0f;
    FaceQualityAnalyzer brightness_only(config);

    // 亮度 128 在理想窗口内，对比度为 0 不再拉低分数
    EXPECT_NEAR(brightness_only.lighting_score(mid_flat_image), 100.0f, 0.01f);
    EXPECT_NEAR(analyzer.lighting_score(mid_flat_image), 70.0f, 0.01f);
}

TEST(FaceQualityWeightsTest, WeightsAreNormalized) {
    FaceQualityConfig config;
    config.weights.blur = 1.0f;
    config.weights.lighting = 1.0f;
    config.weights.size = 1.0f;
    config.weights.aspect = 1.0f;
    config.weights.confidence = 1.0f;

    FaceQualityAnalyzer analyzer(config);
    EXPECT_NEAR(analyzer.weights().sum(), 1.0f, 1e-6f);
    EXPECT_NEAR(analyzer.weights().blur, 0.2f, 1e-6f);
}

TEST(FaceQualityWeightsTest, DefaultWeightsSumToOne) {
    FaceQualityAnalyzer analyzer;
    EXPECT_NEAR(analyzer.weights().sum(), 1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(analyzer.weights().blur, 0.30f);
}
