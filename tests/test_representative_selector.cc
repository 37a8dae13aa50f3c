#include <gtest/gtest.h>
#include <memory>
#include "service/label_remapper.h"
#include "service/representative_selector.h"

using service::LabelRemapper;
using service::RepresentativeSelector;
using service::SelectionCandidate;
using service::SelectionContext;
using service::SelectionLevel;

class RepresentativeSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        embeddings = {{1.0f, 0.0f}, {0.0f, 0.0f}, {0.0f, 0.1f}, {3.0f, 0.0f}};
        ctx.metric = DistanceMetric::Euclidean;
        ctx.centroid = {0.0f, 0.0f};
    }

    void add_member(int64_t id, int emb, float quality, float confidence = 0.9f, float side = 40.0f) {
        SelectionCandidate c;
        c.face_id = id;
        c.embedding = &embeddings[emb];
        c.bbox.width = side;
        c.bbox.height = side;
        c.confidence = confidence;
        c.quality.overall_quality = quality;
        ctx.members.push_back(c);
    }

    RepresentativeSelector selector;
    std::vector<std::vector<float>> embeddings;
    SelectionContext ctx;
};

TEST_F(RepresentativeSelectorTest, EmptyClusterHasNoRepresentative) {
    ctx.members.clear();
    EXPECT_FALSE(selector.select(ctx).has_value());
}

TEST_F(RepresentativeSelectorTest, SingleQualifiedCandidateWins) {
    add_member(1, 0, 30.0f);
    add_member(2, 3, 75.0f);
    add_member(3, 1, 50.0f);
    add_member(4, 2, 59.9f);
    add_member(5, 1, 12.0f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 2);
    EXPECT_EQ(rep->level, SelectionLevel::QualityWeighted);
    EXPECT_FLOAT_EQ(rep->quality, 75.0f);
}

TEST_F(RepresentativeSelectorTest, ProximityCanOutweighQuality) {
    add_member(10, 0, 90.0f);     // 距质心 1
    add_member(11, 1, 80.0f);     // 在质心上
    add_member(12, 2, 30.0f);     // 画质不达标

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 11);
    EXPECT_EQ(rep->level, SelectionLevel::QualityWeighted);
    // 0.7 * 0.8 + 0.3 * 1.0
    EXPECT_NEAR(rep->combined_score, 0.86f, 1e-5f);
}

TEST_F(RepresentativeSelectorTest, EqualDistancesFallBackToQuality) {
    embeddings.push_back({-1.0f, 0.0f});
    add_member(20, 0, 70.0f);
    add_member(21, 4, 95.0f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 21);
}

TEST_F(RepresentativeSelectorTest, UnusableCentroidStillRanksByQuality) {
    ctx.centroid.clear();
    add_member(30, 1, 65.0f);
    add_member(31, 0, 85.0f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 31);
    EXPECT_EQ(rep->level, SelectionLevel::QualityWeighted);
}

TEST_F(RepresentativeSelectorTest, BasicThresholdWhenNobodyQualifies) {
    add_member(40, 1, 10.0f, 0.5f);           // 最近但置信度低
    add_member(41, 2, 10.0f, 0.9f, 10.0f);    // 人脸太小
    add_member(42, 0, 10.0f, 0.9f, 30.0f);
    add_member(43, 3, 10.0f, 0.9f, 30.0f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 42);
    EXPECT_EQ(rep->level, SelectionLevel::BasicThreshold);
}

TEST_F(RepresentativeSelectorTest, CentroidOnlyWhenBasicThresholdFails) {
    add_member(50, 0, 0.0f, 0.1f);
    add_member(51, 2, 0.0f, 0.1f);
    add_member(52, 3, 0.0f, 0.1f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 51);
    EXPECT_EQ(rep->level, SelectionLevel::CentroidOnly);
}

TEST_F(RepresentativeSelectorTest, SingletonFallsBackToFirstMember) {
    ctx.centroid = embeddings[3];
    add_member(60, 3, 0.0f, 0.2f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 60);
    EXPECT_EQ(rep->level, SelectionLevel::FirstMember);
}

TEST_F(RepresentativeSelectorTest, SingletonWithGoodDetectionUsesBasicThreshold) {
    ctx.centroid = embeddings[3];
    add_member(61, 3, 0.0f, 0.9f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->level, SelectionLevel::BasicThreshold);
}

TEST_F(RepresentativeSelectorTest, ZeroCentroidUnderCosineSkipsCentroidLevels) {
    embeddings = {{1.0f, 0.0f}, {-1.0f, 0.0f}};
    ctx.metric = DistanceMetric::Cosine;
    ctx.centroid = {0.0f, 0.0f};
    add_member(70, 0, 0.0f, 0.9f);
    add_member(71, 1, 0.0f, 0.9f);

    auto rep = selector.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 70);
    EXPECT_EQ(rep->level, SelectionLevel::FirstMember);
}

TEST_F(RepresentativeSelectorTest, CopyOutlivesOriginal) {
    add_member(80, 0, 90.0f);
    add_member(81, 1, 80.0f);

    service::SelectionConfig strict;
    strict.quality_threshold = 95.0f;
    auto original = std::make_unique<RepresentativeSelector>(strict);
    RepresentativeSelector copy = *original;
    RepresentativeSelector moved = std::move(*original);
    original.reset();

    // 阈值 95 下无人达标，回退到基础门限
    auto rep = copy.select(ctx);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->face_id, 81);
    EXPECT_EQ(rep->level, SelectionLevel::BasicThreshold);

    auto rep_moved = moved.select(ctx);
    ASSERT_TRUE(rep_moved.has_value());
    EXPECT_EQ(rep_moved->level, SelectionLevel::BasicThreshold);

    // 默认配置的选择器重新赋值为严格配置后按新配置工作
    selector = copy;
    EXPECT_EQ(selector.select(ctx)->level, SelectionLevel::BasicThreshold);
}

TEST_F(RepresentativeSelectorTest, LevelNames) {
    EXPECT_STREQ(service::selection_level_name(SelectionLevel::QualityWeighted), "quality_weighted");
    EXPECT_STREQ(service::selection_level_name(SelectionLevel::FirstMember), "first_member");
}

TEST(LabelRemapperTest, LargerClustersGetLowerKeys) {
    LabelRemapper remapper;
    std::vector<int> labels = {1, 1, 0, 0, 0, -1, 2};
    std::vector<int64_t> ids = {10, 11, 12, 13, 14, 15, 5};

    auto keys = remapper.remap(labels, ids);
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "face_000");
    EXPECT_EQ(keys[1], "face_001");
    EXPECT_EQ(keys[2], "face_002");
    EXPECT_EQ(keys.count(-1), 0u);
}

TEST(LabelRemapperTest, TiesBrokenBySmallestMemberId) {
    LabelRemapper remapper;
    auto keys = remapper.remap({0, 0, 1, 1}, {20, 21, 3, 4});
    EXPECT_EQ(keys[1], "face_000");
    EXPECT_EQ(keys[0], "face_001");
}

TEST(LabelRemapperTest, KeysIgnoreRawLabelValues) {
    LabelRemapper remapper;
    // 相同的划分，不同的原始编号
    auto a = remapper.remap({0, 0, 1}, {1, 2, 3});
    auto b = remapper.remap({5, 5, 9}, {1, 2, 3});
    EXPECT_EQ(a[0], b[5]);
    EXPECT_EQ(a[1], b[9]);
}

TEST(LabelRemapperTest, SizeMismatchReturnsEmpty) {
    LabelRemapper remapper;
    EXPECT_TRUE(remapper.remap({0, 1}, {1}).empty());
}

TEST(LabelRemapperTest, KeyFormat) {
    LabelRemapper remapper;
    EXPECT_EQ(remapper.make_key(7), "face_007");
    EXPECT_EQ(remapper.make_key(1234), "face_1234");
    EXPECT_EQ(LabelRemapper("person_").make_key(0), "person_000");
}
