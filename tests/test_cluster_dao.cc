#include <gtest/gtest.h>
#include "database/cluster_dao.h"
#include "database/database_manager.h"
#include "database/face_observation_dao.h"

class ClusterDaoTest : public ::testing::Test {
protected:
    void SetUp() override {
        db::DatabaseManager::instance().close();
        ASSERT_TRUE(db::DatabaseManager::instance().open(":memory:"));
    }

    void TearDown() override {
        db::DatabaseManager::instance().close();
    }

    db::FaceObservation make_observation(int64_t collection_id, const std::string& source,
                                         std::vector<float> embedding) {
        db::FaceObservation o;
        o.collection_id = collection_id;
        o.source_image_path = source;
        o.crop_path = source + ".crop.jpg";
        o.bbox.x = 10;
        o.bbox.y = 20;
        o.bbox.width = 64;
        o.bbox.height = 72;
        o.confidence = 0.87f;
        o.embedding = std::move(embedding);
        return o;
    }

    db::ClusterRecord make_cluster(int64_t collection_id, const std::string& key,
                                   std::vector<int64_t> members) {
        db::ClusterRecord c;
        c.collection_id = collection_id;
        c.cluster_key = key;
        c.member_ids = std::move(members);
        c.photo_count = static_cast<int>(c.member_ids.size());
        c.centroid = {0.5f, 0.25f};
        c.representative_id = c.member_ids.front();
        c.selection_level = 1;
        c.representative_quality = 82.5f;
        c.silhouette = 0.75f;
        c.compactness = 0.1f;
        c.separation = 0.9f;
        return c;
    }

    db::ClusterRunRecord make_run(int64_t collection_id, int cluster_count) {
        db::ClusterRunRecord r;
        r.collection_id = collection_id;
        r.finished_at = 1700000000;
        r.eps = 0.42f;
        r.min_samples = 3;
        r.param_source = "default";
        r.observations_loaded = 10;
        r.cluster_count = cluster_count;
        r.quality_label = "Good";
        r.suggestions = {"first suggestion", "second suggestion"};
        r.level_counts[0] = cluster_count;
        return r;
    }

    db::FaceObservationDao observations;
    db::ClusterDao clusters;
};

TEST_F(ClusterDaoTest, ObservationRoundTrip) {
    int64_t id = observations.add_observation(make_observation(1, "a.jpg", {0.1f, 0.2f, 0.3f}));
    ASSERT_GT(id, 0);
    observations.add_observation(make_observation(2, "b.jpg", {1.0f, 0.0f, 0.0f}));

    std::vector<db::FaceObservation> rows;
    int skipped = -1;
    ASSERT_TRUE(observations.get_observations(1, rows, skipped));
    EXPECT_EQ(skipped, 0);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, id);
    EXPECT_EQ(rows[0].source_image_path, "a.jpg");
    EXPECT_FLOAT_EQ(rows[0].bbox.height, 72.0f);
    EXPECT_FLOAT_EQ(rows[0].confidence, 0.87f);
    ASSERT_EQ(rows[0].embedding.size(), 3u);
    EXPECT_FLOAT_EQ(rows[0].embedding[2], 0.3f);

    EXPECT_EQ(observations.count_observations(1), 1);
    std::vector<int64_t> expected = {1, 2};
    EXPECT_EQ(observations.list_collections(), expected);

    EXPECT_TRUE(observations.delete_observations(2));
    EXPECT_EQ(observations.count_observations(2), 0);
}

TEST_F(ClusterDaoTest, MalformedEmbeddingsAreSkipped) {
    observations.add_observation(make_observation(3, "ok.jpg", {1.0f, 2.0f}));
    // 3 字节不是 float 的整数倍; 维度字段与数据长度不符
    ASSERT_TRUE(db::DatabaseManager::instance().execute(
        "INSERT INTO face_observations (collection_id, source_image_path, embedding, embedding_dim) "
        "VALUES (3, 'bad.jpg', X'010203', 1)"));
    ASSERT_TRUE(db::DatabaseManager::instance().execute(
        "INSERT INTO face_observations (collection_id, source_image_path, embedding, embedding_dim) "
        "VALUES (3, 'bad2.jpg', X'0000803F', 4)"));

    std::vector<db::FaceObservation> rows;
    int skipped = 0;
    ASSERT_TRUE(observations.get_observations(3, rows, skipped));
    EXPECT_EQ(rows.size(), 1u);
    EXPECT_EQ(skipped, 2);
}

TEST_F(ClusterDaoTest, ReplaceAndReadBack) {
    std::vector<db::ClusterRecord> set = {
        make_cluster(5, "face_001", {7, 3}),
        make_cluster(5, "face_000", {1, 2, 4}),
    };
    ASSERT_TRUE(clusters.replace_clusters(5, set, make_run(5, 2)));

    auto stored = clusters.get_clusters(5);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].cluster_key, "face_000");
    std::vector<int64_t> members = {1, 2, 4};
    EXPECT_EQ(stored[0].member_ids, members);
    EXPECT_EQ(stored[0].photo_count, 3);
    EXPECT_EQ(stored[0].representative_id, 1);
    EXPECT_EQ(stored[0].selection_level, 1);
    EXPECT_FLOAT_EQ(stored[0].representative_quality, 82.5f);
    ASSERT_EQ(stored[0].centroid.size(), 2u);
    EXPECT_FLOAT_EQ(stored[0].centroid[1], 0.25f);

    // 成员按 id 升序返回
    std::vector<int64_t> second = {3, 7};
    EXPECT_EQ(clusters.get_members(5, "face_001"), second);

    auto single = clusters.get_cluster(5, "face_001");
    ASSERT_TRUE(single.has_value());
    EXPECT_FLOAT_EQ(single->silhouette, 0.75f);
    EXPECT_FALSE(clusters.get_cluster(5, "face_009").has_value());
}

TEST_F(ClusterDaoTest, ReplaceRemovesPreviousSet) {
    ASSERT_TRUE(clusters.replace_clusters(5, {make_cluster(5, "face_000", {1, 2}),
                                              make_cluster(5, "face_001", {3, 4})}, make_run(5, 2)));
    ASSERT_TRUE(clusters.replace_clusters(5, {make_cluster(5, "face_000", {1, 2, 3})}, make_run(5, 1)));

    auto stored = clusters.get_clusters(5);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].member_ids.size(), 3u);
    EXPECT_TRUE(clusters.get_members(5, "face_001").empty());
    EXPECT_EQ(clusters.count_runs(5), 2);
}

TEST_F(ClusterDaoTest, EmptySetClearsClusters) {
    ASSERT_TRUE(clusters.replace_clusters(5, {make_cluster(5, "face_000", {1, 2})}, make_run(5, 1)));
    ASSERT_TRUE(clusters.replace_clusters(5, {}, make_run(5, 0)));

    EXPECT_TRUE(clusters.get_clusters(5).empty());
    auto run = clusters.get_latest_run(5);
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->cluster_count, 0);
}

TEST_F(ClusterDaoTest, CollectionsAreIndependent) {
    ASSERT_TRUE(clusters.replace_clusters(5, {make_cluster(5, "face_000", {1})}, make_run(5, 1)));
    ASSERT_TRUE(clusters.replace_clusters(6, {make_cluster(6, "face_000", {2})}, make_run(6, 1)));
    ASSERT_TRUE(clusters.replace_clusters(6, {}, make_run(6, 0)));

    EXPECT_EQ(clusters.get_clusters(5).size(), 1u);
    EXPECT_TRUE(clusters.get_clusters(6).empty());
}

TEST_F(ClusterDaoTest, FailedReplaceKeepsPreviousSet) {
    ASSERT_TRUE(clusters.replace_clusters(5, {make_cluster(5, "face_000", {1, 2})}, make_run(5, 1)));
    ASSERT_TRUE(db::DatabaseManager::instance().execute(
        "CREATE TEMP TRIGGER fail_members BEFORE INSERT ON cluster_members "
        "BEGIN SELECT RAISE(ABORT, 'injected failure'); END;"));

    EXPECT_FALSE(clusters.replace_clusters(5, {make_cluster(5, "face_000", {8, 9})}, make_run(5, 1)));
    EXPECT_FALSE(clusters.last_error().empty());

    auto stored = clusters.get_clusters(5);
    ASSERT_EQ(stored.size(), 1u);
    std::vector<int64_t> members = {1, 2};
    EXPECT_EQ(stored[0].member_ids, members);
    EXPECT_EQ(clusters.count_runs(5), 1);
}

TEST_F(ClusterDaoTest, LatestRunRoundTrip) {
    EXPECT_FALSE(clusters.get_latest_run(5).has_value());
    EXPECT_EQ(clusters.count_runs(5), 0);

    db::ClusterRunRecord run = make_run(5, 2);
    run.param_source = "override";
    run.davies_bouldin = 0.5f;
    ASSERT_TRUE(clusters.replace_clusters(5, {}, make_run(5, 0)));
    ASSERT_TRUE(clusters.replace_clusters(5, {}, run));

    auto latest = clusters.get_latest_run(5);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->param_source, "override");
    EXPECT_EQ(latest->finished_at, 1700000000);
    EXPECT_FLOAT_EQ(latest->davies_bouldin, 0.5f);
    EXPECT_EQ(latest->quality_label, "Good");
    ASSERT_EQ(latest->suggestions.size(), 2u);
    EXPECT_EQ(latest->suggestions[1], "second suggestion");
    EXPECT_EQ(latest->level_counts[0], 2);
}
