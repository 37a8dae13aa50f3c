/**
 * @file cluster_dao.cc
 * @brief 聚类结果与运行审计数据访问对象实现
 * @details 聚类集合只通过 replace_clusters() 整体替换，不做增量修改。
 */

#include "database/cluster_dao.h"
#include "database/database_manager.h"
#include <iostream>
#include <cstring>
#include <sstream>

namespace db {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<float> read_float_blob(sqlite3_stmt* stmt, int col) {
    std::vector<float> out;
    const void* blob_data = sqlite3_column_blob(stmt, col);
    int blob_size = sqlite3_column_bytes(stmt, col);
    if (blob_data && blob_size > 0) {
        out.resize(blob_size / sizeof(float));
        std::memcpy(out.data(), blob_data, out.size() * sizeof(float));
    }
    return out;
}

} // namespace

bool ClusterDao::replace_clusters(int64_t collection_id,
                                  const std::vector<ClusterRecord>& clusters,
                                  const ClusterRunRecord& run) {
    DatabaseManager& manager = DatabaseManager::instance();
    // 整个事务期间持有连接锁
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return false;

    last_error_.clear();
    if (!manager.begin_transaction()) {
        last_error_ = manager.last_error();
        return false;
    }

    bool ok = true;

    const char* del_members = "DELETE FROM cluster_members WHERE collection_id = ?";
    const char* del_clusters = "DELETE FROM face_clusters WHERE collection_id = ?";
    for (const char* sql : {del_members, del_clusters}) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
            ok = false;
            break;
        }
        sqlite3_bind_int64(stmt, 1, collection_id);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "Delete previous clusters failed: " << sqlite3_errmsg(db) << std::endl;
            ok = false;
        }
        sqlite3_finalize(stmt);
        if (!ok) break;
    }

    for (size_t i = 0; ok && i < clusters.size(); ++i) {
        ok = insert_cluster(db, clusters[i]);
    }

    if (ok) {
        ok = insert_run(db, run);
    }

    if (!ok) {
        last_error_ = sqlite3_errmsg(db);
        std::cerr << "replace_clusters: rolling back collection " << collection_id << std::endl;
        manager.rollback_transaction();
        return false;
    }

    if (!manager.commit_transaction()) {
        last_error_ = manager.last_error();
        manager.rollback_transaction();
        return false;
    }
    return true;
}

bool ClusterDao::insert_cluster(sqlite3* db, const ClusterRecord& cluster) {
    const char* sql = "INSERT INTO face_clusters (collection_id, cluster_key, member_count, photo_count, centroid, "
                      "representative_id, selection_level, representative_quality, silhouette, compactness, separation) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, cluster.collection_id);
    sqlite3_bind_text(stmt, 2, cluster.cluster_key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, static_cast<int>(cluster.member_ids.size()));
    sqlite3_bind_int(stmt, 4, cluster.photo_count);
    sqlite3_bind_blob(stmt, 5, cluster.centroid.data(),
                      cluster.centroid.size() * sizeof(float), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 6, cluster.representative_id);
    sqlite3_bind_int(stmt, 7, cluster.selection_level);
    sqlite3_bind_double(stmt, 8, cluster.representative_quality);
    sqlite3_bind_double(stmt, 9, cluster.silhouette);
    sqlite3_bind_double(stmt, 10, cluster.compactness);
    sqlite3_bind_double(stmt, 11, cluster.separation);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Insert cluster " << cluster.cluster_key << " failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    if (!success) return false;

    const char* member_sql = "INSERT INTO cluster_members (collection_id, cluster_key, face_id) VALUES (?, ?, ?)";
    if (sqlite3_prepare_v2(db, member_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    for (int64_t face_id : cluster.member_ids) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, cluster.collection_id);
        sqlite3_bind_text(stmt, 2, cluster.cluster_key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, face_id);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "Insert member " << face_id << " failed: " << sqlite3_errmsg(db) << std::endl;
            success = false;
            break;
        }
    }

    sqlite3_finalize(stmt);
    return success;
}

bool ClusterDao::insert_run(sqlite3* db, const ClusterRunRecord& run) {
    const char* sql = "INSERT INTO cluster_runs (collection_id, finished_at, eps, min_samples, param_source, "
                      "observations_loaded, observations_skipped, cluster_count, noise_count, noise_ratio, "
                      "silhouette, davies_bouldin, compactness, separation, overall_quality, quality_label, "
                      "suggestions, level1_count, level2_count, level3_count, level4_count) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    std::string suggestions = join_lines(run.suggestions);

    sqlite3_bind_int64(stmt, 1, run.collection_id);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(run.finished_at));
    sqlite3_bind_double(stmt, 3, run.eps);
    sqlite3_bind_int(stmt, 4, run.min_samples);
    sqlite3_bind_text(stmt, 5, run.param_source.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 6, run.observations_loaded);
    sqlite3_bind_int(stmt, 7, run.observations_skipped);
    sqlite3_bind_int(stmt, 8, run.cluster_count);
    sqlite3_bind_int(stmt, 9, run.noise_count);
    sqlite3_bind_double(stmt, 10, run.noise_ratio);
    sqlite3_bind_double(stmt, 11, run.silhouette);
    sqlite3_bind_double(stmt, 12, run.davies_bouldin);
    sqlite3_bind_double(stmt, 13, run.compactness);
    sqlite3_bind_double(stmt, 14, run.separation);
    sqlite3_bind_double(stmt, 15, run.overall_quality);
    sqlite3_bind_text(stmt, 16, run.quality_label.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 17, suggestions.c_str(), -1, SQLITE_STATIC);
    for (int level = 0; level < 4; ++level) {
        sqlite3_bind_int(stmt, 18 + level, run.level_counts[level]);
    }

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Insert run record failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

std::vector<ClusterRecord> ClusterDao::get_clusters(int64_t collection_id) {
    std::vector<ClusterRecord> clusters;
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return clusters;

    const char* sql = "SELECT collection_id, cluster_key, photo_count, centroid, representative_id, selection_level, "
                      "representative_quality, silhouette, compactness, separation "
                      "FROM face_clusters WHERE collection_id = ? ORDER BY cluster_key";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return clusters;

    sqlite3_bind_int64(stmt, 1, collection_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ClusterRecord c;
        c.collection_id = sqlite3_column_int64(stmt, 0);
        const char* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (key) c.cluster_key = key;
        c.photo_count = sqlite3_column_int(stmt, 2);
        c.centroid = read_float_blob(stmt, 3);
        c.representative_id = sqlite3_column_int64(stmt, 4);
        c.selection_level = sqlite3_column_int(stmt, 5);
        c.representative_quality = static_cast<float>(sqlite3_column_double(stmt, 6));
        c.silhouette = static_cast<float>(sqlite3_column_double(stmt, 7));
        c.compactness = static_cast<float>(sqlite3_column_double(stmt, 8));
        c.separation = static_cast<float>(sqlite3_column_double(stmt, 9));
        clusters.push_back(c);
    }

    sqlite3_finalize(stmt);

    for (auto& c : clusters) {
        c.member_ids = get_members(collection_id, c.cluster_key);
    }
    return clusters;
}

std::optional<ClusterRecord> ClusterDao::get_cluster(int64_t collection_id, const std::string& cluster_key) {
    for (auto& c : get_clusters(collection_id)) {
        if (c.cluster_key == cluster_key) {
            return c;
        }
    }
    return std::nullopt;
}

std::vector<int64_t> ClusterDao::get_members(int64_t collection_id, const std::string& cluster_key) {
    std::vector<int64_t> members;
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return members;

    const char* sql = "SELECT face_id FROM cluster_members WHERE collection_id = ? AND cluster_key = ? ORDER BY face_id";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return members;

    sqlite3_bind_int64(stmt, 1, collection_id);
    sqlite3_bind_text(stmt, 2, cluster_key.c_str(), -1, SQLITE_STATIC);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        members.push_back(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return members;
}

std::optional<ClusterRunRecord> ClusterDao::get_latest_run(int64_t collection_id) {
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return std::nullopt;

    const char* sql = "SELECT run_id, collection_id, finished_at, eps, min_samples, param_source, "
                      "observations_loaded, observations_skipped, cluster_count, noise_count, noise_ratio, "
                      "silhouette, davies_bouldin, compactness, separation, overall_quality, quality_label, "
                      "suggestions, level1_count, level2_count, level3_count, level4_count "
                      "FROM cluster_runs WHERE collection_id = ? ORDER BY run_id DESC LIMIT 1";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, collection_id);

    std::optional<ClusterRunRecord> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ClusterRunRecord r;
        r.run_id = sqlite3_column_int64(stmt, 0);
        r.collection_id = sqlite3_column_int64(stmt, 1);
        r.finished_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 2));
        r.eps = static_cast<float>(sqlite3_column_double(stmt, 3));
        r.min_samples = sqlite3_column_int(stmt, 4);
        const char* source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
        if (source) r.param_source = source;
        r.observations_loaded = sqlite3_column_int(stmt, 6);
        r.observations_skipped = sqlite3_column_int(stmt, 7);
        r.cluster_count = sqlite3_column_int(stmt, 8);
        r.noise_count = sqlite3_column_int(stmt, 9);
        r.noise_ratio = static_cast<float>(sqlite3_column_double(stmt, 10));
        r.silhouette = static_cast<float>(sqlite3_column_double(stmt, 11));
        r.davies_bouldin = static_cast<float>(sqlite3_column_double(stmt, 12));
        r.compactness = static_cast<float>(sqlite3_column_double(stmt, 13));
        r.separation = static_cast<float>(sqlite3_column_double(stmt, 14));
        r.overall_quality = static_cast<float>(sqlite3_column_double(stmt, 15));
        const char* label = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 16));
        if (label) r.quality_label = label;
        const char* suggestions = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 17));
        if (suggestions) r.suggestions = split_lines(suggestions);
        for (int level = 0; level < 4; ++level) {
            r.level_counts[level] = sqlite3_column_int(stmt, 18 + level);
        }
        result = r;
    }

    sqlite3_finalize(stmt);
    return result;
}

int ClusterDao::count_runs(int64_t collection_id) {
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return -1;

    const char* sql = "SELECT COUNT(*) FROM cluster_runs WHERE collection_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return -1;

    sqlite3_bind_int64(stmt, 1, collection_id);

    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

} // namespace db
