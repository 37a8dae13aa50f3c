/**
 * @file database_manager.cc
 * @brief 数据库连接管理实现
 * @details 负责 SQLite 数据库的打开、关闭、事务处理以及人脸观测/聚类表结构的自动创建。
 */

#include "database/database_manager.h"
#include <iostream>

namespace db {

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager instance;
    return instance;
}

DatabaseManager::DatabaseManager() {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        return true; // 已经打开
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc) {
        std::cerr << "Can't open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // 开启外键约束支持
    execute("PRAGMA foreign_keys = ON;");

    // 创建表结构
    if (!create_tables()) {
        close();
        return false;
    }

    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) return false;

    char* zErrMsg = 0;
    int rc = sqlite3_exec(db_, sql.c_str(), 0, 0, &zErrMsg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (zErrMsg ? zErrMsg : "unknown") << "\nSQL: " << sql << std::endl;
        sqlite3_free(zErrMsg);
        return false;
    }
    return true;
}

bool DatabaseManager::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

bool DatabaseManager::commit_transaction() {
    return execute("COMMIT;");
}

bool DatabaseManager::rollback_transaction() {
    return execute("ROLLBACK;");
}

std::string DatabaseManager::last_error() const {
    if (!db_) return "database not open";
    return sqlite3_errmsg(db_);
}

bool DatabaseManager::create_tables() {
    const char* sql_observations =
        "CREATE TABLE IF NOT EXISTS face_observations ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "collection_id INTEGER NOT NULL,"
        "source_image_path TEXT NOT NULL,"
        "crop_path TEXT,"
        "bbox_x REAL,"
        "bbox_y REAL,"
        "bbox_w REAL,"
        "bbox_h REAL,"
        "confidence REAL,"
        "embedding BLOB,"
        "embedding_dim INTEGER DEFAULT 0"
        ");";

    const char* sql_clusters =
        "CREATE TABLE IF NOT EXISTS face_clusters ("
        "collection_id INTEGER NOT NULL,"
        "cluster_key TEXT NOT NULL,"
        "member_count INTEGER DEFAULT 0,"
        "photo_count INTEGER DEFAULT 0,"
        "centroid BLOB,"
        "representative_id INTEGER,"
        "selection_level INTEGER,"
        "representative_quality REAL,"
        "silhouette REAL,"
        "compactness REAL,"
        "separation REAL,"
        "PRIMARY KEY (collection_id, cluster_key)"
        ");";

    const char* sql_members =
        "CREATE TABLE IF NOT EXISTS cluster_members ("
        "collection_id INTEGER NOT NULL,"
        "cluster_key TEXT NOT NULL,"
        "face_id INTEGER NOT NULL,"
        "PRIMARY KEY (collection_id, face_id),"
        "FOREIGN KEY (collection_id, cluster_key) REFERENCES face_clusters(collection_id, cluster_key) ON DELETE CASCADE"
        ");";

    const char* sql_runs =
        "CREATE TABLE IF NOT EXISTS cluster_runs ("
        "run_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "collection_id INTEGER NOT NULL,"
        "finished_at INTEGER,"
        "eps REAL,"
        "min_samples INTEGER,"
        "param_source TEXT,"
        "observations_loaded INTEGER,"
        "observations_skipped INTEGER,"
        "cluster_count INTEGER,"
        "noise_count INTEGER,"
        "noise_ratio REAL,"
        "silhouette REAL,"
        "davies_bouldin REAL,"
        "compactness REAL,"
        "separation REAL,"
        "overall_quality REAL,"
        "quality_label TEXT,"
        "suggestions TEXT,"
        "level1_count INTEGER,"
        "level2_count INTEGER,"
        "level3_count INTEGER,"
        "level4_count INTEGER"
        ");";

    // 索引
    const char* sql_idx_obs = "CREATE INDEX IF NOT EXISTS idx_observations_collection ON face_observations(collection_id);";
    const char* sql_idx_members = "CREATE INDEX IF NOT EXISTS idx_members_cluster ON cluster_members(collection_id, cluster_key);";
    const char* sql_idx_runs = "CREATE INDEX IF NOT EXISTS idx_runs_collection ON cluster_runs(collection_id);";

    return execute(sql_observations) &&
           execute(sql_clusters) &&
           execute(sql_members) &&
           execute(sql_runs) &&
           execute(sql_idx_obs) &&
           execute(sql_idx_members) &&
           execute(sql_idx_runs);
}

} // namespace db
