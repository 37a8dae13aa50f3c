/**
 * @file face_observation_dao.cc
 * @brief 人脸观测数据访问对象实现
 */

#include "database/face_observation_dao.h"
#include "database/database_manager.h"
#include <iostream>
#include <cstring>

namespace db {

int64_t FaceObservationDao::add_observation(const FaceObservation& observation) {
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO face_observations (collection_id, source_image_path, crop_path, "
                      "bbox_x, bbox_y, bbox_w, bbox_h, confidence, embedding, embedding_dim) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, observation.collection_id);
    sqlite3_bind_text(stmt, 2, observation.source_image_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, observation.crop_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 4, observation.bbox.x);
    sqlite3_bind_double(stmt, 5, observation.bbox.y);
    sqlite3_bind_double(stmt, 6, observation.bbox.width);
    sqlite3_bind_double(stmt, 7, observation.bbox.height);
    sqlite3_bind_double(stmt, 8, observation.confidence);

    // Bind BLOB
    // size in bytes = size() * sizeof(float)
    if (observation.embedding.empty()) {
        sqlite3_bind_null(stmt, 9);
    } else {
        sqlite3_bind_blob(stmt, 9, observation.embedding.data(),
                          observation.embedding.size() * sizeof(float), SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 10, static_cast<int>(observation.embedding.size()));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert observation failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

bool FaceObservationDao::get_observations(int64_t collection_id,
                                          std::vector<FaceObservation>& observations,
                                          int& out_skipped) {
    observations.clear();
    out_skipped = 0;

    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return false;

    const char* sql = "SELECT id, collection_id, source_image_path, crop_path, bbox_x, bbox_y, bbox_w, bbox_h, "
                      "confidence, embedding, embedding_dim FROM face_observations "
                      "WHERE collection_id = ? AND embedding IS NOT NULL ORDER BY id";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, collection_id);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        FaceObservation o;
        o.id = sqlite3_column_int64(stmt, 0);
        o.collection_id = sqlite3_column_int64(stmt, 1);
        const char* source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        if (source) o.source_image_path = source;
        const char* crop = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        if (crop) o.crop_path = crop;
        o.bbox.x = static_cast<float>(sqlite3_column_double(stmt, 4));
        o.bbox.y = static_cast<float>(sqlite3_column_double(stmt, 5));
        o.bbox.width = static_cast<float>(sqlite3_column_double(stmt, 6));
        o.bbox.height = static_cast<float>(sqlite3_column_double(stmt, 7));
        o.confidence = static_cast<float>(sqlite3_column_double(stmt, 8));

        // Read BLOB
        const void* blob_data = sqlite3_column_blob(stmt, 9);
        int blob_size = sqlite3_column_bytes(stmt, 9);
        int stored_dim = sqlite3_column_int(stmt, 10);

        if (!blob_data || blob_size <= 0 || blob_size % sizeof(float) != 0) {
            out_skipped++;
            continue;
        }

        int float_count = blob_size / sizeof(float);
        if (stored_dim > 0 && stored_dim != float_count) {
            out_skipped++;
            continue;
        }

        o.embedding.resize(float_count);
        std::memcpy(o.embedding.data(), blob_data, blob_size);
        observations.push_back(o);
    }

    bool success = (rc == SQLITE_DONE);
    if (!success) {
        std::cerr << "Read observations failed: " << sqlite3_errmsg(db) << std::endl;
        observations.clear();
    }
    sqlite3_finalize(stmt);
    return success;
}

int FaceObservationDao::count_observations(int64_t collection_id) {
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return -1;

    const char* sql = "SELECT COUNT(*) FROM face_observations WHERE collection_id = ?";
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

std::vector<int64_t> FaceObservationDao::list_collections() {
    std::vector<int64_t> ids;
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return ids;

    const char* sql = "SELECT DISTINCT collection_id FROM face_observations ORDER BY collection_id";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return ids;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return ids;
}

bool FaceObservationDao::delete_observations(int64_t collection_id) {
    DatabaseManager& manager = DatabaseManager::instance();
    std::lock_guard<std::recursive_mutex> lock(manager.mutex());
    sqlite3* db = manager.connection();
    if (!db) return false;

    const char* sql = "DELETE FROM face_observations WHERE collection_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int64(stmt, 1, collection_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    sqlite3_finalize(stmt);
    return success;
}

} // namespace db
