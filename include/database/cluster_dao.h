#ifndef CLUSTER_DAO_H
#define CLUSTER_DAO_H

#include "database/database_types.h"
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace db {

class ClusterDao {
public:
    /**
     * @brief 原子替换项目的全部聚类结果
     * @details 单个事务内：删除旧的簇和成员 -> 写入新簇、成员 -> 追加审计记录。
     *          任一步失败则回滚，旧结果保持不变。
     * @param collection_id 项目ID
     * @param clusters 新的完整聚类集合 (可以为空)
     * @param run 本次运行的审计记录
     * @return 成功返回 true
     */
    bool replace_clusters(int64_t collection_id,
                          const std::vector<ClusterRecord>& clusters,
                          const ClusterRunRecord& run);

    // 查询 (按 cluster_key 排序, 含成员)
    std::vector<ClusterRecord> get_clusters(int64_t collection_id);
    std::optional<ClusterRecord> get_cluster(int64_t collection_id, const std::string& cluster_key);

    std::vector<int64_t> get_members(int64_t collection_id, const std::string& cluster_key);

    // 审计记录
    std::optional<ClusterRunRecord> get_latest_run(int64_t collection_id);
    int count_runs(int64_t collection_id);

    // replace_clusters 失败时的 SQLite 错误信息
    const std::string& last_error() const { return last_error_; }

private:
    bool insert_cluster(sqlite3* db, const ClusterRecord& cluster);
    bool insert_run(sqlite3* db, const ClusterRunRecord& run);

    std::string last_error_;
};

} // namespace db

#endif // CLUSTER_DAO_H
