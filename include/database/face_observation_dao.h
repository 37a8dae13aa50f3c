#ifndef FACE_OBSERVATION_DAO_H
#define FACE_OBSERVATION_DAO_H

#include "database/database_types.h"
#include <vector>

namespace db {

class FaceObservationDao {
public:
    // 添加人脸观测，返回生成的 id，失败返回 -1 (检测模块 / 导入工具使用)
    int64_t add_observation(const FaceObservation& observation);

    /**
     * @brief 读取项目内所有带特征向量的人脸观测 (按 id 升序)
     * @param collection_id 项目ID
     * @param observations 输出: 有效的观测
     * @param out_skipped 输出: 特征数据损坏而被跳过的条数
     *        (空 BLOB、字节数不是 float 的整数倍、维度字段与数据长度不符)
     * @return 查询失败返回 false
     */
    bool get_observations(int64_t collection_id,
                          std::vector<FaceObservation>& observations,
                          int& out_skipped);

    int count_observations(int64_t collection_id);

    // 所有出现过的项目ID (升序)
    std::vector<int64_t> list_collections();

    bool delete_observations(int64_t collection_id);
};

} // namespace db

#endif // FACE_OBSERVATION_DAO_H
