/**
 * @file label_remapper.h
 * @brief 聚类原始标签 -> 稳定键
 * @details DBSCAN 输出的簇编号依赖遍历顺序，没有语义。持久化和对外报告前统一重映射：
 *          按簇大小降序、同大小按最小成员 id 升序排序后依次分配 face_000, face_001 ...
 *          相同的划分总是得到相同的键。
 */

#ifndef LABEL_REMAPPER_H
#define LABEL_REMAPPER_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "config.h"

namespace service {

class LabelRemapper {
public:
    explicit LabelRemapper(const std::string& prefix = Config::Clustering::KEY_PREFIX);

    /**
     * @param labels 每个观测的原始簇标签 (负数为噪声)
     * @param ids 与 labels 对应的观测 id
     * @return 原始标签 -> 稳定键 (噪声不出现在结果中)；长度不一致时返回空
     */
    std::map<int, std::string> remap(const std::vector<int>& labels,
                                     const std::vector<int64_t>& ids) const;

    std::string make_key(int index) const;

private:
    std::string prefix_;
};

} // namespace service

#endif // LABEL_REMAPPER_H
