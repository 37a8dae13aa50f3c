/**
 * @file label_remapper.cc
 * @brief 稳定键分配
 */

#include "service/label_remapper.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace service {

namespace {

struct LabelInfo {
    int label = 0;
    int size = 0;
    int64_t min_id = 0;
};

} // namespace

LabelRemapper::LabelRemapper(const std::string& prefix)
    : prefix_(prefix)
{
}

std::map<int, std::string> LabelRemapper::remap(const std::vector<int>& labels,
                                                const std::vector<int64_t>& ids) const {
    std::map<int, std::string> result;
    if (labels.size() != ids.size()) return result;

    std::map<int, LabelInfo> infos;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] < 0) continue;
        auto it = infos.find(labels[i]);
        if (it == infos.end()) {
            LabelInfo info;
            info.label = labels[i];
            info.size = 1;
            info.min_id = ids[i];
            infos[labels[i]] = info;
        } else {
            it->second.size++;
            it->second.min_id = std::min(it->second.min_id, ids[i]);
        }
    }

    std::vector<LabelInfo> ordered;
    ordered.reserve(infos.size());
    for (const auto& kv : infos) {
        ordered.push_back(kv.second);
    }
    std::sort(ordered.begin(), ordered.end(), [](const LabelInfo& a, const LabelInfo& b) {
        if (a.size != b.size) return a.size > b.size;
        return a.min_id < b.min_id;
    });

    for (size_t i = 0; i < ordered.size(); ++i) {
        result[ordered[i].label] = make_key(static_cast<int>(i));
    }
    return result;
}

std::string LabelRemapper::make_key(int index) const {
    std::ostringstream oss;
    oss << prefix_ << std::setw(3) << std::setfill('0') << index;
    return oss.str();
}

} // namespace service
