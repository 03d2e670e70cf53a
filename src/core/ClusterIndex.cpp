#include "core/ClusterIndex.hpp"

namespace LoOP {

int ClusterIndex::get_or_create_id(const std::string& label) {
    auto it = name_to_id_.find(label);
    if (it != name_to_id_.end()) {
        return it->second;
    }

    int new_id = static_cast<int>(id_to_name_.size());
    name_to_id_[label] = new_id;
    id_to_name_.push_back(label);
    return new_id;
}

int ClusterIndex::find_id(const std::string& label) const {
    auto it = name_to_id_.find(label);
    if (it != name_to_id_.end()) {
        return it->second;
    }
    return -1;
}

std::string ClusterIndex::get_name(int cluster_id) const {
    if (cluster_id >= 0 && cluster_id < static_cast<int>(id_to_name_.size())) {
        return id_to_name_[cluster_id];
    }
    return std::to_string(cluster_id);
}

std::vector<int> ClusterIndex::encode(const std::vector<std::string>& labels) {
    std::vector<int> ids;
    ids.reserve(labels.size());
    for (const auto& label : labels) {
        ids.push_back(get_or_create_id(label));
    }
    return ids;
}

}  // namespace LoOP
