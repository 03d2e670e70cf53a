#pragma once

#include <map>
#include <string>
#include <vector>

namespace LoOP {

/**
 * @brief Maps categorical cluster labels (text) to dense integer IDs.
 *
 * IDs are assigned in order of first appearance, starting at 0.
 */
class ClusterIndex {
public:
    /**
     * @brief Gets existing ID or creates a new one for the given label.
     */
    int get_or_create_id(const std::string& label);

    /**
     * @brief Finds the ID for a label.
     * @return ID if found, -1 if not found.
     */
    int find_id(const std::string& label) const;

    /**
     * @brief Gets the label for a given ID, or the ID as text if it was never registered.
     */
    std::string get_name(int cluster_id) const;

    /**
     * @brief Maps a whole label column to IDs.
     */
    std::vector<int> encode(const std::vector<std::string>& labels);

    int size() const { return static_cast<int>(id_to_name_.size()); }
    bool empty() const { return id_to_name_.empty(); }

private:
    std::map<std::string, int> name_to_id_;
    std::vector<std::string> id_to_name_;
};

}  // namespace LoOP
