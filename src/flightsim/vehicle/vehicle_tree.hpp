#pragma once

#include "flightsim/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace flightsim {
namespace vehicle {

// Adjacency view over a flat part list. Indices refer to positions in the list the
// tree was built from; the list may change fuel/flags but must not be restructured
// while the tree is in use.
class VehicleTree {
public:
    static constexpr int kNoParent = -1;

    // O(n). Does not validate; call validate() for launch-time checks.
    explicit VehicleTree(const std::vector<Part>& parts);

    size_t size() const { return parents_.size(); }

    // Index of the first root found, kNoParent if there is none
    int root() const { return root_; }

    int parentOf(size_t index) const { return parents_[index]; }
    const std::vector<size_t>& childrenOf(size_t index) const { return children_[index]; }

    // kNoParent when the id is unknown
    int indexOf(const std::string& instance_id) const;

    // All descendants of index, inclusive, in breadth-first order. Iterative.
    std::vector<size_t> collectSubtree(size_t index) const;

    // Throws std::invalid_argument when the list is not a single rooted tree
    void validate(const std::vector<Part>& parts) const;

private:
    std::unordered_map<std::string, size_t> index_by_id_;
    std::vector<int> parents_;
    std::vector<std::vector<size_t>> children_;
    int root_;
    size_t root_count_;
    std::vector<std::string> dangling_;
    std::vector<std::string> duplicates_;
};

bool isDecoupler(const Part& part);

// Only stack decouplers separate vertical stages; radial ones release boosters.
bool isStackDecoupler(const Part& part);

/**
 * @brief Place every part relative to the root using attachment node offsets
 * @param parts Part list
 * @param tree Adjacency built from parts
 * @return Part centers [m], +y is down the stack. Unreachable parts, and parts whose
 *         parent lacks the named node (with their subtrees), stay at the origin.
 */
std::vector<Vec2> computeLayout(const std::vector<Part>& parts, const VehicleTree& tree);

} // namespace vehicle
} // namespace flightsim
