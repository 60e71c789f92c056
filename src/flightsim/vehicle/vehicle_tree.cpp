#include "flightsim/vehicle/vehicle_tree.hpp"
#include <algorithm>
#include <deque>
#include <sstream>
#include <stdexcept>

namespace flightsim {
namespace vehicle {

VehicleTree::VehicleTree(const std::vector<Part>& parts)
    : parents_(parts.size(), kNoParent), children_(parts.size()), root_(kNoParent), root_count_(0) {
    index_by_id_.reserve(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!index_by_id_.emplace(parts[i].instance_id, i).second) {
            duplicates_.push_back(parts[i].instance_id);
        }
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        const Part& p = parts[i];
        if (p.isRoot()) {
            if (root_ == kNoParent) root_ = static_cast<int>(i);
            ++root_count_;
            continue;
        }
        auto it = index_by_id_.find(p.parent_id);
        if (it == index_by_id_.end()) {
            dangling_.push_back(p.instance_id);
            continue;
        }
        parents_[i] = static_cast<int>(it->second);
        children_[it->second].push_back(i);
    }
}

int VehicleTree::indexOf(const std::string& instance_id) const {
    auto it = index_by_id_.find(instance_id);
    return it == index_by_id_.end() ? kNoParent : static_cast<int>(it->second);
}

std::vector<size_t> VehicleTree::collectSubtree(size_t index) const {
    std::vector<size_t> out;
    std::vector<bool> seen(size(), false);
    std::deque<size_t> queue{index};
    seen[index] = true;
    while (!queue.empty()) {
        size_t cur = queue.front();
        queue.pop_front();
        out.push_back(cur);
        for (size_t child : children_[cur]) {
            if (!seen[child]) {
                seen[child] = true;
                queue.push_back(child);
            }
        }
    }
    return out;
}

void VehicleTree::validate(const std::vector<Part>& parts) const {
    if (parts.size() != size()) {
        throw std::invalid_argument("Vehicle tree was built from a different part list");
    }
    if (parts.empty()) {
        throw std::invalid_argument("Vehicle has no parts");
    }
    if (!duplicates_.empty()) {
        throw std::invalid_argument("Duplicate part instance id: " + duplicates_.front());
    }
    if (root_count_ == 0) {
        throw std::invalid_argument("Vehicle has no root part");
    }
    if (root_count_ > 1) {
        std::ostringstream msg;
        msg << "Vehicle has " << root_count_ << " root parts";
        throw std::invalid_argument(msg.str());
    }
    if (!dangling_.empty()) {
        throw std::invalid_argument("Part " + dangling_.front() + " references a missing parent");
    }

    // Every node has one parent and there is one root, so reaching all nodes from the
    // root rules out cycles.
    std::vector<size_t> reachable = collectSubtree(static_cast<size_t>(root_));
    if (reachable.size() != parts.size()) {
        std::vector<bool> hit(parts.size(), false);
        for (size_t i : reachable) hit[i] = true;
        auto missing = std::find(hit.begin(), hit.end(), false);
        size_t idx = static_cast<size_t>(std::distance(hit.begin(), missing));
        throw std::invalid_argument("Part " + parts[idx].instance_id + " is part of a cycle");
    }

    for (const auto& p : parts) {
        if (p.hasFuel() && (p.current_fuel < 0.0 || p.current_fuel > p.fuel_capacity)) {
            throw std::invalid_argument("Part " + p.instance_id + " fuel is outside its capacity");
        }
    }
}

bool isDecoupler(const Part& part) {
    return part.type == PartType::DECOUPLER;
}

bool isStackDecoupler(const Part& part) {
    if (!isDecoupler(part)) return false;
    return std::any_of(part.nodes.begin(), part.nodes.end(),
                       [](const AttachNode& n) { return n.kind == NodeKind::STACK; });
}

namespace {

const AttachNode* findNode(const Part& part, const std::string& id) {
    for (const auto& n : part.nodes) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

// Node on the child that mates with the given parent node
const AttachNode* matingNode(const Part& child, const std::string& parent_node_id) {
    std::string wanted = "top";
    if (parent_node_id == "top") {
        wanted = "bottom";
    } else if (parent_node_id == "left" || parent_node_id == "right" || parent_node_id == "attach") {
        wanted = isDecoupler(child) ? "root" : "left";
    }
    const AttachNode* node = findNode(child, wanted);
    if (!node && !child.nodes.empty()) {
        node = &child.nodes.front();
    }
    return node;
}

double effectiveX(const Part& part, double x) {
    return part.radial_offset == -1 ? -x : x;
}

} // namespace

std::vector<Vec2> computeLayout(const std::vector<Part>& parts, const VehicleTree& tree) {
    std::vector<Vec2> layout(parts.size(), Vec2::Zero());
    if (tree.root() == VehicleTree::kNoParent) {
        return layout;
    }

    std::deque<size_t> queue{static_cast<size_t>(tree.root())};
    std::vector<bool> placed(parts.size(), false);
    placed[static_cast<size_t>(tree.root())] = true;
    while (!queue.empty()) {
        size_t cur = queue.front();
        queue.pop_front();
        const Part& parent = parts[cur];
        for (size_t c : tree.childrenOf(cur)) {
            if (placed[c]) continue;
            const Part& child = parts[c];
            const AttachNode* pnode = findNode(parent, child.parent_node_id);
            // Attached to a node the parent does not have: subtree stays unplaced
            if (!pnode) continue;
            placed[c] = true;
            queue.push_back(c);

            const AttachNode* cnode = matingNode(child, child.parent_node_id);
            Vec2 parent_anchor(effectiveX(parent, pnode->offset.x()), pnode->offset.y());
            Vec2 child_anchor = Vec2::Zero();
            if (cnode) {
                child_anchor = Vec2(effectiveX(child, cnode->offset.x()), cnode->offset.y());
            }
            layout[c] = layout[cur] + parent_anchor - child_anchor;
        }
    }
    return layout;
}

} // namespace vehicle
} // namespace flightsim
