#pragma once

#include "flightsim/types.hpp"
#include <string>
#include <vector>

namespace flightsim {
namespace vehicle {

/**
 * @brief Built-in part definitions
 *
 * Definitions are Part values with empty instance/tree fields; makePart() copies one
 * and fills in the tree edge and a full fuel load.
 */
class PartCatalog {
public:
    /**
     * @brief Constructor, loads the standard parts
     */
    PartCatalog();

    const std::vector<Part>& definitions() const { return defs_; }

    /**
     * @brief Look up a definition
     * @param def_id Definition id, e.g. "tank-s"
     * @return Definition
     * @throws std::invalid_argument for an unknown id
     */
    const Part& find(const std::string& def_id) const;

    /**
     * @brief Instantiate a part
     * @param def_id Definition id
     * @param instance_id Unique id of the new instance
     * @param parent_id Parent instance id, empty for the root
     * @param parent_node_id Node on the parent this part attaches to
     * @param radial_offset -1 to mirror a radial attachment
     * @return Part with fuel at capacity
     */
    Part makePart(const std::string& def_id, const std::string& instance_id,
                  const std::string& parent_id = "", const std::string& parent_node_id = "",
                  int radial_offset = 1) const;

private:
    std::vector<Part> defs_;
};

} // namespace vehicle
} // namespace flightsim
