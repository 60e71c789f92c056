#include "flightsim/vehicle/part_catalog.hpp"
#include <stdexcept>

namespace flightsim {
namespace vehicle {

namespace {

std::vector<AttachNode> stackNodes(double h) {
    return {AttachNode("top", 0.0, -h / 2.0, NodeKind::STACK),
            AttachNode("bottom", 0.0, h / 2.0, NodeKind::STACK)};
}

std::vector<AttachNode> tankNodes(double w, double h) {
    std::vector<AttachNode> nodes = stackNodes(h);
    nodes.emplace_back("left", -w / 2.0, 0.0, NodeKind::RADIAL);
    nodes.emplace_back("right", w / 2.0, 0.0, NodeKind::RADIAL);
    return nodes;
}

Part define(const std::string& id, const std::string& name, PartType type, double mass,
            double drag_coeff, double height, double width, std::vector<AttachNode> nodes) {
    Part p;
    p.def_id = id;
    p.name = name;
    p.type = type;
    p.mass = mass;
    p.drag_coeff = drag_coeff;
    p.height = height;
    p.width = width;
    p.nodes = std::move(nodes);
    return p;
}

Part defineTank(const std::string& id, const std::string& name, double mass, double fuel,
                double drag_coeff, double height, double width) {
    Part p = define(id, name, PartType::TANK, mass, drag_coeff, height, width, tankNodes(width, height));
    p.fuel_capacity = fuel;
    return p;
}

Part defineEngine(const std::string& id, const std::string& name, double mass, double thrust,
                  double burn_rate, double drag_coeff, double height, double width) {
    Part p = define(id, name, PartType::ENGINE, mass, drag_coeff, height, width, stackNodes(height));
    p.thrust = thrust;
    p.burn_rate = burn_rate;
    return p;
}

} // namespace

PartCatalog::PartCatalog() {
    Part pod = define("cmd-mk1", "Command Pod Mk1", PartType::COMMAND, 800.0, 0.2, 1.5, 1.5,
                      {AttachNode("bottom", 0.0, 0.75, NodeKind::STACK),
                       AttachNode("top", 0.0, -0.75, NodeKind::STACK)});
    defs_.push_back(pod);

    defs_.push_back(define("chute-mk1", "Mk16 Parachute", PartType::PARACHUTE, 100.0, 0.5, 0.4, 0.8,
                           {AttachNode("bottom", 0.0, 0.2, NodeKind::STACK)}));
    defs_.push_back(define("nose-basic", "Aerodynamic Nose Cone", PartType::NOSE, 100.0, 0.1, 1.2, 1.2,
                           {AttachNode("bottom", 0.0, 0.6, NodeKind::STACK)}));

    defs_.push_back(defineTank("tank-s", "FL-T100 Fuel Tank", 60.0, 500.0, 0.2, 1.0, 1.2));
    defs_.push_back(defineTank("tank-m", "FL-T400 Fuel Tank", 250.0, 2000.0, 0.2, 2.0, 1.2));
    defs_.push_back(defineTank("tank-l", "Rockomax Jumbo-64", 1000.0, 8000.0, 0.3, 4.0, 2.5));

    std::vector<AttachNode> girder = stackNodes(1.5);
    girder.emplace_back("mid-l", -0.4, 0.0, NodeKind::RADIAL);
    girder.emplace_back("mid-r", 0.4, 0.0, NodeKind::RADIAL);
    defs_.push_back(define("struct-girder", "Modular Girder", PartType::STRUCTURAL, 120.0, 0.8, 1.5, 0.8, girder));

    defs_.push_back(defineEngine("eng-swivel", "LV-T45 \"Swivel\"", 1500.0, 215000.0, 80.0, 0.2, 1.5, 1.2));
    defs_.push_back(defineEngine("eng-mainsail", "RE-M3 \"Mainsail\"", 6000.0, 1500000.0, 400.0, 0.3, 3.0, 2.5));

    defs_.push_back(define("decoupler-s", "TR-18A Stack Decoupler", PartType::DECOUPLER, 50.0, 0.1, 0.4, 1.2,
                           stackNodes(0.4)));
    defs_.push_back(define("decoupler-r", "TT-38K Radial Decoupler", PartType::DECOUPLER, 75.0, 0.3, 0.8, 0.4,
                           {AttachNode("root", -0.2, 0.0, NodeKind::RADIAL),
                            AttachNode("attach", 0.2, 0.0, NodeKind::RADIAL)}));

    defs_.push_back(define("fin-basic", "AV-R8 Winglet", PartType::FIN, 50.0, 0.4, 1.0, 0.5,
                           {AttachNode("root", -0.25, 0.0, NodeKind::RADIAL)}));
    defs_.push_back(define("leg-lt1", "LT-1 Landing Strut", PartType::LEG, 80.0, 0.3, 1.2, 0.4,
                           {AttachNode("root", -0.2, -0.4, NodeKind::RADIAL)}));
}

const Part& PartCatalog::find(const std::string& def_id) const {
    for (const auto& d : defs_) {
        if (d.def_id == def_id) return d;
    }
    throw std::invalid_argument("Unknown part definition: " + def_id);
}

Part PartCatalog::makePart(const std::string& def_id, const std::string& instance_id,
                           const std::string& parent_id, const std::string& parent_node_id,
                           int radial_offset) const {
    Part p = find(def_id);
    p.instance_id = instance_id;
    p.parent_id = parent_id;
    p.parent_node_id = parent_node_id;
    p.radial_offset = radial_offset;
    p.current_fuel = p.fuel_capacity;
    return p;
}

} // namespace vehicle
} // namespace flightsim
