#include <osmnet/reader/network_to_zoning_data.h>

#include <exceptions/exceptions.h>

#include <utility>

namespace osmnet::reader
{

network_to_zoning_data::network_to_zoning_data(std::shared_ptr<network::network> net,
                                               const osm::osm_node_table& node_table,
                                               geo::box bounding_box,
                                               std::map<std::string, layer_state*> layer_states) :
    network_{std::move(net)},
    node_table_{&node_table},
    bounding_box_{bounding_box},
    layer_states_{std::move(layer_states)}
{
    if (!network_)
        throw make_exception_macro(null_pointer_exception, "network to zoning data requires a populated network");
}

layer_state& network_to_zoning_data::get_layer_state(const std::string& layer) const
{
    auto it = layer_states_.find(layer);
    if (it == layer_states_.end() || it->second == nullptr)
        throw make_exception_macro(invalid_parameter_exception, "no reader state for layer " + layer);
    return *it->second;
}

layer_state& network_to_zoning_data::get_layer_state(const network::network_layer& layer) const
{
    return get_layer_state(layer.get_id());
}

std::vector<std::string> network_to_zoning_data::get_layer_ids() const
{
    std::vector<std::string> ids;
    for (const auto& [id, state] : layer_states_)
        ids.push_back(id);
    return ids;
}

}// namespace osmnet::reader
