#ifndef OSMNET_READER_NETWORK_TO_ZONING_DATA_H_
#define OSMNET_READER_NETWORK_TO_ZONING_DATA_H_

#include <osmnet/network/network.h>
#include <osmnet/osm/osm_node_table.h>
#include <osmnet/reader/layer_state.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace osmnet::reader
{

/*
 * What the zoning phase needs from a completed network phase. Refers to the
 * state owned by the network reader, which has to outlive it.
 */
class network_to_zoning_data
{
public:
    network_to_zoning_data(std::shared_ptr<network::network> net,
                           const osm::osm_node_table& node_table,
                           geo::box bounding_box,
                           std::map<std::string, layer_state*> layer_states);

    // throws invalid_parameter_exception for a layer that was not parsed
    layer_state& get_layer_state(const std::string& layer) const;
    layer_state& get_layer_state(const network::network_layer& layer) const;

    std::vector<std::string> get_layer_ids() const;

    const osm::osm_node_table& get_osm_node_table() const
    {
        return *node_table_;
    }

    const std::shared_ptr<network::network>& get_populated_network() const
    {
        return network_;
    }

    const geo::box& get_network_bounding_box() const
    {
        return bounding_box_;
    }

private:
    std::shared_ptr<network::network> network_;
    const osm::osm_node_table* node_table_;
    geo::box bounding_box_;
    std::map<std::string, layer_state*> layer_states_;
};

}// namespace osmnet::reader

#endif//OSMNET_READER_NETWORK_TO_ZONING_DATA_H_
