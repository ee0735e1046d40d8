#ifndef OSMNET_ZONING_CONNECTOID_HELPER_H_
#define OSMNET_ZONING_CONNECTOID_HELPER_H_

#include <osmnet/reader/network_to_zoning_data.h>
#include <osmnet/zoning/zoning.h>
#include <osmnet/zoning/zoning_state.h>

#include <optional>
#include <string>
#include <vector>

namespace osmnet::zoning
{

/*
 * Places connectoids on the network. This is the only path through which
 * the zoning phase modifies the populated network: links are broken where an
 * access node is needed and coordinates are injected for stand-alone zones.
 */
class connectoid_helper
{
public:
    connectoid_helper(zoning& z, zoning_state& state, const reader::network_to_zoning_data& network_data);

    // Node at loc on the layer, created by breaking the links loc is internal
    // to when there is none yet. nullptr when loc is not part of the layer.
    network::node* extract_connectoid_access_node(const geo::location& loc, const std::string& layer);

    void break_links_at_node(const std::vector<network::link*>& links, network::node* n, const std::string& layer);

    // connectoid of the zone at loc, nullptr when no access node can be found
    connectoid* create_connectoid(transfer_zone* zone, const std::string& layer, const geo::location& loc,
                                  std::optional<osm::osmid> stop_position = std::nullopt);

    // closest location on the link to the zone, added to the link geometry if needed
    std::optional<geo::location> extract_stand_alone_zone_location(const transfer_zone& zone, network::link* l, const std::string& layer);

private:
    zoning* zoning_;
    zoning_state* state_;
    const reader::network_to_zoning_data* network_data_;
};

}// namespace osmnet::zoning

#endif//OSMNET_ZONING_CONNECTOID_HELPER_H_
