#ifndef OSMNET_ZONING_CONNECTOID_H_
#define OSMNET_ZONING_CONNECTOID_H_

#include <osmnet/network/node.h>
#include <osmnet/osm/osm.h>

#include <optional>
#include <string>
#include <vector>

namespace osmnet::zoning
{
class transfer_zone;

// Access point of one or more transfer zones on a network layer
class connectoid
{
public:
    connectoid(size_t id, std::string layer, network::node* access_node, std::optional<osm::osmid> stop_position);

    size_t get_id() const
    {
        return id_;
    }

    const std::string& get_layer_id() const
    {
        return layer_;
    }

    network::node* get_access_node() const
    {
        return access_node_;
    }

    const geo::location& get_location() const
    {
        return access_node_->get_position();
    }

    // OSM stop position the connectoid was created for, if any
    const std::optional<osm::osmid>& get_stop_position() const
    {
        return stop_position_;
    }

    const std::vector<transfer_zone*>& get_transfer_zones() const
    {
        return zones_;
    }

    bool has_transfer_zone(const transfer_zone* zone) const;
    void add_transfer_zone(transfer_zone* zone);

private:
    size_t id_;
    std::string layer_;
    network::node* access_node_;
    std::optional<osm::osmid> stop_position_;
    std::vector<transfer_zone*> zones_;
};

}// namespace osmnet::zoning

#endif//OSMNET_ZONING_CONNECTOID_H_
