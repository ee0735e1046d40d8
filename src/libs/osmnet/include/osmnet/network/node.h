#ifndef OSMNET_NETWORK_NODE_H_
#define OSMNET_NETWORK_NODE_H_

#include <osmnet/geo/location.h>
#include <osmnet/osm/osm.h>

#include <optional>
#include <vector>

namespace osmnet::network
{
class link;
class network_layer;

class node
{
public:
    node(size_t id, const geo::location& position, std::optional<osm::osmid> external_id);

    size_t get_id() const
    {
        return id_;
    }

    const geo::location& get_position() const
    {
        return position_;
    }

    const std::optional<osm::osmid>& get_external_id() const
    {
        return external_id_;
    }

    const std::vector<link*>& get_links() const
    {
        return links_;
    }

    size_t get_degree() const
    {
        return links_.size();
    }

private:
    friend class network_layer;

    void add_link(link* l);
    void remove_link(const link* l);

    size_t id_;
    geo::location position_;
    std::optional<osm::osmid> external_id_;
    std::vector<link*> links_;
};

}// namespace osmnet::network

#endif//OSMNET_NETWORK_NODE_H_
