#ifndef OSMNET_NETWORK_LINK_H_
#define OSMNET_NETWORK_LINK_H_

#include <osmnet/geo/location.h>
#include <osmnet/osm/osm.h>

#include <string>

namespace osmnet::network
{
class node;
class network_layer;

// Edge between two nodes. The external id is the id of the OSM way the link
// was derived from and is shared by all links the way was broken into.
class link
{
public:
    link(size_t id, node* node_a, node* node_b, geo::line_string geometry, osm::osmid external_id);

    size_t get_id() const
    {
        return id_;
    }

    node* get_node_a() const
    {
        return node_a_;
    }

    node* get_node_b() const
    {
        return node_b_;
    }

    node* get_other_node(const node* n) const;

    const geo::line_string& get_geometry() const
    {
        return geometry_;
    }

    osm::osmid get_external_id() const
    {
        return external_id_;
    }

    const std::string& get_name() const
    {
        return name_;
    }

    void set_name(const std::string& name)
    {
        name_ = name;
    }

    const std::string& get_way_type() const
    {
        return way_type_;
    }

    void set_way_type(const std::string& way_type)
    {
        way_type_ = way_type;
    }

    geo::box get_bounding_box() const;

    // position of loc on the geometry, exact coordinate match
    std::optional<geo::coordinate_position> find_position(const geo::location& loc) const;

    bool has_internal_location(const geo::location& loc) const;

private:
    friend class network_layer;

    size_t id_;
    node* node_a_;
    node* node_b_;
    geo::line_string geometry_;
    osm::osmid external_id_;
    std::string name_;
    std::string way_type_;
};

}// namespace osmnet::network

#endif//OSMNET_NETWORK_LINK_H_
