#include <osmnet/network/link.h>
#include <osmnet/network/node.h>

#include <util/geo/Geo.h>

#include <utility>

namespace osmnet::network
{

link::link(size_t id, node* node_a, node* node_b, geo::line_string geometry, osm::osmid external_id) :
    id_{id},
    node_a_{node_a},
    node_b_{node_b},
    geometry_{std::move(geometry)},
    external_id_{external_id}
{
}

node* link::get_other_node(const node* n) const
{
    if (n == node_a_)
        return node_b_;
    if (n == node_b_)
        return node_a_;
    return nullptr;
}

geo::box link::get_bounding_box() const
{
    return util::geo::getBoundingBox(geometry_);
}

std::optional<geo::coordinate_position> link::find_position(const geo::location& loc) const
{
    return geo::find_coordinate_position(geometry_, loc);
}

bool link::has_internal_location(const geo::location& loc) const
{
    auto position = find_position(loc);
    return position && *position == geo::coordinate_position::internal;
}

}// namespace osmnet::network
