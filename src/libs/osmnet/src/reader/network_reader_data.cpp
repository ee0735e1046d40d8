#include <osmnet/reader/network_reader_data.h>

#include <util/geo/Geo.h>

#include <utility>

namespace osmnet::reader
{

network_reader_data::network_reader_data(std::optional<geo::box> bounding_box_filter) :
    bounding_box_filter_{std::move(bounding_box_filter)}
{
}

void network_reader_data::register_referenced_node(osm::osmid id)
{
    referenced_nodes_.insert(id);
}

bool network_reader_data::is_referenced_node(osm::osmid id) const
{
    return referenced_nodes_.count(id) > 0;
}

void network_reader_data::register_circular_way(const osm::osm_way& way)
{
    circular_ways_[way.id] = way;
}

void network_reader_data::clear_circular_ways()
{
    circular_ways_.clear();
}

void network_reader_data::register_unavailable_way(osm::osmid id)
{
    unavailable_ways_.insert(id);
}

bool network_reader_data::is_unavailable_way(osm::osmid id) const
{
    return unavailable_ways_.count(id) > 0;
}

bool network_reader_data::is_within_bounding_box_filter(const geo::location& loc) const
{
    return !bounding_box_filter_ || util::geo::contains(loc, *bounding_box_filter_);
}

void network_reader_data::update_network_bounding_box(const geo::location& loc)
{
    network_bounding_box_ = util::geo::extendBox(loc, network_bounding_box_);
}

void network_reader_data::reset()
{
    node_table_.clear();
    referenced_nodes_.clear();
    circular_ways_.clear();
    unavailable_ways_.clear();
    network_bounding_box_ = geo::box{};
}

}// namespace osmnet::reader
