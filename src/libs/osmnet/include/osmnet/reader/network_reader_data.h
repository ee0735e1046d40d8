#ifndef OSMNET_READER_NETWORK_READER_DATA_H_
#define OSMNET_READER_NETWORK_READER_DATA_H_

#include <osmnet/geo/location.h>
#include <osmnet/osm/osm.h>
#include <osmnet/osm/osm_node_table.h>

#include <map>
#include <optional>
#include <unordered_set>

namespace osmnet::reader
{

// OSM side data gathered by the network reader and shared by its layer parsers
class network_reader_data
{
public:
    explicit network_reader_data(std::optional<geo::box> bounding_box_filter = std::nullopt);

    osm::osm_node_table& get_osm_node_table()
    {
        return node_table_;
    }

    const osm::osm_node_table& get_osm_node_table() const
    {
        return node_table_;
    }

    // nodes referenced by eligible ways, only these are kept in the node table
    void register_referenced_node(osm::osmid id);
    bool is_referenced_node(osm::osmid id) const;

    size_t get_number_of_referenced_nodes() const
    {
        return referenced_nodes_.size();
    }

    // circular ways are processed after all other ways, ordered by id
    void register_circular_way(const osm::osm_way& way);

    const std::map<osm::osmid, osm::osm_way>& get_circular_ways() const
    {
        return circular_ways_;
    }

    void clear_circular_ways();

    void register_unavailable_way(osm::osmid id);
    bool is_unavailable_way(osm::osmid id) const;

    size_t get_number_of_unavailable_ways() const
    {
        return unavailable_ways_.size();
    }

    const std::optional<geo::box>& get_bounding_box_filter() const
    {
        return bounding_box_filter_;
    }

    // true when no filter is set
    bool is_within_bounding_box_filter(const geo::location& loc) const;

    void update_network_bounding_box(const geo::location& loc);

    const geo::box& get_network_bounding_box() const
    {
        return network_bounding_box_;
    }

    void reset();

private:
    std::optional<geo::box> bounding_box_filter_;
    osm::osm_node_table node_table_;
    std::unordered_set<osm::osmid> referenced_nodes_;
    std::map<osm::osmid, osm::osm_way> circular_ways_;
    std::unordered_set<osm::osmid> unavailable_ways_;
    geo::box network_bounding_box_;
};

}// namespace osmnet::reader

#endif//OSMNET_READER_NETWORK_READER_DATA_H_
