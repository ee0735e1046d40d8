#ifndef OSMNET_ZONING_ZONING_READER_H_
#define OSMNET_ZONING_ZONING_READER_H_

#include <osmnet/config/settings.h>
#include <osmnet/osm/osm.h>
#include <osmnet/osm/osm_node_table.h>
#include <osmnet/osm/tag_classifier.h>
#include <osmnet/reader/network_to_zoning_data.h>
#include <osmnet/zoning/connectoid_helper.h>
#include <osmnet/zoning/zoning.h>
#include <osmnet/zoning/zoning_state.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace osmnet::zoning
{

/*
 * Populates a zoning on top of a completed network. Transfer zones and stop
 * positions are collected from the OSM entity stream, complete() then places
 * connectoids: stop positions first, matched to the zones of their stop area
 * or the closest zone within the search radius, then the remaining zones on
 * the closest link within the link search radius.
 */
class zoning_reader
{
public:
    struct statistics
    {
        size_t transfer_zones{0};
        size_t salvaged_zones{0};
        size_t discarded_zones{0};
        size_t stop_positions{0};
        size_t stop_areas{0};
        size_t stop_based_connectoids{0};
        size_t pole_zones_created{0};
        size_t stand_alone_connections{0};
        size_t nodes_outside_bounding_box{0};
    };

    zoning_reader(const config::settings& settings, const osm::tag_classifier& classifier,
                  reader::network_to_zoning_data network_data, std::shared_ptr<zoning> z);

    zoning_reader(const zoning_reader&) = delete;
    zoning_reader& operator=(const zoning_reader&) = delete;

    // reads the file in four passes and completes the zoning
    void read(const std::string& path);

    void preprocess_way(const osm::osm_way& way);
    void handle_node(const osm::osm_node& node);
    void handle_way(const osm::osm_way& way);
    void handle_relation(const osm::osm_relation& relation);

    void complete();

    bool is_completed() const
    {
        return completed_;
    }

    const std::shared_ptr<zoning>& get_zoning() const
    {
        return zoning_;
    }

    zoning_state& get_zoning_state()
    {
        return state_;
    }

    const statistics& get_statistics() const
    {
        return stats_;
    }

    void reset();

private:
    transfer_zone* register_transfer_zone(const osm::osm_element& element, osm::entity_type type, geo::line_string geometry);

    // network layers the tagged entity serves
    std::vector<std::string> active_layers(const std::vector<std::string>& layers) const;

    bool connect_stop_position(const osm::osm_node& stop, const std::string& layer);
    transfer_zone* find_closest_zone(const geo::location& loc, const std::string& layer) const;
    transfer_zone* create_pole_zone(const osm::osm_node& stop, const std::string& layer);
    void connect_stand_alone_zone(transfer_zone* zone);

    bool is_within_bounding_box_filter(const geo::location& loc) const;

    static geo::box create_extent(const reader::network_to_zoning_data& network_data, const config::settings& settings);

    const config::settings* settings_;
    const osm::tag_classifier* classifier_;
    reader::network_to_zoning_data network_data_;
    std::shared_ptr<zoning> zoning_;
    zoning_state state_;
    connectoid_helper helper_;
    std::set<osm::osmid> referenced_nodes_;
    osm::osm_node_table zone_nodes_;
    statistics stats_;
    bool completed_{false};
};

}// namespace osmnet::zoning

#endif//OSMNET_ZONING_ZONING_READER_H_
