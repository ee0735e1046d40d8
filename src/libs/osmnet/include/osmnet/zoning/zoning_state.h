#ifndef OSMNET_ZONING_ZONING_STATE_H_
#define OSMNET_ZONING_ZONING_STATE_H_

#include <osmnet/network/network.h>
#include <osmnet/reader/location_reconciler.h>
#include <osmnet/zoning/zoning.h>

#include <util/geo/Grid.h>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace osmnet::zoning
{

// resolves transfer zones for the connectoid reconciler
class zone_traits
{
public:
    using id_type = size_t;
    using lineage_type = transfer_zone_key;

    explicit zone_traits(const zoning& z) :
        zoning_{&z}
    {}

    id_type id_of(const transfer_zone& zone) const
    {
        return zone.get_id();
    }

    lineage_type lineage_of(const transfer_zone& zone) const
    {
        return zone.get_key();
    }

    transfer_zone* find(id_type id) const
    {
        return zoning_->find_transfer_zone(id);
    }

    // zones waiting at a stop are registered against its location
    std::optional<reader::member_position> locate(const transfer_zone& zone, const geo::location&) const
    {
        if (zoning_->find_transfer_zone(zone.get_id()) != &zone)
            return std::nullopt;
        return reader::member_position::internal;
    }

private:
    const zoning* zoning_;
};

using connectoid_reconciler = reader::location_reconciler<connectoid, transfer_zone, zone_traits>;

/*
 * Bookkeeping of the zoning phase. Transfer zones start out incomplete and
 * become complete once a connectoid connects them to the network. Both sets
 * are indexed on a grid over the zone bounding boxes, a key is never in both.
 * Connectoids are tracked per layer and location. The links of the network
 * are indexed spatially and the index follows the links broken while
 * connectoids are placed.
 */
class zoning_state
{
public:
    zoning_state(zoning& z, double grid_cell_size, const geo::box& extent);

    zoning_state(const zoning_state&) = delete;
    zoning_state& operator=(const zoning_state&) = delete;

    void add_incomplete_transfer_zone(transfer_zone* zone);
    std::vector<transfer_zone*> find_incomplete_zones_near(const geo::box& envelope) const;
    std::vector<transfer_zone*> find_complete_zones_near(const geo::box& envelope) const;

    // throws invalid_state_exception if the zone is not incomplete
    void promote_to_complete(transfer_zone* zone);
    void remove_incomplete(transfer_zone* zone);

    bool is_incomplete(const transfer_zone& zone) const;
    bool is_complete(const transfer_zone& zone) const;

    // ordered by key
    std::vector<transfer_zone*> get_incomplete_zones() const;

    size_t get_number_of_incomplete_zones() const
    {
        return incomplete_.size();
    }

    size_t get_number_of_complete_zones() const
    {
        return complete_.size();
    }

    void register_connectoid(const std::string& layer, const geo::location& loc, connectoid* c);
    connectoid* find_connectoid(const std::string& layer, const geo::location& loc) const;
    bool has_connectoid(const std::string& layer, const geo::location& loc) const;
    std::vector<connectoid*> connectoids_of(const transfer_zone& zone) const;

    // zone listed in a stop area together with the stop at loc
    void register_zone_at_stop(const std::string& layer, const geo::location& loc, const transfer_zone& zone);
    std::vector<transfer_zone*> zones_waiting_at(const std::string& layer, const geo::location& loc);

    void initialise_link_index(const network::network& net);
    void add_links_to_index(const std::vector<network::link*>& links, const std::string& layer);
    void remove_links_from_index(const std::vector<network::link*>& links);
    void remove_link_ids_from_index(const std::vector<size_t>& ids);

    // links of the layer whose bounding box intersects the envelope, by id
    std::vector<network::link*> find_links_spatially(const geo::box& envelope, const std::string& layer) const;

    size_t get_number_of_indexed_links() const
    {
        return indexed_links_.size();
    }

    void add_unprocessed_stop_position(const osm::osm_node& stop);
    const osm::osm_node* find_unprocessed_stop_position(osm::osmid id) const;
    void mark_stop_position_processed(osm::osmid id);

    // ordered by OSM id
    const std::map<osm::osmid, osm::osm_node>& get_unprocessed_stop_positions() const
    {
        return unprocessed_stops_;
    }

    // stop positions referenced by a stop area that are not stop positions
    void add_invalid_stop_area_stop_position(osm::osmid id);
    bool is_invalid_stop_area_stop_position(osm::osmid id) const;

    size_t get_number_of_invalid_stop_area_stop_positions() const
    {
        return invalid_stops_.size();
    }

    void log_statistics() const;

    void reset();

private:
    using zone_grid = util::geo::Grid<transfer_zone_key, util::geo::Box, double>;
    using link_grid = util::geo::Grid<size_t, util::geo::Box, double>;

    struct indexed_link
    {
        network::link* link;
        std::string layer;
    };

    connectoid_reconciler& reconciler_for(const std::string& layer);
    const connectoid_reconciler* find_reconciler(const std::string& layer) const;

    static std::vector<transfer_zone*> query(const zone_grid& grid,
                                             const std::map<transfer_zone_key, transfer_zone*>& zones,
                                             const geo::box& envelope);

    zoning* zoning_;

    std::map<transfer_zone_key, transfer_zone*> incomplete_;
    std::map<transfer_zone_key, transfer_zone*> complete_;
    zone_grid incomplete_grid_;
    zone_grid complete_grid_;

    std::map<std::string, connectoid_reconciler> reconcilers_;

    link_grid link_grid_;
    std::map<size_t, indexed_link> indexed_links_;

    std::map<osm::osmid, osm::osm_node> unprocessed_stops_;
    std::set<osm::osmid> invalid_stops_;
};

}// namespace osmnet::zoning

#endif//OSMNET_ZONING_ZONING_STATE_H_
