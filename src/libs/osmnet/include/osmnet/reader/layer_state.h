#ifndef OSMNET_READER_LAYER_STATE_H_
#define OSMNET_READER_LAYER_STATE_H_

#include <osmnet/network/network_layer.h>
#include <osmnet/osm/osm.h>
#include <osmnet/reader/location_reconciler.h>

#include <optional>
#include <set>
#include <vector>

namespace osmnet::reader
{

// resolves links of one layer for the reconciler
class link_traits
{
public:
    using id_type = size_t;
    using lineage_type = osm::osmid;

    explicit link_traits(const network::network_layer& layer) :
        layer_{&layer}
    {}

    id_type id_of(const network::link& l) const
    {
        return l.get_id();
    }

    lineage_type lineage_of(const network::link& l) const
    {
        return l.get_external_id();
    }

    network::link* find(id_type id) const
    {
        return layer_->find_link(id);
    }

    std::optional<member_position> locate(const network::link& l, const geo::location& loc) const;

private:
    const network::network_layer* layer_;
};

using link_reconciler = location_reconciler<network::node, network::link, link_traits>;

/*
 * Per layer knowledge about locations: the node placed at a location, the
 * links a location is internal to, and for every OSM way that has been
 * split, the links currently representing it.
 */
class layer_state
{
public:
    struct statistics
    {
        size_t salvaged_ways{0};
        size_t discarded_ways{0};
        size_t circular_ways{0};
        size_t broken_links{0};
    };

    explicit layer_state(network::network_layer& layer);

    layer_state(const layer_state&) = delete;
    layer_state& operator=(const layer_state&) = delete;

    network::network_layer& get_layer() const
    {
        return *layer_;
    }

    // warns when the layer is completed and loc is still internal to a link
    void register_node_at_location(const geo::location& loc, network::node* n);
    network::node* find_node_at_location(const geo::location& loc) const;

    void register_location_as_internal_to_link(const geo::location& loc, const network::link& l, const osm::osm_node* osm_node = nullptr);

    bool is_location_present(const geo::location& loc) const;
    bool is_location_internal_to_any_link(const geo::location& loc) const;

    // Links the location is currently internal to, resolved through the split
    // OSM ways. Empty when the location was never registered on this layer.
    std::vector<network::link*> find_current_links_at_location(const geo::location& loc);

    // full outcome of resolving the location, including extreme matches
    link_reconciler::reconciliation reconcile_location(const geo::location& loc);

    std::vector<geo::location> collect_locations_internal_to_at_least(size_t n) const;

    // OSM node ids of the locations internal to at least n links, ascending
    std::vector<osm::osmid> collect_osm_nodes_internal_to_at_least(size_t n) const;

    std::optional<osm::osmid> find_osm_node_at_location(const geo::location& loc) const;

    // breaks the links the node's location is currently internal to
    std::vector<network::link_break> break_links_at_location(network::node* n);

    // Breaks the given links at the node's location and records the outcome.
    // Links on which the location is the first or last coordinate are left
    // untouched and produce no entry, so an empty result is a no-op, not a
    // failure. Either way the node is registered at its location afterwards.
    std::vector<network::link_break> break_links_at(const std::vector<network::link*>& links, network::node* n);

    // a way that was converted into several links from the start
    void register_way_links(osm::osmid way_id, const std::vector<network::link*>& links);

    const std::set<size_t>* current_link_ids_for_way(osm::osmid way_id) const;
    std::vector<network::link*> current_links_for_way(osm::osmid way_id) const;

    size_t number_of_ways_with_multiple_links() const;

    // removal notifications, e.g. from network pruning
    void notify_links_removed(const std::vector<network::link*>& links);
    void notify_node_removed(const network::node& n);

    const link_reconciler::statistics& get_reconciler_statistics() const;

    statistics& get_statistics()
    {
        return stats_;
    }

    const statistics& get_statistics() const
    {
        return stats_;
    }

    void log_statistics() const;

    // from here on every location internal to a link is expected to stay so
    // until the link is broken there
    void mark_completed()
    {
        completed_ = true;
    }

    bool is_completed() const
    {
        return completed_;
    }

    void reset();

private:
    network::network_layer* layer_;
    link_reconciler reconciler_;
    statistics stats_;
    bool completed_{false};
};

}// namespace osmnet::reader

#endif//OSMNET_READER_LAYER_STATE_H_
