#include <osmnet/zoning/zoning_state.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>
#include <util/geo/Geo.h>

#include <sstream>

namespace osmnet::zoning
{

zoning_state::zoning_state(zoning& z, double grid_cell_size, const geo::box& extent) :
    zoning_{&z},
    incomplete_grid_{grid_cell_size, grid_cell_size, extent},
    complete_grid_{grid_cell_size, grid_cell_size, extent},
    link_grid_{grid_cell_size, grid_cell_size, extent}
{
}

void zoning_state::add_incomplete_transfer_zone(transfer_zone* zone)
{
    if (zone == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot add empty transfer zone");

    const auto& key = zone->get_key();
    if (complete_.count(key) > 0)
    {
        std::ostringstream oss;
        oss << "transfer zone " << key << " is already complete";
        throw make_exception_macro(invalid_state_exception, oss.str());
    }

    incomplete_[key] = zone;
    incomplete_grid_.add(zone->get_bounding_box(), key);
}

std::vector<transfer_zone*> zoning_state::query(const zone_grid& grid,
                                                const std::map<transfer_zone_key, transfer_zone*>& zones,
                                                const geo::box& envelope)
{
    std::set<transfer_zone_key> candidates;
    grid.get(envelope, &candidates);

    std::vector<transfer_zone*> ret;
    for (const auto& key : candidates)
    {
        auto it = zones.find(key);
        if (it != zones.end() && util::geo::intersects(it->second->get_bounding_box(), envelope))
            ret.push_back(it->second);
    }
    return ret;
}

std::vector<transfer_zone*> zoning_state::find_incomplete_zones_near(const geo::box& envelope) const
{
    return query(incomplete_grid_, incomplete_, envelope);
}

std::vector<transfer_zone*> zoning_state::find_complete_zones_near(const geo::box& envelope) const
{
    return query(complete_grid_, complete_, envelope);
}

void zoning_state::promote_to_complete(transfer_zone* zone)
{
    if (zone == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot promote empty transfer zone");

    const auto& key = zone->get_key();
    auto it = incomplete_.find(key);
    if (it == incomplete_.end())
    {
        std::ostringstream oss;
        oss << "transfer zone " << key << (complete_.count(key) > 0 ? " is already complete" : " is unknown");
        throw make_exception_macro(invalid_state_exception, oss.str());
    }

    incomplete_.erase(it);
    incomplete_grid_.remove(key);
    complete_[key] = zone;
    complete_grid_.add(zone->get_bounding_box(), key);
}

void zoning_state::remove_incomplete(transfer_zone* zone)
{
    if (zone == nullptr)
        return;
    incomplete_.erase(zone->get_key());
    incomplete_grid_.remove(zone->get_key());
}

bool zoning_state::is_incomplete(const transfer_zone& zone) const
{
    return incomplete_.count(zone.get_key()) > 0;
}

bool zoning_state::is_complete(const transfer_zone& zone) const
{
    return complete_.count(zone.get_key()) > 0;
}

std::vector<transfer_zone*> zoning_state::get_incomplete_zones() const
{
    std::vector<transfer_zone*> ret;
    ret.reserve(incomplete_.size());
    for (const auto& [key, zone] : incomplete_)
        ret.push_back(zone);
    return ret;
}

connectoid_reconciler& zoning_state::reconciler_for(const std::string& layer)
{
    auto it = reconcilers_.find(layer);
    if (it == reconcilers_.end())
        it = reconcilers_.try_emplace(layer, zone_traits{*zoning_}, "zoning/" + layer).first;
    return it->second;
}

const connectoid_reconciler* zoning_state::find_reconciler(const std::string& layer) const
{
    auto it = reconcilers_.find(layer);
    return it == reconcilers_.end() ? nullptr : &it->second;
}

void zoning_state::register_connectoid(const std::string& layer, const geo::location& loc, connectoid* c)
{
    if (c == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot register empty connectoid at " + geo::to_string(loc));
    reconciler_for(layer).register_anchor(loc, c);
}

connectoid* zoning_state::find_connectoid(const std::string& layer, const geo::location& loc) const
{
    const auto* reconciler = find_reconciler(layer);
    return reconciler == nullptr ? nullptr : reconciler->find_anchor(loc);
}

bool zoning_state::has_connectoid(const std::string& layer, const geo::location& loc) const
{
    return find_connectoid(layer, loc) != nullptr;
}

std::vector<connectoid*> zoning_state::connectoids_of(const transfer_zone& zone) const
{
    return zone.get_connectoids();
}

void zoning_state::register_zone_at_stop(const std::string& layer, const geo::location& loc, const transfer_zone& zone)
{
    reconciler_for(layer).register_internal(loc, zone);
}

std::vector<transfer_zone*> zoning_state::zones_waiting_at(const std::string& layer, const geo::location& loc)
{
    auto& reconciler = reconciler_for(layer);
    if (!reconciler.is_location_internal(loc))
        return {};
    return reconciler.reconcile(loc).current;
}

void zoning_state::initialise_link_index(const network::network& net)
{
    link_grid_.clear();
    indexed_links_.clear();
    for (auto* layer : net.get_layers())
        add_links_to_index(layer->get_links(), layer->get_id());
    LOG(DEBUG) << "indexed " << indexed_links_.size() << " links for the zoning";
}

void zoning_state::add_links_to_index(const std::vector<network::link*>& links, const std::string& layer)
{
    for (auto* l : links)
    {
        if (l == nullptr)
            continue;
        indexed_links_[l->get_id()] = indexed_link{l, layer};
        link_grid_.add(l->get_bounding_box(), l->get_id());
    }
}

void zoning_state::remove_links_from_index(const std::vector<network::link*>& links)
{
    std::vector<size_t> ids;
    for (const auto* l : links)
    {
        if (l != nullptr)
            ids.push_back(l->get_id());
    }
    remove_link_ids_from_index(ids);
}

void zoning_state::remove_link_ids_from_index(const std::vector<size_t>& ids)
{
    for (auto id : ids)
    {
        indexed_links_.erase(id);
        link_grid_.remove(id);
    }
}

std::vector<network::link*> zoning_state::find_links_spatially(const geo::box& envelope, const std::string& layer) const
{
    std::set<size_t> candidates;
    link_grid_.get(envelope, &candidates);

    std::vector<network::link*> ret;
    for (auto id : candidates)
    {
        auto it = indexed_links_.find(id);
        if (it == indexed_links_.end() || it->second.layer != layer)
            continue;
        if (util::geo::intersects(it->second.link->get_bounding_box(), envelope))
            ret.push_back(it->second.link);
    }
    return ret;
}

void zoning_state::add_unprocessed_stop_position(const osm::osm_node& stop)
{
    unprocessed_stops_[stop.id] = stop;
}

const osm::osm_node* zoning_state::find_unprocessed_stop_position(osm::osmid id) const
{
    auto it = unprocessed_stops_.find(id);
    return it == unprocessed_stops_.end() ? nullptr : &it->second;
}

void zoning_state::mark_stop_position_processed(osm::osmid id)
{
    unprocessed_stops_.erase(id);
}

void zoning_state::add_invalid_stop_area_stop_position(osm::osmid id)
{
    invalid_stops_.insert(id);
}

bool zoning_state::is_invalid_stop_area_stop_position(osm::osmid id) const
{
    return invalid_stops_.count(id) > 0;
}

void zoning_state::log_statistics() const
{
    LOG(INFO) << "transfer zones: " << complete_.size() << " complete, " << incomplete_.size() << " incomplete";
    LOG(INFO) << "stop positions: " << unprocessed_stops_.size() << " unprocessed, "
              << invalid_stops_.size() << " invalid in stop areas";
    for (const auto& [layer, reconciler] : reconcilers_)
    {
        const auto& stats = reconciler.get_statistics();
        LOG(INFO) << "[" << layer << "] connectoids: " << reconciler.number_of_anchors()
                  << ", dropped zone references: " << stats.dropped_references;
    }
}

void zoning_state::reset()
{
    incomplete_.clear();
    complete_.clear();
    incomplete_grid_.clear();
    complete_grid_.clear();
    reconcilers_.clear();
    link_grid_.clear();
    indexed_links_.clear();
    unprocessed_stops_.clear();
    invalid_stops_.clear();
}

}// namespace osmnet::zoning
