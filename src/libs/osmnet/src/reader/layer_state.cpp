#include <osmnet/reader/layer_state.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>

#include <algorithm>

namespace osmnet::reader
{

std::optional<member_position> link_traits::locate(const network::link& l, const geo::location& loc) const
{
    auto position = l.find_position(loc);
    if (!position)
        return std::nullopt;
    return *position == geo::coordinate_position::internal ? member_position::internal : member_position::extreme;
}

layer_state::layer_state(network::network_layer& layer) :
    layer_{&layer},
    reconciler_{link_traits{layer}, layer.get_id()}
{
}

void layer_state::register_node_at_location(const geo::location& loc, network::node* n)
{
    if (n == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot register empty node at " + geo::to_string(loc));
    if (completed_ && reconciler_.is_location_internal(loc))
    {
        LOG(WARN) << "[" << layer_->get_id() << "] node " << n->get_id() << " registered at " << geo::to_string(loc)
                  << " while the location is still internal to a link";
    }
    reconciler_.register_anchor(loc, n);
}

network::node* layer_state::find_node_at_location(const geo::location& loc) const
{
    return reconciler_.find_anchor(loc);
}

void layer_state::register_location_as_internal_to_link(const geo::location& loc, const network::link& l, const osm::osm_node* osm_node)
{
    std::optional<osm::osmid> osm_id;
    if (osm_node != nullptr)
        osm_id = osm_node->id;
    reconciler_.register_internal(loc, l, osm_id);
}

bool layer_state::is_location_present(const geo::location& loc) const
{
    return reconciler_.is_location_present(loc);
}

bool layer_state::is_location_internal_to_any_link(const geo::location& loc) const
{
    return reconciler_.is_location_internal(loc);
}

std::vector<network::link*> layer_state::find_current_links_at_location(const geo::location& loc)
{
    if (reconciler_.find_internal(loc) == nullptr)
    {
        LOG(DEBUG) << "location " << geo::to_string(loc) << " is not internal to any link of layer " << layer_->get_id();
    }
    return reconciler_.reconcile(loc).current;
}

link_reconciler::reconciliation layer_state::reconcile_location(const geo::location& loc)
{
    return reconciler_.reconcile(loc);
}

std::vector<geo::location> layer_state::collect_locations_internal_to_at_least(size_t n) const
{
    return reconciler_.collect_locations_internal_to_at_least(n);
}

std::vector<osm::osmid> layer_state::collect_osm_nodes_internal_to_at_least(size_t n) const
{
    std::vector<osm::osmid> ret;
    for (const auto& [loc, entry] : reconciler_.internal_entries())
    {
        if (entry.osm_node && !entry.members.empty() && entry.members.size() >= n)
            ret.push_back(*entry.osm_node);
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

std::optional<osm::osmid> layer_state::find_osm_node_at_location(const geo::location& loc) const
{
    if (const auto* n = find_node_at_location(loc); n != nullptr && n->get_external_id())
        return n->get_external_id();

    const auto* entry = reconciler_.find_internal(loc);
    if (entry == nullptr)
        return std::nullopt;
    return entry->osm_node;
}

std::vector<network::link_break> layer_state::break_links_at_location(network::node* n)
{
    if (n == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot break links of layer " + layer_->get_id() + " without a node");

    auto links = find_current_links_at_location(n->get_position());
    return break_links_at(links, n);
}

std::vector<network::link_break> layer_state::break_links_at(const std::vector<network::link*>& links, network::node* n)
{
    if (n == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot break links of layer " + layer_->get_id() + " without a node");

    std::vector<network::link_break> breaks;
    if (!links.empty())
        breaks = layer_->break_links_at(links, n);

    for (const auto& b : breaks)
    {
        reconciler_.update_lineage(b.external_id, {b.original_id}, {b.first, b.second});
    }
    stats_.broken_links += breaks.size();

    // the location is an extreme point of every link from here on
    reconciler_.promote(n->get_position());
    if (find_node_at_location(n->get_position()) != n)
        register_node_at_location(n->get_position(), n);

    return breaks;
}

void layer_state::register_way_links(osm::osmid way_id, const std::vector<network::link*>& links)
{
    reconciler_.register_lineage(way_id, links);
}

const std::set<size_t>* layer_state::current_link_ids_for_way(osm::osmid way_id) const
{
    return reconciler_.find_lineage(way_id);
}

std::vector<network::link*> layer_state::current_links_for_way(osm::osmid way_id) const
{
    std::vector<network::link*> ret;
    if (const auto* ids = current_link_ids_for_way(way_id))
    {
        for (auto id : *ids)
        {
            if (auto* l = layer_->find_link(id))
                ret.push_back(l);
        }
    }
    return ret;
}

size_t layer_state::number_of_ways_with_multiple_links() const
{
    return reconciler_.number_of_lineages();
}

void layer_state::notify_links_removed(const std::vector<network::link*>& links)
{
    for (const auto* l : links)
    {
        if (l != nullptr)
            reconciler_.forget_member(l->get_id(), l->get_external_id());
    }
}

void layer_state::notify_node_removed(const network::node& n)
{
    if (find_node_at_location(n.get_position()) == &n)
        reconciler_.forget_anchor(n.get_position());
}

const link_reconciler::statistics& layer_state::get_reconciler_statistics() const
{
    return reconciler_.get_statistics();
}

void layer_state::log_statistics() const
{
    const auto& r = reconciler_.get_statistics();
    LOG(INFO) << "[" << layer_->get_id() << "] nodes: " << layer_->get_number_of_nodes()
              << ", links: " << layer_->get_number_of_links()
              << ", OSM ways with multiple links: " << number_of_ways_with_multiple_links();
    LOG(INFO) << "[" << layer_->get_id() << "] broken links: " << stats_.broken_links
              << ", circular ways: " << stats_.circular_ways
              << ", salvaged ways: " << stats_.salvaged_ways
              << ", discarded ways: " << stats_.discarded_ways;
    if (r.dropped_references > 0 || r.undersized_lineages > 0 || r.replaced_anchors > 0)
    {
        LOG(WARN) << "[" << layer_->get_id() << "] dropped link references: " << r.dropped_references
                  << ", ways registered with less than two links: " << r.undersized_lineages
                  << ", replaced nodes: " << r.replaced_anchors;
    }
}

void layer_state::reset()
{
    reconciler_.reset();
    stats_ = statistics{};
    completed_ = false;
}

}// namespace osmnet::reader
