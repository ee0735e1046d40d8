#include <osmnet/zoning/connectoid_helper.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>

namespace osmnet::zoning
{

connectoid_helper::connectoid_helper(zoning& z, zoning_state& state, const reader::network_to_zoning_data& network_data) :
    zoning_{&z},
    state_{&state},
    network_data_{&network_data}
{
}

network::node* connectoid_helper::extract_connectoid_access_node(const geo::location& loc, const std::string& layer)
{
    auto& layer_state = network_data_->get_layer_state(layer);
    auto* existing = layer_state.find_node_at_location(loc);

    if (!layer_state.is_location_internal_to_any_link(loc))
    {
        if (existing == nullptr)
            LOG(DEBUG) << "no access node on layer " << layer << " at " << geo::to_string(loc);
        return existing;
    }

    auto links = layer_state.find_current_links_at_location(loc);
    if (existing != nullptr)
    {
        // an injected coordinate can coincide with a node of another link
        if (!links.empty())
            break_links_at_node(links, existing, layer);
        return existing;
    }

    if (links.empty())
    {
        LOG(WARN) << "location " << geo::to_string(loc) << " was registered on layer " << layer
                  << " but no current link contains it, no access node created";
        return nullptr;
    }

    // registered at its location by the break
    auto* n = layer_state.get_layer().create_node(loc, layer_state.find_osm_node_at_location(loc));
    break_links_at_node(links, n, layer);
    return n;
}

void connectoid_helper::break_links_at_node(const std::vector<network::link*>& links, network::node* n, const std::string& layer)
{
    if (n == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot break links of layer " + layer + " without a node");

    auto breaks = network_data_->get_layer_state(layer).break_links_at(links, n);

    // links the location is an extreme point of are not broken and stay indexed
    std::vector<size_t> broken;
    std::vector<network::link*> replacements;
    broken.reserve(breaks.size());
    replacements.reserve(breaks.size() * 2);
    for (const auto& b : breaks)
    {
        broken.push_back(b.original_id);
        replacements.push_back(b.first);
        replacements.push_back(b.second);
    }
    state_->remove_link_ids_from_index(broken);
    state_->add_links_to_index(replacements, layer);
}

connectoid* connectoid_helper::create_connectoid(transfer_zone* zone, const std::string& layer, const geo::location& loc,
                                                 std::optional<osm::osmid> stop_position)
{
    if (zone == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot create connectoid on layer " + layer + " without a transfer zone");

    auto* access_node = extract_connectoid_access_node(loc, layer);
    if (access_node == nullptr)
        return nullptr;

    const auto& position = access_node->get_position();
    auto* c = state_->find_connectoid(layer, position);
    if (c == nullptr)
    {
        c = zoning_->create_connectoid(layer, access_node, stop_position);
        state_->register_connectoid(layer, position, c);
    }

    c->add_transfer_zone(zone);
    zone->add_connectoid(c);

    if (state_->is_incomplete(*zone))
        state_->promote_to_complete(zone);

    return c;
}

std::optional<geo::location> connectoid_helper::extract_stand_alone_zone_location(const transfer_zone& zone, network::link* l, const std::string& layer)
{
    if (l == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot connect transfer zone without a link");

    std::optional<geo::projection> best;
    double best_distance = 0;
    for (const auto& coordinate : zone.get_geometry())
    {
        auto candidate = geo::project_on(l->get_geometry(), coordinate);
        if (!candidate)
            continue;

        double d = geo::distance_in_metres(candidate->point, coordinate);
        if (!best || d < best_distance)
        {
            best = candidate;
            best_distance = d;
        }
    }

    if (!best)
        return std::nullopt;

    if (!geo::find_coordinate_index(l->get_geometry(), best->point))
    {
        auto& layer_state = network_data_->get_layer_state(layer);
        layer_state.get_layer().inject_coordinate(l, best->segment_index, best->point);
        layer_state.register_location_as_internal_to_link(best->point, *l);
    }
    return best->point;
}

}// namespace osmnet::zoning
