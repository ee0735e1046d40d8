#include <osmnet/zoning/zoning_reader.h>

#include "osm/osmium_conversion.h"

#include <exceptions/exceptions.h>
#include <logging/logger.h>
#include <logging/scoped_timer.h>
#include <util/geo/Geo.h>

#include <osmium/handler.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/io/reader.hpp>
#include <osmium/visitor.hpp>

#include <algorithm>
#include <system_error>

namespace osmnet::zoning
{
namespace
{
const std::set<std::string> STOP_ROLES = {"stop", "stop_entry_only", "stop_exit_only"};

zoning& require_zoning(const std::shared_ptr<zoning>& z)
{
    if (!z)
        throw make_exception_macro(null_pointer_exception, "zoning reader requires a zoning to populate");
    return *z;
}

class zoning_osmium_handler : public osmium::handler::Handler
{
public:
    explicit zoning_osmium_handler(zoning_reader& reader) :
        reader{reader}
    {
    }

protected:
    zoning_reader& reader;
};

class preprocessing_handler : public zoning_osmium_handler
{
public:
    explicit preprocessing_handler(zoning_reader& reader) :
        zoning_osmium_handler{reader}
    {
    }

    void way(const osmium::Way& way)
    {
        reader.preprocess_way(osm::to_osm_way(way));
    }
};

class node_handler : public zoning_osmium_handler
{
public:
    explicit node_handler(zoning_reader& reader) :
        zoning_osmium_handler{reader}
    {
    }

    void node(const osmium::Node& node)
    {
        if (!node.location().valid())
            return;
        reader.handle_node(osm::to_osm_node(node));
    }
};

class way_handler : public zoning_osmium_handler
{
public:
    explicit way_handler(zoning_reader& reader) :
        zoning_osmium_handler{reader}
    {
    }

    void way(const osmium::Way& way)
    {
        reader.handle_way(osm::to_osm_way(way));
    }
};

class relation_handler : public zoning_osmium_handler
{
public:
    explicit relation_handler(zoning_reader& reader) :
        zoning_osmium_handler{reader}
    {
    }

    void relation(const osmium::Relation& relation)
    {
        reader.handle_relation(osm::to_osm_relation(relation));
    }
};
}// namespace

zoning_reader::zoning_reader(const config::settings& settings, const osm::tag_classifier& classifier,
                             reader::network_to_zoning_data network_data, std::shared_ptr<zoning> z) :
    settings_{&settings},
    classifier_{&classifier},
    network_data_{std::move(network_data)},
    zoning_{std::move(z)},
    state_{require_zoning(zoning_), settings.grid_size, create_extent(network_data_, settings)},
    helper_{*zoning_, state_, network_data_}
{
}

geo::box zoning_reader::create_extent(const reader::network_to_zoning_data& network_data, const config::settings& settings)
{
    const auto& bounding_box = network_data.get_network_bounding_box();
    if (bounding_box.isEmpty())
        return bounding_box;
    return geo::envelope_around(bounding_box, std::max(settings.stop_search_radius, settings.link_search_radius));
}

void zoning_reader::read(const std::string& path)
{
    logging::scoped_timer timer("reading zoning");

    osm::check_osm_input(path);

    try
    {
        LOG(INFO) << "Pre-processing transfer zone ways of " << path << "...";
        osmium::io::Reader reader_pass1{path, osmium::osm_entity_bits::way};
        osmium::apply(reader_pass1, preprocessing_handler(*this));
        reader_pass1.close();

        LOG(INFO) << "Reading transfer zone and stop position nodes...";
        osmium::io::Reader reader_pass2{path, osmium::osm_entity_bits::node};
        osmium::apply(reader_pass2, node_handler(*this));
        reader_pass2.close();

        LOG(INFO) << "Reading transfer zone ways...";
        osmium::io::Reader reader_pass3{path, osmium::osm_entity_bits::way};
        osmium::apply(reader_pass3, way_handler(*this));
        reader_pass3.close();

        LOG(INFO) << "Reading stop areas...";
        osmium::io::Reader reader_pass4{path, osmium::osm_entity_bits::relation};
        osmium::apply(reader_pass4, relation_handler(*this));
        reader_pass4.close();
    }
    catch (const osmium::io_error& e)
    {
        throw make_exception_macro(unsupported_format_exception, "failed to read " + path + ": " + e.what());
    }
    catch (const std::system_error& e)
    {
        throw make_exception_macro(unsupported_format_exception, "failed to read " + path + ": " + e.what());
    }

    complete();
}

void zoning_reader::preprocess_way(const osm::osm_way& way)
{
    if (!classifier_->is_transfer_zone(way.attrs))
        return;

    referenced_nodes_.insert(way.nodes.begin(), way.nodes.end());
}

bool zoning_reader::is_within_bounding_box_filter(const geo::location& loc) const
{
    return !settings_->bounding_box || util::geo::contains(loc, *settings_->bounding_box);
}

void zoning_reader::handle_node(const osm::osm_node& node)
{
    bool referenced = referenced_nodes_.count(node.id) > 0;
    bool zone = classifier_->is_transfer_zone(node.attrs);
    bool stop = classifier_->is_stop_position(node.attrs);
    if (!referenced && !zone && !stop)
        return;

    if (!is_within_bounding_box_filter(node.position()))
    {
        ++stats_.nodes_outside_bounding_box;
        LOG(DEBUG) << "OSM node " << node.id << " outside bounding box, ignored";
        return;
    }

    if (referenced)
        zone_nodes_.register_node(node);

    if (zone)
        register_transfer_zone(node, osm::entity_type::node, geo::line_string{node.position()});

    if (stop)
    {
        state_.add_unprocessed_stop_position(node);
        ++stats_.stop_positions;
    }
}

void zoning_reader::handle_way(const osm::osm_way& way)
{
    if (!classifier_->is_transfer_zone(way.attrs))
        return;

    geo::line_string geometry;
    size_t missing = 0;
    for (auto id : way.nodes)
    {
        const auto* node = zone_nodes_.find(id);
        if (node == nullptr)
            node = network_data_.get_osm_node_table().find(id);
        if (node == nullptr)
        {
            ++missing;
            continue;
        }
        geometry.push_back(node->position());
    }

    if (geometry.empty())
    {
        LOG(DEBUG) << "DISCARD: transfer zone OSM way " << way.id << " has no available nodes";
        ++stats_.discarded_zones;
        return;
    }

    if (missing > 0)
    {
        LOG(WARN) << "SALVAGED: transfer zone OSM way " << way.id << " misses " << missing << " of "
                  << way.nodes.size() << " nodes, kept the available ones";
        ++stats_.salvaged_zones;
    }

    register_transfer_zone(way, osm::entity_type::way, std::move(geometry));
}

void zoning_reader::handle_relation(const osm::osm_relation& relation)
{
    if (!classifier_->is_stop_area(relation.attrs))
        return;

    ++stats_.stop_areas;

    std::vector<transfer_zone*> zones;
    std::vector<const osm::osm_node*> stops;
    for (const auto& member : relation.members)
    {
        if (member.type == osm::entity_type::relation)
            continue;

        if (auto* zone = zoning_->find_transfer_zone(transfer_zone_key{member.type, member.ref}))
        {
            zones.push_back(zone);
            continue;
        }

        if (member.type != osm::entity_type::node)
            continue;

        if (const auto* stop = state_.find_unprocessed_stop_position(member.ref))
        {
            stops.push_back(stop);
        }
        else if (STOP_ROLES.count(member.role) > 0)
        {
            LOG(WARN) << "stop area " << relation.id << " references OSM node " << member.ref
                      << " as stop position, but it is not a known stop position";
            state_.add_invalid_stop_area_stop_position(member.ref);
        }
    }

    for (const auto* stop : stops)
    {
        for (const auto& layer : active_layers(classifier_->layers_for_stop(stop->attrs)))
        {
            for (const auto* zone : zones)
            {
                if (zone->serves_layer(layer))
                    state_.register_zone_at_stop(layer, stop->position(), *zone);
            }
        }
    }
}

transfer_zone* zoning_reader::register_transfer_zone(const osm::osm_element& element, osm::entity_type type, geo::line_string geometry)
{
    transfer_zone_key key{type, element.id};
    if (zoning_->find_transfer_zone(key) != nullptr)
    {
        LOG(WARN) << "transfer zone " << key << " already exists, ignored";
        return nullptr;
    }

    auto* zone = zoning_->create_transfer_zone(key, classifier_->get_transfer_zone_type(element.attrs), std::move(geometry));
    if (auto name = element.get_tag("name"))
        zone->set_name(*name);
    zone->set_layers(classifier_->layers_for_stop(element.attrs));

    state_.add_incomplete_transfer_zone(zone);
    ++stats_.transfer_zones;
    return zone;
}

std::vector<std::string> zoning_reader::active_layers(const std::vector<std::string>& layers) const
{
    auto available = network_data_.get_layer_ids();
    if (layers.empty())
        return available;

    std::vector<std::string> ret;
    for (const auto& layer : layers)
    {
        if (std::find(available.begin(), available.end(), layer) != available.end())
            ret.push_back(layer);
    }
    return ret;
}

void zoning_reader::complete()
{
    if (completed_)
    {
        LOG(WARN) << "zoning reader already completed";
        return;
    }

    logging::scoped_timer timer("completing zoning");

    state_.initialise_link_index(*network_data_.get_populated_network());

    LOG(INFO) << "Connecting " << state_.get_unprocessed_stop_positions().size() << " stop positions...";
    std::vector<osm::osm_node> stops;
    for (const auto& [id, stop] : state_.get_unprocessed_stop_positions())
        stops.push_back(stop);

    for (const auto& stop : stops)
    {
        auto layers = active_layers(classifier_->layers_for_stop(stop.attrs));
        bool connected = !layers.empty();
        for (const auto& layer : layers)
            connected = connect_stop_position(stop, layer) && connected;

        if (connected)
        {
            state_.mark_stop_position_processed(stop.id);
        }
        else
        {
            LOG(WARN) << "stop position " << stop.id << " at " << geo::to_string(stop.position())
                      << " is not part of every network layer it serves";
        }
    }

    LOG(INFO) << "Connecting " << state_.get_number_of_incomplete_zones() << " stand-alone transfer zones...";
    for (auto* zone : state_.get_incomplete_zones())
        connect_stand_alone_zone(zone);

    LOG(INFO) << "transfer zones: " << stats_.transfer_zones
              << ", salvaged: " << stats_.salvaged_zones
              << ", discarded: " << stats_.discarded_zones
              << ", created at stop positions: " << stats_.pole_zones_created;
    LOG(INFO) << "stop positions: " << stats_.stop_positions
              << ", stop areas: " << stats_.stop_areas
              << ", connectoids at stop positions: " << stats_.stop_based_connectoids
              << ", stand-alone connections: " << stats_.stand_alone_connections;
    state_.log_statistics();

    completed_ = true;
}

bool zoning_reader::connect_stop_position(const osm::osm_node& stop, const std::string& layer)
{
    auto loc = stop.position();
    if (helper_.extract_connectoid_access_node(loc, layer) == nullptr)
        return false;

    std::vector<transfer_zone*> zones;
    for (auto* zone : state_.zones_waiting_at(layer, loc))
    {
        if (zone->serves_layer(layer))
            zones.push_back(zone);
    }

    if (zones.empty())
    {
        if (auto* closest = find_closest_zone(loc, layer))
            zones.push_back(closest);
        else if (auto* pole = create_pole_zone(stop, layer))
            zones.push_back(pole);
    }

    for (auto* zone : zones)
    {
        if (helper_.create_connectoid(zone, layer, loc, stop.id) != nullptr)
            ++stats_.stop_based_connectoids;
    }
    return true;
}

transfer_zone* zoning_reader::find_closest_zone(const geo::location& loc, const std::string& layer) const
{
    auto envelope = geo::envelope_around(loc, settings_->stop_search_radius);
    auto candidates = state_.find_incomplete_zones_near(envelope);
    auto complete = state_.find_complete_zones_near(envelope);
    candidates.insert(candidates.end(), complete.begin(), complete.end());

    transfer_zone* closest = nullptr;
    double closest_distance = 0;
    for (auto* zone : candidates)
    {
        if (!zone->serves_layer(layer))
            continue;

        double d = zone->distance_in_metres_to(loc);
        if (d > settings_->stop_search_radius)
            continue;

        if (closest == nullptr || d < closest_distance || (d == closest_distance && zone->get_key() < closest->get_key()))
        {
            closest = zone;
            closest_distance = d;
        }
    }
    return closest;
}

transfer_zone* zoning_reader::create_pole_zone(const osm::osm_node& stop, const std::string& layer)
{
    transfer_zone_key key{osm::entity_type::node, stop.id};
    if (auto* existing = zoning_->find_transfer_zone(key))
    {
        existing->add_layer(layer);
        return existing;
    }

    LOG(DEBUG) << "no transfer zone near stop position " << stop.id << ", creating one at its location";
    auto* zone = zoning_->create_transfer_zone(key, osm::transfer_zone_type::pole, geo::line_string{stop.position()});
    if (auto name = stop.get_tag("name"))
        zone->set_name(*name);
    zone->set_layers({layer});
    state_.add_incomplete_transfer_zone(zone);
    ++stats_.pole_zones_created;
    return zone;
}

void zoning_reader::connect_stand_alone_zone(transfer_zone* zone)
{
    for (const auto& layer : active_layers(zone->get_layers()))
    {
        auto envelope = geo::envelope_around(zone->get_bounding_box(), settings_->link_search_radius);

        network::link* closest = nullptr;
        double closest_distance = 0;
        for (auto* l : state_.find_links_spatially(envelope, layer))
        {
            for (const auto& coordinate : zone->get_geometry())
            {
                auto projection = geo::project_on(l->get_geometry(), coordinate);
                if (!projection)
                    continue;

                double d = geo::distance_in_metres(projection->point, coordinate);
                if (d <= settings_->link_search_radius && (closest == nullptr || d < closest_distance))
                {
                    closest = l;
                    closest_distance = d;
                }
            }
        }

        if (closest == nullptr)
        {
            LOG(DEBUG) << "no " << layer << " link within " << settings_->link_search_radius << "m of transfer zone " << zone->get_key();
            continue;
        }

        auto loc = helper_.extract_stand_alone_zone_location(*zone, closest, layer);
        if (loc && helper_.create_connectoid(zone, layer, *loc) != nullptr)
            ++stats_.stand_alone_connections;
    }

    if (state_.is_incomplete(*zone))
    {
        LOG(DEBUG) << "transfer zone " << zone->get_key() << " could not be connected to the network";
    }
}

void zoning_reader::reset()
{
    state_.reset();
    referenced_nodes_.clear();
    zone_nodes_.clear();
    stats_ = statistics{};
    completed_ = false;
}

}// namespace osmnet::zoning
