#include <osmnet/reader/network_reader.h>

#include "osm/osmium_conversion.h"

#include <exceptions/exceptions.h>
#include <logging/logger.h>
#include <logging/scoped_timer.h>

#include <osmium/handler.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/io/reader.hpp>
#include <osmium/visitor.hpp>

#include <system_error>

namespace osmnet::reader
{
namespace
{
class network_osmium_handler : public osmium::handler::Handler
{
public:
    explicit network_osmium_handler(network_reader& reader) :
        reader{reader}
    {
    }

protected:
    network_reader& reader;
};

class preprocessing_handler : public network_osmium_handler
{
public:
    explicit preprocessing_handler(network_reader& reader) :
        network_osmium_handler{reader}
    {
    }

    void way(const osmium::Way& way)
    {
        reader.preprocess_way(osm::to_osm_way(way));
    }
};

class node_handler : public network_osmium_handler
{
public:
    explicit node_handler(network_reader& reader) :
        network_osmium_handler{reader}
    {
    }

    void node(const osmium::Node& node)
    {
        if (!node.location().valid())
            return;
        reader.handle_node(osm::to_osm_node(node));
    }
};

class way_handler : public network_osmium_handler
{
public:
    explicit way_handler(network_reader& reader) :
        network_osmium_handler{reader}
    {
    }

    void way(const osmium::Way& way)
    {
        reader.handle_way(osm::to_osm_way(way));
    }
};
}// namespace

network_reader::network_reader(const config::settings& settings, const osm::tag_classifier& classifier, std::shared_ptr<network::network> net) :
    settings_{&settings},
    classifier_{&classifier},
    network_{std::move(net)},
    data_{settings.bounding_box}
{
    if (!network_)
        throw make_exception_macro(null_pointer_exception, "network reader requires a network to populate");

    if (!network_->get_country_name().empty() && !settings.country_name.empty() && network_->get_country_name() != settings.country_name)
    {
        throw make_exception_macro(configuration_exception,
                                   "country " + settings.country_name + " does not match country " + network_->get_country_name() + " of the network to populate");
    }

    if (settings.layers.empty())
        throw make_exception_macro(configuration_exception, "no network layer activated");

    for (const auto& id : settings.layers)
    {
        auto* layer = network_->find_layer(id);
        if (layer == nullptr)
            layer = &network_->add_layer(id);
        parsers_.emplace(id, std::make_unique<layer_parser>(*layer, data_));
    }
}

void network_reader::read(const std::string& path)
{
    logging::scoped_timer timer("reading network");

    osm::check_osm_input(path);

    try
    {
        LOG(INFO) << "Pre-processing ways of " << path << "...";
        osmium::io::Reader reader_pass1{path, osmium::osm_entity_bits::way};
        osmium::apply(reader_pass1, preprocessing_handler(*this));
        reader_pass1.close();

        LOG(INFO) << "Reading nodes...";
        osmium::io::Reader reader_pass2{path, osmium::osm_entity_bits::node};
        osmium::apply(reader_pass2, node_handler(*this));
        reader_pass2.close();

        LOG(INFO) << "Reading ways...";
        osmium::io::Reader reader_pass3{path, osmium::osm_entity_bits::way};
        osmium::apply(reader_pass3, way_handler(*this));
        reader_pass3.close();
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

void network_reader::preprocess_way(const osm::osm_way& way)
{
    if (!classifier_->is_network_way(way.attrs))
        return;

    for (auto id : way.nodes)
        data_.register_referenced_node(id);
}

void network_reader::handle_node(const osm::osm_node& node)
{
    if (!data_.is_referenced_node(node.id))
        return;

    if (!data_.is_within_bounding_box_filter(node.position()))
    {
        ++stats_.nodes_outside_bounding_box;
        return;
    }

    data_.get_osm_node_table().register_node(node);
    ++stats_.kept_nodes;
}

void network_reader::handle_way(const osm::osm_way& way)
{
    if (!classifier_->is_network_way(way.attrs))
        return;

    if (way.nodes.size() < 2)
    {
        LOG(DEBUG) << "OSM way " << way.id << " has less than two nodes, ignored";
        return;
    }

    ++stats_.network_ways;
    if (way.has_loop())
    {
        data_.register_circular_way(way);
        ++stats_.postponed_circular_ways;
        return;
    }

    for (const auto& layer : classifier_->layers_for_way(way.attrs))
    {
        if (auto* parser = find_layer_parser(layer))
            parser->handle_way(way);
    }
}

void network_reader::handle_relation(const osm::osm_relation& relation)
{
    LOG(TRACE) << "OSM relation " << relation.id << " not used by the network";
}

void network_reader::complete()
{
    if (completed_)
    {
        LOG(WARN) << "network reader already completed";
        return;
    }

    LOG(INFO) << "Processing " << data_.get_circular_ways().size() << " circular ways...";
    for (const auto& [id, way] : data_.get_circular_ways())
    {
        for (const auto& layer : classifier_->layers_for_way(way.attrs))
        {
            if (auto* parser = find_layer_parser(layer))
                parser->handle_raw_circular_way(way);
        }
    }
    data_.clear_circular_ways();

    for (auto& [id, parser] : parsers_)
        parser->complete();

    LOG(INFO) << "OSM nodes kept: " << stats_.kept_nodes
              << ", outside bounding box: " << stats_.nodes_outside_bounding_box
              << ", network ways: " << stats_.network_ways
              << ", circular ways: " << stats_.postponed_circular_ways
              << ", unavailable ways: " << data_.get_number_of_unavailable_ways();

    completed_ = true;
}

layer_parser* network_reader::find_layer_parser(const std::string& layer) const
{
    auto it = parsers_.find(layer);
    return it == parsers_.end() ? nullptr : it->second.get();
}

network_to_zoning_data network_reader::create_network_to_zoning_data()
{
    if (!completed_)
        throw make_exception_macro(invalid_state_exception, "network to zoning data is only available once the network reader completed");

    std::map<std::string, layer_state*> states;
    for (auto& [id, parser] : parsers_)
        states.emplace(id, &parser->get_layer_state());

    return network_to_zoning_data{network_, data_.get_osm_node_table(), data_.get_network_bounding_box(), std::move(states)};
}

void network_reader::reset()
{
    data_.reset();
    for (auto& [id, parser] : parsers_)
        parser->reset();
    stats_ = statistics{};
    completed_ = false;
}

}// namespace osmnet::reader
