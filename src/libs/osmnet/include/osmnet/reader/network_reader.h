#ifndef OSMNET_READER_NETWORK_READER_H_
#define OSMNET_READER_NETWORK_READER_H_

#include <osmnet/config/settings.h>
#include <osmnet/network/network.h>
#include <osmnet/osm/osm.h>
#include <osmnet/osm/tag_classifier.h>
#include <osmnet/reader/layer_parser.h>
#include <osmnet/reader/network_reader_data.h>
#include <osmnet/reader/network_to_zoning_data.h>

#include <map>
#include <memory>
#include <string>

namespace osmnet::reader
{

/*
 * Populates a network from an OSM entity stream, one layer parser per
 * activated layer. Entities are handed over pass by pass: ways for the
 * referenced nodes, then nodes, then ways, then complete().
 */
class network_reader
{
public:
    struct statistics
    {
        size_t kept_nodes{0};
        size_t nodes_outside_bounding_box{0};
        size_t network_ways{0};
        size_t postponed_circular_ways{0};
    };

    network_reader(const config::settings& settings, const osm::tag_classifier& classifier, std::shared_ptr<network::network> net);

    network_reader(const network_reader&) = delete;
    network_reader& operator=(const network_reader&) = delete;

    // reads the file in three passes and completes the network
    void read(const std::string& path);

    void preprocess_way(const osm::osm_way& way);
    void handle_node(const osm::osm_node& node);
    void handle_way(const osm::osm_way& way);
    void handle_relation(const osm::osm_relation& relation);

    // circular ways, then breaking of links per layer
    void complete();

    bool is_completed() const
    {
        return completed_;
    }

    layer_parser* find_layer_parser(const std::string& layer) const;

    network_reader_data& get_reader_data()
    {
        return data_;
    }

    const std::shared_ptr<network::network>& get_network() const
    {
        return network_;
    }

    const statistics& get_statistics() const
    {
        return stats_;
    }

    // throws invalid_state_exception before complete()
    network_to_zoning_data create_network_to_zoning_data();

    // clears the reader state for another parse, the populated network is left as is
    void reset();

private:
    const config::settings* settings_;
    const osm::tag_classifier* classifier_;
    std::shared_ptr<network::network> network_;
    network_reader_data data_;
    std::map<std::string, std::unique_ptr<layer_parser>> parsers_;
    statistics stats_;
    bool completed_{false};
};

}// namespace osmnet::reader

#endif//OSMNET_READER_NETWORK_READER_H_
