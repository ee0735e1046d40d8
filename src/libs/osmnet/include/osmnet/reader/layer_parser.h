#ifndef OSMNET_READER_LAYER_PARSER_H_
#define OSMNET_READER_LAYER_PARSER_H_

#include <osmnet/network/network_layer.h>
#include <osmnet/osm/osm.h>
#include <osmnet/reader/layer_state.h>
#include <osmnet/reader/network_reader_data.h>

#include <optional>
#include <vector>

namespace osmnet::reader
{

/*
 * Converts OSM ways into links of a single network layer and, once all ways
 * are known, breaks links wherever they meet at a non extreme location so
 * that every topological intersection becomes a node.
 */
class layer_parser
{
public:
    layer_parser(network::network_layer& layer, network_reader_data& data);

    layer_parser(const layer_parser&) = delete;
    layer_parser& operator=(const layer_parser&) = delete;

    network::network_layer& get_layer() const
    {
        return *layer_;
    }

    layer_state& get_layer_state()
    {
        return state_;
    }

    const layer_state& get_layer_state() const
    {
        return state_;
    }

    // node at the location of the OSM node, created when absent; nullptr if the
    // OSM node is not available
    network::node* extract_node(osm::osmid osm_node_id);

    // Link for the way nodes start..end. Sections of circular ways are never
    // truncated, other sections drop unavailable leading and trailing nodes.
    network::link* extract_partial_osm_way(const osm::osm_way& way, size_t start, size_t end, bool part_of_circular_way);

    // way without any loop, converted into a single link
    network::link* handle_way(const osm::osm_way& way);

    // way with at least one loop somewhere, split into sections
    std::vector<network::link*> handle_raw_circular_way(const osm::osm_way& way);

    // the loop first..last of the way, where both indices refer to the same node
    std::vector<network::link*> handle_perfect_circular_way(const osm::osm_way& way, size_t first, size_t last);

    // true when links were broken at the location of the node
    bool break_links_with_internal_node(network::node* n);

    void break_links_with_internal_connections();

    void complete();

    bool is_completed() const
    {
        return completed_;
    }

    void reset();

private:
    std::vector<network::link*> handle_raw_circular_way(const osm::osm_way& way, size_t initial);

    // creates the link for the way nodes at the given indices, in order
    network::link* extract_link(const osm::osm_way& way, std::vector<size_t> indices, bool allow_truncation);

    // indices start..end, wrapping around the loop first..last when end < start
    static std::vector<size_t> section_indices(size_t start, size_t end, size_t loop_first, size_t loop_last);

    bool is_active(osm::osmid osm_node_id) const;

    network::network_layer* layer_;
    network_reader_data* data_;
    layer_state state_;
    bool completed_{false};
};

}// namespace osmnet::reader

#endif//OSMNET_READER_LAYER_PARSER_H_
