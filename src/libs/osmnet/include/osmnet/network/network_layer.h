#ifndef OSMNET_NETWORK_NETWORK_LAYER_H_
#define OSMNET_NETWORK_NETWORK_LAYER_H_

#include <osmnet/network/link.h>
#include <osmnet/network/node.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace osmnet::network
{

// ids are unique within a network, shared by all of its layers
struct id_generator
{
    size_t next_node_id{0};
    size_t next_link_id{0};
};

// outcome of breaking one link at an internal node
struct link_break
{
    size_t original_id;
    osm::osmid external_id;
    link* first;
    link* second;
};

/*
 * Mode compatible sub network, owner of its nodes and links.
 */
class network_layer
{
public:
    explicit network_layer(std::string id);
    network_layer(std::string id, std::shared_ptr<id_generator> ids);

    network_layer(const network_layer&) = delete;
    network_layer& operator=(const network_layer&) = delete;

    const std::string& get_id() const
    {
        return id_;
    }

    node* create_node(const geo::location& position, std::optional<osm::osmid> external_id = std::nullopt);

    // geometry must start at a's and end at b's location
    link* create_link(node* a, node* b, geo::line_string geometry, osm::osmid external_id);

    // Splits every link in links at the location of n. Links on which the
    // location is not an internal coordinate are left untouched. Broken links
    // are destroyed, their replacements inherit the external id.
    std::vector<link_break> break_links_at(const std::vector<link*>& links, node* n);

    void remove_links(const std::vector<link*>& links);

    // removes the node together with its adjacent links
    void remove_node(node* n);

    // adds loc as a coordinate of l directly after the coordinate at segment_index
    void inject_coordinate(link* l, size_t segment_index, const geo::location& loc);

    node* find_node(size_t id) const;
    link* find_link(size_t id) const;

    // nodes and links in creation order
    std::vector<node*> get_nodes() const;
    std::vector<link*> get_links() const;

    size_t get_number_of_nodes() const
    {
        return nodes_.size();
    }

    size_t get_number_of_links() const
    {
        return links_.size();
    }

    geo::box get_bounding_box() const;

    // logs inconsistencies between links and nodes, returns their number
    size_t validate() const;

    void clear();

private:
    void destroy_link(link* l);

    std::string id_;
    std::shared_ptr<id_generator> ids_;
    std::map<size_t, std::unique_ptr<node>> nodes_;
    std::map<size_t, std::unique_ptr<link>> links_;
};

}// namespace osmnet::network

#endif//OSMNET_NETWORK_NETWORK_LAYER_H_
