#ifndef OSMNET_OSM_OSM_NODE_TABLE_H_
#define OSMNET_OSM_OSM_NODE_TABLE_H_

#include <osmnet/osm/osm.h>

#include <optional>
#include <unordered_map>

namespace osmnet::osm
{

// OSM nodes gathered during the network phase, treated as an immutable
// snapshot once node parsing is complete
class osm_node_table
{
public:
    using container = std::unordered_map<osmid, osm_node>;

    void register_node(const osm_node& node);

    const osm_node* find(osmid id) const;
    bool contains(osmid id) const;

    size_t size() const
    {
        return nodes_.size();
    }

    const container& nodes() const
    {
        return nodes_;
    }

    bool is_all_available(const osm_way& way) const;

    void clear();

private:
    container nodes_;
};

}// namespace osmnet::osm

#endif//OSMNET_OSM_OSM_NODE_TABLE_H_
