#include <osmnet/osm/osm_node_table.h>

namespace osmnet::osm
{

void osm_node_table::register_node(const osm_node& node)
{
    nodes_[node.id] = node;
}

const osm_node* osm_node_table::find(osmid id) const
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

bool osm_node_table::contains(osmid id) const
{
    return nodes_.count(id) > 0;
}

bool osm_node_table::is_all_available(const osm_way& way) const
{
    for (auto id : way.nodes)
    {
        if (!contains(id))
            return false;
    }
    return true;
}

void osm_node_table::clear()
{
    nodes_.clear();
}

}// namespace osmnet::osm
