#include <osmnet/network/node.h>

#include <algorithm>

namespace osmnet::network
{

node::node(size_t id, const geo::location& position, std::optional<osm::osmid> external_id) :
    id_{id},
    position_{position},
    external_id_{external_id}
{
}

void node::add_link(link* l)
{
    if (std::find(links_.begin(), links_.end(), l) == links_.end())
        links_.push_back(l);
}

void node::remove_link(const link* l)
{
    links_.erase(std::remove(links_.begin(), links_.end(), l), links_.end());
}

}// namespace osmnet::network
