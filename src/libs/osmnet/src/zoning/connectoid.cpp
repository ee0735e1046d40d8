#include <osmnet/zoning/connectoid.h>

#include <exceptions/exceptions.h>

#include <algorithm>
#include <utility>

namespace osmnet::zoning
{

connectoid::connectoid(size_t id, std::string layer, network::node* access_node, std::optional<osm::osmid> stop_position) :
    id_{id},
    layer_{std::move(layer)},
    access_node_{access_node},
    stop_position_{stop_position}
{
    if (access_node_ == nullptr)
        throw make_exception_macro(null_pointer_exception, "connectoid on layer " + layer_ + " requires an access node");
}

bool connectoid::has_transfer_zone(const transfer_zone* zone) const
{
    return std::find(zones_.begin(), zones_.end(), zone) != zones_.end();
}

void connectoid::add_transfer_zone(transfer_zone* zone)
{
    if (zone != nullptr && !has_transfer_zone(zone))
        zones_.push_back(zone);
}

}// namespace osmnet::zoning
