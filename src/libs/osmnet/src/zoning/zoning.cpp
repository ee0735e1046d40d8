#include <osmnet/zoning/zoning.h>

#include <exceptions/exceptions.h>

#include <sstream>
#include <utility>

namespace osmnet::zoning
{

transfer_zone* zoning::create_transfer_zone(const transfer_zone_key& key, osm::transfer_zone_type type, geo::line_string geometry)
{
    if (zones_by_key_.count(key) > 0)
    {
        std::ostringstream oss;
        oss << "transfer zone " << key << " already exists";
        throw make_exception_macro(invalid_parameter_exception, oss.str());
    }

    auto id = next_zone_id_++;
    auto zone = std::make_unique<transfer_zone>(id, key, type, std::move(geometry));
    auto* ret = zone.get();
    zones_.emplace(id, std::move(zone));
    zones_by_key_.emplace(key, id);
    return ret;
}

connectoid* zoning::create_connectoid(const std::string& layer, network::node* access_node, std::optional<osm::osmid> stop_position)
{
    auto id = next_connectoid_id_++;
    auto c = std::make_unique<connectoid>(id, layer, access_node, stop_position);
    auto* ret = c.get();
    connectoids_.emplace(id, std::move(c));
    return ret;
}

transfer_zone* zoning::find_transfer_zone(size_t id) const
{
    auto it = zones_.find(id);
    return it == zones_.end() ? nullptr : it->second.get();
}

transfer_zone* zoning::find_transfer_zone(const transfer_zone_key& key) const
{
    auto it = zones_by_key_.find(key);
    return it == zones_by_key_.end() ? nullptr : find_transfer_zone(it->second);
}

connectoid* zoning::find_connectoid(size_t id) const
{
    auto it = connectoids_.find(id);
    return it == connectoids_.end() ? nullptr : it->second.get();
}

std::vector<transfer_zone*> zoning::get_transfer_zones() const
{
    std::vector<transfer_zone*> ret;
    ret.reserve(zones_.size());
    for (const auto& [id, zone] : zones_)
        ret.push_back(zone.get());
    return ret;
}

std::vector<connectoid*> zoning::get_connectoids() const
{
    std::vector<connectoid*> ret;
    ret.reserve(connectoids_.size());
    for (const auto& [id, c] : connectoids_)
        ret.push_back(c.get());
    return ret;
}

void zoning::clear()
{
    connectoids_.clear();
    zones_by_key_.clear();
    zones_.clear();
    next_zone_id_ = 0;
    next_connectoid_id_ = 0;
}

}// namespace osmnet::zoning
