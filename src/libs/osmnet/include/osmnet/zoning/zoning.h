#ifndef OSMNET_ZONING_ZONING_H_
#define OSMNET_ZONING_ZONING_H_

#include <osmnet/zoning/connectoid.h>
#include <osmnet/zoning/transfer_zone.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace osmnet::zoning
{

// Owns the transfer zones and connectoids of a public transport zoning
class zoning
{
public:
    zoning() = default;

    zoning(const zoning&) = delete;
    zoning& operator=(const zoning&) = delete;

    // throws invalid_parameter_exception when the key is already in use
    transfer_zone* create_transfer_zone(const transfer_zone_key& key, osm::transfer_zone_type type, geo::line_string geometry);

    connectoid* create_connectoid(const std::string& layer, network::node* access_node, std::optional<osm::osmid> stop_position = std::nullopt);

    transfer_zone* find_transfer_zone(size_t id) const;
    transfer_zone* find_transfer_zone(const transfer_zone_key& key) const;

    connectoid* find_connectoid(size_t id) const;

    // in creation order
    std::vector<transfer_zone*> get_transfer_zones() const;
    std::vector<connectoid*> get_connectoids() const;

    size_t get_number_of_transfer_zones() const
    {
        return zones_.size();
    }

    size_t get_number_of_connectoids() const
    {
        return connectoids_.size();
    }

    void clear();

private:
    size_t next_zone_id_{0};
    size_t next_connectoid_id_{0};
    std::map<size_t, std::unique_ptr<transfer_zone>> zones_;
    std::map<transfer_zone_key, size_t> zones_by_key_;
    std::map<size_t, std::unique_ptr<connectoid>> connectoids_;
};

}// namespace osmnet::zoning

#endif//OSMNET_ZONING_ZONING_H_
