#ifndef OSMNET_ZONING_TRANSFER_ZONE_H_
#define OSMNET_ZONING_TRANSFER_ZONE_H_

#include <osmnet/geo/location.h>
#include <osmnet/osm/osm.h>
#include <osmnet/osm/tag_classifier.h>

#include <ostream>
#include <string>
#include <vector>

namespace osmnet::zoning
{
class connectoid;

// OSM entity a transfer zone was derived from
struct transfer_zone_key
{
    osm::entity_type type;
    osm::osmid id;

    bool operator==(const transfer_zone_key& other) const
    {
        return type == other.type && id == other.id;
    }

    bool operator!=(const transfer_zone_key& other) const
    {
        return !(*this == other);
    }

    bool operator<(const transfer_zone_key& other) const
    {
        return type < other.type || (type == other.type && id < other.id);
    }
};

std::ostream& operator<<(std::ostream& os, const transfer_zone_key& key);

/*
 * Waiting area of a public transport stop: a platform, pole or station. The
 * geometry is a single location for OSM nodes, the outline for OSM ways.
 */
class transfer_zone
{
public:
    transfer_zone(size_t id, transfer_zone_key key, osm::transfer_zone_type type, geo::line_string geometry);

    size_t get_id() const
    {
        return id_;
    }

    const transfer_zone_key& get_key() const
    {
        return key_;
    }

    osm::transfer_zone_type get_type() const
    {
        return type_;
    }

    const std::string& get_name() const
    {
        return name_;
    }

    void set_name(const std::string& name)
    {
        name_ = name;
    }

    const geo::line_string& get_geometry() const
    {
        return geometry_;
    }

    bool is_point() const
    {
        return geometry_.size() == 1;
    }

    const geo::box& get_bounding_box() const
    {
        return bounding_box_;
    }

    // layers the zone serves, empty when unknown
    const std::vector<std::string>& get_layers() const
    {
        return layers_;
    }

    void set_layers(std::vector<std::string> layers)
    {
        layers_ = std::move(layers);
    }

    // adds the layer unless the zone already serves it
    void add_layer(const std::string& layer);

    bool serves_layer(const std::string& layer) const;

    // shortest distance between loc and the zone geometry
    double distance_in_metres_to(const geo::location& loc) const;

    const std::vector<connectoid*>& get_connectoids() const
    {
        return connectoids_;
    }

    void add_connectoid(connectoid* c);

private:
    size_t id_;
    transfer_zone_key key_;
    osm::transfer_zone_type type_;
    std::string name_;
    geo::line_string geometry_;
    geo::box bounding_box_;
    std::vector<std::string> layers_;
    std::vector<connectoid*> connectoids_;
};

}// namespace osmnet::zoning

#endif//OSMNET_ZONING_TRANSFER_ZONE_H_
