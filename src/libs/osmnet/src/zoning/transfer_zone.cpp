#include <osmnet/zoning/transfer_zone.h>

#include <exceptions/exceptions.h>
#include <util/geo/Geo.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace osmnet::zoning
{

std::ostream& operator<<(std::ostream& os, const transfer_zone_key& key)
{
    return os << key.type << "/" << key.id;
}

transfer_zone::transfer_zone(size_t id, transfer_zone_key key, osm::transfer_zone_type type, geo::line_string geometry) :
    id_{id},
    key_{key},
    type_{type},
    geometry_{std::move(geometry)}
{
    if (geometry_.empty())
    {
        std::ostringstream oss;
        oss << "transfer zone " << key_ << " requires a geometry";
        throw make_exception_macro(invalid_parameter_exception, oss.str());
    }
    bounding_box_ = util::geo::getBoundingBox(geometry_);
}

void transfer_zone::add_layer(const std::string& layer)
{
    if (!serves_layer(layer))
        layers_.push_back(layer);
}

bool transfer_zone::serves_layer(const std::string& layer) const
{
    return layers_.empty() || std::find(layers_.begin(), layers_.end(), layer) != layers_.end();
}

double transfer_zone::distance_in_metres_to(const geo::location& loc) const
{
    if (is_point())
        return geo::distance_in_metres(geometry_.front(), loc);

    auto projection = geo::project_on(geometry_, loc);
    return geo::distance_in_metres(projection->point, loc);
}

void transfer_zone::add_connectoid(connectoid* c)
{
    if (c != nullptr && std::find(connectoids_.begin(), connectoids_.end(), c) == connectoids_.end())
        connectoids_.push_back(c);
}

}// namespace osmnet::zoning
