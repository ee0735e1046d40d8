#ifndef OSMNET_GEO_LOCATION_H_
#define OSMNET_GEO_LOCATION_H_

#include <util/geo/Box.h>
#include <util/geo/Line.h>
#include <util/geo/Point.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace osmnet::geo
{
// x is the longitude, y the latitude. Two locations are the same entity
// if and only if their coordinates are exactly equal.
using location = util::geo::Point<double>;
using location_hash = util::geo::PointHash<double>;
using line_string = util::geo::Line<double>;
using box = util::geo::Box<double>;

template<typename V>
using location_map = std::unordered_map<location, V, location_hash>;
using location_set = std::unordered_set<location, location_hash>;

inline location make_location(double lon, double lat)
{
    return location{lon, lat};
}

enum class coordinate_position
{
    first,
    internal,
    last
};

// exact coordinate search, first occurrence
std::optional<size_t> find_coordinate_index(const line_string& line, const location& loc);

// position of loc on the line, empty when loc is not one of its coordinates
std::optional<coordinate_position> find_coordinate_position(const line_string& line, const location& loc);

// closest point on the line and the index of the segment it lies on
struct projection
{
    location point;
    size_t segment_index;
    double distance;
};

std::optional<projection> project_on(const line_string& line, const location& loc);

// distance in metres between two WGS84 locations
double distance_in_metres(const location& a, const location& b);

// box around loc extended by the given distance in metres
box envelope_around(const location& loc, double metres);
box envelope_around(const box& b, double metres);

std::string to_string(const location& loc);

}// namespace osmnet::geo

#endif//OSMNET_GEO_LOCATION_H_
