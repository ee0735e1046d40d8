#include <osmnet/geo/location.h>

#include <util/geo/Geo.h>

#include <osmium/geom/coordinates.hpp>
#include <osmium/geom/haversine.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace osmnet::geo
{
namespace
{
constexpr double METRES_PER_DEGREE = 111319.49;
constexpr double PI = 3.14159265358979323846;
}

std::optional<size_t> find_coordinate_index(const line_string& line, const location& loc)
{
    auto it = std::find(line.begin(), line.end(), loc);
    if (it == line.end())
        return std::nullopt;
    return static_cast<size_t>(std::distance(line.begin(), it));
}

std::optional<coordinate_position> find_coordinate_position(const line_string& line, const location& loc)
{
    auto index = find_coordinate_index(line, loc);
    if (!index)
        return std::nullopt;

    if (*index == 0)
        return coordinate_position::first;
    if (*index == line.size() - 1)
        return coordinate_position::last;

    return coordinate_position::internal;
}

std::optional<projection> project_on(const line_string& line, const location& loc)
{
    if (line.size() < 2)
        return std::nullopt;

    std::optional<projection> best;
    for (size_t i = 0; i + 1 < line.size(); ++i)
    {
        auto candidate = util::geo::projectOn(line[i], loc, line[i + 1]);
        double d = util::geo::dist(candidate, loc);
        if (!best || d < best->distance)
        {
            best = projection{candidate, i, d};
        }
    }
    return best;
}

double distance_in_metres(const location& a, const location& b)
{
    return osmium::geom::haversine::distance(osmium::geom::Coordinates{a.getX(), a.getY()},
                                             osmium::geom::Coordinates{b.getX(), b.getY()});
}

box envelope_around(const location& loc, double metres)
{
    return envelope_around(util::geo::getBoundingBox(loc), metres);
}

box envelope_around(const box& b, double metres)
{
    double dy = metres / METRES_PER_DEGREE;
    double lat = std::max(std::fabs(b.getLowerLeft().getY()), std::fabs(b.getUpperRight().getY()));
    double cos_lat = std::max(0.01, std::cos(lat * PI / 180.0));
    double dx = dy / cos_lat;

    return box{location{b.getLowerLeft().getX() - dx, b.getLowerLeft().getY() - dy},
               location{b.getUpperRight().getX() + dx, b.getUpperRight().getY() + dy}};
}

std::string to_string(const location& loc)
{
    std::ostringstream oss;
    oss.precision(9);
    oss << loc;
    return oss.str();
}

}// namespace osmnet::geo
