#ifndef OSMNET_CONFIG_SETTINGS_H_
#define OSMNET_CONFIG_SETTINGS_H_

#include <osmnet/geo/location.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace osmnet::config
{

struct settings
{
    std::string osm_path;
    std::string country_name;
    std::vector<std::string> layers{"road", "rail"};
    std::optional<geo::box> bounding_box;
    // cell size of the spatial grids, degrees
    double grid_size{0.01};
    // metres
    double stop_search_radius{25};
    double link_search_radius{50};
    bool read_zoning{true};
    std::string log_level{"info"};
    std::string log_directory{"logs"};
    bool use_syslog{false};
    bool print_options{false};

    std::string to_string() const
    {
        std::stringstream ss;
        ss << "osm-file: " << osm_path << "\n"
           << "country: " << country_name << "\n"
           << "layers: ";

        for (const auto& l : layers)
        {
            ss << l << " ";
        }

        ss << "\nbbox: ";
        if (bounding_box)
        {
            ss << bounding_box->getLowerLeft().getX() << "," << bounding_box->getLowerLeft().getY() << ","
               << bounding_box->getUpperRight().getX() << "," << bounding_box->getUpperRight().getY();
        }
        else
        {
            ss << "none";
        }

        ss << "\ngrid-size: " << grid_size << "\n"
           << "stop-radius: " << stop_search_radius << "\n"
           << "link-radius: " << link_search_radius << "\n"
           << "read-zoning: " << read_zoning << "\n"
           << "log-level: " << log_level << "\n"
           << "log-dir: " << log_directory << "\n"
           << "syslog: " << use_syslog << "\n";

        return ss.str();
    }
};

}// namespace osmnet::config

#endif//OSMNET_CONFIG_SETTINGS_H_
