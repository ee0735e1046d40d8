#include <osmnet/config/config_reader.h>
#include <osmnet/osm/tag_classifier.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>

#include <getopt.h>
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifndef OSMNET_VERSION
#define OSMNET_VERSION "unknown"
#endif

namespace osmnet::config
{
static const char* YEAR = static_cast<const char*>(__DATE__) + 7;

namespace
{
std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& s, char separator)
{
    std::vector<std::string> ret;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, separator))
        ret.push_back(trim(item));
    return ret;
}

double parse_double(const std::string& option, const std::string& value)
{
    try
    {
        size_t consumed = 0;
        double ret = std::stod(value, &consumed);
        if (consumed != value.size())
            throw make_exception_macro(configuration_exception, "invalid value '" + value + "' for option " + option);
        return ret;
    }
    catch (const std::invalid_argument&)
    {
        throw make_exception_macro(configuration_exception, "invalid value '" + value + "' for option " + option);
    }
    catch (const std::out_of_range&)
    {
        throw make_exception_macro(configuration_exception, "value '" + value + "' out of range for option " + option);
    }
}

double parse_positive(const std::string& option, const std::string& value)
{
    double ret = parse_double(option, value);
    if (ret <= 0)
        throw make_exception_macro(configuration_exception, "option " + option + " requires a positive value, got " + value);
    return ret;
}
}// namespace

// _____________________________________________________________________________
void config_reader::help(const char* bin)
{
    std::cout << std::setfill(' ') << std::left << "osmnet OSM transport network converter "
              << OSMNET_VERSION << "\n(built " << __DATE__ << " " << __TIME__ << ")\n\n"
              << "Usage: " << bin
              << " -x <OSM FILE>\n\n"
              << "Allowed options:\n\n"
              << "General:\n"
              << std::setw(35) << "  -v [ --version ]"
              << "print version\n"
              << std::setw(35) << "  -h [ --help ]"
              << "show this help message\n"
              << std::setw(35) << "  -p"
              << "print the configured options\n"
              << "\nInput:\n"
              << std::setw(35) << "  -x [ --osm-file ] arg"
              << "OSM input file (.osm, .osm.bz2, .osm.pbf)\n"
              << std::setw(35) << "  -c [ --country ] arg"
              << "country the input belongs to\n"
              << std::setw(35) << "  -l [ --layers ] arg (=road,rail)"
              << "network layers to build, comma sep.\n"
              << std::setw(35) << "  -b [ --bbox ] arg"
              << "only keep nodes inside the box\n"
              << std::setw(35) << " "
              << "  min_lon,min_lat,max_lon,max_lat\n"
              << "\nZoning:\n"
              << std::setw(35) << "  --no-zoning"
              << "only build the network\n"
              << std::setw(35) << "  --stop-radius arg (=25)"
              << "metres between a stop position and the\n"
              << std::setw(35) << " "
              << "  transfer zones it may serve\n"
              << std::setw(35) << "  --link-radius arg (=50)"
              << "metres between a stand-alone transfer\n"
              << std::setw(35) << " "
              << "  zone and the link it connects to\n"
              << "\nMisc:\n"
              << std::setw(35) << "  -g [ --grid-size ] arg (=0.01)"
              << "spatial grid cell size, degrees\n"
              << std::setw(35) << "  --log-level arg (=info)"
              << "console log level\n"
              << std::setw(35) << "  --log-dir arg (=logs)"
              << "directory of the log file\n"
              << std::setw(35) << "  --syslog"
              << "also log to syslog\n";
}

config_reader::config_reader(settings& cfg) :
    settings_{cfg}
{
}

// _____________________________________________________________________________
void config_reader::read(int argc, char** argv)
{
    struct option ops[] = {{"osm-file", required_argument, nullptr, 'x'},
                           {"country", required_argument, nullptr, 'c'},
                           {"layers", required_argument, nullptr, 'l'},
                           {"bbox", required_argument, nullptr, 'b'},
                           {"grid-size", required_argument, nullptr, 'g'},
                           {"stop-radius", required_argument, nullptr, 1},
                           {"link-radius", required_argument, nullptr, 2},
                           {"no-zoning", no_argument, nullptr, 3},
                           {"log-level", required_argument, nullptr, 4},
                           {"log-dir", required_argument, nullptr, 5},
                           {"syslog", no_argument, nullptr, 6},
                           {"version", no_argument, nullptr, 'v'},
                           {"help", no_argument, nullptr, 'h'},
                           {nullptr, 0, nullptr, 0}};

    // full rescan, read may be called more than once per process
    optind = 0;

    int c = 0;
    while ((c = getopt_long(argc, argv, ":x:c:l:b:g:hvp", ops, nullptr)) != -1)
    {
        switch (c)
        {
            case 1:
                settings_.stop_search_radius = parse_positive("--stop-radius", optarg);
                break;
            case 2:
                settings_.link_search_radius = parse_positive("--link-radius", optarg);
                break;
            case 3:
                settings_.read_zoning = false;
                break;
            case 4:
                try
                {
                    logging::parse_level(optarg);
                }
                catch (const std::invalid_argument& e)
                {
                    throw make_exception_macro(configuration_exception, e.what());
                }
                settings_.log_level = optarg;
                break;
            case 5:
                settings_.log_directory = optarg;
                break;
            case 6:
                settings_.use_syslog = true;
                break;
            case 'x':
                settings_.osm_path = optarg;
                break;
            case 'c':
                settings_.country_name = optarg;
                break;
            case 'l':
                settings_.layers = parse_layers(optarg);
                break;
            case 'b':
                settings_.bounding_box = parse_bounding_box(optarg);
                break;
            case 'g':
                settings_.grid_size = parse_positive("--grid-size", optarg);
                break;
            case 'v':
                std::cout << "osmnet " << OSMNET_VERSION << " (built " << __DATE__ << " " << __TIME__ << ")\n"
                          << "(C) " << YEAR << "\n";
                exit(0);
            case 'p':
                settings_.print_options = true;
                break;
            case 'h':
                help(argv[0]);
                exit(0);
            case ':':
                throw make_exception_macro(configuration_exception, std::string(argv[optind - 1]) + " requires an argument");
            case '?':
                throw make_exception_macro(configuration_exception, std::string(argv[optind - 1]) + " option unknown");
            default:
                throw make_exception_macro(configuration_exception, "error while parsing arguments");
        }
    }

    if (optind < argc && settings_.osm_path.empty())
        settings_.osm_path = argv[optind];

    if (settings_.print_options)
    {
        LOG_INFO() << "\nConfigured options:\n\n"
                   << settings_.to_string();
    }
}

geo::box config_reader::parse_bounding_box(const std::string& value)
{
    auto parts = split(value, ',');
    if (parts.size() != 4)
        throw make_exception_macro(configuration_exception, "bounding box requires min_lon,min_lat,max_lon,max_lat, got " + value);

    double min_lon = parse_double("--bbox", parts[0]);
    double min_lat = parse_double("--bbox", parts[1]);
    double max_lon = parse_double("--bbox", parts[2]);
    double max_lat = parse_double("--bbox", parts[3]);
    if (min_lon > max_lon || min_lat > max_lat)
        throw make_exception_macro(configuration_exception, "empty bounding box " + value);

    return geo::box{geo::make_location(min_lon, min_lat), geo::make_location(max_lon, max_lat)};
}

std::vector<std::string> config_reader::parse_layers(const std::string& value)
{
    std::vector<std::string> layers;
    for (const auto& layer : split(value, ','))
    {
        if (layer.empty())
            continue;
        if (layer != osm::default_tag_classifier::ROAD_LAYER && layer != osm::default_tag_classifier::RAIL_LAYER)
            throw make_exception_macro(configuration_exception, "unknown layer " + layer);
        if (std::find(layers.begin(), layers.end(), layer) == layers.end())
            layers.push_back(layer);
    }
    if (layers.empty())
        throw make_exception_macro(configuration_exception, "at least one layer is required");
    return layers;
}
}// namespace osmnet::config
