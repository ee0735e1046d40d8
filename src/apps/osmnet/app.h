#ifndef OSMNET_APP_H
#define OSMNET_APP_H

#include <osmnet/config/settings.h>
#include <osmnet/network/network.h>
#include <osmnet/osm/tag_classifier.h>
#include <osmnet/zoning/zoning.h>

#include <memory>

namespace osmnet::reader
{
class network_reader;
}

enum class ret_code
{
    SUCCESS = 0,
    NO_OSM_INPUT = 1,
    CFG_ERR = 2,
    OSM_PARSE_ERR = 3,
    ZONING_PARSE_ERR = 4
};

class app
{
public:
    app(int argc, char* argv[]);
    ret_code run();

private:
    void log_summary(const osmnet::reader::network_reader& network_reader) const;

    osmnet::config::settings cfg_;
    bool has_config_;
    osmnet::osm::default_tag_classifier classifier_;
    std::shared_ptr<osmnet::network::network> network_;
    std::shared_ptr<osmnet::zoning::zoning> zoning_;
};

#endif//OSMNET_APP_H
