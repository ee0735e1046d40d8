#ifndef OSMNET_CONFIG_CONFIG_READER_H_
#define OSMNET_CONFIG_CONFIG_READER_H_

#include <osmnet/config/settings.h>

#include <string>

namespace osmnet::config
{

class config_reader
{
public:
    explicit config_reader(settings& cfg);

    // throws configuration_exception on invalid option values
    void read(int argc, char** argv);
    void help(const char* bin);

    static geo::box parse_bounding_box(const std::string& value);
    static std::vector<std::string> parse_layers(const std::string& value);

private:
    settings& settings_;
};
}// namespace osmnet::config
#endif//OSMNET_CONFIG_CONFIG_READER_H_
