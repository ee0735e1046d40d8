#include "app.h"

#include <osmnet/config/config_reader.h>
#include <osmnet/reader/network_reader.h>
#include <osmnet/zoning/zoning_reader.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>
#include <logging/scoped_timer.h>

#include <stdexcept>

namespace
{
bool read_config(osmnet::config::settings& cfg, int argc, char** argv)
{
    try
    {
        osmnet::config::config_reader reader(cfg);
        reader.read(argc, argv);
    }
    catch (const configuration_exception& e)
    {
        LOG(ERROR) << e.what();
        return false;
    }

    logging::options opts;
    opts.console_level = logging::parse_level(cfg.log_level);
    opts.directory = cfg.log_directory;
    opts.use_syslog = cfg.use_syslog;
    logging::configure_logging(opts);
    LOG(DEBUG) << "console logging at level " << logging::level_name(opts.console_level);
    return true;
}
}// namespace

app::app(int argc, char** argv) :
    cfg_{},
    has_config_{read_config(cfg_, argc, argv)},
    network_{std::make_shared<osmnet::network::network>(cfg_.country_name)},
    zoning_{std::make_shared<osmnet::zoning::zoning>()}
{
}

ret_code app::run()
{
    if (!has_config_)
        return ret_code::CFG_ERR;

    if (cfg_.osm_path.empty())
    {
        LOG_ERROR() << "No OSM input file specified (-x), see --help.";
        return ret_code::NO_OSM_INPUT;
    }

    try
    {
        osmnet::reader::network_reader network_reader(cfg_, classifier_, network_);
        try
        {
            network_reader.read(cfg_.osm_path);
        }
        catch (const unsupported_format_exception& e)
        {
            LOG(ERROR) << "Could not read the network: " << e.what();
            return ret_code::OSM_PARSE_ERR;
        }

        if (cfg_.read_zoning)
        {
            osmnet::zoning::zoning_reader zoning_reader(cfg_, classifier_, network_reader.create_network_to_zoning_data(), zoning_);
            try
            {
                zoning_reader.read(cfg_.osm_path);
            }
            catch (const unsupported_format_exception& e)
            {
                LOG(ERROR) << "Could not read the zoning: " << e.what();
                return ret_code::ZONING_PARSE_ERR;
            }
        }
        else
        {
            LOG(INFO) << "Zoning disabled, only the network is read";
        }

        log_summary(network_reader);
    }
    catch (const configuration_exception& e)
    {
        LOG(ERROR) << e.what();
        return ret_code::CFG_ERR;
    }

    return ret_code::SUCCESS;
}

void app::log_summary(const osmnet::reader::network_reader& network_reader) const
{
    for (const auto* layer : network_->get_layers())
    {
        size_t split_ways = 0;
        if (const auto* parser = network_reader.find_layer_parser(layer->get_id()))
            split_ways = parser->get_layer_state().number_of_ways_with_multiple_links();

        LOG(INFO) << "[" << layer->get_id() << "] " << layer->get_number_of_nodes() << " nodes, "
                  << layer->get_number_of_links() << " links, "
                  << split_ways << " OSM ways with multiple links";
    }

    if (!cfg_.read_zoning)
        return;

    size_t complete = 0;
    for (const auto* zone : zoning_->get_transfer_zones())
    {
        if (!zone->get_connectoids().empty())
            ++complete;
    }
    LOG(INFO) << "transfer zones: " << zoning_->get_number_of_transfer_zones() << " (" << complete << " connected, "
              << zoning_->get_number_of_transfer_zones() - complete << " not connected), connectoids: "
              << zoning_->get_number_of_connectoids();
}
