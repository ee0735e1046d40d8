#include <osmnet/network/network.h>

#include <exceptions/exceptions.h>
#include <util/geo/Geo.h>

#include <utility>

namespace osmnet::network
{

network::network(std::string country_name) :
    country_name_{std::move(country_name)},
    ids_{std::make_shared<id_generator>()}
{
}

network_layer& network::add_layer(const std::string& id)
{
    if (find_layer(id) != nullptr)
        throw make_exception_macro(invalid_parameter_exception, "network layer " + id + " already exists");

    layers_.push_back(std::make_unique<network_layer>(id, ids_));
    return *layers_.back();
}

network_layer* network::find_layer(const std::string& id) const
{
    for (const auto& layer : layers_)
    {
        if (layer->get_id() == id)
            return layer.get();
    }
    return nullptr;
}

std::vector<network_layer*> network::get_layers() const
{
    std::vector<network_layer*> ret;
    for (const auto& layer : layers_)
        ret.push_back(layer.get());
    return ret;
}

bool network::is_empty() const
{
    for (const auto& layer : layers_)
    {
        if (layer->get_number_of_nodes() > 0)
            return false;
    }
    return true;
}

link* network::find_link(size_t id) const
{
    for (const auto& layer : layers_)
    {
        if (auto* l = layer->find_link(id))
            return l;
    }
    return nullptr;
}

geo::box network::get_bounding_box() const
{
    geo::box ret;
    for (const auto& layer : layers_)
        ret = util::geo::extendBox(layer->get_bounding_box(), ret);
    return ret;
}

void network::clear()
{
    for (auto& layer : layers_)
        layer->clear();
}

}// namespace osmnet::network
