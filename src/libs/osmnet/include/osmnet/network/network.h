#ifndef OSMNET_NETWORK_NETWORK_H_
#define OSMNET_NETWORK_NETWORK_H_

#include <osmnet/network/network_layer.h>

#include <memory>
#include <string>
#include <vector>

namespace osmnet::network
{

class network
{
public:
    explicit network(std::string country_name = "");

    network(const network&) = delete;
    network& operator=(const network&) = delete;

    const std::string& get_country_name() const
    {
        return country_name_;
    }

    // throws when a layer with the same id exists
    network_layer& add_layer(const std::string& id);

    network_layer* find_layer(const std::string& id) const;
    std::vector<network_layer*> get_layers() const;

    size_t get_number_of_layers() const
    {
        return layers_.size();
    }

    bool is_empty() const;

    link* find_link(size_t id) const;

    geo::box get_bounding_box() const;

    // removes all nodes and links, layers remain
    void clear();

private:
    std::string country_name_;
    std::shared_ptr<id_generator> ids_;
    std::vector<std::unique_ptr<network_layer>> layers_;
};

}// namespace osmnet::network

#endif//OSMNET_NETWORK_NETWORK_H_
