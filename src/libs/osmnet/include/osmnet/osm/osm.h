#ifndef OSMNET_OSM_OSM_H_
#define OSMNET_OSM_OSM_H_

#include <osmnet/geo/location.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace osmnet::osm
{

using osmid = uint64_t;
using attribute_map = std::unordered_map<std::string, std::string>;
using osmid_list = std::vector<osmid>;

enum class entity_type
{
    node,
    way,
    relation
};

std::ostream& operator<<(std::ostream& os, entity_type type);

struct osm_element
{
    osmid id{0};
    attribute_map attrs;

    bool has_tag(const std::string& key) const;
    bool has_tag(const std::string& key, const std::string& value) const;
    std::optional<std::string> get_tag(const std::string& key) const;
};

struct osm_node : public osm_element
{
    double lat{0};
    double lng{0};

    geo::location position() const
    {
        return geo::make_location(lng, lat);
    }
};

struct osm_way : public osm_element
{
    osmid_list nodes;

    // first node equals last node
    bool is_perfect_loop() const;

    // first two indices (from offset on) referencing the same node
    std::optional<std::pair<size_t, size_t>> find_first_loop(size_t offset = 0) const;

    // any node referenced at least twice
    bool has_loop() const
    {
        return find_first_loop().has_value();
    }
};

struct osm_member
{
    entity_type type;
    osmid ref;
    std::string role;
};

struct osm_relation : public osm_element
{
    std::vector<osm_member> members;
};

}// namespace osmnet::osm

#endif//OSMNET_OSM_OSM_H_
