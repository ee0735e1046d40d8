#include <osmnet/osm/tag_classifier.h>

#include <utility>

namespace osmnet::osm
{
namespace
{
const default_tag_classifier::multi_attribute_map DEFAULT_KEEP = {
        {"highway", {"motorway", "motorway_link", "trunk", "trunk_link", "primary", "primary_link",
                     "secondary", "secondary_link", "tertiary", "tertiary_link", "unclassified",
                     "residential", "living_street", "service", "road", "busway", "bus_guideway"}},
        {"railway", {"rail", "light_rail", "tram", "subway", "narrow_gauge", "monorail", "funicular"}}};

const default_tag_classifier::multi_attribute_map DEFAULT_DROP = {
        {"area", {"yes"}},
        {"access", {"no", "private"}}};

const std::set<std::string> RAIL_STOP_KEYS = {"train", "tram", "subway", "light_rail", "monorail", "funicular"};
const std::set<std::string> ROAD_STOP_KEYS = {"bus", "trolleybus", "share_taxi", "coach"};
}// namespace

std::ostream& operator<<(std::ostream& os, transfer_zone_type type)
{
    switch (type)
    {
        case transfer_zone_type::platform:
            return os << "platform";
        case transfer_zone_type::station:
            return os << "station";
        case transfer_zone_type::pole:
            return os << "pole";
        case transfer_zone_type::unknown:
            break;
    }
    return os << "unknown";
}

default_tag_classifier::default_tag_classifier() :
    default_tag_classifier(DEFAULT_KEEP, DEFAULT_DROP)
{
}

default_tag_classifier::default_tag_classifier(multi_attribute_map keep, multi_attribute_map drop) :
    keep_{std::move(keep)},
    drop_{std::move(drop)}
{
}

bool default_tag_classifier::contained(const attribute_map& tags, const multi_attribute_map& rules)
{
    for (const auto& [key, value] : tags)
    {
        auto rule = rules.find(key);
        if (rule == rules.end())
            continue;
        if (rule->second.empty() || rule->second.count(value) || rule->second.count("*"))
            return true;
    }
    return false;
}

bool default_tag_classifier::is_network_way(const attribute_map& tags) const
{
    return contained(tags, keep_) && !contained(tags, drop_);
}

std::vector<std::string> default_tag_classifier::layers_for_way(const attribute_map& tags) const
{
    std::vector<std::string> layers;
    if (!is_network_way(tags))
        return layers;

    auto keep_key = [&](const std::string& key) {
        auto tag = tags.find(key);
        auto rule = keep_.find(key);
        return tag != tags.end() && rule != keep_.end() &&
               (rule->second.empty() || rule->second.count(tag->second) || rule->second.count("*"));
    };

    if (keep_key("highway"))
        layers.emplace_back(ROAD_LAYER);
    if (keep_key("railway"))
        layers.emplace_back(RAIL_LAYER);
    return layers;
}

bool default_tag_classifier::is_transfer_zone(const attribute_map& tags) const
{
    return get_transfer_zone_type(tags) != transfer_zone_type::unknown;
}

transfer_zone_type default_tag_classifier::get_transfer_zone_type(const attribute_map& tags) const
{
    auto pt = tags.find("public_transport");
    if (pt != tags.end())
    {
        if (pt->second == "platform")
            return transfer_zone_type::platform;
        if (pt->second == "station")
            return transfer_zone_type::station;
    }

    auto highway = tags.find("highway");
    if (highway != tags.end())
    {
        if (highway->second == "bus_stop")
            return transfer_zone_type::pole;
        if (highway->second == "platform")
            return transfer_zone_type::platform;
    }

    auto railway = tags.find("railway");
    if (railway != tags.end())
    {
        if (railway->second == "platform")
            return transfer_zone_type::platform;
        if (railway->second == "station" || railway->second == "halt")
            return transfer_zone_type::station;
        if (railway->second == "tram_stop")
            return transfer_zone_type::pole;
    }

    return transfer_zone_type::unknown;
}

bool default_tag_classifier::is_stop_position(const attribute_map& tags) const
{
    auto pt = tags.find("public_transport");
    return pt != tags.end() && pt->second == "stop_position";
}

std::vector<std::string> default_tag_classifier::layers_for_stop(const attribute_map& tags) const
{
    bool road = false;
    bool rail = false;
    for (const auto& [key, value] : tags)
    {
        if (value != "yes")
            continue;
        road = road || ROAD_STOP_KEYS.count(key) > 0;
        rail = rail || RAIL_STOP_KEYS.count(key) > 0;
    }

    // without explicit modes, fall back on the infrastructure tagging
    if (!road && !rail)
    {
        road = tags.count("highway") > 0;
        rail = tags.count("railway") > 0 || tags.count("train") > 0;
    }
    if (!road && !rail)
    {
        road = true;
        rail = true;
    }

    std::vector<std::string> layers;
    if (road)
        layers.emplace_back(ROAD_LAYER);
    if (rail)
        layers.emplace_back(RAIL_LAYER);
    return layers;
}

bool default_tag_classifier::is_stop_area(const attribute_map& tags) const
{
    auto type = tags.find("type");
    auto pt = tags.find("public_transport");
    return type != tags.end() && type->second == "public_transport" &&
           pt != tags.end() && pt->second == "stop_area";
}

}// namespace osmnet::osm
