#include "osmium_conversion.h"

#include <exceptions/exceptions.h>

#include <osmium/io/file.hpp>
#include <osmium/io/file_format.hpp>

#include <fstream>

namespace osmnet::osm
{

attribute_map to_attribute_map(const osmium::TagList& tags)
{
    attribute_map attrs;
    for (const auto& tag : tags)
    {
        attrs[tag.key()] = tag.value();
    }
    return attrs;
}

osm_node to_osm_node(const osmium::Node& node)
{
    osm_node n;
    n.id = static_cast<osmid>(node.id());
    n.attrs = to_attribute_map(node.tags());
    n.lat = node.location().lat();
    n.lng = node.location().lon();
    return n;
}

osm_way to_osm_way(const osmium::Way& way)
{
    osm_way w;
    w.id = static_cast<osmid>(way.id());
    w.attrs = to_attribute_map(way.tags());
    for (const auto& nd : way.nodes())
    {
        w.nodes.emplace_back(static_cast<osmid>(nd.ref()));
    }
    return w;
}

osm_relation to_osm_relation(const osmium::Relation& relation)
{
    osm_relation r;
    r.id = static_cast<osmid>(relation.id());
    r.attrs = to_attribute_map(relation.tags());
    for (const auto& member : relation.members())
    {
        switch (member.type())
        {
            case osmium::item_type::node:
                r.members.push_back({entity_type::node, static_cast<osmid>(member.ref()), member.role()});
                break;
            case osmium::item_type::way:
                r.members.push_back({entity_type::way, static_cast<osmid>(member.ref()), member.role()});
                break;
            case osmium::item_type::relation:
                r.members.push_back({entity_type::relation, static_cast<osmid>(member.ref()), member.role()});
                break;
            default:
                break;
        }
    }
    return r;
}

void check_osm_input(const std::string& path)
{
    if (!std::ifstream(path).good())
        throw make_exception_macro(unsupported_format_exception, "cannot open OSM input " + path);

    osmium::io::File file{path};
    if (file.format() == osmium::io::file_format::unknown)
        throw make_exception_macro(unsupported_format_exception, "unsupported OSM input format " + path);
}

}// namespace osmnet::osm
