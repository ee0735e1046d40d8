#ifndef OSMNET_OSM_OSMIUM_CONVERSION_H_
#define OSMNET_OSM_OSMIUM_CONVERSION_H_

#include <osmnet/osm/osm.h>

#include <osmium/osm/node.hpp>
#include <osmium/osm/relation.hpp>
#include <osmium/osm/tag.hpp>
#include <osmium/osm/way.hpp>

#include <string>

namespace osmnet::osm
{

attribute_map to_attribute_map(const osmium::TagList& tags);

osm_node to_osm_node(const osmium::Node& node);
osm_way to_osm_way(const osmium::Way& way);
osm_relation to_osm_relation(const osmium::Relation& relation);

// throws unsupported_format_exception when the file cannot be opened or its format is unknown
void check_osm_input(const std::string& path);

}// namespace osmnet::osm

#endif//OSMNET_OSM_OSMIUM_CONVERSION_H_
