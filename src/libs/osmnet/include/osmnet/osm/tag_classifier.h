#ifndef OSMNET_OSM_TAG_CLASSIFIER_H_
#define OSMNET_OSM_TAG_CLASSIFIER_H_

#include <osmnet/osm/osm.h>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace osmnet::osm
{

enum class transfer_zone_type
{
    platform,
    station,
    pole,
    unknown
};

std::ostream& operator<<(std::ostream& os, transfer_zone_type type);

// Decides which OSM entities take part in the conversion and on which
// network layers. Passed explicitly to the readers.
class tag_classifier
{
public:
    virtual ~tag_classifier() = default;

    // way that is converted into links on at least one layer
    virtual bool is_network_way(const attribute_map& tags) const = 0;

    // layers a network way contributes to
    virtual std::vector<std::string> layers_for_way(const attribute_map& tags) const = 0;

    virtual bool is_transfer_zone(const attribute_map& tags) const = 0;
    virtual transfer_zone_type get_transfer_zone_type(const attribute_map& tags) const = 0;

    virtual bool is_stop_position(const attribute_map& tags) const = 0;

    // layers a stop position or transfer zone serves
    virtual std::vector<std::string> layers_for_stop(const attribute_map& tags) const = 0;

    virtual bool is_stop_area(const attribute_map& tags) const = 0;
};

// highway=* on the road layer, railway=* on the rail layer, public_transport
// tagging for the zoning
class default_tag_classifier : public tag_classifier
{
public:
    using value_set = std::set<std::string>;
    using multi_attribute_map = std::map<std::string, value_set>;

    static constexpr const char* ROAD_LAYER = "road";
    static constexpr const char* RAIL_LAYER = "rail";

    default_tag_classifier();
    default_tag_classifier(multi_attribute_map keep, multi_attribute_map drop);

    bool is_network_way(const attribute_map& tags) const override;
    std::vector<std::string> layers_for_way(const attribute_map& tags) const override;

    bool is_transfer_zone(const attribute_map& tags) const override;
    transfer_zone_type get_transfer_zone_type(const attribute_map& tags) const override;

    bool is_stop_position(const attribute_map& tags) const override;
    std::vector<std::string> layers_for_stop(const attribute_map& tags) const override;

    bool is_stop_area(const attribute_map& tags) const override;

    static bool contained(const attribute_map& tags, const multi_attribute_map& rules);

private:
    multi_attribute_map keep_;
    multi_attribute_map drop_;
};

}// namespace osmnet::osm

#endif//OSMNET_OSM_TAG_CLASSIFIER_H_
