#include <osmnet/osm/osm.h>

namespace osmnet::osm
{

std::ostream& operator<<(std::ostream& os, entity_type type)
{
    switch (type)
    {
        case entity_type::node:
            return os << "node";
        case entity_type::way:
            return os << "way";
        case entity_type::relation:
            return os << "relation";
    }
    return os << "unknown";
}

bool osm_element::has_tag(const std::string& key) const
{
    return attrs.count(key) > 0;
}

bool osm_element::has_tag(const std::string& key, const std::string& value) const
{
    auto it = attrs.find(key);
    return it != attrs.end() && it->second == value;
}

std::optional<std::string> osm_element::get_tag(const std::string& key) const
{
    auto it = attrs.find(key);
    if (it == attrs.end())
        return std::nullopt;
    return it->second;
}

bool osm_way::is_perfect_loop() const
{
    return nodes.size() > 2 && nodes.front() == nodes.back();
}

std::optional<std::pair<size_t, size_t>> osm_way::find_first_loop(size_t offset) const
{
    for (size_t i = offset; i < nodes.size(); ++i)
    {
        for (size_t j = i + 1; j < nodes.size(); ++j)
        {
            if (nodes[i] == nodes[j])
                return std::make_pair(i, j);
        }
    }
    return std::nullopt;
}

}// namespace osmnet::osm
