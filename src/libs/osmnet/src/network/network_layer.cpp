#include <osmnet/network/network_layer.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>
#include <util/geo/Geo.h>

#include <algorithm>
#include <set>
#include <utility>

namespace osmnet::network
{

network_layer::network_layer(std::string id) :
    network_layer(std::move(id), std::make_shared<id_generator>())
{
}

network_layer::network_layer(std::string id, std::shared_ptr<id_generator> ids) :
    id_{std::move(id)},
    ids_{std::move(ids)}
{
    if (!ids_)
        throw make_exception_macro(null_pointer_exception, "network layer " + id_ + " requires an id generator");
}

node* network_layer::create_node(const geo::location& position, std::optional<osm::osmid> external_id)
{
    size_t id = ids_->next_node_id++;
    auto [it, inserted] = nodes_.emplace(id, std::make_unique<node>(id, position, external_id));
    return it->second.get();
}

link* network_layer::create_link(node* a, node* b, geo::line_string geometry, osm::osmid external_id)
{
    if (a == nullptr || b == nullptr)
        throw make_exception_macro(null_pointer_exception, "link for OSM way " + std::to_string(external_id) + " requires two nodes");
    if (geometry.size() < 2)
        throw make_exception_macro(invalid_parameter_exception, "link for OSM way " + std::to_string(external_id) + " requires at least two coordinates");
    if (geometry.front() != a->get_position() || geometry.back() != b->get_position())
        throw make_exception_macro(invalid_parameter_exception, "geometry of link for OSM way " + std::to_string(external_id) + " does not connect its nodes");

    size_t id = ids_->next_link_id++;
    auto [it, inserted] = links_.emplace(id, std::make_unique<link>(id, a, b, std::move(geometry), external_id));
    auto* l = it->second.get();
    a->add_link(l);
    b->add_link(l);
    return l;
}

std::vector<link_break> network_layer::break_links_at(const std::vector<link*>& links, node* n)
{
    if (n == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot break links of layer " + id_ + " without a node");

    std::vector<link_break> breaks;
    std::set<size_t> seen;
    for (auto* l : links)
    {
        if (l == nullptr || !seen.insert(l->get_id()).second)
            continue;

        if (find_link(l->get_id()) != l)
        {
            LOG(WARN) << "link " << l->get_id() << " is not part of layer " << id_ << ", not broken";
            continue;
        }

        const auto& geometry = l->get_geometry();
        auto index = geo::find_coordinate_index(geometry, n->get_position());
        if (!index || *index == 0 || *index == geometry.size() - 1)
        {
            LOG(DEBUG) << "location " << geo::to_string(n->get_position()) << " is not internal to link " << l->get_id() << ", not broken";
            continue;
        }

        geo::line_string first_part(geometry.begin(), geometry.begin() + *index + 1);
        geo::line_string second_part(geometry.begin() + *index, geometry.end());

        auto* first = create_link(l->get_node_a(), n, std::move(first_part), l->get_external_id());
        auto* second = create_link(n, l->get_node_b(), std::move(second_part), l->get_external_id());
        first->set_name(l->get_name());
        first->set_way_type(l->get_way_type());
        second->set_name(l->get_name());
        second->set_way_type(l->get_way_type());

        breaks.push_back(link_break{l->get_id(), l->get_external_id(), first, second});
        destroy_link(l);
    }
    return breaks;
}

void network_layer::remove_links(const std::vector<link*>& links)
{
    for (auto* l : links)
    {
        if (l != nullptr && find_link(l->get_id()) == l)
            destroy_link(l);
    }
}

void network_layer::remove_node(node* n)
{
    if (n == nullptr || find_node(n->get_id()) != n)
        return;

    // copy, destroying a link alters the adjacency
    auto adjacent = n->get_links();
    remove_links(adjacent);
    nodes_.erase(n->get_id());
}

void network_layer::inject_coordinate(link* l, size_t segment_index, const geo::location& loc)
{
    if (l == nullptr || find_link(l->get_id()) != l)
        throw make_exception_macro(invalid_parameter_exception, "cannot inject coordinate into link that is not part of layer " + id_);
    if (segment_index + 1 >= l->geometry_.size())
        throw make_exception_macro(invalid_parameter_exception, "segment index " + std::to_string(segment_index) + " out of range for link " + std::to_string(l->get_id()));

    l->geometry_.insert(l->geometry_.begin() + segment_index + 1, loc);
}

node* network_layer::find_node(size_t id) const
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

link* network_layer::find_link(size_t id) const
{
    auto it = links_.find(id);
    return it == links_.end() ? nullptr : it->second.get();
}

std::vector<node*> network_layer::get_nodes() const
{
    std::vector<node*> ret;
    ret.reserve(nodes_.size());
    for (const auto& [id, n] : nodes_)
        ret.push_back(n.get());
    return ret;
}

std::vector<link*> network_layer::get_links() const
{
    std::vector<link*> ret;
    ret.reserve(links_.size());
    for (const auto& [id, l] : links_)
        ret.push_back(l.get());
    return ret;
}

geo::box network_layer::get_bounding_box() const
{
    geo::box ret;
    for (const auto& [id, n] : nodes_)
        ret = util::geo::extendBox(n->get_position(), ret);
    for (const auto& [id, l] : links_)
        ret = util::geo::extendBox(l->get_bounding_box(), ret);
    return ret;
}

size_t network_layer::validate() const
{
    size_t issues = 0;
    for (const auto& [id, l] : links_)
    {
        const auto& geometry = l->get_geometry();
        if (find_node(l->get_node_a()->get_id()) != l->get_node_a() || find_node(l->get_node_b()->get_id()) != l->get_node_b())
        {
            LOG(ERROR) << "link " << id << " of layer " << id_ << " references a node outside of the layer";
            ++issues;
        }
        if (geometry.front() != l->get_node_a()->get_position() || geometry.back() != l->get_node_b()->get_position())
        {
            LOG(ERROR) << "geometry of link " << id << " of layer " << id_ << " does not connect its nodes";
            ++issues;
        }
    }
    for (const auto& [id, n] : nodes_)
    {
        for (const auto* l : n->get_links())
        {
            if (find_link(l->get_id()) != l)
            {
                LOG(ERROR) << "node " << id << " of layer " << id_ << " is adjacent to a removed link";
                ++issues;
            }
        }
    }
    return issues;
}

void network_layer::clear()
{
    links_.clear();
    nodes_.clear();
}

void network_layer::destroy_link(link* l)
{
    l->get_node_a()->remove_link(l);
    l->get_node_b()->remove_link(l);
    links_.erase(l->get_id());
}

}// namespace osmnet::network
