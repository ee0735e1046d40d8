#include <osmnet/reader/layer_parser.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>
#include <logging/scoped_timer.h>

#include <algorithm>
#include <set>

namespace osmnet::reader
{

namespace
{
std::string find_way_type(const osm::osm_way& way)
{
    for (const char* key : {"highway", "railway"})
    {
        if (auto value = way.get_tag(key))
            return *value;
    }
    return {};
}
}// namespace

layer_parser::layer_parser(network::network_layer& layer, network_reader_data& data) :
    layer_{&layer},
    data_{&data},
    state_{layer}
{
}

network::node* layer_parser::extract_node(osm::osmid osm_node_id)
{
    const auto* osm_node = data_->get_osm_node_table().find(osm_node_id);
    if (osm_node == nullptr)
        return nullptr;

    const auto position = osm_node->position();
    if (auto* existing = state_.find_node_at_location(position))
        return existing;

    auto* n = layer_->create_node(position, osm_node->id);
    state_.register_node_at_location(position, n);
    data_->update_network_bounding_box(position);
    return n;
}

network::link* layer_parser::extract_partial_osm_way(const osm::osm_way& way, size_t start, size_t end, bool part_of_circular_way)
{
    if (start >= way.nodes.size() || end >= way.nodes.size())
    {
        throw make_exception_macro(invalid_parameter_exception,
                                   "invalid section " + std::to_string(start) + ".." + std::to_string(end) + " of OSM way " + std::to_string(way.id));
    }
    if (end < start && !(part_of_circular_way && way.is_perfect_loop()))
    {
        throw make_exception_macro(invalid_parameter_exception,
                                   "only sections of closed OSM ways can wrap around, OSM way " + std::to_string(way.id));
    }

    return extract_link(way, section_indices(start, end, 0, way.nodes.size() - 1), !part_of_circular_way);
}

network::link* layer_parser::handle_way(const osm::osm_way& way)
{
    if (way.nodes.size() < 2)
    {
        LOG(DEBUG) << "OSM way " << way.id << " has less than two nodes, ignored";
        return nullptr;
    }
    return extract_partial_osm_way(way, 0, way.nodes.size() - 1, false);
}

std::vector<network::link*> layer_parser::handle_raw_circular_way(const osm::osm_way& way)
{
    // circular ways are only converted when complete
    if (!data_->get_osm_node_table().is_all_available(way))
    {
        LOG(WARN) << "circular OSM way " << way.id << " references unavailable nodes, ignored on layer " << layer_->get_id();
        ++state_.get_statistics().discarded_ways;
        data_->register_unavailable_way(way.id);
        return {};
    }

    ++state_.get_statistics().circular_ways;
    auto links = handle_raw_circular_way(way, 0);
    if (!links.empty())
        state_.register_way_links(way.id, links);
    return links;
}

std::vector<network::link*> layer_parser::handle_raw_circular_way(const osm::osm_way& way, size_t initial)
{
    std::vector<network::link*> created;
    const size_t final_index = way.nodes.size() - 1;

    auto loop = way.find_first_loop(initial);
    if (loop)
    {
        auto [first, last] = *loop;
        if (first > initial)
        {
            if (auto* l = extract_partial_osm_way(way, initial, first, false))
                created.push_back(l);
        }

        // remainder first, so that every non circular part is a link before the loop is split
        if (last < final_index)
        {
            auto remainder = handle_raw_circular_way(way, last);
            created.insert(created.end(), remainder.begin(), remainder.end());
        }

        auto loop_links = handle_perfect_circular_way(way, first, last);
        created.insert(created.end(), loop_links.begin(), loop_links.end());
    }
    else if (initial < final_index)
    {
        if (auto* l = extract_partial_osm_way(way, initial, final_index, false))
            created.push_back(l);
    }
    return created;
}

std::vector<network::link*> layer_parser::handle_perfect_circular_way(const osm::osm_way& way, size_t first, size_t last)
{
    if (first >= last || last >= way.nodes.size() || way.nodes[first] != way.nodes[last])
    {
        throw make_exception_macro(invalid_parameter_exception,
                                   "section " + std::to_string(first) + ".." + std::to_string(last) + " of OSM way " + std::to_string(way.id) + " is not a loop");
    }

    std::vector<network::link*> created;
    auto add = [&created](network::link* l) {
        if (l != nullptr)
            created.push_back(l);
    };

    std::optional<size_t> first_start;
    std::optional<size_t> start;
    std::optional<size_t> end;

    // sections between nodes that already connect to something on this layer
    for (size_t i = first; i <= last; ++i)
    {
        if (!is_active(way.nodes[i]))
            continue;

        if (!start)
        {
            start = i;
            first_start = i;
        }
        else if (!(i == last && *start == *first_start))
        {
            if (auto* l = extract_link(way, section_indices(*start, i, first, last), false))
            {
                created.push_back(l);
                end = i;
                start = i;
            }
        }
    }

    if (!start)
    {
        LOG(DEBUG) << "circular OSM way " << way.id << " has no connection to layer " << layer_->get_id() << ", split halfway";
        start = first;
    }

    if (!end)
    {
        // a single connection point
        size_t split = *start;
        if (split == first)
            split = first + (last - first) / 2;

        add(extract_link(way, section_indices(first, split, first, last), false));
        add(extract_link(way, section_indices(split, last, first, last), false));
    }
    else if (*end != last)
    {
        // close the loop back to the first connection point
        add(extract_link(way, section_indices(*start, *first_start, first, last), false));
    }

    return created;
}

bool layer_parser::break_links_with_internal_node(network::node* n)
{
    if (n == nullptr)
        throw make_exception_macro(null_pointer_exception, "cannot break links of layer " + layer_->get_id() + " without a node");

    if (!state_.is_location_internal_to_any_link(n->get_position()))
        return false;

    auto links = state_.find_current_links_at_location(n->get_position());
    state_.break_links_at(links, n);
    return true;
}

void layer_parser::break_links_with_internal_connections()
{
    LOG(INFO) << "[" << layer_->get_id() << "] breaking OSM ways with internal connections into multiple links...";

    std::set<osm::osmid> processed;

    // existing nodes that are internal to other links
    auto nodes = layer_->get_nodes();
    for (auto* n : nodes)
    {
        if (break_links_with_internal_node(n) && n->get_external_id())
            processed.insert(*n->get_external_id());
    }

    // shared internal nodes that are not a node yet, ascending id for reproducible ids
    for (auto osm_node_id : state_.collect_osm_nodes_internal_to_at_least(2))
    {
        if (processed.count(osm_node_id) > 0)
            continue;

        auto* n = extract_node(osm_node_id);
        if (n == nullptr)
        {
            LOG(ERROR) << "OSM node " << osm_node_id << " internal to several OSM ways could not be converted into a node on layer " << layer_->get_id();
            continue;
        }
        break_links_with_internal_node(n);
    }

    LOG(INFO) << "[" << layer_->get_id() << "] broke " << state_.number_of_ways_with_multiple_links() << " OSM ways into multiple links...DONE";
}

void layer_parser::complete()
{
    logging::scoped_timer timer("completing layer " + layer_->get_id());

    break_links_with_internal_connections();

    if (auto issues = layer_->validate(); issues > 0)
        LOG(WARN) << "layer " << layer_->get_id() << " has " << issues << " inconsistencies";

    state_.log_statistics();
    state_.mark_completed();
    completed_ = true;
}

void layer_parser::reset()
{
    state_.reset();
    completed_ = false;
}

network::link* layer_parser::extract_link(const osm::osm_way& way, std::vector<size_t> indices, bool allow_truncation)
{
    const auto& table = data_->get_osm_node_table();
    auto is_available = [&](size_t index) {
        return table.contains(way.nodes[index]);
    };

    if (indices.size() < 2)
        return nullptr;

    bool salvaged = false;
    if (allow_truncation && !is_available(indices.front()))
    {
        auto it = std::find_if(indices.begin() + 1, indices.end(), is_available);
        if (it == indices.end())
        {
            LOG(DEBUG) << "OSM way " << way.id << " has no available nodes on layer " << layer_->get_id() << ", ignored";
            data_->register_unavailable_way(way.id);
            return nullptr;
        }
        LOG(WARN) << "SALVAGED: OSM way " << way.id << " geometry incomplete, truncated at OSM (start) node " << way.nodes[*it];
        indices.erase(indices.begin(), it);
        salvaged = true;
    }
    if (allow_truncation && !is_available(indices.back()))
    {
        auto it = std::find_if(indices.rbegin() + 1, indices.rend(), is_available);
        if (it != indices.rend())
        {
            LOG(WARN) << "SALVAGED: OSM way " << way.id << " geometry incomplete, truncated at OSM (end) node " << way.nodes[*it];
            indices.erase(it.base(), indices.end());
            salvaged = true;
        }
    }

    const auto* first = table.find(way.nodes[indices.front()]);
    const auto* last = table.find(way.nodes[indices.back()]);
    if (first == nullptr || last == nullptr || first->position() == last->position())
    {
        LOG(DEBUG) << "DISCARD: OSM way " << way.id << " truncated to single node, unable to create link for it";
        ++state_.get_statistics().discarded_ways;
        data_->register_unavailable_way(way.id);
        return nullptr;
    }

    geo::line_string geometry;
    for (auto index : indices)
    {
        const auto* osm_node = table.find(way.nodes[index]);
        if (osm_node == nullptr)
        {
            LOG(WARN) << "OSM way " << way.id << " internal geometry incomplete, OSM node " << way.nodes[index] << " unavailable, link discarded";
            ++state_.get_statistics().discarded_ways;
            return nullptr;
        }
        auto position = osm_node->position();
        if (geometry.empty() || geometry.back() != position)
            geometry.push_back(position);
    }

    auto* node_a = extract_node(first->id);
    auto* node_b = extract_node(last->id);
    auto* l = layer_->create_link(node_a, node_b, std::move(geometry), way.id);
    if (auto name = way.get_tag("name"))
        l->set_name(*name);
    l->set_way_type(find_way_type(way));

    if (salvaged)
        ++state_.get_statistics().salvaged_ways;

    // internal nodes, needed to break the link where other links connect to it later on
    for (size_t i = 1; i + 1 < indices.size(); ++i)
    {
        const auto* osm_node = table.find(way.nodes[indices[i]]);
        auto position = osm_node->position();
        if (position == node_a->get_position() || position == node_b->get_position())
            continue;
        state_.register_location_as_internal_to_link(position, *l, osm_node);
    }

    return l;
}

std::vector<size_t> layer_parser::section_indices(size_t start, size_t end, size_t loop_first, size_t loop_last)
{
    std::vector<size_t> indices;
    if (start <= end)
    {
        for (size_t i = start; i <= end; ++i)
            indices.push_back(i);
        return indices;
    }

    // the loop's last node is its first node
    for (size_t i = start; i <= loop_last; ++i)
        indices.push_back(i);
    for (size_t i = loop_first + 1; i <= end; ++i)
        indices.push_back(i);
    return indices;
}

bool layer_parser::is_active(osm::osmid osm_node_id) const
{
    const auto* osm_node = data_->get_osm_node_table().find(osm_node_id);
    return osm_node != nullptr && state_.is_location_present(osm_node->position());
}

}// namespace osmnet::reader
