#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "log_capture.h"
#include "test_helpers.h"

#include <osmnet/zoning/connectoid_helper.h>
#include <osmnet/zoning/zoning.h>
#include <osmnet/zoning/zoning_reader.h>
#include <osmnet/zoning/zoning_state.h>

#include <exceptions/exceptions.h>

#include <algorithm>

namespace osmnet::test
{
namespace
{
using Catch::Matchers::WithinAbs;

const osm::attribute_map STOP_POSITION{{"public_transport", "stop_position"}, {"bus", "yes"}};
const osm::attribute_map BUS_POLE{{"highway", "bus_stop"}, {"bus", "yes"}};
const osm::attribute_map BUS_PLATFORM{{"public_transport", "platform"}, {"bus", "yes"}};
const osm::attribute_map STOP_AREA{{"type", "public_transport"}, {"public_transport", "stop_area"}};

osm::osm_relation make_relation(osm::osmid id, std::vector<osm::osm_member> members, osm::attribute_map tags = STOP_AREA)
{
    osm::osm_relation r;
    r.id = id;
    r.members = std::move(members);
    r.attrs = std::move(tags);
    return r;
}

// road along y = 0 from x = 0 to x = 20 with node 2 at x = 10
std::vector<osm::osm_node> road_nodes(osm::attribute_map node_2_tags = {})
{
    return {grid_node(1, 0, 0), grid_node(2, 10, 0, std::move(node_2_tags)), grid_node(3, 20, 0)};
}

struct zoning_fixture
{
    network_fixture network;
    std::shared_ptr<zoning::zoning> zones{std::make_shared<zoning::zoning>()};
    std::unique_ptr<zoning::zoning_reader> reader;

    explicit zoning_fixture(std::vector<std::string> layers = {osm::default_tag_classifier::ROAD_LAYER}) :
        network{std::move(layers)}
    {
    }

    void read(const std::vector<osm::osm_node>& nodes, const std::vector<osm::osm_way>& ways,
              const std::vector<osm::osm_relation>& relations = {})
    {
        network.read(nodes, ways);
        reader = std::make_unique<zoning::zoning_reader>(network.cfg, network.classifier,
                                                         network.reader->create_network_to_zoning_data(), zones);
        for (const auto& w : ways)
            reader->preprocess_way(w);
        for (const auto& n : nodes)
            reader->handle_node(n);
        for (const auto& w : ways)
            reader->handle_way(w);
        for (const auto& r : relations)
            reader->handle_relation(r);
        reader->complete();
    }

    zoning::transfer_zone* zone(osm::entity_type type, osm::osmid id) const
    {
        return zones->find_transfer_zone(zoning::transfer_zone_key{type, id});
    }
};
}// namespace

TEST_CASE("Transfer zone keys are unique", "[zoning]")
{
    zoning::zoning z;
    zoning::transfer_zone_key key{osm::entity_type::node, 5};
    auto* zone = z.create_transfer_zone(key, osm::transfer_zone_type::pole, {grid_node(5, 0, 0).position()});

    REQUIRE(zone->is_point());
    REQUIRE(z.find_transfer_zone(key) == zone);
    REQUIRE(z.find_transfer_zone(zone->get_id()) == zone);
    REQUIRE(z.find_transfer_zone(zoning::transfer_zone_key{osm::entity_type::way, 5}) == nullptr);
    REQUIRE_THROWS_AS(z.create_transfer_zone(key, osm::transfer_zone_type::pole, {grid_node(5, 0, 0).position()}), invalid_parameter_exception);
    REQUIRE_THROWS_AS(z.create_transfer_zone({osm::entity_type::way, 6}, osm::transfer_zone_type::platform, {}), invalid_parameter_exception);
    REQUIRE(z.get_number_of_transfer_zones() == 1);
}

TEST_CASE("Distances to a transfer zone are measured to its outline", "[zoning]")
{
    zoning::zoning z;
    auto* platform = z.create_transfer_zone({osm::entity_type::way, 1}, osm::transfer_zone_type::platform,
                                            {grid_node(1, 0, 1).position(), grid_node(2, 10, 1).position()});

    auto d = platform->distance_in_metres_to(grid_node(3, 5, 0).position());
    REQUIRE_THAT(d, WithinAbs(11.1, 0.2));
    REQUIRE_THAT(platform->distance_in_metres_to(grid_node(3, 5, 1).position()), WithinAbs(0, 1e-6));
}

SCENARIO("Transfer zones are either incomplete or complete", "[zoning]")
{
    GIVEN("an incomplete transfer zone")
    {
        zoning::zoning z;
        zoning::zoning_state state{z, 0.001, geo::box{grid_node(0, -100, -100).position(), grid_node(0, 100, 100).position()}};
        auto* zone = z.create_transfer_zone({osm::entity_type::node, 1}, osm::transfer_zone_type::pole, {grid_node(1, 0, 0).position()});
        state.add_incomplete_transfer_zone(zone);
        auto near = geo::envelope_around(grid_node(0, 1, 0).position(), 25);

        REQUIRE(state.is_incomplete(*zone));
        REQUIRE_FALSE(state.is_complete(*zone));
        REQUIRE(state.find_incomplete_zones_near(near) == std::vector<zoning::transfer_zone*>{zone});
        REQUIRE(state.find_incomplete_zones_near(geo::envelope_around(grid_node(0, 50, 0).position(), 25)).empty());

        WHEN("it is promoted")
        {
            state.promote_to_complete(zone);

            THEN("it moves to the complete zones")
            {
                REQUIRE_FALSE(state.is_incomplete(*zone));
                REQUIRE(state.is_complete(*zone));
                REQUIRE(state.find_incomplete_zones_near(near).empty());
                REQUIRE(state.find_complete_zones_near(near) == std::vector<zoning::transfer_zone*>{zone});
                REQUIRE(state.get_number_of_incomplete_zones() == 0);
                REQUIRE(state.get_number_of_complete_zones() == 1);
            }

            THEN("it cannot be promoted or added again")
            {
                REQUIRE_THROWS_AS(state.promote_to_complete(zone), invalid_state_exception);
                REQUIRE_THROWS_AS(state.add_incomplete_transfer_zone(zone), invalid_state_exception);
                REQUIRE_FALSE(state.is_incomplete(*zone));
            }
        }

        WHEN("it is removed")
        {
            state.remove_incomplete(zone);

            THEN("it is in neither collection")
            {
                REQUIRE_FALSE(state.is_incomplete(*zone));
                REQUIRE_FALSE(state.is_complete(*zone));
                REQUIRE_THROWS_AS(state.promote_to_complete(zone), invalid_state_exception);
            }
        }
    }
}

TEST_CASE("Connectoids and waiting zones are tracked per layer", "[zoning]")
{
    network::network_layer layer{"road"};
    auto loc = grid_node(1, 0, 0).position();
    auto* access = layer.create_node(loc);

    zoning::zoning z;
    zoning::zoning_state state{z, 0.001, geo::box{}};
    auto* zone = z.create_transfer_zone({osm::entity_type::way, 7}, osm::transfer_zone_type::platform, {grid_node(2, 0, 1).position()});
    auto* c = z.create_connectoid("road", access, 1);

    state.register_connectoid("road", loc, c);
    REQUIRE(state.find_connectoid("road", loc) == c);
    REQUIRE(state.has_connectoid("road", loc));
    REQUIRE_FALSE(state.has_connectoid("rail", loc));
    REQUIRE_THROWS_AS(state.register_connectoid("road", loc, nullptr), null_pointer_exception);

    REQUIRE(state.zones_waiting_at("road", loc).empty());
    state.register_zone_at_stop("road", loc, *zone);
    REQUIRE(state.zones_waiting_at("road", loc) == std::vector<zoning::transfer_zone*>{zone});
    REQUIRE(state.zones_waiting_at("rail", loc).empty());

    c->add_transfer_zone(zone);
    c->add_transfer_zone(zone);
    zone->add_connectoid(c);
    REQUIRE(c->get_transfer_zones().size() == 1);
    REQUIRE(state.connectoids_of(*zone) == std::vector<zoning::connectoid*>{c});

    state.reset();
    REQUIRE_FALSE(state.has_connectoid("road", loc));
}

TEST_CASE("The link index follows the links", "[zoning]")
{
    network::network net;
    auto& road = net.add_layer("road");
    auto* a = road.create_node(grid_node(1, 0, 0).position());
    auto* b = road.create_node(grid_node(2, 10, 0).position());
    auto* l = road.create_link(a, b, {a->get_position(), b->get_position()}, 1);

    zoning::zoning z;
    zoning::zoning_state state{z, 0.001, net.get_bounding_box()};
    state.initialise_link_index(net);
    REQUIRE(state.get_number_of_indexed_links() == 1);

    auto near = geo::envelope_around(grid_node(0, 5, 1).position(), 20);
    auto far = geo::envelope_around(grid_node(0, 5, 50).position(), 20);
    REQUIRE(state.find_links_spatially(near, "road") == std::vector<network::link*>{l});
    REQUIRE(state.find_links_spatially(near, "rail").empty());
    REQUIRE(state.find_links_spatially(far, "road").empty());

    state.remove_links_from_index({l});
    REQUIRE(state.find_links_spatially(near, "road").empty());

    state.add_links_to_index({l}, "road");
    REQUIRE(state.find_links_spatially(near, "road").size() == 1);
}

SCENARIO("Connectoids are placed on the network", "[zoning]")
{
    GIVEN("a completed road network and an empty zoning")
    {
        network_fixture network;
        network.read(road_nodes(), {make_way(1, {1, 2, 3})});
        auto data = network.reader->create_network_to_zoning_data();

        zoning::zoning z;
        zoning::zoning_state state{z, 0.001, data.get_network_bounding_box()};
        state.initialise_link_index(*data.get_populated_network());
        zoning::connectoid_helper helper{z, state, data};

        auto internal = grid_node(2, 10, 0).position();
        auto* pole = z.create_transfer_zone({osm::entity_type::node, 100}, osm::transfer_zone_type::pole, {grid_node(100, 10, 1).position()});
        auto* platform = z.create_transfer_zone({osm::entity_type::way, 200}, osm::transfer_zone_type::platform,
                                                {grid_node(0, 9, 2).position(), grid_node(0, 11, 2).position()});
        state.add_incomplete_transfer_zone(pole);
        state.add_incomplete_transfer_zone(platform);

        WHEN("an access node is needed at an internal location")
        {
            auto* n = helper.extract_connectoid_access_node(internal, "road");

            THEN("the link is broken at a new node carrying the OSM node")
            {
                REQUIRE(n != nullptr);
                REQUIRE(n->get_external_id() == osm::osmid{2});
                REQUIRE(network.road().get_number_of_links() == 2);
                REQUIRE(n->get_degree() == 2);
                REQUIRE(network.road_state().find_node_at_location(internal) == n);
                REQUIRE(network.road_state().current_links_for_way(1).size() == 2);

                auto indexed = state.find_links_spatially(geo::envelope_around(internal, 5), "road");
                REQUIRE(indexed.size() == 2);
                for (auto* l : indexed)
                    REQUIRE(network.road().find_link(l->get_id()) == l);
            }

            THEN("the node is reused the next time")
            {
                REQUIRE(helper.extract_connectoid_access_node(internal, "road") == n);
                REQUIRE(network.road().get_number_of_links() == 2);
            }
        }

        WHEN("an access node is needed at the end of a link")
        {
            auto* n = helper.extract_connectoid_access_node(grid_node(1, 0, 0).position(), "road");

            THEN("the existing node is used")
            {
                REQUIRE(n != nullptr);
                REQUIRE(n->get_external_id() == osm::osmid{1});
                REQUIRE(network.road().get_number_of_links() == 1);
            }
        }

        WHEN("an access node is needed away from the network")
        {
            THEN("there is none")
            {
                REQUIRE(helper.extract_connectoid_access_node(grid_node(0, 10, 10).position(), "road") == nullptr);
                REQUIRE(helper.create_connectoid(pole, "road", grid_node(0, 10, 10).position()) == nullptr);
                REQUIRE(state.is_incomplete(*pole));
                REQUIRE_THROWS_AS(helper.extract_connectoid_access_node(internal, "water"), invalid_parameter_exception);
            }
        }

        WHEN("two zones are connected at the same location")
        {
            auto* c1 = helper.create_connectoid(pole, "road", internal, 2);
            auto* c2 = helper.create_connectoid(platform, "road", internal, 2);

            THEN("they share one connectoid and are complete")
            {
                REQUIRE(c1 != nullptr);
                REQUIRE(c1 == c2);
                REQUIRE(z.get_number_of_connectoids() == 1);
                REQUIRE(c1->get_transfer_zones().size() == 2);
                REQUIRE(c1->get_stop_position() == osm::osmid{2});
                REQUIRE(c1->get_location() == internal);
                REQUIRE(state.is_complete(*pole));
                REQUIRE(state.is_complete(*platform));
                REQUIRE(pole->get_connectoids() == std::vector<zoning::connectoid*>{c1});
            }
        }

        WHEN("a stand-alone zone is projected on a link")
        {
            auto* l = network.road().get_links().front();
            auto loc = helper.extract_stand_alone_zone_location(*pole, l, "road");

            THEN("the projection is an existing coordinate when the zone lies next to one")
            {
                REQUIRE(loc);
                REQUIRE(*loc == internal);
                REQUIRE(l->get_geometry().size() == 3);
            }
        }

        WHEN("a stand-alone zone lies next to a segment")
        {
            auto* zone = z.create_transfer_zone({osm::entity_type::node, 300}, osm::transfer_zone_type::pole, {grid_node(300, 5, 2).position()});
            auto* l = network.road().get_links().front();
            auto loc = helper.extract_stand_alone_zone_location(*zone, l, "road");

            THEN("the projected location is injected into the link")
            {
                REQUIRE(loc);
                REQUIRE(l->get_geometry().size() == 4);
                REQUIRE(l->has_internal_location(*loc));
                REQUIRE(loc->getY() == BASE_LAT);
                REQUIRE_THAT(loc->getX(), WithinAbs(BASE_LON + 5 * STEP, 1e-9));
                REQUIRE(network.road_state().is_location_internal_to_any_link(*loc));
            }
        }
    }
}

SCENARIO("Stop positions are matched to transfer zones", "[zoning]")
{
    GIVEN("a stop position on a road with a pole nearby")
    {
        auto nodes = road_nodes(STOP_POSITION);
        nodes.push_back(grid_node(100, 10, 1, BUS_POLE));

        zoning_fixture fixture;
        fixture.read(nodes, {make_way(1, {1, 2, 3})});

        THEN("the pole is connected at the stop position")
        {
            auto* pole = fixture.zone(osm::entity_type::node, 100);
            REQUIRE(pole != nullptr);
            REQUIRE(pole->get_type() == osm::transfer_zone_type::pole);
            REQUIRE(pole->get_connectoids().size() == 1);

            auto* c = pole->get_connectoids().front();
            REQUIRE(c->get_location() == nodes[1].position());
            REQUIRE(c->get_stop_position() == osm::osmid{2});
            REQUIRE(c->get_layer_id() == osm::default_tag_classifier::ROAD_LAYER);
            REQUIRE(fixture.reader->get_zoning_state().is_complete(*pole));
            REQUIRE(fixture.reader->get_zoning_state().get_unprocessed_stop_positions().empty());
            REQUIRE(fixture.network.road().get_number_of_links() == 2);
            REQUIRE(fixture.zones->get_number_of_connectoids() == 1);
        }
    }

    GIVEN("a stop area with a platform out of the search radius")
    {
        auto nodes = road_nodes(STOP_POSITION);
        for (auto n : {grid_node(201, 8, 5), grid_node(202, 12, 5), grid_node(203, 12, 6), grid_node(204, 8, 6)})
            nodes.push_back(n);
        std::vector<osm::osm_way> ways{make_way(1, {1, 2, 3}), make_way(200, {201, 202, 203, 204, 201}, BUS_PLATFORM)};
        auto area = make_relation(300, {{osm::entity_type::node, 2, "stop"},
                                        {osm::entity_type::way, 200, "platform"},
                                        {osm::entity_type::node, 999, "stop"}});

        zoning_fixture fixture;
        fixture.read(nodes, ways, {area});

        THEN("the platform is connected through the stop area")
        {
            auto* platform = fixture.zone(osm::entity_type::way, 200);
            REQUIRE(platform != nullptr);
            REQUIRE(platform->get_geometry().size() == 5);
            REQUIRE(platform->get_connectoids().size() == 1);
            REQUIRE(platform->get_connectoids().front()->get_location() == nodes[1].position());
            REQUIRE(fixture.reader->get_statistics().pole_zones_created == 0);
            REQUIRE(fixture.reader->get_statistics().stop_areas == 1);
        }

        THEN("the unknown stop member is recorded as invalid")
        {
            REQUIRE(fixture.reader->get_zoning_state().is_invalid_stop_area_stop_position(999));
            REQUIRE(fixture.reader->get_zoning_state().get_number_of_invalid_stop_area_stop_positions() == 1);
        }
    }

    GIVEN("a stop position without any transfer zone around")
    {
        zoning_fixture fixture;
        fixture.read(road_nodes(STOP_POSITION), {make_way(1, {1, 2, 3})});

        THEN("a transfer zone is created at the stop")
        {
            auto* zone = fixture.zone(osm::entity_type::node, 2);
            REQUIRE(zone != nullptr);
            REQUIRE(zone->get_type() == osm::transfer_zone_type::pole);
            REQUIRE(zone->get_connectoids().size() == 1);
            REQUIRE(fixture.reader->get_statistics().pole_zones_created == 1);
        }
    }

    GIVEN("a stop position that is not part of the network")
    {
        auto nodes = road_nodes();
        nodes.push_back(grid_node(500, 50, 50, STOP_POSITION));

        zoning_fixture fixture;
        fixture.read(nodes, {make_way(1, {1, 2, 3})});

        THEN("it stays unprocessed")
        {
            REQUIRE(fixture.reader->get_zoning_state().find_unprocessed_stop_position(500) != nullptr);
            REQUIRE(fixture.zones->get_number_of_connectoids() == 0);
            REQUIRE(fixture.zones->get_number_of_transfer_zones() == 0);
            REQUIRE(fixture.network.road().get_number_of_links() == 1);
        }
    }

    GIVEN("a stop position at the end of a road")
    {
        auto nodes = road_nodes();
        nodes[0].attrs = STOP_POSITION;
        nodes.push_back(grid_node(100, 0, 1, BUS_POLE));

        zoning_fixture fixture;
        fixture.read(nodes, {make_way(1, {1, 2, 3})});

        THEN("the existing node is the access node")
        {
            REQUIRE(fixture.network.road().get_number_of_links() == 1);
            auto* c = fixture.zone(osm::entity_type::node, 100)->get_connectoids().front();
            REQUIRE(c->get_access_node() == fixture.network.road_state().find_node_at_location(nodes[0].position()));
        }
    }
}

SCENARIO("Stand-alone transfer zones connect to the closest link", "[zoning]")
{
    GIVEN("a platform next to a road and one far away")
    {
        auto nodes = road_nodes();
        nodes.push_back(grid_node(400, 5, 2, BUS_POLE));
        nodes.push_back(grid_node(401, 5, 10, BUS_POLE));

        zoning_fixture fixture;
        fixture.read(nodes, {make_way(1, {1, 2, 3})});

        THEN("the close one is connected at its projection on the road")
        {
            auto* zone = fixture.zone(osm::entity_type::node, 400);
            REQUIRE(zone->get_connectoids().size() == 1);

            const auto& loc = zone->get_connectoids().front()->get_location();
            REQUIRE(loc.getY() == BASE_LAT);
            REQUIRE_THAT(loc.getX(), WithinAbs(BASE_LON + 5 * STEP, 1e-9));
            REQUIRE(fixture.network.road().get_number_of_links() == 2);
            REQUIRE(fixture.reader->get_statistics().stand_alone_connections == 1);
        }

        THEN("the far one stays incomplete")
        {
            auto* zone = fixture.zone(osm::entity_type::node, 401);
            REQUIRE(zone->get_connectoids().empty());
            REQUIRE(fixture.reader->get_zoning_state().is_incomplete(*zone));
        }

        THEN("no zone is both incomplete and complete")
        {
            const auto& state = fixture.reader->get_zoning_state();
            for (const auto* zone : fixture.zones->get_transfer_zones())
                REQUIRE_FALSE((state.is_incomplete(*zone) && state.is_complete(*zone)));
        }
    }
}

SCENARIO("Access nodes are only used where the links pass through", "[zoning]")
{
    GIVEN("a road passing next to the end of a dead-end road")
    {
        // way 1 runs from x = 0 to x = 20, way 2 ends at (10, 0) without being part of way 1
        std::vector<osm::osm_node> nodes{grid_node(1, 0, 0), grid_node(2, 20, 0), grid_node(3, 10, 10), grid_node(4, 10, 0)};
        network_fixture network;
        network.read(nodes, {make_way(1, {1, 2}), make_way(2, {3, 4})});
        auto data = network.reader->create_network_to_zoning_data();

        zoning::zoning z;
        zoning::zoning_state state{z, 0.001, data.get_network_bounding_box()};
        state.initialise_link_index(*data.get_populated_network());
        zoning::connectoid_helper helper{z, state, data};

        auto dead_end = nodes[3].position();
        auto* m = network.road_state().find_node_at_location(dead_end);
        auto* through = links_of_way(network.road(), 1).front();
        REQUIRE(m != nullptr);
        REQUIRE(m->get_degree() == 1);

        WHEN("a zone projection adds the dead end location to the passing road")
        {
            network.road().inject_coordinate(through, 0, dead_end);
            network.road_state().register_location_as_internal_to_link(dead_end, *through);

            log_capture log;
            auto* n = helper.extract_connectoid_access_node(dead_end, "road");

            THEN("the passing road is broken at the existing node")
            {
                REQUIRE(n == m);
                REQUIRE(m->get_degree() == 3);
                REQUIRE(links_of_way(network.road(), 1).size() == 2);
                REQUIRE(network.road().get_number_of_links() == 3);
                REQUIRE(count_links_containing_internally(network.road(), dead_end) == 0);
                REQUIRE_FALSE(network.road_state().is_location_internal_to_any_link(dead_end));
                REQUIRE(network.road().validate() == 0);
                REQUIRE_FALSE(log.contains(spdlog::level::warn, "still internal to a link"));
            }

            THEN("the index holds the replacements of the passing road")
            {
                auto indexed = state.find_links_spatially(geo::envelope_around(dead_end, 5), "road");
                REQUIRE(indexed.size() == 3);
                for (auto* l : indexed)
                    REQUIRE(network.road().find_link(l->get_id()) == l);
            }
        }

        WHEN("links are broken at a node that is one of their end points")
        {
            auto* end = network.road_state().find_node_at_location(nodes[0].position());
            helper.break_links_at_node({through}, end, "road");

            THEN("they stay in the index")
            {
                REQUIRE(network.road().find_link(through->get_id()) == through);
                REQUIRE(state.find_links_spatially(geo::envelope_around(nodes[0].position(), 5), "road") ==
                        std::vector<network::link*>{through});
                REQUIRE(state.get_number_of_indexed_links() == 2);
            }
        }
    }
}

TEST_CASE("Zoning breaks follow the links of ways split by the network phase", "[zoning]")
{
    // way 1 along y = 0, split at node 2 by the crossing way 2
    std::vector<osm::osm_node> nodes{grid_node(1, 0, 0), grid_node(2, 10, 0), grid_node(3, 20, 0), grid_node(4, 30, 0),
                                     grid_node(5, 40, 0), grid_node(6, 10, -10), grid_node(7, 10, 10)};
    network_fixture network;
    network.read(nodes, {make_way(1, {1, 2, 3, 4, 5}), make_way(2, {6, 2, 7})});
    REQUIRE(network.road_state().current_links_for_way(1).size() == 2);

    auto data = network.reader->create_network_to_zoning_data();
    zoning::zoning z;
    zoning::zoning_state state{z, 0.001, data.get_network_bounding_box()};
    state.initialise_link_index(*data.get_populated_network());
    zoning::connectoid_helper helper{z, state, data};

    auto* n = helper.extract_connectoid_access_node(nodes[3].position(), "road");
    REQUIRE(n != nullptr);
    REQUIRE(n->get_external_id() == osm::osmid{4});
    REQUIRE(network.road_state().current_links_for_way(1).size() == 3);

    auto everything = geo::envelope_around(network.road().get_bounding_box(), 10);
    auto indexed = state.find_links_spatially(everything, "road");
    auto current = network.road().get_links();
    std::sort(indexed.begin(), indexed.end());
    std::sort(current.begin(), current.end());
    REQUIRE(indexed == current);
    REQUIRE(state.get_number_of_indexed_links() == 5);
}

TEST_CASE("A stop position shared by two layers gets one zone serving both", "[zoning]")
{
    const osm::attribute_map level_crossing_stop{{"public_transport", "stop_position"}, {"bus", "yes"}, {"train", "yes"}};
    std::vector<osm::osm_node> nodes{grid_node(1, 0, 0), grid_node(2, 10, 0, level_crossing_stop), grid_node(3, 20, 0),
                                     grid_node(4, 10, -10), grid_node(5, 10, 10)};
    std::vector<osm::osm_way> ways{make_way(1, {1, 2, 3}), make_way(2, {4, 2, 5}, {{"railway", "rail"}})};

    zoning_fixture fixture{{osm::default_tag_classifier::ROAD_LAYER, osm::default_tag_classifier::RAIL_LAYER}};
    fixture.read(nodes, ways);

    auto* zone = fixture.zone(osm::entity_type::node, 2);
    REQUIRE(zone != nullptr);
    REQUIRE(zone->get_layers().size() == 2);
    REQUIRE(zone->serves_layer(osm::default_tag_classifier::ROAD_LAYER));
    REQUIRE(zone->serves_layer(osm::default_tag_classifier::RAIL_LAYER));
    REQUIRE(zone->get_connectoids().size() == 2);
    REQUIRE(fixture.reader->get_statistics().pole_zones_created == 1);
    REQUIRE(fixture.reader->get_zoning_state().get_unprocessed_stop_positions().empty());
}

TEST_CASE("Zoning reader requires a zoning", "[zoning]")
{
    network_fixture network;
    network.read(road_nodes(), {make_way(1, {1, 2, 3})});

    REQUIRE_THROWS_AS(zoning::zoning_reader(network.cfg, network.classifier, network.reader->create_network_to_zoning_data(), nullptr),
                      null_pointer_exception);
}

TEST_CASE("Zoning reader reset clears its state", "[zoning]")
{
    auto nodes = road_nodes();
    nodes.push_back(grid_node(500, 50, 50, STOP_POSITION));

    zoning_fixture fixture;
    fixture.read(nodes, {make_way(1, {1, 2, 3})});
    fixture.reader->reset();

    REQUIRE_FALSE(fixture.reader->is_completed());
    REQUIRE(fixture.reader->get_zoning_state().get_unprocessed_stop_positions().empty());
    REQUIRE(fixture.reader->get_statistics().stop_positions == 0);
}

}// namespace osmnet::test
