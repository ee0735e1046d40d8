#include <catch2/catch_test_macros.hpp>

#include <osmnet/network/network.h>
#include <osmnet/network/network_layer.h>

#include <exceptions/exceptions.h>

namespace osmnet::network
{
namespace
{
geo::location at(double x, double y = 0)
{
    return geo::make_location(x, y);
}
}// namespace

TEST_CASE("Links require nodes matching their geometry", "[network]")
{
    network_layer layer{"road"};
    auto* a = layer.create_node(at(0), 1);
    auto* b = layer.create_node(at(2), 2);

    REQUIRE_THROWS_AS(layer.create_link(a, nullptr, {at(0), at(2)}, 10), null_pointer_exception);
    REQUIRE_THROWS_AS(layer.create_link(a, b, {at(0)}, 10), invalid_parameter_exception);
    REQUIRE_THROWS_AS(layer.create_link(a, b, {at(0), at(1)}, 10), invalid_parameter_exception);

    auto* l = layer.create_link(a, b, {at(0), at(1), at(2)}, 10);
    REQUIRE(l->get_external_id() == 10);
    REQUIRE(a->get_degree() == 1);
    REQUIRE(b->get_degree() == 1);
    REQUIRE(l->find_position(at(1)) == geo::coordinate_position::internal);
    REQUIRE(l->find_position(at(0)) == geo::coordinate_position::first);
    REQUIRE(l->find_position(at(2)) == geo::coordinate_position::last);
    REQUIRE_FALSE(l->find_position(at(5)));
    REQUIRE(layer.validate() == 0);
}

SCENARIO("Links are broken at internal nodes", "[network]")
{
    GIVEN("a link with two internal coordinates")
    {
        network_layer layer{"road"};
        auto* a = layer.create_node(at(0));
        auto* b = layer.create_node(at(3));
        auto* l = layer.create_link(a, b, {at(0), at(1), at(2), at(3)}, 10);
        l->set_name("main street");
        auto original = l->get_id();

        WHEN("it is broken at an internal coordinate")
        {
            auto* n = layer.create_node(at(1));
            auto breaks = layer.break_links_at({l}, n);

            THEN("two links replace it, sharing the node")
            {
                REQUIRE(breaks.size() == 1);
                REQUIRE(breaks.front().original_id == original);
                REQUIRE(breaks.front().external_id == 10);
                REQUIRE(layer.find_link(original) == nullptr);
                REQUIRE(layer.get_number_of_links() == 2);
                REQUIRE(breaks.front().first->get_geometry() == geo::line_string{at(0), at(1)});
                REQUIRE(breaks.front().second->get_geometry() == geo::line_string{at(1), at(2), at(3)});
                REQUIRE(breaks.front().second->get_name() == "main street");
                REQUIRE(n->get_degree() == 2);
                REQUIRE(a->get_degree() == 1);
                REQUIRE(layer.validate() == 0);
            }
        }

        WHEN("it is broken at one of its end points")
        {
            auto breaks = layer.break_links_at({l}, b);

            THEN("nothing changes")
            {
                REQUIRE(breaks.empty());
                REQUIRE(layer.find_link(original) == l);
                REQUIRE(layer.get_number_of_links() == 1);
            }
        }

        WHEN("the same link is passed twice")
        {
            auto* n = layer.create_node(at(2));
            auto breaks = layer.break_links_at({l, l}, n);

            THEN("it is broken once")
            {
                REQUIRE(breaks.size() == 1);
                REQUIRE(layer.get_number_of_links() == 2);
            }
        }
    }
}

TEST_CASE("Coordinates are injected after a segment", "[network]")
{
    network_layer layer{"road"};
    auto* a = layer.create_node(at(0));
    auto* b = layer.create_node(at(2));
    auto* l = layer.create_link(a, b, {at(0), at(2)}, 10);

    layer.inject_coordinate(l, 0, at(1));
    REQUIRE(l->get_geometry() == geo::line_string{at(0), at(1), at(2)});
    REQUIRE(l->has_internal_location(at(1)));

    REQUIRE_THROWS_AS(layer.inject_coordinate(l, 2, at(3)), invalid_parameter_exception);
}

TEST_CASE("Removing a node removes its links", "[network]")
{
    network_layer layer{"road"};
    auto* a = layer.create_node(at(0));
    auto* b = layer.create_node(at(1));
    auto* c = layer.create_node(at(2));
    layer.create_link(a, b, {at(0), at(1)}, 1);
    layer.create_link(b, c, {at(1), at(2)}, 2);

    layer.remove_node(b);
    REQUIRE(layer.get_number_of_nodes() == 2);
    REQUIRE(layer.get_number_of_links() == 0);
    REQUIRE(a->get_degree() == 0);
    REQUIRE(layer.validate() == 0);
}

TEST_CASE("Layers of a network share their id space", "[network]")
{
    network net{"Belgium"};
    auto& road = net.add_layer("road");
    auto& rail = net.add_layer("rail");
    REQUIRE_THROWS_AS(net.add_layer("road"), invalid_parameter_exception);

    auto* n1 = road.create_node(at(0));
    auto* n2 = rail.create_node(at(0));
    REQUIRE(n1->get_id() != n2->get_id());

    auto* l = rail.create_link(n2, rail.create_node(at(1, 1)), {at(0), at(1, 1)}, 5);
    REQUIRE(net.find_link(l->get_id()) == l);
    REQUIRE(net.find_layer("rail") == &rail);
    REQUIRE(net.find_layer("water") == nullptr);

    auto bbox = net.get_bounding_box();
    REQUIRE(bbox.getLowerLeft() == at(0));
    REQUIRE(bbox.getUpperRight() == at(1, 1));

    net.clear();
    REQUIRE(net.is_empty());
}

}// namespace osmnet::network
