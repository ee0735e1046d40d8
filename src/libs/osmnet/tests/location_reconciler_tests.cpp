#include <catch2/catch_test_macros.hpp>

#include <osmnet/reader/location_reconciler.h>

#include <map>

namespace osmnet::reader
{
namespace
{
struct anchor
{
    int id;
};

struct segment
{
    size_t id;
    int lineage;
    geo::line_string geometry;
};

struct segment_traits
{
    using id_type = size_t;
    using lineage_type = int;

    std::map<size_t, segment*>* segments;

    id_type id_of(const segment& s) const
    {
        return s.id;
    }

    lineage_type lineage_of(const segment& s) const
    {
        return s.lineage;
    }

    segment* find(id_type id) const
    {
        auto it = segments->find(id);
        return it == segments->end() ? nullptr : it->second;
    }

    std::optional<member_position> locate(const segment& s, const geo::location& loc) const
    {
        auto position = geo::find_coordinate_position(s.geometry, loc);
        if (!position)
            return std::nullopt;
        return *position == geo::coordinate_position::internal ? member_position::internal : member_position::extreme;
    }
};

using segment_reconciler = location_reconciler<anchor, segment, segment_traits>;

geo::location at(double x)
{
    return geo::make_location(x, 0);
}
}// namespace

TEST_CASE("Anchors are registered per location", "[reconciler]")
{
    std::map<size_t, segment*> segments;
    segment_reconciler reconciler{segment_traits{&segments}, "test"};

    anchor a{1};
    anchor b{2};
    reconciler.register_anchor(at(1), &a);

    REQUIRE(reconciler.find_anchor(at(1)) == &a);
    REQUIRE(reconciler.find_anchor(at(2)) == nullptr);
    REQUIRE(reconciler.is_location_present(at(1)));

    reconciler.register_anchor(at(1), &a);
    REQUIRE(reconciler.get_statistics().replaced_anchors == 0);

    reconciler.register_anchor(at(1), &b);
    REQUIRE(reconciler.find_anchor(at(1)) == &b);
    REQUIRE(reconciler.get_statistics().replaced_anchors == 1);
    REQUIRE(reconciler.number_of_anchors() == 1);

    reconciler.forget_anchor(at(1));
    REQUIRE(reconciler.find_anchor(at(1)) == nullptr);
    REQUIRE_FALSE(reconciler.is_location_present(at(1)));
}

TEST_CASE("Unsplit members resolve to themselves", "[reconciler]")
{
    segment whole{0, 7, {at(0), at(1), at(2), at(3)}};
    std::map<size_t, segment*> segments{{0, &whole}};
    segment_reconciler reconciler{segment_traits{&segments}, "test"};

    reconciler.register_internal(at(1), whole, 42);
    reconciler.register_internal(at(2), whole);
    reconciler.register_internal(at(2), whole);

    REQUIRE(reconciler.is_location_internal(at(1)));
    REQUIRE(reconciler.find_internal(at(1))->osm_node == 42);
    REQUIRE(reconciler.find_internal(at(2))->members.size() == 1);

    auto result = reconciler.reconcile(at(1));
    REQUIRE(result.current.size() == 1);
    REQUIRE(result.current.front() == &whole);
    REQUIRE(result.extreme.empty());
    REQUIRE(result.dropped == 0);

    REQUIRE(reconciler.reconcile(at(9)).current.empty());
    REQUIRE(reconciler.get_statistics().unregistered_lookups == 1);
}

SCENARIO("Recorded members are resolved through their lineage", "[reconciler]")
{
    GIVEN("a member split once at its second coordinate")
    {
        segment whole{0, 7, {at(0), at(1), at(2), at(3), at(4)}};
        std::map<size_t, segment*> segments{{0, &whole}};
        segment_reconciler reconciler{segment_traits{&segments}, "test"};
        reconciler.register_internal(at(1), whole);
        reconciler.register_internal(at(2), whole);
        reconciler.register_internal(at(3), whole);

        segment left{1, 7, {at(0), at(1), at(2)}};
        segment right{2, 7, {at(2), at(3), at(4)}};
        segments.erase(0);
        segments[1] = &left;
        segments[2] = &right;
        reconciler.update_lineage(7, {0}, {&left, &right});
        reconciler.promote(at(2));

        WHEN("a location on either half is reconciled")
        {
            auto on_left = reconciler.reconcile(at(1));
            auto on_right = reconciler.reconcile(at(3));

            THEN("the half containing it is returned")
            {
                REQUIRE(on_left.current.size() == 1);
                REQUIRE(on_left.current.front() == &left);
                REQUIRE(on_right.current.size() == 1);
                REQUIRE(on_right.current.front() == &right);
                REQUIRE(reconciler.find_lineage(7)->size() == 2);
            }
        }

        WHEN("the split location is looked up")
        {
            THEN("it is no longer internal")
            {
                REQUIRE_FALSE(reconciler.is_location_internal(at(2)));
                REQUIRE(reconciler.reconcile(at(2)).current.empty());
            }
        }

        WHEN("one half is split again")
        {
            segment right_a{3, 7, {at(2), at(3)}};
            segment right_b{4, 7, {at(3), at(4)}};
            segments.erase(2);
            segments[3] = &right_a;
            segments[4] = &right_b;
            reconciler.update_lineage(7, {2}, {&right_a, &right_b});

            THEN("the split location is an extreme point of the current members")
            {
                auto result = reconciler.reconcile(at(3));
                REQUIRE(result.current.empty());
                REQUIRE(result.extreme.size() == 1);
                REQUIRE(reconciler.find_lineage(7)->size() == 3);
            }
        }
    }
}

TEST_CASE("References without a current member are dropped", "[reconciler]")
{
    segment whole{0, 7, {at(0), at(1), at(2)}};
    std::map<size_t, segment*> segments{{0, &whole}};
    segment_reconciler reconciler{segment_traits{&segments}, "test"};
    reconciler.register_internal(at(1), whole);

    segments.clear();
    reconciler.forget_member(0, 7);

    auto result = reconciler.reconcile(at(1));
    REQUIRE(result.current.empty());
    REQUIRE(result.dropped == 1);
    REQUIRE(reconciler.get_statistics().dropped_references == 1);
    REQUIRE_FALSE(reconciler.is_location_internal(at(1)));
}

TEST_CASE("Lineages with less than two members are reported", "[reconciler]")
{
    segment only{0, 3, {at(0), at(1)}};
    std::map<size_t, segment*> segments{{0, &only}};
    segment_reconciler reconciler{segment_traits{&segments}, "test"};

    reconciler.register_lineage(3, {&only});
    REQUIRE(reconciler.get_statistics().undersized_lineages == 1);
    REQUIRE(reconciler.number_of_lineages() == 1);
}

TEST_CASE("Locations are collected by the number of members", "[reconciler]")
{
    segment a{0, 1, {at(0), at(1), at(2)}};
    segment b{1, 2, {at(5), at(1), at(6)}};
    std::map<size_t, segment*> segments{{0, &a}, {1, &b}};
    segment_reconciler reconciler{segment_traits{&segments}, "test"};

    reconciler.register_internal(at(1), a);
    reconciler.register_internal(at(1), b);
    reconciler.register_internal(at(2), a);

    REQUIRE(reconciler.collect_locations_internal_to_at_least(1).size() == 2);
    auto shared = reconciler.collect_locations_internal_to_at_least(2);
    REQUIRE(shared.size() == 1);
    REQUIRE(shared.front() == at(1));

    reconciler.reset();
    REQUIRE(reconciler.collect_locations_internal_to_at_least(1).empty());
    REQUIRE(reconciler.number_of_lineages() == 0);
}

}// namespace osmnet::reader
