#ifndef OSMNET_READER_LOCATION_RECONCILER_H_
#define OSMNET_READER_LOCATION_RECONCILER_H_

#include <osmnet/geo/location.h>
#include <osmnet/osm/osm.h>

#include <logging/logger.h>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace osmnet::reader
{

enum class member_position
{
    internal,
    extreme
};

/*
 * Tracks what is known about a location: the anchor placed at it (a network
 * node, a connectoid) and the members it lies on (links, transfer zones),
 * while members are replaced over time. Members are referenced by their
 * surrogate id and grouped in lineages (an OSM way, a transfer zone key).
 * Once a lineage has been registered, its member set is the authority on
 * which members currently represent it.
 *
 * Traits must provide:
 *   using id_type, using lineage_type (both ordered)
 *   id_type id_of(const Member&) const
 *   lineage_type lineage_of(const Member&) const
 *   Member* find(id_type) const, nullptr once the member is gone
 *   std::optional<member_position> locate(const Member&, const geo::location&) const
 */
template<typename Anchor, typename Member, typename Traits>
class location_reconciler
{
public:
    using id_type = typename Traits::id_type;
    using lineage_type = typename Traits::lineage_type;

    struct member_ref
    {
        id_type id;
        lineage_type lineage;

        bool operator==(const member_ref& other) const
        {
            return id == other.id && lineage == other.lineage;
        }
    };

    struct internal_entry
    {
        std::vector<member_ref> members;
        std::optional<osm::osmid> osm_node;
    };

    struct reconciliation
    {
        // members the location is internal to, this is what gets broken
        std::vector<Member*> current;
        // members on which the location has become the first or last coordinate
        std::vector<Member*> extreme;
        size_t dropped{0};
    };

    struct statistics
    {
        size_t replaced_anchors{0};
        size_t dropped_references{0};
        size_t extreme_matches{0};
        size_t undersized_lineages{0};
        size_t unregistered_lookups{0};
    };

    location_reconciler(Traits traits, std::string name) :
        traits_{std::move(traits)},
        name_{std::move(name)}
    {
    }

    const Traits& traits() const
    {
        return traits_;
    }

    void register_anchor(const geo::location& loc, Anchor* anchor)
    {
        auto& current = anchors_[loc];
        if (current != nullptr && current != anchor)
        {
            LOG(WARN) << "[" << name_ << "] replacing anchor registered at " << geo::to_string(loc);
            ++stats_.replaced_anchors;
        }
        current = anchor;
    }

    Anchor* find_anchor(const geo::location& loc) const
    {
        auto it = anchors_.find(loc);
        return it == anchors_.end() ? nullptr : it->second;
    }

    void forget_anchor(const geo::location& loc)
    {
        anchors_.erase(loc);
    }

    size_t number_of_anchors() const
    {
        return anchors_.size();
    }

    void register_internal(const geo::location& loc, const Member& member, std::optional<osm::osmid> osm_node = std::nullopt)
    {
        auto& entry = internal_[loc];
        member_ref ref{traits_.id_of(member), traits_.lineage_of(member)};
        if (std::find(entry.members.begin(), entry.members.end(), ref) == entry.members.end())
            entry.members.push_back(ref);
        if (osm_node)
            entry.osm_node = osm_node;
    }

    bool is_location_present(const geo::location& loc) const
    {
        return anchors_.count(loc) > 0 || internal_.count(loc) > 0;
    }

    bool is_location_internal(const geo::location& loc) const
    {
        auto it = internal_.find(loc);
        return it != internal_.end() && !it->second.members.empty();
    }

    const internal_entry* find_internal(const geo::location& loc) const
    {
        auto it = internal_.find(loc);
        return it == internal_.end() ? nullptr : &it->second;
    }

    const geo::location_map<internal_entry>& internal_entries() const
    {
        return internal_;
    }

    /*
     * Resolves the members recorded for loc into the members that currently
     * represent them. A recorded member whose lineage was replaced is looked up
     * in the latest member set of that lineage by exact coordinate search.
     * References that resolve to nothing are dropped with a warning. The stored
     * entry is rewritten with the resolved references.
     */
    reconciliation reconcile(const geo::location& loc)
    {
        reconciliation result;

        auto it = internal_.find(loc);
        if (it == internal_.end())
        {
            ++stats_.unregistered_lookups;
            return result;
        }

        std::vector<member_ref> resolved;
        for (const auto& ref : it->second.members)
        {
            std::vector<id_type> candidates;
            auto lineage = lineages_.find(ref.lineage);
            if (lineage == lineages_.end())
                candidates.push_back(ref.id);
            else
                candidates.assign(lineage->second.begin(), lineage->second.end());

            Member* internal_match = nullptr;
            Member* extreme_match = nullptr;
            for (const auto& id : candidates)
            {
                Member* candidate = traits_.find(id);
                if (candidate == nullptr)
                    continue;

                auto position = traits_.locate(*candidate, loc);
                if (!position)
                    continue;

                if (*position == member_position::internal)
                {
                    internal_match = candidate;
                    break;
                }
                if (extreme_match == nullptr)
                    extreme_match = candidate;
            }

            if (internal_match != nullptr)
            {
                member_ref current{traits_.id_of(*internal_match), ref.lineage};
                if (std::find(resolved.begin(), resolved.end(), current) == resolved.end())
                {
                    resolved.push_back(current);
                    result.current.push_back(internal_match);
                }
            }
            else if (extreme_match != nullptr)
            {
                if (std::find(result.extreme.begin(), result.extreme.end(), extreme_match) == result.extreme.end())
                    result.extreme.push_back(extreme_match);
                ++stats_.extreme_matches;
            }
            else
            {
                LOG(WARN) << "[" << name_ << "] no current member of lineage " << ref.lineage << " contains "
                          << geo::to_string(loc) << ", reference dropped (malformed input?)";
                ++result.dropped;
                ++stats_.dropped_references;
            }
        }

        it->second.members = std::move(resolved);
        return result;
    }

    // merges the replacement into the current member set of the lineage
    void update_lineage(const lineage_type& lineage, const std::vector<id_type>& removed, const std::vector<Member*>& added)
    {
        auto& members = lineages_[lineage];
        for (const auto& id : removed)
            members.erase(id);
        for (const auto* member : added)
        {
            if (member != nullptr)
                members.insert(traits_.id_of(*member));
        }

        if (members.size() < 2)
        {
            LOG(WARN) << "[" << name_ << "] lineage " << lineage << " is registered with " << members.size()
                      << " member(s), expected at least two";
            ++stats_.undersized_lineages;
        }
    }

    void register_lineage(const lineage_type& lineage, const std::vector<Member*>& members)
    {
        update_lineage(lineage, {}, members);
    }

    // current members of the lineage, nullptr if it has never been split
    const std::set<id_type>* find_lineage(const lineage_type& lineage) const
    {
        auto it = lineages_.find(lineage);
        return it == lineages_.end() ? nullptr : &it->second;
    }

    size_t number_of_lineages() const
    {
        return lineages_.size();
    }

    // the location became an anchor, it is no longer internal to anything
    void promote(const geo::location& loc)
    {
        internal_.erase(loc);
    }

    // member removed from outside, e.g. by pruning
    void forget_member(const id_type& id, const lineage_type& lineage)
    {
        auto it = lineages_.find(lineage);
        if (it != lineages_.end())
            it->second.erase(id);
    }

    std::vector<geo::location> collect_locations_internal_to_at_least(size_t n) const
    {
        std::vector<geo::location> ret;
        for (const auto& [loc, entry] : internal_)
        {
            if (entry.members.size() >= n && !entry.members.empty())
                ret.push_back(loc);
        }
        std::sort(ret.begin(), ret.end());
        return ret;
    }

    const statistics& get_statistics() const
    {
        return stats_;
    }

    void reset()
    {
        anchors_.clear();
        internal_.clear();
        lineages_.clear();
        stats_ = statistics{};
    }

private:
    Traits traits_;
    std::string name_;
    geo::location_map<Anchor*> anchors_;
    geo::location_map<internal_entry> internal_;
    std::map<lineage_type, std::set<id_type>> lineages_;
    statistics stats_;
};

}// namespace osmnet::reader

#endif//OSMNET_READER_LOCATION_RECONCILER_H_
