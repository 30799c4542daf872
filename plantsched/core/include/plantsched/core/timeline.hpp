#pragma once

#include <plantsched/core/machine_unit.hpp>
#include <plantsched/core/types.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plantsched::core {

class ResourceCatalog;

/// @brief Half-open occupied range [start, end) owned by one order.
/// @ingroup core_timeline
struct Interval {
    Minutes start;
    Minutes end;
    std::string order_id;
};

/// @brief Free range returned by a slot search, [start, end).
/// @ingroup core_timeline
struct Slot {
    Minutes start;
    Minutes end;

    constexpr bool operator==(const Slot&) const = default;
};

/// @brief Occupancy of one machine unit on one day.
/// @ingroup core_timeline
///
/// Intervals are kept sorted by start and never overlap. The search never
/// mutates the timeline; only insert() does.
class Timeline {
public:
    /// @brief First-fit search for a free range of @p required minutes.
    ///
    /// Walks the intervals in start order with a cursor starting at 0.
    /// The first gap between the cursor and the next interval that is at
    /// least @p required wide wins, even if a tighter gap exists later.
    /// Otherwise the tail of the window after the last interval is tried.
    ///
    /// @param required Length of the requested range.
    /// @param window   Length of the working day.
    /// @return The earliest fitting slot, or std::nullopt.
    [[nodiscard]] std::optional<Slot> find_slot(Minutes required, Minutes window) const;

    /// @brief Occupy a range.
    ///
    /// @param interval Range and owning order.
    /// @param window   Length of the working day.
    /// @throws OverlapError if the range is empty, leaves [0, window], or
    ///         overlaps an occupied range.
    void insert(Interval interval, Minutes window);

    /// @brief Occupied ranges, sorted by start.
    [[nodiscard]] const std::vector<Interval>& intervals() const noexcept { return intervals_; }

    /// @brief Sum of occupied minutes.
    [[nodiscard]] Minutes occupied() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return intervals_.empty(); }

private:
    std::vector<Interval> intervals_;
};

/// @brief A unit together with the slot it offers.
/// @ingroup core_timeline
struct UnitSlot {
    const MachineUnit* unit;
    Slot slot;
};

/// @brief Per-unit, per-day timelines of the whole plant.
/// @ingroup core_timeline
///
/// Day records are created explicitly with ensure_day(), which gives every
/// schedulable unit an empty timeline for that day. Searches on a day that
/// was never ensured behave as if all timelines were empty.
///
/// The store is owned by a single Dispatcher: a search and the commit that
/// follows it must not be interleaved with another writer.
///
/// @see ResourceCatalog, algo::Dispatcher
class UnitTimelineStore {
public:
    /// @brief Construct a store over a finalized catalog.
    /// @param catalog Catalog providing units and the working window.
    /// @throws InvalidStateError if @p catalog is not finalized.
    explicit UnitTimelineStore(const ResourceCatalog& catalog);

    /// @brief Create empty timelines for every unit on @p day.
    ///
    /// Existing timelines for that day are left untouched.
    void ensure_day(Day day);

    /// @brief Whether a record for @p day exists.
    [[nodiscard]] bool has_day(Day day) const noexcept { return days_.contains(day); }

    /// @brief First-fit search on one unit.
    /// @see Timeline::find_slot
    [[nodiscard]] std::optional<Slot> find_slot(const UnitKey& unit, Day day,
                                                Minutes required) const;

    /// @brief Pick the unit of a machine type that can start earliest.
    ///
    /// Every unit of the type is searched with find_slot(). The unit with
    /// the smallest start wins; on equal starts the lowest instance index
    /// wins.
    ///
    /// @param type_id  MachineType::id() of the machine type.
    /// @param day      Day to search.
    /// @param required Length of the requested range.
    /// @return Chosen unit and slot, or std::nullopt if no unit has room.
    [[nodiscard]] std::optional<UnitSlot> select_best_unit(std::size_t type_id, Day day,
                                                           Minutes required) const;

    /// @brief Occupy [start, end) on a unit's timeline for @p day.
    ///
    /// @throws OverlapError if the range overlaps an occupied one.
    /// @throws OutOfRangeError if @p unit is unknown to the catalog.
    void commit(const UnitKey& unit, Day day, Minutes start, Minutes end,
                std::string_view order_id);

    /// @brief Timeline of a unit on a day (empty if never written).
    [[nodiscard]] const Timeline& timeline(const UnitKey& unit, Day day) const;

    /// @brief Days for which a record exists, ascending.
    [[nodiscard]] std::vector<Day> days() const;

    [[nodiscard]] const ResourceCatalog& catalog() const noexcept { return catalog_; }

private:
    const ResourceCatalog& catalog_;
    std::map<Day, std::map<UnitKey, Timeline>> days_;
};

} // namespace plantsched::core
