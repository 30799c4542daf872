#include <plantsched/core/timeline.hpp>
#include <plantsched/core/catalog.hpp>
#include <plantsched/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace plantsched::core {

namespace {

// Absorbs rounding in start + duration against the end of the window
constexpr double kWindowTolerance = 1e-9;

const Timeline& empty_timeline() {
    static const Timeline empty;
    return empty;
}

} // anonymous namespace

// =============================================================================
// Timeline
// =============================================================================

std::optional<Slot> Timeline::find_slot(Minutes required, Minutes window) const {
    Minutes cursor{0.0};
    for (const auto& interval : intervals_) {
        if ((interval.start - cursor).count >= required.count) {
            return Slot{cursor, cursor + required};
        }
        cursor = std::max(cursor, interval.end);
    }
    if ((window - cursor).count >= required.count) {
        return Slot{cursor, cursor + required};
    }
    return std::nullopt;
}

void Timeline::insert(Interval interval, Minutes window) {
    if (!(interval.start < interval.end)) {
        throw OverlapError("empty interval for order '" + interval.order_id + "'");
    }
    if (interval.start.count < 0.0 || interval.end.count > window.count + kWindowTolerance) {
        throw OverlapError("interval for order '" + interval.order_id +
                           "' leaves the working window");
    }
    for (const auto& existing : intervals_) {
        if (interval.start < existing.end && existing.start < interval.end) {
            throw OverlapError("interval for order '" + interval.order_id +
                               "' overlaps order '" + existing.order_id + "'");
        }
    }

    auto pos = std::upper_bound(intervals_.begin(), intervals_.end(), interval.start,
                                [](Minutes start, const Interval& other) {
                                    return start < other.start;
                                });
    intervals_.insert(pos, std::move(interval));
}

Minutes Timeline::occupied() const noexcept {
    Minutes total{0.0};
    for (const auto& interval : intervals_) {
        total += interval.end - interval.start;
    }
    return total;
}

// =============================================================================
// UnitTimelineStore
// =============================================================================

UnitTimelineStore::UnitTimelineStore(const ResourceCatalog& catalog)
    : catalog_(catalog) {
    if (!catalog_.is_finalized()) {
        throw InvalidStateError("UnitTimelineStore requires a finalized catalog");
    }
}

void UnitTimelineStore::ensure_day(Day day) {
    auto& units = days_[day];
    for (std::size_t i = 0; i < catalog_.unit_count(); ++i) {
        units.try_emplace(catalog_.unit(i).key());
    }
}

std::optional<Slot> UnitTimelineStore::find_slot(const UnitKey& unit, Day day,
                                                 Minutes required) const {
    return timeline(unit, day).find_slot(required, catalog_.constants().daily_work_minutes);
}

std::optional<UnitSlot> UnitTimelineStore::select_best_unit(std::size_t type_id, Day day,
                                                            Minutes required) const {
    std::optional<UnitSlot> best;
    for (const MachineUnit* unit : catalog_.units_of(type_id)) {
        auto slot = find_slot(unit->key(), day, required);
        if (!slot) {
            continue;
        }
        // Strict comparison keeps the lowest index on ties
        if (!best || slot->start < best->slot.start) {
            best = UnitSlot{unit, *slot};
        }
    }
    return best;
}

void UnitTimelineStore::commit(const UnitKey& unit, Day day, Minutes start, Minutes end,
                               std::string_view order_id) {
    // Validates the key before a day record is touched
    (void)catalog_.unit(unit);

    ensure_day(day);
    days_[day][unit].insert(Interval{start, end, std::string(order_id)},
                            catalog_.constants().daily_work_minutes);
}

const Timeline& UnitTimelineStore::timeline(const UnitKey& unit, Day day) const {
    auto day_it = days_.find(day);
    if (day_it == days_.end()) {
        return empty_timeline();
    }
    auto unit_it = day_it->second.find(unit);
    if (unit_it == day_it->second.end()) {
        return empty_timeline();
    }
    return unit_it->second;
}

std::vector<Day> UnitTimelineStore::days() const {
    std::vector<Day> result;
    result.reserve(days_.size());
    for (const auto& [day, units] : days_) {
        result.push_back(day);
    }
    return result;
}

} // namespace plantsched::core
