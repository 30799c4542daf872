#pragma once

#include <plantsched/core/calendar.hpp>
#include <plantsched/core/catalog.hpp>
#include <plantsched/core/operator_ledger.hpp>
#include <plantsched/core/order.hpp>
#include <plantsched/core/production_log.hpp>
#include <plantsched/core/routing.hpp>
#include <plantsched/core/timeline.hpp>
#include <plantsched/core/trace_writer.hpp>
#include <plantsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace plantsched::algo {

/// @brief Overall state of a dispatch run.
/// @ingroup algo
enum class RunState {
    Scheduling, ///< Pending orders remain.
    Complete    ///< No pending orders remain (placed or terminally failed).
};

/// @brief State of a day once its pass is over.
/// @ingroup algo
enum class DayState {
    Open,     ///< The pass placed at least one order.
    Exhausted ///< The pass placed nothing; only a new day can help.
};

/// @brief Tuning knobs of a Dispatcher.
/// @ingroup algo
struct DispatcherOptions {
    /// Failed placement days after which a pending order becomes
    /// unschedulable. 0 selects the number of submitted orders, which no
    /// feasible order can reach.
    uint32_t max_attempts{0};

    /// Working days run() processes before giving up on the remaining
    /// pending orders. 0 means no bound.
    uint32_t max_days{0};
};

/// @brief Resources an order needs, derived from its route and quantity.
/// @ingroup algo
struct WorkPlan {
    core::Workflow workflow;
    const core::MachineType* machine; ///< Type whose units run the order.
    core::Minutes etc;                ///< Estimated time to completion.
    uint32_t operators;               ///< Crew size, support roles included.
};

/// @brief Outcome of one working day.
/// @ingroup algo
struct DayReport {
    core::Day day;
    DayState state{DayState::Exhausted};
    std::size_t attempted{0};     ///< Pending orders visited by the pass.
    std::size_t placed{0};
    std::size_t deferred{0};      ///< Left pending for a later day.
    std::size_t unschedulable{0}; ///< Turned terminal during the pass.
    std::size_t rejected{0};      ///< Quantity did not fit the workflow.
};

/// @brief Aggregate result of a run.
/// @ingroup algo
struct RunSummary {
    std::size_t submitted{0};
    std::size_t placed{0};
    std::size_t rejected{0};
    std::size_t unschedulable{0};
    std::size_t pending{0};      ///< Non-zero only when max_days cut the run short.
    core::Energy total_energy{0.0};
    uint32_t days_simulated{0};  ///< Working days on which a pass ran.
    core::Day last_day;          ///< Last day a pass ran on.
};

/// @brief Day-by-day, priority-ordered allocator of orders to machine
///        units and the operator pool.
/// @ingroup algo
///
/// Each working day the Dispatcher visits every pending order once, urgent
/// orders first and then by identifier. For each order it derives a
/// WorkPlan, asks the UnitTimelineStore for the unit that can start
/// earliest and the OperatorLedger for admission, and commits both on
/// success. Orders that cannot be placed are deferred to the next working
/// day. A second pass over the same day could never place more, since a
/// day's free capacity only shrinks, so every day gets exactly one pass.
///
/// Before each pass, screen() rejects orders with invalid quantities,
/// duplicate ids or a quantity that does not match their workflow. Unknown
/// products and demand that can never fit in a day (ETC beyond the working
/// window or not positive, crew beyond the pool) are detected inside the
/// pass, at the order's first attempt, and declared unschedulable there
/// instead of being retried forever.
///
/// The Dispatcher owns the timelines, the ledger and the production log;
/// the catalog and routing table are borrowed and must outlive it.
/// Single-threaded: every search is immediately followed by its commit.
///
/// @see core::UnitTimelineStore, core::OperatorLedger, core::ProductionLog
class Dispatcher {
public:
    /// @brief Construct a dispatcher over a finalized catalog.
    /// @param catalog Plant description (must be finalized).
    /// @param routing Product-to-machine table.
    /// @param options Retry ceiling and run bound.
    /// @throws core::InvalidStateError if @p catalog is not finalized.
    Dispatcher(const core::ResourceCatalog& catalog, const core::ProductRoutingTable& routing,
               DispatcherOptions options = {});

    /// @brief Set the trace writer for decision logging.
    /// @param writer Pointer to a TraceWriter, or nullptr to disable.
    void set_trace_writer(core::TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Dispatch until no order is pending or max_days is reached.
    ///
    /// Per-order failures never abort the run: they are recorded on the
    /// order (status and reason) and the loop moves on.
    ///
    /// @param orders Orders to place; statuses and assignments are updated.
    /// @return Counts of placed, rejected, unschedulable and pending orders.
    RunSummary run(std::vector<core::Order>& orders);

    /// @brief Run the pass of the current day, then advance the calendar.
    ///
    /// Does nothing and reports an empty day when no order is pending.
    ///
    /// @param orders Orders to place.
    /// @return What happened on the day.
    DayReport run_day(std::vector<core::Order>& orders);

    /// @brief Reject invalid input before dispatch.
    ///
    /// Pending orders with a non-positive or unreadable quantity, a quantity
    /// that does not match their workflow, or an id already used by an
    /// earlier order are rejected. Idempotent.
    ///
    /// @param orders Orders to screen.
    void screen(std::vector<core::Order>& orders);

    /// @brief Derive the work plan of an order.
    ///
    /// @param order Order to plan.
    /// @return Workflow, machine type, ETC and crew size.
    /// @throws ClassificationError if the product type has no route.
    /// @throws ConfigurationError if the route names a machine or support
    ///         role the catalog lacks.
    /// @throws InvalidOrderError if the quantity does not fit the workflow.
    [[nodiscard]] WorkPlan plan(const core::Order& order) const;

    /// @brief Tally the current status of @p orders.
    [[nodiscard]] RunSummary summarize(const std::vector<core::Order>& orders) const;

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] core::Day current_day() const noexcept { return current_day_; }
    [[nodiscard]] uint32_t days_simulated() const noexcept { return days_simulated_; }

    [[nodiscard]] const core::ResourceCatalog& catalog() const noexcept { return catalog_; }
    [[nodiscard]] const core::WorkCalendar& calendar() const noexcept { return calendar_; }
    [[nodiscard]] const core::UnitTimelineStore& timelines() const noexcept { return timelines_; }
    [[nodiscard]] const core::OperatorLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const core::ProductionLog& log() const noexcept { return log_; }

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

private:
    enum class Attempt { Placed, Deferred, Unschedulable, Rejected };

    Attempt attempt(core::Order& order, uint32_t ceiling);
    Attempt defer(core::Order& order, uint32_t ceiling, std::string_view reason);
    void place(core::Order& order, const WorkPlan& plan, const core::UnitSlot& choice);
    [[nodiscard]] uint32_t retry_ceiling(std::size_t submitted) const noexcept;
    [[nodiscard]] static bool has_pending(const std::vector<core::Order>& orders) noexcept;

    template<typename F>
    void trace(F&& func);

    const core::ResourceCatalog& catalog_;
    const core::ProductRoutingTable& routing_;
    DispatcherOptions options_;
    core::WorkCalendar calendar_;

    core::UnitTimelineStore timelines_;
    core::OperatorLedger ledger_;
    core::ProductionLog log_;

    RunState state_{RunState::Scheduling};
    core::Day current_day_{core::WorkCalendar::first_day()};
    core::Day last_day_{core::WorkCalendar::first_day()};
    uint32_t days_simulated_{0};
    core::TraceWriter* trace_writer_{nullptr};
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename F>
void Dispatcher::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_day_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace plantsched::algo
