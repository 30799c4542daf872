#include <plantsched/algo/dispatcher.hpp>
#include <plantsched/algo/error.hpp>

#include <plantsched/core/estimation.hpp>
#include <plantsched/core/machine_type.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <sstream>
#include <variant>

namespace plantsched::algo {

namespace {

using namespace plantsched::core;

bool quantity_fits(Workflow workflow, const OrderQuantity& quantity) {
    switch (workflow) {
        case Workflow::Forming:
            return std::holds_alternative<LengthQuantity>(quantity);
        case Workflow::ShearingBending:
            return std::holds_alternative<BendQuantity>(quantity);
    }
    return false;
}

std::string format_minutes(Minutes minutes) {
    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << minutes.count;
    return oss.str();
}

} // anonymous namespace

Dispatcher::Dispatcher(const ResourceCatalog& catalog, const ProductRoutingTable& routing,
                       DispatcherOptions options)
    : catalog_(catalog)
    , routing_(routing)
    , options_(options)
    , calendar_(catalog.constants().work_days_per_week, catalog.constants().week_length)
    , timelines_(catalog)
    , ledger_(catalog.constants().operator_pool) {}

RunSummary Dispatcher::run(std::vector<Order>& orders) {
    screen(orders);
    state_ = has_pending(orders) ? RunState::Scheduling : RunState::Complete;

    while (state_ == RunState::Scheduling) {
        if (options_.max_days != 0 && days_simulated_ >= options_.max_days) {
            break;
        }
        run_day(orders);
    }

    RunSummary summary = summarize(orders);
    trace([&](TraceWriter& w) {
        w.type("run_complete");
        w.field("submitted", static_cast<uint64_t>(summary.submitted));
        w.field("placed", static_cast<uint64_t>(summary.placed));
        w.field("rejected", static_cast<uint64_t>(summary.rejected));
        w.field("unschedulable", static_cast<uint64_t>(summary.unschedulable));
        w.field("pending", static_cast<uint64_t>(summary.pending));
        w.field("energy_kwh", summary.total_energy.kwh);
    });
    return summary;
}

DayReport Dispatcher::run_day(std::vector<Order>& orders) {
    screen(orders);

    DayReport report;
    report.day = current_day_;
    if (!has_pending(orders)) {
        state_ = RunState::Complete;
        return report;
    }
    state_ = RunState::Scheduling;

    timelines_.ensure_day(current_day_);
    ledger_.ensure_day(current_day_);

    std::vector<Order*> queue;
    for (auto& order : orders) {
        if (order.is_pending()) {
            queue.push_back(&order);
        }
    }
    std::stable_sort(queue.begin(), queue.end(), [](const Order* lhs, const Order* rhs) {
        return dispatch_before(*lhs, *rhs);
    });

    trace([&](TraceWriter& w) {
        w.type("day_open");
        w.field("label", day_label(current_day_));
        w.field("pending", static_cast<uint64_t>(queue.size()));
        w.field("operators_available", static_cast<uint64_t>(ledger_.available(current_day_)));
    });

    uint32_t ceiling = retry_ceiling(orders.size());
    for (Order* order : queue) {
        ++report.attempted;
        switch (attempt(*order, ceiling)) {
            case Attempt::Placed:
                ++report.placed;
                break;
            case Attempt::Deferred:
                ++report.deferred;
                break;
            case Attempt::Unschedulable:
                ++report.unschedulable;
                break;
            case Attempt::Rejected:
                ++report.rejected;
                break;
        }
    }

    report.state = report.placed > 0 ? DayState::Open : DayState::Exhausted;
    bool pending_left = has_pending(orders);
    if (report.state == DayState::Exhausted && pending_left) {
        trace([&](TraceWriter& w) {
            w.type("day_exhausted");
            w.field("deferred", static_cast<uint64_t>(report.deferred));
        });
    }

    last_day_ = current_day_;
    ++days_simulated_;
    current_day_ = calendar_.next_working_day(current_day_);
    if (!pending_left) {
        state_ = RunState::Complete;
    }
    return report;
}

void Dispatcher::screen(std::vector<Order>& orders) {
    auto reject = [this](Order& order, std::string reason) {
        trace([&](TraceWriter& w) {
            w.type("order_rejected");
            w.field("order_id", order.id());
            w.field("reason", reason);
        });
        order.reject(std::move(reason));
    };

    std::set<std::string, std::less<>> seen;
    for (auto& order : orders) {
        if (order.status() == OrderStatus::Rejected) {
            continue;
        }
        if (order.is_pending()) {
            if (auto reason = validate_quantity(order)) {
                reject(order, *reason);
                continue;
            }
        }
        if (!seen.insert(order.id()).second) {
            if (order.is_pending()) {
                reject(order, "duplicate order id");
            }
            continue;
        }
        if (!order.is_pending()) {
            continue;
        }
        const ProductRoute* route = routing_.find(order.product_type());
        if (route != nullptr && !quantity_fits(route->workflow, order.quantity())) {
            reject(order, "quantity does not match the " +
                              std::string(to_string(route->workflow)) + " workflow");
        }
    }
}

WorkPlan Dispatcher::plan(const Order& order) const {
    const ProductRoute* route = routing_.find(order.product_type());
    if (route == nullptr) {
        throw ClassificationError(order.product_type());
    }
    if (!quantity_fits(route->workflow, order.quantity())) {
        throw InvalidOrderError("quantity of order '" + order.id() + "' does not match the " +
                                std::string(to_string(route->workflow)) + " workflow");
    }

    const MachineType* machine = catalog_.find_machine_type(route->machine);
    if (machine == nullptr) {
        throw ConfigurationError("no machine type '" + route->machine + "' for product '" +
                                 route->product + "'");
    }
    if (machine->is_process_role()) {
        throw ConfigurationError("machine type '" + route->machine + "' has no schedulable units");
    }

    WorkPlan result{route->workflow, machine, Minutes{0.0}, machine->operators_per_unit()};
    if (route->workflow == Workflow::Forming) {
        const auto& length = std::get<LengthQuantity>(order.quantity());
        result.etc = estimate_forming(length.total_length_m, machine->length_rate());
        return result;
    }

    const auto& bends = std::get<BendQuantity>(order.quantity());
    result.etc = estimate_bending(bends.total_operations(), machine->cycle_rate());
    for (const auto& role_name : route->support_roles) {
        const MachineType* role = catalog_.find_machine_type(role_name);
        if (role == nullptr) {
            throw ConfigurationError("no process role '" + role_name + "' for product '" +
                                     route->product + "'");
        }
        result.operators += role->operators_per_unit();
    }
    return result;
}

RunSummary Dispatcher::summarize(const std::vector<Order>& orders) const {
    OrderTally tally = tally_orders(orders);
    RunSummary summary;
    summary.submitted = tally.submitted;
    summary.placed = tally.placed;
    summary.rejected = tally.rejected;
    summary.unschedulable = tally.unschedulable;
    summary.pending = tally.pending;
    summary.days_simulated = days_simulated_;
    summary.last_day = last_day_;
    for (const auto& order : orders) {
        if (order.is_scheduled()) {
            summary.total_energy += order.assignment()->energy;
        }
    }
    return summary;
}

Dispatcher::Attempt Dispatcher::attempt(Order& order, uint32_t ceiling) {
    std::optional<WorkPlan> work;
    try {
        work = plan(order);
    }
    catch (const ClassificationError& e) {
        trace([&](TraceWriter& w) {
            w.type("order_unschedulable");
            w.field("order_id", order.id());
            w.field("reason", std::string_view(e.what()));
        });
        order.mark_unschedulable(e.what());
        return Attempt::Unschedulable;
    }
    catch (const ConfigurationError& e) {
        trace([&](TraceWriter& w) {
            w.type("order_skipped");
            w.field("order_id", order.id());
            w.field("reason", std::string_view(e.what()));
        });
        return defer(order, ceiling, "configuration_error");
    }
    catch (const InvalidOrderError& e) {
        trace([&](TraceWriter& w) {
            w.type("order_rejected");
            w.field("order_id", order.id());
            w.field("reason", std::string_view(e.what()));
        });
        order.reject(e.what());
        return Attempt::Rejected;
    }

    trace([&](TraceWriter& w) {
        w.type("order_attempt");
        w.field("order_id", order.id());
        w.field("workflow", to_string(work->workflow));
        w.field("machine", work->machine->name());
        w.field("etc_minutes", work->etc.count);
        w.field("operators", static_cast<uint64_t>(work->operators));
    });

    const Minutes window = catalog_.constants().daily_work_minutes;
    std::string infeasible;
    if (!std::isfinite(work->etc.count)) {
        infeasible = "machine '" + std::string(work->machine->name()) + "' has no usable speed";
    }
    else if (!(work->etc.count > 0.0)) {
        infeasible = "ETC of " + format_minutes(work->etc) +
                     " minutes is too short to occupy a slot";
    }
    else if (work->etc > window) {
        infeasible = "ETC of " + format_minutes(work->etc) + " minutes exceeds the " +
                     format_minutes(window) + "-minute working day";
    }
    else if (work->operators > ledger_.pool_size()) {
        infeasible = "needs " + std::to_string(work->operators) + " operators, pool has " +
                     std::to_string(ledger_.pool_size());
    }
    if (!infeasible.empty()) {
        trace([&](TraceWriter& w) {
            w.type("order_unschedulable");
            w.field("order_id", order.id());
            w.field("reason", infeasible);
        });
        order.mark_unschedulable(std::move(infeasible));
        return Attempt::Unschedulable;
    }

    auto choice = timelines_.select_best_unit(work->machine->id(), current_day_, work->etc);
    if (!choice) {
        return defer(order, ceiling, "no_machine_slot");
    }
    if (!ledger_.can_admit(current_day_, work->operators)) {
        return defer(order, ceiling, "operators_exhausted");
    }

    place(order, *work, *choice);
    return Attempt::Placed;
}

Dispatcher::Attempt Dispatcher::defer(Order& order, uint32_t ceiling, std::string_view reason) {
    uint32_t attempts = order.record_attempt();
    trace([&](TraceWriter& w) {
        w.type("order_deferred");
        w.field("order_id", order.id());
        w.field("priority", to_string(order.priority()));
        w.field("reason", reason);
        w.field("attempts", static_cast<uint64_t>(attempts));
    });

    if (attempts >= ceiling) {
        std::string why = "retry ceiling reached after " + std::to_string(attempts) +
                          " attempts (last: " + std::string(reason) + ")";
        trace([&](TraceWriter& w) {
            w.type("order_unschedulable");
            w.field("order_id", order.id());
            w.field("reason", why);
        });
        order.mark_unschedulable(std::move(why));
        return Attempt::Unschedulable;
    }
    return Attempt::Deferred;
}

void Dispatcher::place(Order& order, const WorkPlan& plan, const UnitSlot& choice) {
    const MachineUnit& unit = *choice.unit;
    timelines_.commit(unit.key(), current_day_, choice.slot.start, choice.slot.end, order.id());
    ledger_.commit(current_day_, plan.operators);

    Assignment assignment{
        unit.key(),
        current_day_,
        choice.slot.start,
        choice.slot.end,
        plan.etc,
        plan.operators,
        estimate_energy(plan.machine->power(), plan.etc)
    };
    order.mark_scheduled(assignment);

    log_.append(ProductionLogEntry{
        order.id(),
        order.product_type(),
        order.thickness(),
        plan.workflow,
        unit.key(),
        unit.label(),
        current_day_,
        day_label(current_day_),
        assignment.start,
        assignment.end,
        assignment.duration,
        assignment.operators,
        assignment.energy
    });

    trace([&](TraceWriter& w) {
        w.type("order_placed");
        w.field("order_id", order.id());
        w.field("product_type", order.product_type());
        w.field("unit", unit.label());
        w.field("start_minute", assignment.start.count);
        w.field("end_minute", assignment.end.count);
        w.field("operators", static_cast<uint64_t>(assignment.operators));
        w.field("energy_kwh", assignment.energy.kwh);
    });
}

uint32_t Dispatcher::retry_ceiling(std::size_t submitted) const noexcept {
    if (options_.max_attempts != 0) {
        return options_.max_attempts;
    }
    return std::max<uint32_t>(1, static_cast<uint32_t>(submitted));
}

bool Dispatcher::has_pending(const std::vector<Order>& orders) noexcept {
    return std::any_of(orders.begin(), orders.end(),
                       [](const Order& order) { return order.is_pending(); });
}

} // namespace plantsched::algo
