#include <plantsched/core/order.hpp>
#include <plantsched/core/error.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace plantsched::core {

std::string_view to_string(Priority priority) noexcept {
    return priority == Priority::Urgent ? "Urgent" : "Normal";
}

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    if (text == "Urgent" || text == "Mendesak") {
        return Priority::Urgent;
    }
    if (text == "Normal") {
        return Priority::Normal;
    }
    return std::nullopt;
}

std::string_view to_string(OrderStatus status) noexcept {
    switch (status) {
        case OrderStatus::Pending:
            return "pending";
        case OrderStatus::Scheduled:
            return "scheduled";
        case OrderStatus::Rejected:
            return "rejected";
        case OrderStatus::Unschedulable:
            return "unschedulable";
    }
    return "unknown";
}

Order::Order(std::string id, std::string product_type, Priority priority, OrderQuantity quantity)
    : id_(std::move(id))
    , product_type_(std::move(product_type))
    , priority_(priority)
    , quantity_(quantity) {}

void Order::mark_scheduled(const Assignment& assignment) {
    if (status_ != OrderStatus::Pending) {
        throw InvalidStateError("order '" + id_ + "' is " + std::string(to_string(status_)) +
                                ", cannot schedule it");
    }
    assignment_ = assignment;
    status_ = OrderStatus::Scheduled;
}

void Order::reject(std::string reason) {
    if (status_ == OrderStatus::Scheduled) {
        throw InvalidStateError("order '" + id_ + "' is already scheduled");
    }
    status_ = OrderStatus::Rejected;
    failure_reason_ = std::move(reason);
}

void Order::mark_unschedulable(std::string reason) {
    if (status_ == OrderStatus::Scheduled) {
        throw InvalidStateError("order '" + id_ + "' is already scheduled");
    }
    status_ = OrderStatus::Unschedulable;
    failure_reason_ = std::move(reason);
}

std::optional<std::string> validate_quantity(const Order& order) {
    const auto& quantity = order.quantity();
    if (std::holds_alternative<std::monostate>(quantity)) {
        return "missing or non-numeric quantity";
    }
    if (const auto* length = std::get_if<LengthQuantity>(&quantity)) {
        if (!std::isfinite(length->total_length_m) || length->total_length_m <= 0.0) {
            return "total length must be a positive number of metres";
        }
        return std::nullopt;
    }
    const auto& bends = std::get<BendQuantity>(quantity);
    if (bends.bends_per_item <= 0) {
        return "bends per item must be positive";
    }
    if (bends.item_count <= 0) {
        return "item count must be positive";
    }
    if (bends.item_count > std::numeric_limits<int64_t>::max() / bends.bends_per_item) {
        return "bend count too large";
    }
    return std::nullopt;
}

OrderTally tally_orders(const std::vector<Order>& orders) noexcept {
    OrderTally tally;
    tally.submitted = orders.size();
    for (const auto& order : orders) {
        switch (order.status()) {
            case OrderStatus::Scheduled:
                ++tally.placed;
                break;
            case OrderStatus::Rejected:
                ++tally.rejected;
                break;
            case OrderStatus::Unschedulable:
                ++tally.unschedulable;
                break;
            case OrderStatus::Pending:
                ++tally.pending;
                break;
        }
    }
    return tally;
}

bool dispatch_before(const Order& lhs, const Order& rhs) noexcept {
    int lhs_rank = priority_rank(lhs.priority());
    int rhs_rank = priority_rank(rhs.priority());
    if (lhs_rank != rhs_rank) {
        return lhs_rank < rhs_rank;
    }
    return lhs.id() < rhs.id();
}

} // namespace plantsched::core
