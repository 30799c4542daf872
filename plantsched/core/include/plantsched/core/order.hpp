#pragma once

#include <plantsched/core/machine_unit.hpp>
#include <plantsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace plantsched::core {

/// @brief Order urgency.
/// @ingroup core_orders
enum class Priority {
    Urgent, ///< Dispatched before every Normal order of the same day.
    Normal
};

/// @brief Sort rank of a priority: Urgent = 1, Normal = 2.
[[nodiscard]] constexpr int priority_rank(Priority priority) noexcept {
    return priority == Priority::Urgent ? 1 : 2;
}

/// @brief Priority name ("Urgent" / "Normal").
[[nodiscard]] std::string_view to_string(Priority priority) noexcept;

/// @brief Parse a priority name.
///
/// Accepts "Urgent" and "Normal", plus the plant-floor spelling "Mendesak"
/// for urgent orders.
///
/// @return The priority, or std::nullopt for any other text.
[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;

/// @brief Quantity of a forming order: total product length.
struct LengthQuantity {
    double total_length_m;
};

/// @brief Quantity of an accessory order: bends per item times item count.
struct BendQuantity {
    int64_t bends_per_item;
    int64_t item_count;

    /// @brief Total bend operations for the order.
    [[nodiscard]] constexpr int64_t total_operations() const noexcept {
        return bends_per_item * item_count;
    }
};

/// @brief Workflow-specific quantity of an order.
///
/// @c std::monostate marks a record whose quantity could not be read; such
/// orders are rejected before dispatch.
using OrderQuantity = std::variant<std::monostate, LengthQuantity, BendQuantity>;

/// @brief Lifecycle status of an order within one run.
/// @ingroup core_orders
enum class OrderStatus {
    Pending,      ///< Waiting for a slot; re-enters every working day.
    Scheduled,    ///< Placed; the assignment is set.
    Rejected,     ///< Invalid input; never entered the dispatch loop.
    Unschedulable ///< Terminal failure: unknown product, infeasible demand,
                  ///< or retry ceiling reached.
};

/// @brief Status name ("pending", "scheduled", "rejected", "unschedulable").
[[nodiscard]] std::string_view to_string(OrderStatus status) noexcept;

/// @brief Placement of an order on a machine unit.
/// @ingroup core_orders
struct Assignment {
    UnitKey unit;
    Day day;
    Minutes start;
    Minutes end;
    Minutes duration;
    uint32_t operators;
    Energy energy;
};

/// @brief A production order.
/// @ingroup core_orders
///
/// Orders are produced by an intake collaborator (see io::load_orders) and
/// passed to the Dispatcher, which only changes their status, attempt count
/// and assignment. An order persists across day iterations while Pending.
///
/// @see algo::Dispatcher
class Order {
public:
    /// @brief Construct a pending order.
    /// @param id           Identifier, unique across the run.
    /// @param product_type Product type name (resolved via ProductRoutingTable).
    /// @param priority     Urgency.
    /// @param quantity     Length or bend quantity.
    Order(std::string id, std::string product_type, Priority priority, OrderQuantity quantity);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& product_type() const noexcept { return product_type_; }
    [[nodiscard]] Priority priority() const noexcept { return priority_; }
    [[nodiscard]] const OrderQuantity& quantity() const noexcept { return quantity_; }

    /// @brief Material thickness label ("0.5mm"); informational only.
    [[nodiscard]] const std::string& thickness() const noexcept { return thickness_; }
    void set_thickness(std::string thickness) { thickness_ = std::move(thickness); }

    [[nodiscard]] OrderStatus status() const noexcept { return status_; }
    [[nodiscard]] bool is_scheduled() const noexcept { return status_ == OrderStatus::Scheduled; }
    [[nodiscard]] bool is_pending() const noexcept { return status_ == OrderStatus::Pending; }

    /// @brief Why the order was rejected or declared unschedulable.
    /// @return Empty for pending and scheduled orders.
    [[nodiscard]] const std::string& failure_reason() const noexcept { return failure_reason_; }

    /// @brief Number of days on which placement was attempted and failed.
    [[nodiscard]] uint32_t attempts() const noexcept { return attempts_; }

    /// @brief Placement, set once the order is scheduled.
    [[nodiscard]] const std::optional<Assignment>& assignment() const noexcept { return assignment_; }

    /// @brief Record a successful placement.
    /// @throws InvalidStateError if the order is not pending.
    void mark_scheduled(const Assignment& assignment);

    /// @brief Mark invalid input; the order never enters the dispatch loop.
    /// @throws InvalidStateError if the order is already scheduled.
    void reject(std::string reason);

    /// @brief Mark a terminal scheduling failure.
    /// @throws InvalidStateError if the order is already scheduled.
    void mark_unschedulable(std::string reason);

    /// @brief Count one failed placement day.
    /// @return Attempt count after the increment.
    uint32_t record_attempt() noexcept { return ++attempts_; }

private:
    std::string id_;
    std::string product_type_;
    Priority priority_;
    OrderQuantity quantity_;
    std::string thickness_;

    OrderStatus status_{OrderStatus::Pending};
    std::string failure_reason_;
    uint32_t attempts_{0};
    std::optional<Assignment> assignment_;
};

/// @brief Check that an order's quantity is usable.
///
/// Lengths must be finite and strictly positive; bend counts and item
/// counts must be strictly positive, and their product must fit in
/// @c int64_t so that BendQuantity::total_operations() is well defined.
///
/// @return Empty when valid, otherwise the reason for rejection.
[[nodiscard]] std::optional<std::string> validate_quantity(const Order& order);

/// @brief Order counts by status.
/// @ingroup core_orders
struct OrderTally {
    std::size_t submitted{0};
    std::size_t placed{0};
    std::size_t rejected{0};
    std::size_t unschedulable{0};
    std::size_t pending{0};
};

/// @brief Count orders by status.
[[nodiscard]] OrderTally tally_orders(const std::vector<Order>& orders) noexcept;

/// @brief Dispatch order: priority rank, then identifier ascending.
[[nodiscard]] bool dispatch_before(const Order& lhs, const Order& rhs) noexcept;

} // namespace plantsched::core
