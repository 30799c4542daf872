#pragma once

#include <plantsched/core/types.hpp>

#include <cstdint>
#include <map>

namespace plantsched::core {

/// @brief Per-day count of operators committed against the plant pool.
/// @ingroup core_operators
///
/// Each day starts at zero committed. can_admit() and commit() are always
/// used as a check-then-commit pair by the single dispatcher thread.
///
/// Invariant: committed(day) <= pool_size() for every day.
class OperatorLedger {
public:
    /// @brief Construct a ledger over a pool of @p pool_size operators.
    explicit OperatorLedger(uint32_t pool_size) noexcept
        : pool_size_(pool_size) {}

    [[nodiscard]] uint32_t pool_size() const noexcept { return pool_size_; }

    /// @brief Create the record for @p day, at zero committed, if absent.
    void ensure_day(Day day);

    /// @brief Operators committed on @p day (zero for unknown days).
    [[nodiscard]] uint32_t committed(Day day) const noexcept;

    /// @brief Operators still free on @p day.
    [[nodiscard]] uint32_t available(Day day) const noexcept {
        return pool_size_ - committed(day);
    }

    /// @brief Whether @p required operators fit in what is left on @p day.
    [[nodiscard]] bool can_admit(Day day, uint32_t required) const noexcept {
        return available(day) >= required;
    }

    /// @brief Commit @p required operators on @p day.
    /// @throws AdmissionError if the pool would be exceeded.
    void commit(Day day, uint32_t required);

    /// @brief Committed counts of every recorded day.
    [[nodiscard]] const std::map<Day, uint32_t>& days() const noexcept { return committed_; }

private:
    uint32_t pool_size_;
    std::map<Day, uint32_t> committed_;
};

} // namespace plantsched::core
