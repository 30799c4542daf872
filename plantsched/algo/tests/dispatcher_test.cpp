#include <plantsched/algo/dispatcher.hpp>
#include <plantsched/algo/error.hpp>

#include <plantsched/core/catalog.hpp>
#include <plantsched/core/error.hpp>
#include <plantsched/core/machine_type.hpp>
#include <plantsched/core/routing.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace plantsched::algo;
using namespace plantsched::core;

class DispatcherPlanTest : public ::testing::Test {
protected:
    ResourceCatalog catalog_{make_reference_catalog()};
    ProductRoutingTable routing_{make_reference_routing()};
    Dispatcher dispatcher_{catalog_, routing_};
};

// =============================================================================
// Work planning
// =============================================================================

TEST_F(DispatcherPlanTest, FormingPlan) {
    Order order("P-1", "Yane600", Priority::Normal, LengthQuantity{4800.0});
    auto plan = dispatcher_.plan(order);

    EXPECT_EQ(plan.workflow, Workflow::Forming);
    ASSERT_NE(plan.machine, nullptr);
    EXPECT_EQ(plan.machine->name(), "Yane600");
    EXPECT_DOUBLE_EQ(plan.etc.count, 300.0);
    EXPECT_EQ(plan.operators, 1U);
}

TEST_F(DispatcherPlanTest, DerivedProductsUseYane750) {
    Order sd("P-1", "SD680", Priority::Normal, LengthQuantity{2000.0});
    Order kabe("P-2", "Kabe325", Priority::Normal, LengthQuantity{1000.0});

    auto sd_plan = dispatcher_.plan(sd);
    auto kabe_plan = dispatcher_.plan(kabe);

    EXPECT_EQ(sd_plan.machine->name(), "Yane750");
    EXPECT_DOUBLE_EQ(sd_plan.etc.count, 100.0);
    EXPECT_EQ(kabe_plan.machine->name(), "Yane750");
    EXPECT_DOUBLE_EQ(kabe_plan.etc.count, 50.0);
}

TEST_F(DispatcherPlanTest, ShearingBendingPlanIncludesSupportCrews) {
    Order order("A-1", "Aksesoris", Priority::Normal, BendQuantity{4, 900});
    auto plan = dispatcher_.plan(order);

    EXPECT_EQ(plan.workflow, Workflow::ShearingBending);
    EXPECT_EQ(plan.machine->name(), "Bending");
    // 3600 bends x 4 s
    EXPECT_DOUBLE_EQ(plan.etc.count, 240.0);
    // Bending 2 + Shearing 2 + Forklift 1
    EXPECT_EQ(plan.operators, 5U);
}

TEST_F(DispatcherPlanTest, UnknownProductThrowsClassificationError) {
    Order order("X-1", "Spandek", Priority::Normal, LengthQuantity{100.0});
    try {
        (void)dispatcher_.plan(order);
        FAIL() << "expected ClassificationError";
    }
    catch (const ClassificationError& e) {
        EXPECT_EQ(e.product_type(), "Spandek");
    }
}

TEST_F(DispatcherPlanTest, QuantityMismatchThrowsInvalidOrder) {
    Order order("P-1", "Yane600", Priority::Normal, BendQuantity{4, 10});
    EXPECT_THROW((void)dispatcher_.plan(order), InvalidOrderError);
}

TEST(DispatcherConfigTest, MissingMachineThrowsConfigurationError) {
    auto catalog = make_reference_catalog();
    ProductRoutingTable routing;
    routing.add_forming_route("Ghost", "Yane999");
    Dispatcher dispatcher(catalog, routing);

    Order order("G-1", "Ghost", Priority::Normal, LengthQuantity{100.0});
    EXPECT_THROW((void)dispatcher.plan(order), ConfigurationError);
}

TEST(DispatcherConfigTest, MissingSupportRoleThrowsConfigurationError) {
    auto catalog = make_reference_catalog();
    ProductRoutingTable routing;
    routing.add_shearing_bending_route("Aksesoris", "Bending", {"Shearing", "Crane"});
    Dispatcher dispatcher(catalog, routing);

    Order order("A-1", "Aksesoris", Priority::Normal, BendQuantity{4, 10});
    EXPECT_THROW((void)dispatcher.plan(order), ConfigurationError);
}

TEST(DispatcherConfigTest, RouteOntoProcessRoleThrowsConfigurationError) {
    auto catalog = make_reference_catalog();
    ProductRoutingTable routing;
    routing.add_forming_route("Sheet", "Shearing");
    Dispatcher dispatcher(catalog, routing);

    Order order("S-1", "Sheet", Priority::Normal, LengthQuantity{100.0});
    EXPECT_THROW((void)dispatcher.plan(order), ConfigurationError);
}

TEST(DispatcherConfigTest, RequiresFinalizedCatalog) {
    ResourceCatalog catalog;
    catalog.add_machine_type("Yane600", LengthRate{16.0}, Power{11.0}, 1, 1);
    ProductRoutingTable routing;
    EXPECT_THROW(Dispatcher dispatcher(catalog, routing), InvalidStateError);
}

// =============================================================================
// Screening
// =============================================================================

TEST_F(DispatcherPlanTest, ScreenRejectsInvalidQuantities) {
    std::vector<Order> orders;
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{-5.0});
    orders.emplace_back("P-2", "Yane600", Priority::Normal, LengthQuantity{0.0});
    orders.emplace_back("A-1", "Aksesoris", Priority::Normal, BendQuantity{0, 10});
    orders.emplace_back("P-3", "Yane600", Priority::Normal, LengthQuantity{10.0});

    dispatcher_.screen(orders);

    EXPECT_EQ(orders[0].status(), OrderStatus::Rejected);
    EXPECT_EQ(orders[1].status(), OrderStatus::Rejected);
    EXPECT_EQ(orders[2].status(), OrderStatus::Rejected);
    EXPECT_TRUE(orders[3].is_pending());
    EXPECT_FALSE(orders[0].failure_reason().empty());
}

TEST_F(DispatcherPlanTest, ScreenRejectsOverflowingBendCount) {
    std::vector<Order> orders;
    orders.emplace_back("A-1", "Aksesoris", Priority::Urgent, BendQuantity{3037000500, 3037000500});
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{160.0});

    auto summary = dispatcher_.run(orders);

    EXPECT_EQ(orders[0].status(), OrderStatus::Rejected);
    EXPECT_EQ(orders[0].failure_reason(), "bend count too large");
    EXPECT_TRUE(orders[1].is_scheduled());
    EXPECT_EQ(summary.rejected, 1U);
    EXPECT_EQ(summary.placed, 1U);
    EXPECT_EQ(dispatcher_.state(), RunState::Complete);
}

TEST_F(DispatcherPlanTest, ScreenRejectsLaterDuplicates) {
    std::vector<Order> orders;
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{10.0});
    orders.emplace_back("P-1", "Yane672", Priority::Urgent, LengthQuantity{20.0});

    dispatcher_.screen(orders);

    EXPECT_TRUE(orders[0].is_pending());
    EXPECT_EQ(orders[1].status(), OrderStatus::Rejected);
    EXPECT_EQ(orders[1].failure_reason(), "duplicate order id");
}

TEST_F(DispatcherPlanTest, ScreenRejectsWorkflowMismatch) {
    std::vector<Order> orders;
    orders.emplace_back("P-1", "Yane600", Priority::Normal, BendQuantity{2, 2});
    orders.emplace_back("A-1", "Aksesoris", Priority::Normal, LengthQuantity{10.0});

    dispatcher_.screen(orders);

    EXPECT_EQ(orders[0].status(), OrderStatus::Rejected);
    EXPECT_EQ(orders[1].status(), OrderStatus::Rejected);
}

TEST_F(DispatcherPlanTest, ScreenLeavesUnknownProductsForDispatch) {
    std::vector<Order> orders;
    orders.emplace_back("X-1", "Spandek", Priority::Normal, LengthQuantity{10.0});

    dispatcher_.screen(orders);
    EXPECT_TRUE(orders[0].is_pending());
}

TEST_F(DispatcherPlanTest, InfeasibleDemandIsDetectedAtFirstAttempt) {
    std::vector<Order> orders;
    // 8000 m at 16 m/min = 500 min > 480
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{8000.0});

    dispatcher_.screen(orders);
    EXPECT_TRUE(orders[0].is_pending());

    auto report = dispatcher_.run_day(orders);
    EXPECT_EQ(report.attempted, 1U);
    EXPECT_EQ(orders[0].status(), OrderStatus::Unschedulable);
    EXPECT_EQ(orders[0].attempts(), 0U);
}

TEST_F(DispatcherPlanTest, ScreenIsIdempotent) {
    std::vector<Order> orders;
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{10.0});
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{10.0});

    dispatcher_.screen(orders);
    dispatcher_.screen(orders);

    EXPECT_TRUE(orders[0].is_pending());
    EXPECT_EQ(orders[1].status(), OrderStatus::Rejected);
}

// =============================================================================
// Summary
// =============================================================================

TEST_F(DispatcherPlanTest, SummaryCountsEveryStatus) {
    std::vector<Order> orders;
    orders.emplace_back("P-1", "Yane600", Priority::Normal, LengthQuantity{10.0});
    orders.emplace_back("P-2", "Yane600", Priority::Normal, LengthQuantity{-1.0});
    orders.emplace_back("X-1", "Spandek", Priority::Normal, LengthQuantity{10.0});

    auto summary = dispatcher_.run(orders);

    EXPECT_EQ(summary.submitted, 3U);
    EXPECT_EQ(summary.placed, 1U);
    EXPECT_EQ(summary.rejected, 1U);
    EXPECT_EQ(summary.unschedulable, 1U);
    EXPECT_EQ(summary.pending, 0U);
    EXPECT_EQ(summary.placed + summary.rejected + summary.unschedulable + summary.pending,
              summary.submitted);
    EXPECT_EQ(dispatcher_.state(), RunState::Complete);
}

TEST_F(DispatcherPlanTest, EmptyRunCompletesImmediately) {
    std::vector<Order> orders;
    auto summary = dispatcher_.run(orders);

    EXPECT_EQ(summary.submitted, 0U);
    EXPECT_EQ(summary.days_simulated, 0U);
    EXPECT_EQ(dispatcher_.state(), RunState::Complete);
    EXPECT_TRUE(dispatcher_.log().empty());
}
