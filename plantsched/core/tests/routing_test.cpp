#include <plantsched/core/routing.hpp>
#include <plantsched/core/error.hpp>

#include <gtest/gtest.h>

using namespace plantsched::core;

TEST(RoutingTest, FormingRoute) {
    ProductRoutingTable table;
    table.add_forming_route("Yane600", "Yane600");

    const auto* route = table.find("Yane600");
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->workflow, Workflow::Forming);
    EXPECT_EQ(route->machine, "Yane600");
    EXPECT_TRUE(route->support_roles.empty());
}

TEST(RoutingTest, ShearingBendingRoute) {
    ProductRoutingTable table;
    table.add_shearing_bending_route("Aksesoris", "Bending", {"Shearing", "Forklift"});

    const auto* route = table.find("Aksesoris");
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->workflow, Workflow::ShearingBending);
    EXPECT_EQ(route->machine, "Bending");
    ASSERT_EQ(route->support_roles.size(), 2U);
    EXPECT_EQ(route->support_roles[0], "Shearing");
}

TEST(RoutingTest, UnknownProductIsNotFound) {
    ProductRoutingTable table;
    table.add_forming_route("Yane600", "Yane600");
    EXPECT_EQ(table.find("Spandek"), nullptr);
}

TEST(RoutingTest, DuplicateProductThrows) {
    ProductRoutingTable table;
    table.add_forming_route("SD680", "Yane750");
    EXPECT_THROW(table.add_forming_route("SD680", "Yane600"), InvalidConfigurationError);
    EXPECT_THROW(table.add_shearing_bending_route("SD680", "Bending", {}),
                 InvalidConfigurationError);
}

TEST(RoutingTest, ReferenceRoutesDerivedProductsToYane750) {
    auto table = make_reference_routing();

    EXPECT_EQ(table.routes().size(), 6U);
    ASSERT_NE(table.find("SD680"), nullptr);
    EXPECT_EQ(table.find("SD680")->machine, "Yane750");
    ASSERT_NE(table.find("Kabe325"), nullptr);
    EXPECT_EQ(table.find("Kabe325")->machine, "Yane750");
    ASSERT_NE(table.find("Aksesoris"), nullptr);
    EXPECT_EQ(table.find("Aksesoris")->workflow, Workflow::ShearingBending);
}

TEST(RoutingTest, WorkflowNames) {
    EXPECT_EQ(to_string(Workflow::Forming), "forming");
    EXPECT_EQ(to_string(Workflow::ShearingBending), "shearing_bending");
}
