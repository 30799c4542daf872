#include <plantsched/core/catalog.hpp>
#include <plantsched/core/error.hpp>
#include <plantsched/core/machine_type.hpp>
#include <plantsched/core/machine_unit.hpp>

#include <gtest/gtest.h>

using namespace plantsched::core;

class CatalogTest : public ::testing::Test {
protected:
    ResourceCatalog catalog_;
};

TEST_F(CatalogTest, AddMachineType) {
    auto& type = catalog_.add_machine_type("Yane600", LengthRate{16.0}, Power{11.0}, 2, 1);

    EXPECT_EQ(type.id(), 0U);
    EXPECT_EQ(type.name(), "Yane600");
    EXPECT_DOUBLE_EQ(type.power().kw, 11.0);
    EXPECT_EQ(type.unit_count(), 2U);
    EXPECT_EQ(type.operators_per_unit(), 1U);
    EXPECT_FALSE(type.is_process_role());
    EXPECT_DOUBLE_EQ(type.length_rate().metres_per_minute, 16.0);
    EXPECT_DOUBLE_EQ(type.cycle_rate().seconds_per_operation, 0.0);
}

TEST_F(CatalogTest, AddProcessRole) {
    auto& role = catalog_.add_machine_type("Shearing", std::monostate{}, Power{0.0}, 0, 2);

    EXPECT_TRUE(role.is_process_role());
    EXPECT_EQ(role.operators_per_unit(), 2U);
}

TEST_F(CatalogTest, DuplicateNameThrows) {
    catalog_.add_machine_type("Bending", CycleRate{4.0}, Power{9.7}, 2, 2);
    EXPECT_THROW(catalog_.add_machine_type("Bending", CycleRate{5.0}, Power{9.7}, 1, 2),
                 InvalidConfigurationError);
}

TEST_F(CatalogTest, UnitsWithoutSpeedThrow) {
    EXPECT_THROW(catalog_.add_machine_type("Yane600", std::monostate{}, Power{11.0}, 2, 1),
                 InvalidConfigurationError);
}

TEST_F(CatalogTest, RoleWithSpeedThrows) {
    EXPECT_THROW(catalog_.add_machine_type("Forklift", LengthRate{1.0}, Power{0.0}, 0, 1),
                 InvalidConfigurationError);
}

TEST_F(CatalogTest, NegativePowerThrows) {
    EXPECT_THROW(catalog_.add_machine_type("Yane600", LengthRate{16.0}, Power{-1.0}, 1, 1),
                 InvalidConfigurationError);
}

TEST_F(CatalogTest, FinalizeCreatesUnits) {
    catalog_.add_machine_type("Yane600", LengthRate{16.0}, Power{11.0}, 2, 1);
    catalog_.add_machine_type("Shearing", std::monostate{}, Power{0.0}, 0, 2);
    catalog_.add_machine_type("Bending", CycleRate{4.0}, Power{9.7}, 2, 2);
    catalog_.finalize();

    EXPECT_TRUE(catalog_.is_finalized());
    EXPECT_EQ(catalog_.unit_count(), 4U);
    EXPECT_EQ(catalog_.unit(0).label(), "Yane600_1");
    EXPECT_EQ(catalog_.unit(1).label(), "Yane600_2");
    EXPECT_EQ(catalog_.unit(2).label(), "Bending_1");
    EXPECT_TRUE(catalog_.units_of(1).empty());
    EXPECT_EQ(catalog_.units_of(2).size(), 2U);
}

TEST_F(CatalogTest, UnitLookupByKey) {
    catalog_.add_machine_type("Yane600", LengthRate{16.0}, Power{11.0}, 2, 1);
    catalog_.finalize();

    const auto& unit = catalog_.unit(UnitKey{0, 1});
    EXPECT_EQ(unit.index(), 1U);
    EXPECT_EQ(&unit.type(), &catalog_.machine_type(0));
    EXPECT_THROW((void)catalog_.unit(UnitKey{0, 2}), OutOfRangeError);
    EXPECT_THROW((void)catalog_.unit(UnitKey{5, 0}), OutOfRangeError);
}

TEST_F(CatalogTest, AddAfterFinalizeThrows) {
    catalog_.finalize();
    EXPECT_THROW(catalog_.add_machine_type("Yane600", LengthRate{16.0}, Power{11.0}, 2, 1),
                 AlreadyFinalizedError);
    EXPECT_THROW(catalog_.set_constants(PlantConstants{}), AlreadyFinalizedError);
}

TEST_F(CatalogTest, InvalidConstantsThrow) {
    PlantConstants constants;
    constants.daily_work_minutes = Minutes{0.0};
    EXPECT_THROW(catalog_.set_constants(constants), InvalidConfigurationError);

    constants = PlantConstants{};
    constants.work_days_per_week = 8;
    EXPECT_THROW(catalog_.set_constants(constants), InvalidConfigurationError);
}

TEST_F(CatalogTest, FindMachineType) {
    catalog_.add_machine_type("Yane750", LengthRate{20.0}, Power{9.5}, 1, 1);

    ASSERT_NE(catalog_.find_machine_type("Yane750"), nullptr);
    EXPECT_EQ(catalog_.find_machine_type("Yane999"), nullptr);
    EXPECT_THROW((void)catalog_.machine_type(3), OutOfRangeError);
}

TEST(ReferenceCatalogTest, MatchesPlant) {
    auto catalog = make_reference_catalog();

    EXPECT_TRUE(catalog.is_finalized());
    EXPECT_EQ(catalog.machine_type_count(), 6U);
    // Yane600 x2, Yane672, Yane750, Bending x2
    EXPECT_EQ(catalog.unit_count(), 6U);
    EXPECT_EQ(catalog.constants().operator_pool, 10U);
    EXPECT_DOUBLE_EQ(catalog.constants().daily_work_minutes.count, 480.0);
    EXPECT_EQ(catalog.constants().work_days_per_week, 5U);

    const auto* bending = catalog.find_machine_type("Bending");
    ASSERT_NE(bending, nullptr);
    EXPECT_DOUBLE_EQ(bending->cycle_rate().seconds_per_operation, 4.0);
    EXPECT_EQ(bending->operators_per_unit(), 2U);
}

TEST(ReferenceCatalogTest, SurvivesMove) {
    auto catalog = make_reference_catalog();
    const MachineType* yane = catalog.find_machine_type("Yane600");

    ResourceCatalog moved = std::move(catalog);
    EXPECT_EQ(moved.find_machine_type("Yane600"), yane);
    EXPECT_EQ(&moved.unit(0).type(), yane);
}
