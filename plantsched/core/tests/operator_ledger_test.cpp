#include <plantsched/core/operator_ledger.hpp>
#include <plantsched/core/error.hpp>

#include <gtest/gtest.h>

using namespace plantsched::core;

class OperatorLedgerTest : public ::testing::Test {
protected:
    OperatorLedger ledger_{10};
};

TEST_F(OperatorLedgerTest, FreshDayHasWholePool) {
    EXPECT_EQ(ledger_.pool_size(), 10U);
    EXPECT_EQ(ledger_.committed(Day{1}), 0U);
    EXPECT_EQ(ledger_.available(Day{1}), 10U);
    EXPECT_TRUE(ledger_.can_admit(Day{1}, 10));
    EXPECT_FALSE(ledger_.can_admit(Day{1}, 11));
}

TEST_F(OperatorLedgerTest, CommitReducesAvailability) {
    ledger_.commit(Day{1}, 5);
    ledger_.commit(Day{1}, 3);

    EXPECT_EQ(ledger_.committed(Day{1}), 8U);
    EXPECT_EQ(ledger_.available(Day{1}), 2U);
    EXPECT_FALSE(ledger_.can_admit(Day{1}, 3));
    EXPECT_TRUE(ledger_.can_admit(Day{1}, 2));
}

TEST_F(OperatorLedgerTest, ExactFitIsAdmitted) {
    ledger_.commit(Day{1}, 5);
    EXPECT_NO_THROW(ledger_.commit(Day{1}, 5));
    EXPECT_EQ(ledger_.available(Day{1}), 0U);
}

TEST_F(OperatorLedgerTest, OverCommitThrowsAndLeavesLedgerUnchanged) {
    ledger_.commit(Day{1}, 8);
    try {
        ledger_.commit(Day{1}, 3);
        FAIL() << "expected AdmissionError";
    }
    catch (const AdmissionError& e) {
        EXPECT_EQ(e.requested(), 3U);
        EXPECT_EQ(e.available(), 2U);
    }
    EXPECT_EQ(ledger_.committed(Day{1}), 8U);
}

TEST_F(OperatorLedgerTest, DaysAreIndependent) {
    ledger_.commit(Day{1}, 10);
    EXPECT_EQ(ledger_.available(Day{2}), 10U);
}

TEST_F(OperatorLedgerTest, EnsureDayRecordsZero) {
    ledger_.ensure_day(Day{8});
    ASSERT_EQ(ledger_.days().size(), 1U);
    EXPECT_EQ(ledger_.days().at(Day{8}), 0U);
}
