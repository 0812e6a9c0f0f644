#include <gtest/gtest.h>
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "circuit/mock_prover.hpp"
#include "gadgets/range_check.hpp"

using namespace bitcoin_vm;

class RangeCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = cs.advice_column();
        cs.enable_equality(source);
        config = RangeCheckChip::configure(cs);
    }

    struct Result {
        std::vector<AssignedCell> bytes;
        Assignment assignment;
    };

    Result decompose(uint64_t value, size_t total_bits) {
        Layouter layouter(cs);
        const size_t source_region = layouter.plan_region("source", 1);
        const size_t range_region = layouter.plan_region("range", RangeCheckChip::rows_for(total_bits));
        layouter.plan_table("byte range table", RangeCheckChip::TABLE_ROWS);
        layouter.allocate();

        RangeCheckChip chip(config);
        chip.load(layouter);

        Region src = layouter.region(source_region);
        AssignedCell cell = src.assign_advice(source, 0, BFieldElement(value));
        layouter.commit(src);

        Region range = layouter.region(range_region);
        std::vector<AssignedCell> bytes = chip.decompose(range, 0, cell, 8, total_bits);
        layouter.commit(range);
        return Result{bytes, layouter.take_assignment()};
    }

    ConstraintSystem cs;
    Column source;
    RangeCheckConfig config;
};

TEST_F(RangeCheckTest, LittleEndianBytes) {
    Result result = decompose(0x12345678, 32);
    ASSERT_EQ(result.bytes.size(), 4u);
    EXPECT_EQ(result.bytes[0].value, BFieldElement(0x78));
    EXPECT_EQ(result.bytes[1].value, BFieldElement(0x56));
    EXPECT_EQ(result.bytes[2].value, BFieldElement(0x34));
    EXPECT_EQ(result.bytes[3].value, BFieldElement(0x12));
    EXPECT_TRUE(MockProver::run(cs, result.assignment, {}).verify().empty());
}

TEST_F(RangeCheckTest, MaximumLimb) {
    Result result = decompose(0xffffffffULL, 32);
    EXPECT_TRUE(MockProver::run(cs, result.assignment, {}).verify().empty());
}

TEST_F(RangeCheckTest, RowsFor) {
    EXPECT_EQ(RangeCheckChip::rows_for(32), 5u);
    EXPECT_EQ(RangeCheckChip::rows_for(8), 2u);
}

TEST_F(RangeCheckTest, OverflowThrows) {
    EXPECT_THROW(decompose(0x1ffffffffULL, 32), std::invalid_argument);
}

TEST_F(RangeCheckTest, UnsupportedShapesThrow) {
    Layouter layouter(cs);
    const size_t index = layouter.plan_region("range", 8);
    layouter.allocate();
    Region region = layouter.region(index);
    AssignedCell cell = region.assign_advice(source, 0, BFieldElement(1));
    RangeCheckChip chip(config);
    EXPECT_THROW(chip.decompose(region, 1, cell, 4, 32), std::invalid_argument);
    EXPECT_THROW(chip.decompose(region, 1, cell, 8, 12), std::invalid_argument);
}

TEST_F(RangeCheckTest, TamperedByteIsRejected) {
    Result result = decompose(0x0102, 16);
    const Cell byte = result.bytes[0].cell;
    // 0x0102 = 256 * 0x01 + 0x02; shift weight between bytes
    result.assignment.set(byte.column, byte.row, BFieldElement(0x02 + 256));
    EXPECT_FALSE(MockProver::run(cs, result.assignment, {}).verify().empty());
}

TEST_F(RangeCheckTest, ValueMustMatchSourceCell) {
    Result result = decompose(0xabcd, 16);
    result.assignment.set(source, 0, BFieldElement(0xabce));
    auto failures = MockProver::run(cs, result.assignment, {}).verify();
    ASSERT_FALSE(failures.empty());
    EXPECT_EQ(failures.back().kind, VerifyFailure::Kind::Permutation);
}
