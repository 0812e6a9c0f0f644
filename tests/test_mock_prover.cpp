#include <gtest/gtest.h>
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "circuit/mock_prover.hpp"
#include "types/b_field_element.hpp"

using namespace bitcoin_vm;

/**
 * Fibonacci-style circuit: a[i+1] = a[i] + a[i-1] under a selector,
 * a[0] bound to instance row 0.
 */
class MockProverTest : public ::testing::Test {
protected:
    void SetUp() override {
        a = cs.advice_column();
        cs.enable_equality(a);
        instance = cs.instance_column();
        cs.enable_equality(instance);
        q = cs.selector();
        table = cs.lookup_table_column();

        const Expression q_expr = Expression::query(q);
        cs.create_gate("fibonacci", {
            q_expr * (Expression::query(a, Rotation::next()) -
                      Expression::query(a, Rotation::cur()) -
                      Expression::query(a, Rotation::prev())),
        });
        cs.lookup("small values", {{q_expr * Expression::query(a, Rotation::cur()), table}});
    }

    // Rows 0..5 hold 1, 1, 2, 3, 5, 8
    Assignment build(const std::vector<uint64_t>& values) {
        Layouter layouter(cs);
        const size_t index = layouter.plan_region("fibonacci", values.size());
        layouter.plan_table("small values", 16);
        layouter.allocate();

        TableRegion t = layouter.table("small values");
        for (size_t v = 0; v < 16; ++v) {
            t.assign_cell(table, v, BFieldElement(v));
        }

        Region region = layouter.region(index);
        AssignedCell first;
        for (size_t i = 0; i < values.size(); ++i) {
            AssignedCell cell = region.assign_advice(a, i, BFieldElement(values[i]));
            if (i == 0) first = cell;
            if (i > 0 && i + 1 < values.size()) {
                region.enable_selector(q, i);
            }
        }
        layouter.commit(region);
        layouter.constrain_instance(first.cell, instance, 0);
        return layouter.take_assignment();
    }

    ConstraintSystem cs;
    Column a;
    Column instance;
    Selector q;
    TableColumn table;
};

TEST_F(MockProverTest, HonestWitnessIsSatisfied) {
    Assignment assignment = build({1, 1, 2, 3, 5, 8});
    EXPECT_EQ(assignment.num_rows(), 16u);
    auto prover = MockProver::run(cs, assignment, {{BFieldElement(1)}});
    EXPECT_TRUE(prover.verify().empty());
    EXPECT_NO_THROW(prover.assert_satisfied());
}

TEST_F(MockProverTest, BrokenGateIsReported) {
    Assignment assignment = build({1, 1, 2, 4, 5, 8});
    auto failures = MockProver::run(cs, assignment, {{BFieldElement(1)}}).verify();
    ASSERT_FALSE(failures.empty());
    EXPECT_EQ(failures[0].kind, VerifyFailure::Kind::ConstraintNotSatisfied);
    EXPECT_EQ(failures[0].name, "fibonacci");
    EXPECT_THROW(MockProver::run(cs, assignment, {{BFieldElement(1)}}).assert_satisfied(), std::runtime_error);
}

TEST_F(MockProverTest, LookupOutsideTableIsReported) {
    // 8 + 13 = 21 is outside the 0..15 table
    Assignment assignment = build({8, 13, 21, 34});
    auto failures = MockProver::run(cs, assignment, {{BFieldElement(8)}}).verify();
    bool lookup_failed = false;
    for (const auto& failure : failures) {
        if (failure.kind == VerifyFailure::Kind::Lookup) {
            lookup_failed = true;
            EXPECT_EQ(failure.name, "small values");
        }
    }
    EXPECT_TRUE(lookup_failed);
}

TEST_F(MockProverTest, WrongInstanceIsPermutationFailure) {
    Assignment assignment = build({1, 1, 2, 3, 5, 8});
    auto failures = MockProver::run(cs, assignment, {{BFieldElement(2)}}).verify();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].kind, VerifyFailure::Kind::Permutation);
}

TEST_F(MockProverTest, RotationsWrapAround) {
    // Selector on the last row reads row 0 as its next row
    Layouter layouter(cs);
    layouter.plan_region("wrap", 4);
    layouter.allocate();
    Assignment& assignment = layouter.assignment();
    assignment.set(a, 0, BFieldElement(5));
    assignment.set(a, 2, BFieldElement(2));
    assignment.set(a, 3, BFieldElement(3));
    assignment.set(q.column, 3, BFieldElement::one());
    assignment.set(table.column, 3, BFieldElement(3));
    auto failures = MockProver::run(cs, assignment, {{}}).verify();
    EXPECT_TRUE(failures.empty());
}

TEST_F(MockProverTest, InstanceColumnCountMismatchThrows) {
    Assignment assignment = build({1, 1, 2});
    EXPECT_THROW(MockProver::run(cs, assignment, {}), std::invalid_argument);
}

TEST_F(MockProverTest, CopyOnColumnWithoutEqualityThrows) {
    Column plain = cs.advice_column();
    Layouter layouter(cs);
    const size_t index = layouter.plan_region("copies", 2);
    layouter.allocate();
    Region region = layouter.region(index);
    AssignedCell x = region.assign_advice(a, 0, BFieldElement(1));
    AssignedCell y = region.assign_advice(plain, 1, BFieldElement(1));
    EXPECT_THROW(region.constrain_equal(x.cell, y.cell), std::invalid_argument);
}

TEST_F(MockProverTest, RegionOffsetOutOfBoundsThrows) {
    Layouter layouter(cs);
    const size_t index = layouter.plan_region("small", 2);
    layouter.allocate();
    Region region = layouter.region(index);
    EXPECT_THROW(region.assign_advice(a, 2, BFieldElement(1)), std::out_of_range);
}

TEST_F(MockProverTest, GateDegree) {
    // Lookup inputs count one degree higher
    EXPECT_EQ(cs.max_degree(), 3u);
}
