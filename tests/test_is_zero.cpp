#include <gtest/gtest.h>
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "circuit/mock_prover.hpp"
#include "gadgets/is_zero.hpp"

using namespace bitcoin_vm;

/**
 * out = (value == 0) enforced through the is-zero indicator
 */
class IsZeroTest : public ::testing::Test {
protected:
    void SetUp() override {
        value = cs.advice_column();
        out = cs.advice_column();
        q = cs.selector();
        const Expression q_expr = Expression::query(q);
        config = IsZeroChip::configure(cs, "value", q_expr, Expression::query(value, Rotation::cur()),
                                       cs.advice_column());
        cs.create_gate("output is indicator", {
            q_expr * (Expression::query(out, Rotation::cur()) - config.expr()),
        });
    }

    std::vector<VerifyFailure> run(const std::vector<uint64_t>& values,
                                   const std::vector<uint64_t>& outputs,
                                   bool honest_inverse = true) {
        Layouter layouter(cs);
        const size_t index = layouter.plan_region("is zero", values.size());
        layouter.allocate();
        Region region = layouter.region(index);
        IsZeroChip chip(config);
        for (size_t i = 0; i < values.size(); ++i) {
            region.enable_selector(q, i);
            region.assign_advice(value, i, BFieldElement(values[i]));
            region.assign_advice(out, i, BFieldElement(outputs[i]));
            if (honest_inverse) {
                chip.assign(region, i, BFieldElement(values[i]));
            } else {
                region.assign_advice(config.value_inv(), i, BFieldElement(3));
            }
        }
        layouter.commit(region);
        Assignment assignment = layouter.take_assignment();
        return MockProver::run(cs, assignment, {}).verify();
    }

    ConstraintSystem cs;
    Column value;
    Column out;
    Selector q;
    IsZeroConfig config;
};

TEST_F(IsZeroTest, IndicatorMatchesValue) {
    EXPECT_TRUE(run({0, 1, 0x80, BFieldElement::MODULUS - 1}, {1, 0, 0, 0}).empty());
}

TEST_F(IsZeroTest, WrongIndicatorIsRejected) {
    EXPECT_FALSE(run({5}, {1}).empty());
    EXPECT_FALSE(run({0}, {0}).empty());
}

TEST_F(IsZeroTest, NonZeroValueNeedsTrueInverse) {
    // An arbitrary inverse breaks value * (1 - value * inv) = 0
    EXPECT_FALSE(run({5}, {0}, false).empty());
}

TEST_F(IsZeroTest, ZeroValueAcceptsAnyInverse) {
    // 1 - 0 * inv = 1 regardless of inv
    EXPECT_TRUE(run({0}, {1}, false).empty());
}

TEST_F(IsZeroTest, AssignWritesInverseOrZero) {
    Layouter layouter(cs);
    const size_t index = layouter.plan_region("is zero", 2);
    layouter.allocate();
    Region region = layouter.region(index);
    IsZeroChip chip(config);
    AssignedCell zero = chip.assign(region, 0, BFieldElement::zero());
    AssignedCell seven = chip.assign(region, 1, BFieldElement(7));
    EXPECT_EQ(zero.value, BFieldElement::zero());
    EXPECT_EQ(seven.value * BFieldElement(7), BFieldElement::one());
}
