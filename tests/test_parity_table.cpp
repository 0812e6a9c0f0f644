#include <gtest/gtest.h>
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "circuit/mock_prover.hpp"
#include "script/opcodes.hpp"
#include "table/parity_table.hpp"
#include <set>

using namespace bitcoin_vm;

class ParityTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        prefix = cs.advice_column();
        y_low = cs.advice_column();
        q = cs.selector();
        config = ParityTableChip::configure(cs, Expression::query(q),
                                            Expression::query(prefix, Rotation::cur()),
                                            Expression::query(y_low, Rotation::cur()));
    }

    bool satisfied(uint8_t pk_prefix, uint8_t parity_byte) {
        Layouter layouter(cs);
        const size_t index = layouter.plan_region("keys", 1);
        layouter.plan_table("public key parity table", ParityTableChip::NUM_ROWS);
        layouter.allocate();
        ParityTableChip(config).load(layouter);
        Region region = layouter.region(index);
        region.enable_selector(q, 0);
        region.assign_advice(prefix, 0, BFieldElement(pk_prefix));
        region.assign_advice(y_low, 0, BFieldElement(parity_byte));
        layouter.commit(region);
        Assignment assignment = layouter.take_assignment();
        return MockProver::run(cs, assignment, {}).verify().empty();
    }

    ConstraintSystem cs;
    Column prefix;
    Column y_low;
    Selector q;
    ParityTableConfig config;
};

TEST_F(ParityTableTest, RowContents) {
    const auto rows = ParityTableChip::rows();
    ASSERT_EQ(rows.size(), ParityTableChip::NUM_ROWS);
    std::set<std::pair<uint8_t, uint8_t>> unique(rows.begin(), rows.end());
    EXPECT_EQ(unique.size(), rows.size());
    EXPECT_EQ(rows.back(), std::make_pair(uint8_t{0}, uint8_t{0}));
    for (const auto& [p, b] : rows) {
        if (p == PREFIX_PK_COMPRESSED_EVEN_Y) EXPECT_EQ(b % 2, 0);
        if (p == PREFIX_PK_COMPRESSED_ODD_Y) EXPECT_EQ(b % 2, 1);
    }
}

TEST_F(ParityTableTest, CompressedPrefixMatchesParity) {
    EXPECT_TRUE(satisfied(PREFIX_PK_COMPRESSED_EVEN_Y, 0xb8));
    EXPECT_TRUE(satisfied(PREFIX_PK_COMPRESSED_ODD_Y, 0x2b));
    EXPECT_FALSE(satisfied(PREFIX_PK_COMPRESSED_EVEN_Y, 0x2b));
    EXPECT_FALSE(satisfied(PREFIX_PK_COMPRESSED_ODD_Y, 0xb8));
}

TEST_F(ParityTableTest, UncompressedAcceptsAnyByte) {
    EXPECT_TRUE(satisfied(PREFIX_PK_UNCOMPRESSED, 0x00));
    EXPECT_TRUE(satisfied(PREFIX_PK_UNCOMPRESSED, 0xff));
}

TEST_F(ParityTableTest, UnknownPrefixIsRejected) {
    EXPECT_FALSE(satisfied(0x05, 0x00));
    EXPECT_FALSE(satisfied(0x00, 0x01));
}
