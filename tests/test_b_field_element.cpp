#include <gtest/gtest.h>
#include "types/b_field_element.hpp"

using namespace bitcoin_vm;

class BFieldElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Common setup
    }
};

// Basic construction tests
TEST_F(BFieldElementTest, DefaultConstruction) {
    BFieldElement zero;
    EXPECT_EQ(zero.value(), 0ULL);
}

TEST_F(BFieldElementTest, ValueConstruction) {
    BFieldElement elem(42);
    EXPECT_EQ(elem.value(), 42ULL);
}

TEST_F(BFieldElementTest, ModularReduction) {
    // Value larger than modulus should be reduced
    BFieldElement elem(BFieldElement::MODULUS + 5);
    EXPECT_EQ(elem.value(), 5ULL);
}

// Factory methods
TEST_F(BFieldElementTest, Zero) {
    auto zero = BFieldElement::zero();
    EXPECT_EQ(zero.value(), 0ULL);
    EXPECT_TRUE(zero.is_zero());
}

TEST_F(BFieldElementTest, One) {
    auto one = BFieldElement::one();
    EXPECT_EQ(one.value(), 1ULL);
    EXPECT_TRUE(one.is_one());
}

// Arithmetic tests
TEST_F(BFieldElementTest, Addition) {
    BFieldElement a(100);
    BFieldElement b(200);
    auto result = a + b;
    EXPECT_EQ(result.value(), 300ULL);
}

TEST_F(BFieldElementTest, AdditionWithOverflow) {
    BFieldElement a(BFieldElement::MODULUS - 5);
    BFieldElement b(10);
    auto result = a + b;
    EXPECT_EQ(result.value(), 5ULL);
}

TEST_F(BFieldElementTest, Subtraction) {
    BFieldElement a(200);
    BFieldElement b(100);
    auto result = a - b;
    EXPECT_EQ(result.value(), 100ULL);
}

TEST_F(BFieldElementTest, SubtractionWithUnderflow) {
    BFieldElement a(5);
    BFieldElement b(10);
    auto result = a - b;
    EXPECT_EQ(result.value(), BFieldElement::MODULUS - 5);
}

TEST_F(BFieldElementTest, Multiplication) {
    BFieldElement a(100);
    BFieldElement b(200);
    auto result = a * b;
    EXPECT_EQ(result.value(), 20000ULL);
}

TEST_F(BFieldElementTest, MultiplicationWithReduction) {
    // Test that large products are reduced correctly
    BFieldElement a(1ULL << 32);
    BFieldElement b(1ULL << 32);
    auto result = a * b;
    // (2^32)^2 mod p = 2^64 mod p
    // Since p = 2^64 - 2^32 + 1, we have 2^64 = 2^32 - 1 mod p
    EXPECT_EQ(result.value(), (1ULL << 32) - 1);
}

TEST_F(BFieldElementTest, Negation) {
    BFieldElement a(100);
    auto neg_a = -a;
    EXPECT_EQ((a + neg_a).value(), 0ULL);
}

TEST_F(BFieldElementTest, NegationOfZero) {
    auto zero = BFieldElement::zero();
    auto neg_zero = -zero;
    EXPECT_EQ(neg_zero.value(), 0ULL);
}

// Power tests
TEST_F(BFieldElementTest, PowerOfZero) {
    BFieldElement a(5);
    auto result = a.pow(0);
    EXPECT_EQ(result.value(), 1ULL);
}

TEST_F(BFieldElementTest, PowerOfOne) {
    BFieldElement a(5);
    auto result = a.pow(1);
    EXPECT_EQ(result.value(), 5ULL);
}

TEST_F(BFieldElementTest, PowerOfTwo) {
    BFieldElement a(5);
    auto result = a.pow(2);
    EXPECT_EQ(result.value(), 25ULL);
}

TEST_F(BFieldElementTest, PowerOfTen) {
    BFieldElement a(2);
    auto result = a.pow(10);
    EXPECT_EQ(result.value(), 1024ULL);
}

// Inverse tests
TEST_F(BFieldElementTest, InverseOfOne) {
    auto one = BFieldElement::one();
    auto inv = one.inverse();
    EXPECT_EQ(inv.value(), 1ULL);
}

TEST_F(BFieldElementTest, InverseProperty) {
    BFieldElement a(12345);
    auto inv = a.inverse();
    auto product = a * inv;
    EXPECT_EQ(product.value(), 1ULL);
}

TEST_F(BFieldElementTest, InverseOfZeroThrows) {
    auto zero = BFieldElement::zero();
    EXPECT_THROW(zero.inverse(), std::domain_error);
}

// Division tests
TEST_F(BFieldElementTest, Division) {
    BFieldElement a(100);
    BFieldElement b(5);
    auto result = a / b;
    EXPECT_EQ(result.value(), 20ULL);
}

TEST_F(BFieldElementTest, DivisionProperty) {
    BFieldElement a(12345);
    BFieldElement b(67890);
    auto quotient = a / b;
    auto product = quotient * b;
    EXPECT_EQ(product.value(), a.value());
}

// Is-zero witness helper
TEST_F(BFieldElementTest, InverseOrZeroOfZero) {
    EXPECT_EQ(BFieldElement::zero().inverse_or_zero(), BFieldElement::zero());
}

TEST_F(BFieldElementTest, InverseOrZeroMatchesInverse) {
    BFieldElement a(0x80);
    EXPECT_EQ(a.inverse_or_zero(), a.inverse());
    EXPECT_EQ((a * a.inverse_or_zero()).value(), 1ULL);
}

TEST_F(BFieldElementTest, BatchInversion) {
    std::vector<BFieldElement> elements = {BFieldElement(2), BFieldElement(3), BFieldElement(520), BFieldElement(BFieldElement::MODULUS - 1)};
    auto inverses = BFieldElement::batch_inversion(elements);
    ASSERT_EQ(inverses.size(), elements.size());
    for (size_t i = 0; i < elements.size(); ++i) {
        EXPECT_EQ((elements[i] * inverses[i]).value(), 1ULL);
    }
}

TEST_F(BFieldElementTest, HalfTimesTwoIsOne) {
    // Used to select uncompressed keys in the public key RLC
    auto half = BFieldElement(2).inverse();
    EXPECT_EQ((half * BFieldElement(2)).value(), 1ULL);
    EXPECT_EQ(((BFieldElement(4) - BFieldElement(2)) * (BFieldElement(4) - BFieldElement(3)) * half).value(), 1ULL);
}

TEST_F(BFieldElementTest, ToString) {
    EXPECT_EQ(BFieldElement(128).to_string(), "128");
}

TEST_F(BFieldElementTest, ModulusValue) {
    // Goldilocks prime: 2^64 - 2^32 + 1
    EXPECT_EQ(BFieldElement::MODULUS, 0xFFFFFFFF00000001ULL);
}

