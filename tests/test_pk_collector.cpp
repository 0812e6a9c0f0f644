#include <gtest/gtest.h>
#include "checksig/pk_collector.hpp"
#include "crypto/secp256k1.hpp"
#include "script/opcodes.hpp"
#include "script/script_vm.hpp"

using namespace bitcoin_vm;

class PkCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        key_a = secp256k1::derive_public_key(secp256k1::scalar_from_u64(11));
        key_b = secp256k1::derive_public_key(secp256k1::scalar_from_u64(22));
    }

    // <push key> OP_CHECKSIG
    static std::vector<uint8_t> pay_to_key(const std::vector<uint8_t>& key) {
        std::vector<uint8_t> script = {static_cast<uint8_t>(key.size())};
        script.insert(script.end(), key.begin(), key.end());
        script.push_back(OP_CHECKSIG);
        return script;
    }

    secp256k1::AffinePoint key_a;
    secp256k1::AffinePoint key_b;
};

TEST_F(PkCollectorTest, ValidSignatureCollectsKey) {
    const auto bytes = secp256k1::serialize_public_key(key_a, true);
    auto keys = collect_public_keys(pay_to_key(bytes), {StackElement::valid_signature()});
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0].bytes, bytes);
    EXPECT_EQ(keys[0].point, key_a);
    EXPECT_TRUE(keys[0].compressed());
}

TEST_F(PkCollectorTest, UncompressedKey) {
    const auto bytes = secp256k1::serialize_public_key(key_a, false);
    auto keys = collect_public_keys(pay_to_key(bytes), {StackElement::valid_signature()});
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_FALSE(keys[0].compressed());
    EXPECT_EQ(keys[0].point, key_a);
}

TEST_F(PkCollectorTest, InvalidSignatureCollectsNothing) {
    // The key is not even parsed
    auto keys = collect_public_keys(pay_to_key({0x07, 0x01}), {StackElement::invalid_signature()});
    EXPECT_TRUE(keys.empty());
}

TEST_F(PkCollectorTest, KeysInScriptOrder) {
    std::vector<uint8_t> script = pay_to_key(secp256k1::serialize_public_key(key_a, true));
    const auto second = pay_to_key(secp256k1::serialize_public_key(key_b, false));
    script.insert(script.end(), second.begin(), second.end());

    auto keys = collect_public_keys(script, {StackElement::valid_signature(), StackElement::valid_signature()});
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0].point, key_a);
    EXPECT_EQ(keys[1].point, key_b);
}

TEST_F(PkCollectorTest, PushDataKey) {
    const auto bytes = secp256k1::serialize_public_key(key_b, true);
    std::vector<uint8_t> script = {OP_PUSHDATA1, static_cast<uint8_t>(bytes.size())};
    script.insert(script.end(), bytes.begin(), bytes.end());
    script.push_back(OP_CHECKSIG);
    auto keys = collect_public_keys(script, {StackElement::valid_signature()});
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0].point, key_b);
}

TEST_F(PkCollectorTest, DataInSignaturePositionThrows) {
    const auto bytes = secp256k1::serialize_public_key(key_a, true);
    EXPECT_THROW(collect_public_keys(pay_to_key(bytes), {StackElement::bytes({0x01})}), std::invalid_argument);
    // OP_1 pushes data, not a signature
    std::vector<uint8_t> script = {OP_1};
    const auto rest = pay_to_key(bytes);
    script.insert(script.end(), rest.begin(), rest.end());
    EXPECT_THROW(collect_public_keys(script, {}), std::invalid_argument);
}

TEST_F(PkCollectorTest, TooFewStackItemsThrows) {
    EXPECT_THROW(collect_public_keys({OP_CHECKSIG}, {StackElement::valid_signature()}), std::invalid_argument);
}

TEST_F(PkCollectorTest, StricterThanTraceOnFlags) {
    const BFieldElement r(99);
    const auto bytes = secp256k1::serialize_public_key(key_a, true);

    // Underflowing checksig traces with flag 0
    const auto underflow = ScriptVM::trace_execution({OP_CHECKSIG}, r, std::vector<StackElement>{});
    EXPECT_EQ(underflow.final_stack()[0], BFieldElement::zero());
    EXPECT_EQ(underflow.num_checksig_opcodes(), 0u);
    EXPECT_THROW(collect_public_keys({OP_CHECKSIG}, {}), std::invalid_argument);

    // OP_1 below the key traces as a valid flag
    std::vector<uint8_t> script = {OP_1};
    const auto rest = pay_to_key(bytes);
    script.insert(script.end(), rest.begin(), rest.end());
    const auto data_flag = ScriptVM::trace_execution(script, r, std::vector<StackElement>{});
    EXPECT_EQ(data_flag.num_checksig_opcodes(), 1u);
    EXPECT_THROW(collect_public_keys(script, {}), std::invalid_argument);
}

TEST_F(PkCollectorTest, MalformedKeyThrows) {
    EXPECT_THROW(collect_public_keys(pay_to_key({0x05, 0x01, 0x02}), {StackElement::valid_signature()}),
                 std::invalid_argument);
}

TEST_F(PkCollectorTest, MalformedScriptThrows) {
    EXPECT_THROW(collect_public_keys({0x05, 0x01}, {}), std::invalid_argument);
    EXPECT_THROW(collect_public_keys({OP_PUSHDATA1, 0x00}, {}), std::invalid_argument);
    EXPECT_THROW(collect_public_keys({OP_PUSHDATA2, 0x01}, {}), std::invalid_argument);
}

TEST_F(PkCollectorTest, ChecksigResultFeedsNextCheck) {
    // Second check consumes the first result as its flag
    std::vector<uint8_t> script = pay_to_key(secp256k1::serialize_public_key(key_a, true));
    const auto second = pay_to_key(secp256k1::serialize_public_key(key_b, true));
    script.insert(script.end(), second.begin(), second.end());
    auto keys = collect_public_keys(script, {StackElement::invalid_signature()});
    EXPECT_TRUE(keys.empty());
}
