#include <gtest/gtest.h>
#include "circuit/bitcoin_vm_circuit.hpp"
#include "circuit/synthesis_error.hpp"
#include "common/rlc.hpp"
#include "crypto/secp256k1.hpp"
#include "script/opcodes.hpp"

using namespace bitcoin_vm;

class BitcoinVmCircuitTest : public ::testing::Test {
protected:
    static SignatureWithKey sign(uint64_t sk, uint64_t nonce) {
        const secp256k1::Scalar key = secp256k1::scalar_from_u64(sk);
        return {secp256k1::sign_with_nonce(key, secp256k1::scalar_from_u64(nonce),
                                           secp256k1::scalar_from_u64(ECDSA_MESSAGE_HASH)),
                secp256k1::derive_public_key(key)};
    }

    // <push key> OP_CHECKSIG
    static std::vector<uint8_t> pay_to_key(const secp256k1::AffinePoint& point, bool compressed) {
        const std::vector<uint8_t> key = secp256k1::serialize_public_key(point, compressed);
        std::vector<uint8_t> script = {static_cast<uint8_t>(key.size())};
        script.insert(script.end(), key.begin(), key.end());
        script.push_back(OP_CHECKSIG);
        return script;
    }

    CircuitInput input(std::vector<uint8_t> script,
                       std::vector<StackElement> initial = {},
                       std::vector<SignatureWithKey> signatures = {}) const {
        CircuitInput in;
        in.script = std::move(script);
        in.randomness = r;
        in.initial_stack = std::move(initial);
        in.signatures = std::move(signatures);
        return in;
    }

    static bool has_failure(const std::vector<VerifyFailure>& failures, const std::string& name) {
        for (const auto& failure : failures) {
            if (failure.name == name) return true;
        }
        return false;
    }

    const BFieldElement r{0x9e3779b9};
};

TEST_F(BitcoinVmCircuitTest, PayToCompressedKey) {
    const SignatureWithKey sig = sign(0xdeadbeef, 0x1111);
    BitcoinVmCircuit circuit(input(pay_to_key(sig.second, true), {StackElement::valid_signature()}, {sig}));
    EXPECT_TRUE(circuit.mock_verify().empty());
}

TEST_F(BitcoinVmCircuitTest, PayToUncompressedKey) {
    const SignatureWithKey sig = sign(0xfeedface, 0x2222);
    BitcoinVmCircuit circuit(input(pay_to_key(sig.second, false), {StackElement::valid_signature()}, {sig}));
    EXPECT_TRUE(circuit.mock_verify().empty());
}

TEST_F(BitcoinVmCircuitTest, TwoChecksigs) {
    const SignatureWithKey a = sign(17, 3);
    const SignatureWithKey b = sign(19, 5);
    std::vector<uint8_t> script = pay_to_key(a.second, true);
    const std::vector<uint8_t> second = pay_to_key(b.second, false);
    script.insert(script.end(), second.begin(), second.end());

    BitcoinVmCircuit circuit(input(script,
                                   {StackElement::valid_signature(), StackElement::valid_signature()},
                                   {a, b}));
    EXPECT_TRUE(circuit.mock_verify().empty());
}

TEST_F(BitcoinVmCircuitTest, InvalidSignatureNeedsNoWitness) {
    const secp256k1::AffinePoint key = secp256k1::derive_public_key(secp256k1::scalar_from_u64(5));
    std::vector<uint8_t> script = pay_to_key(key, true);
    script.push_back(OP_1);
    BitcoinVmCircuit circuit(input(script, {StackElement::invalid_signature()}));
    EXPECT_TRUE(circuit.mock_verify().empty());
}

TEST_F(BitcoinVmCircuitTest, InvalidSignatureLeavesFalse) {
    const secp256k1::AffinePoint key = secp256k1::derive_public_key(secp256k1::scalar_from_u64(5));
    BitcoinVmCircuit circuit(input(pay_to_key(key, true), {StackElement::invalid_signature()}));
    EXPECT_TRUE(has_failure(circuit.mock_verify(), "stack top is true after execution"));
}

TEST_F(BitcoinVmCircuitTest, PushOnlyScript) {
    BitcoinVmCircuit circuit(input({OP_NOP, 0x02, 0xab, 0xcd, OP_NOP}));
    EXPECT_TRUE(circuit.mock_verify().empty());
}

TEST_F(BitcoinVmCircuitTest, InstancesCommitToScript) {
    const std::vector<uint8_t> script = {OP_NOP, OP_1};
    BitcoinVmCircuit circuit(input(script));
    const auto instances = circuit.instances();
    ASSERT_EQ(instances.size(), 1u);
    ASSERT_EQ(instances[0].size(), 3u);
    EXPECT_EQ(instances[0][0], BFieldElement(2));
    EXPECT_EQ(instances[0][1], BFieldElement(OP_NOP) + r * BFieldElement(OP_1));
    EXPECT_EQ(instances[0][2], r);
}

TEST_F(BitcoinVmCircuitTest, WrongPublicInputsAreRejected) {
    BitcoinVmCircuit circuit(input({OP_1}));
    ConstraintSystem cs;
    const BitcoinVmConfig config = BitcoinVmCircuit::configure(cs);
    const Assignment assignment = circuit.synthesize(cs, config);

    auto instances = circuit.instances();
    EXPECT_TRUE(MockProver::run(cs, assignment, instances).verify().empty());

    instances[0][1] = instances[0][1] + BFieldElement::one();
    const auto failures = MockProver::run(cs, assignment, instances).verify();
    ASSERT_FALSE(failures.empty());
    EXPECT_EQ(failures[0].kind, VerifyFailure::Kind::Permutation);
}

TEST_F(BitcoinVmCircuitTest, TamperedBridgeIsRejected) {
    const SignatureWithKey sig = sign(0xabc, 0xdef);
    BitcoinVmCircuit circuit(input(pay_to_key(sig.second, true), {StackElement::valid_signature()}, {sig}));
    ConstraintSystem cs;
    const BitcoinVmConfig config = BitcoinVmCircuit::configure(cs);
    Assignment assignment = circuit.synthesize(cs, config);

    // First bridge row holds the folded accumulator; find it by value
    const Column acc = config.checksig.pk_rlc_acc;
    size_t row = 0;
    while (assignment.get(acc, row).is_zero()) ++row;
    assignment.set(acc, row, assignment.get(acc, row) + BFieldElement::one());
    EXPECT_FALSE(MockProver::run(cs, assignment, circuit.instances()).verify().empty());
}

TEST_F(BitcoinVmCircuitTest, DisabledOpcodeFails) {
    BitcoinVmCircuit circuit(input({OP_1, OP_1NEGATE}));
    EXPECT_TRUE(has_failure(circuit.mock_verify(), "only enabled opcodes"));
}

TEST_F(BitcoinVmCircuitTest, MissingSignatureThrows) {
    const SignatureWithKey sig = sign(0xabc, 0xdef);
    BitcoinVmCircuit circuit(input(pay_to_key(sig.second, true), {StackElement::valid_signature()}));
    EXPECT_THROW(circuit.mock_verify(), SynthesisError);
}

TEST_F(BitcoinVmCircuitTest, KeyMismatchThrows) {
    const SignatureWithKey sig = sign(0xabc, 0xdef);
    const SignatureWithKey other = sign(0x123, 0xdef);
    BitcoinVmCircuit circuit(input(pay_to_key(sig.second, true), {StackElement::valid_signature()}, {other}));
    EXPECT_THROW(circuit.mock_verify(), SynthesisError);
}

TEST_F(BitcoinVmCircuitTest, TooManySignaturesThrows) {
    const SignatureWithKey sig = sign(0xabc, 0xdef);
    BitcoinVmCircuit circuit(input({OP_1}, {}, std::vector<SignatureWithKey>(MAX_CHECKSIG_COUNT + 1, sig)));
    EXPECT_THROW(circuit.mock_verify(), std::invalid_argument);
}

TEST_F(BitcoinVmCircuitTest, DataFlagBelowKeyThrows) {
    const SignatureWithKey sig = sign(0xabc, 0xdef);
    std::vector<uint8_t> script = {OP_1};
    const std::vector<uint8_t> rest = pay_to_key(sig.second, true);
    script.insert(script.end(), rest.begin(), rest.end());
    BitcoinVmCircuit circuit(input(script, {}, {sig}));
    EXPECT_THROW(circuit.mock_verify(), std::invalid_argument);
}

TEST_F(BitcoinVmCircuitTest, ZeroLengthPushDataThrows) {
    BitcoinVmCircuit circuit(input({OP_PUSHDATA1, 0x00, OP_1}));
    EXPECT_THROW(circuit.mock_verify(), std::invalid_argument);
}

TEST_F(BitcoinVmCircuitTest, OversizedScriptThrows) {
    BitcoinVmCircuit circuit(input(std::vector<uint8_t>(MAX_SCRIPT_PUBKEY_SIZE + 1, OP_NOP)));
    EXPECT_THROW(circuit.mock_verify(), std::invalid_argument);
}
