#include <gtest/gtest.h>
#include "common/hex.hpp"
#include "crypto/secp256k1.hpp"
#include "script/opcodes.hpp"
#include <algorithm>

using namespace bitcoin_vm;
using namespace bitcoin_vm::secp256k1;

namespace {

Scalar scalar_from_hex(const std::string& hex) {
    const std::vector<uint8_t> bytes = bytes_from_hex(hex);
    Scalar out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

const char* GENERATOR_COMPRESSED = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
const char* GENERATOR_Y = "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";
const char* TWO_G_X = "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
const char* TWO_G_Y = "1ae168fea63dc339a3c58419466ceaeef7f632653266d0e1236431a950cfe52a";

} // anonymous namespace

class Secp256k1Test : public ::testing::Test {
protected:
    const Scalar hash = scalar_from_u64(ECDSA_MESSAGE_HASH);
};

TEST_F(Secp256k1Test, GeneratorEncoding) {
    const AffinePoint g = generator();
    EXPECT_EQ(bytes_to_hex(serialize_public_key(g, true)), GENERATOR_COMPRESSED);
    EXPECT_EQ(g.y, scalar_from_hex(GENERATOR_Y));
    EXPECT_FALSE(g.y_is_odd());
}

TEST_F(Secp256k1Test, DerivePublicKey) {
    EXPECT_EQ(derive_public_key(scalar_from_u64(1)), generator());
    const AffinePoint two_g = derive_public_key(scalar_from_u64(2));
    EXPECT_EQ(two_g.x, scalar_from_hex(TWO_G_X));
    EXPECT_EQ(two_g.y, scalar_from_hex(TWO_G_Y));
}

TEST_F(Secp256k1Test, DeriveRejectsZero) {
    EXPECT_THROW(derive_public_key(scalar_from_u64(0)), std::invalid_argument);
}

TEST_F(Secp256k1Test, ParseRoundTrip) {
    const AffinePoint point = derive_public_key(scalar_from_u64(0xc0ffee));
    EXPECT_EQ(parse_public_key(serialize_public_key(point, true)), point);
    EXPECT_EQ(parse_public_key(serialize_public_key(point, false)), point);
    EXPECT_EQ(serialize_public_key(point, true).size(), COMPRESSED_PUBLIC_KEY_SIZE);
    EXPECT_EQ(serialize_public_key(point, false).size(), UNCOMPRESSED_PUBLIC_KEY_SIZE);
}

TEST_F(Secp256k1Test, ParseRejectsMalformedKeys) {
    std::vector<uint8_t> key = serialize_public_key(generator(), true);

    std::vector<uint8_t> bad_prefix = key;
    bad_prefix[0] = 0x05;
    EXPECT_THROW(parse_public_key(bad_prefix), std::invalid_argument);

    std::vector<uint8_t> short_key(key.begin(), key.end() - 1);
    EXPECT_THROW(parse_public_key(short_key), std::invalid_argument);

    std::vector<uint8_t> long_compressed = serialize_public_key(generator(), false);
    long_compressed[0] = PREFIX_PK_COMPRESSED_EVEN_Y;
    EXPECT_THROW(parse_public_key(long_compressed), std::invalid_argument);

    EXPECT_THROW(parse_public_key({}), std::invalid_argument);
}

TEST_F(Secp256k1Test, ParseRejectsPointOffCurve) {
    std::vector<uint8_t> key = serialize_public_key(generator(), false);
    key.back() ^= 0x01;
    EXPECT_THROW(parse_public_key(key), std::invalid_argument);
}

TEST_F(Secp256k1Test, SignAndVerify) {
    const Scalar sk = scalar_from_u64(123456789);
    const AffinePoint pk = derive_public_key(sk);
    const Signature sig = sign_with_nonce(sk, scalar_from_u64(987654321), hash);
    EXPECT_TRUE(verify_signature(sig, pk, hash));

    EXPECT_FALSE(verify_signature(sig, pk, scalar_from_u64(2)));
    EXPECT_FALSE(verify_signature(sig, generator(), hash));

    Signature tampered = sig;
    tampered.s[31] ^= 0x01;
    EXPECT_FALSE(verify_signature(tampered, pk, hash));
}

TEST_F(Secp256k1Test, PaddingSignatureShape) {
    // sk = k = h = 1: r = G.x, s = 1 + G.x (mod n)
    const Signature sig = sign_with_nonce(scalar_from_u64(1), scalar_from_u64(1), hash);
    EXPECT_EQ(sig.r, generator().x);
    Scalar expected_s = generator().x;
    expected_s[31] = static_cast<uint8_t>(expected_s[31] + 1);
    EXPECT_EQ(sig.s, expected_s);
    EXPECT_TRUE(verify_signature(sig, generator(), hash));
}

TEST_F(Secp256k1Test, VerifyRejectsZeroScalars) {
    const Signature zero{};
    EXPECT_FALSE(verify_signature(zero, generator(), hash));
}
