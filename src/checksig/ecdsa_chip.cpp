#include "checksig/ecdsa_chip.hpp"
#include "circuit/synthesis_error.hpp"
#include "common/debug_control.hpp"
#include <string>

namespace bitcoin_vm {

namespace {

LimbColumns limb_columns(ConstraintSystem& cs, const std::string& name, bool equality) {
    LimbColumns columns;
    for (size_t i = 0; i < ECDSA_NUM_LIMBS; ++i) {
        columns[i] = cs.advice_column();
        if (equality) {
            cs.enable_equality(columns[i]);
        }
        cs.annotate_column(columns[i], "ecdsa_" + name + "[" + std::to_string(i) + "]");
    }
    return columns;
}

AssignedLimbs assign_limbs(Region& region, const LimbColumns& columns, size_t offset,
                           const secp256k1::Scalar& value) {
    const auto limbs = NativeEcdsaChip::limbs_le(value);
    AssignedLimbs cells;
    for (size_t i = 0; i < ECDSA_NUM_LIMBS; ++i) {
        cells[i] = region.assign_advice(columns[i], offset, BFieldElement(limbs[i]));
    }
    return cells;
}

} // anonymous namespace

EcdsaConfig NativeEcdsaChip::configure(ConstraintSystem& cs) {
    EcdsaConfig config;
    config.r = limb_columns(cs, "r", false);
    config.s = limb_columns(cs, "s", false);
    // x and y are copied out to the range checks
    config.x = limb_columns(cs, "x", true);
    config.y = limb_columns(cs, "y", true);
    config.verified = cs.advice_column();
    cs.annotate_column(config.verified, "ecdsa_verified");
    config.q_verify = cs.selector();

    cs.create_gate("ecdsa signature verified", {
        Expression::query(config.q_verify) *
            (Expression::query(config.verified, Rotation::cur()) - Expression::constant(1)),
    });
    return config;
}

std::array<uint64_t, ECDSA_NUM_LIMBS> NativeEcdsaChip::limbs_le(const secp256k1::Scalar& value) {
    std::array<uint64_t, ECDSA_NUM_LIMBS> limbs{};
    for (size_t i = 0; i < ECDSA_NUM_LIMBS; ++i) {
        uint64_t limb = 0;
        // Limb i covers bytes 31-4i-3 .. 31-4i of the big-endian encoding
        for (size_t j = 0; j < 4; ++j) {
            limb |= static_cast<uint64_t>(value[31 - 4 * i - j]) << (8 * j);
        }
        limbs[i] = limb;
    }
    return limbs;
}

AssignedPublicKey NativeEcdsaChip::verify(
    Region& region,
    size_t offset,
    const secp256k1::Signature& signature,
    const secp256k1::AffinePoint& public_key,
    const secp256k1::Scalar& message_hash
) const {
    if (!secp256k1::verify_signature(signature, public_key, message_hash)) {
        throw SynthesisError("ECDSA signature does not verify under public key " + public_key.to_string());
    }

    region.enable_selector(config_.q_verify, offset);
    assign_limbs(region, config_.r, offset, signature.r);
    assign_limbs(region, config_.s, offset, signature.s);

    AssignedPublicKey assigned;
    assigned.x = assign_limbs(region, config_.x, offset, public_key.x);
    assigned.y = assign_limbs(region, config_.y, offset, public_key.y);
    region.assign_advice(config_.verified, offset, BFieldElement::one());

    BITCOIN_VM_DEBUG_PRINT("[ecdsa] verified signature at %s row %zu\n", region.name().c_str(), offset);
    return assigned;
}

} // namespace bitcoin_vm
