#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "crypto/secp256k1.hpp"
#include <array>

namespace bitcoin_vm {

constexpr size_t ECDSA_NUM_LIMBS = 8;
constexpr size_t ECDSA_LIMB_BITS = 32;

using LimbColumns = std::array<Column, ECDSA_NUM_LIMBS>;
using AssignedLimbs = std::array<AssignedCell, ECDSA_NUM_LIMBS>;

/**
 * Public key of a verified signature, as little-endian 32-bit limbs
 */
struct AssignedPublicKey {
    AssignedLimbs x;
    AssignedLimbs y;
};

/**
 * EcdsaInstructions - signature verification gadget used by the checksig bridge
 */
class EcdsaInstructions {
public:
    virtual ~EcdsaInstructions() = default;

    // Rows of its region one verification occupies
    virtual size_t rows_per_verification() const = 0;

    /**
     * Verify `signature` on `message_hash` under `public_key` at `offset`
     * 
     * @throws SynthesisError if the signature does not verify
     */
    virtual AssignedPublicKey verify(
        Region& region,
        size_t offset,
        const secp256k1::Signature& signature,
        const secp256k1::AffinePoint& public_key,
        const secp256k1::Scalar& message_hash
    ) const = 0;
};

struct EcdsaConfig {
    LimbColumns r;
    LimbColumns s;
    LimbColumns x;
    LimbColumns y;
    Column verified;
    Selector q_verify;
};

/**
 * NativeEcdsaChip - verifies out of circuit and pins the outcome
 * 
 * One row per verification: the r, s, x, y limbs and a `verified` cell
 * that the gate forces to 1.
 * 
 * Adds no in-circuit soundness. `verified` is prover-assigned and no gate
 * relates the signature limbs to the key limbs, so a dishonest prover can
 * place any key here. Only the native check in verify() rejects bad
 * signatures. Replace it with a non-native field gadget before relying on
 * the bridge for signature validity.
 */
class NativeEcdsaChip : public EcdsaInstructions {
public:
    explicit NativeEcdsaChip(EcdsaConfig config) : config_(config) {}

    static EcdsaConfig configure(ConstraintSystem& cs);

    // limbs[0] is the least-significant 32 bits of a big-endian integer
    static std::array<uint64_t, ECDSA_NUM_LIMBS> limbs_le(const secp256k1::Scalar& value);

    size_t rows_per_verification() const override { return 1; }

    AssignedPublicKey verify(
        Region& region,
        size_t offset,
        const secp256k1::Signature& signature,
        const secp256k1::AffinePoint& public_key,
        const secp256k1::Scalar& message_hash
    ) const override;

    const EcdsaConfig& config() const { return config_; }

private:
    EcdsaConfig config_;
};

} // namespace bitcoin_vm
