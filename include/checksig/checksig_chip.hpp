#pragma once

#include "types/b_field_element.hpp"
#include "checksig/ecdsa_chip.hpp"
#include "checksig/pk_collector.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "gadgets/is_zero.hpp"
#include "gadgets/range_check.hpp"
#include "script/opcodes.hpp"
#include "table/parity_table.hpp"
#include <array>
#include <utility>
#include <vector>

namespace bitcoin_vm {

constexpr size_t PUBLIC_KEY_COORDINATE_BYTES = 32;
constexpr size_t PUBLIC_KEY_RLC_POWERS = 2 * PUBLIC_KEY_COORDINATE_BYTES;

using SignatureWithKey = std::pair<secp256k1::Signature, secp256k1::AffinePoint>;

struct CheckSigConfig {
    EcdsaConfig ecdsa;
    RangeCheckConfig range;
    ParityTableConfig parity_table;

    Column randomness;
    // powers[k] = randomness^(k+1)
    std::array<Column, PUBLIC_KEY_RLC_POWERS> powers;
    Column num_checksig_opcodes;
    IsZeroConfig num_checksig_opcodes_is_zero;
    Column pk_rlc_acc;
    Column pk_rlc;
    Column pk_prefix;
    std::array<Column, PUBLIC_KEY_COORDINATE_BYTES> x_le;
    std::array<Column, PUBLIC_KEY_COORDINATE_BYTES> y_le;

    Selector q_bridge;
    Selector q_end;
};

// Row-0 cells linked to the execution region
struct BridgeCells {
    AssignedCell randomness;
    AssignedCell pk_rlc_acc;
    AssignedCell num_checksig_opcodes;
};

struct CheckSigRegions {
    size_t ecdsa;
    size_t range;
    size_t bridge;
};

/**
 * CheckSigChip - ties the execution region's public key accumulator to
 * verified ECDSA signatures
 * 
 * MAX_CHECKSIG_COUNT slots, slot i holding the (m-1-i)-th signature of the
 * script for i < m and a padding signature by the generator otherwise.
 * The bridge rows recompute
 *   pk_rlc_acc[i] = pk_rlc[i] + r * pk_rlc_acc[i+1]
 * while the checksig count counts down to zero, with pk_rlc rebuilt from
 * the range-checked coordinate bytes of each slot.
 */
class CheckSigChip {
public:
    static constexpr size_t NUM_SLOTS = MAX_CHECKSIG_COUNT;
    static constexpr size_t BRIDGE_ROWS = NUM_SLOTS + 1;
    // 16 limbs of 32 bits per slot
    static constexpr size_t RANGE_ROWS_PER_SLOT = 2 * ECDSA_NUM_LIMBS * (ECDSA_LIMB_BITS / 8 + 1);

    CheckSigChip(CheckSigConfig config, const EcdsaInstructions& ecdsa)
        : config_(std::move(config)), ecdsa_(ecdsa) {}

    static CheckSigConfig configure(ConstraintSystem& cs, const EcdsaConfig& ecdsa, const RangeCheckConfig& range);

    CheckSigRegions plan(Layouter& layouter) const;

    // Parity and byte range tables
    void load(Layouter& layouter) const;

    /**
     * Fill the ECDSA, range check and bridge regions
     * 
     * @param signatures Signatures and keys in script order
     * @param collected_keys Keys the script consumed with a valid signature flag
     * @throws std::invalid_argument for more than MAX_CHECKSIG_COUNT signatures
     * @throws SynthesisError when signatures and collected keys disagree
     */
    BridgeCells assign(
        Layouter& layouter,
        const CheckSigRegions& regions,
        BFieldElement randomness,
        const std::vector<SignatureWithKey>& signatures,
        const std::vector<CollectedPublicKey>& collected_keys
    ) const;

    /**
     * RLC of a SEC1 key as the execution stack holds it (Horner over the
     * serialized bytes)
     */
    static BFieldElement public_key_rlc(const secp256k1::AffinePoint& point, bool compressed,
                                        BFieldElement randomness);

    // Signature and key occupying unused slots
    static SignatureWithKey padding_signature();

    const CheckSigConfig& config() const { return config_; }

private:
    struct Slot {
        secp256k1::Signature signature;
        secp256k1::AffinePoint point;
        uint8_t prefix;
    };

    std::vector<Slot> build_slots(
        const std::vector<SignatureWithKey>& signatures,
        const std::vector<CollectedPublicKey>& collected_keys
    ) const;

    CheckSigConfig config_;
    const EcdsaInstructions& ecdsa_;
};

} // namespace bitcoin_vm
